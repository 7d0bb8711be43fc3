#include "core/errors.h"
#include "core/logger.h"
#include "maintenance/candidate_collector.h"
#include "maintenance_mocks.h"
#include "test_runner.h"

int main() {
  TestRunner runner;
  Logger::initialize(LogLevel::WARNING);

  std::cout << "\n========================================" << std::endl;
  std::cout << "CANDIDATE COLLECTOR - TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Tables without tuples are excluded", [&]() {
    MockStatisticsSource source;
    source.rows = {MockStatisticsSource::row("public", "orders", 100, 5),
                   MockStatisticsSource::row("public", "empty", 0, 0),
                   MockStatisticsSource::row("public", "dead_only", 0, 10)};
    CandidateCollector collector(source, TargetScope{}, false);
    auto candidates = collector.collect();
    runner.assertEquals(2, static_cast<int>(candidates.size()),
                        "Empty table dropped");
    runner.assertEquals(std::string("public.orders"),
                        candidates[0].qualifiedName(), "First candidate");
    runner.assertNear(1.0, candidates[1].deadTupleRatio(), 1e-9,
                      "All-dead table has ratio 1");
  });

  runner.runTest("System schemas never become candidates", [&]() {
    MockStatisticsSource source;
    source.rows = {MockStatisticsSource::row("pg_catalog", "pg_class", 10, 1),
                   MockStatisticsSource::row("information_schema", "x", 10, 1),
                   MockStatisticsSource::row("pg_toast", "pg_toast_1", 10, 1),
                   MockStatisticsSource::row("app", "users", 10, 1)};
    CandidateCollector collector(source, TargetScope{}, false);
    auto candidates = collector.collect();
    runner.assertEquals(1, static_cast<int>(candidates.size()),
                        "Only the user table is kept");
    runner.assertEquals(std::string("app"), candidates[0].schema,
                        "User schema");
  });

  runner.runTest("Schema and table globs restrict the scope", [&]() {
    MockStatisticsSource source;
    source.rows = {MockStatisticsSource::row("public", "user_accounts", 10, 1),
                   MockStatisticsSource::row("public", "user_roles", 10, 1),
                   MockStatisticsSource::row("public", "order_items", 10, 1),
                   MockStatisticsSource::row("public", "audit", 10, 1),
                   MockStatisticsSource::row("sales", "user_x", 10, 1)};
    TargetScope scope;
    scope.schemaPattern = "public";
    scope.tablePatterns = {"user_*", "order_*"};
    CandidateCollector collector(source, scope, false);
    auto candidates = collector.collect();
    runner.assertEquals(3, static_cast<int>(candidates.size()),
                        "Three tables match");
    for (const auto &c : candidates) {
      runner.assertEquals(std::string("public"), c.schema,
                          "Schema pattern applied");
      runner.assertTrue(c.table != "audit", "audit not matched");
    }
  });

  runner.runTest("SQL LIKE wildcards work as glob aliases", [&]() {
    MockStatisticsSource source;
    source.rows = {MockStatisticsSource::row("app", "log_2024", 10, 1),
                   MockStatisticsSource::row("app", "log_2025", 10, 1),
                   MockStatisticsSource::row("app", "logs", 10, 1)};
    TargetScope scope;
    scope.schemaPattern = "a%";
    scope.tablePatterns = {"log_202_"};
    CandidateCollector collector(source, scope, false);
    runner.assertEquals(2, static_cast<int>(collector.collect().size()),
                        "Both yearly tables match");
  });

  runner.runTest("Negative counters are clamped", [&]() {
    MockStatisticsSource source;
    auto r = MockStatisticsSource::row("public", "t", 100, 0);
    r.deadTuples = "-5";
    r.modificationsSinceAnalyze = "-20";
    source.rows = {r};
    CandidateCollector collector(source, TargetScope{}, false);
    auto candidates = collector.collect();
    runner.assertEquals(1, static_cast<int>(candidates.size()), "Kept");
    runner.assertEquals(0, static_cast<int>(candidates[0].deadTuples),
                        "Dead clamped to zero");
    runner.assertEquals(
        0, static_cast<int>(candidates[0].modificationsSinceAnalyze),
        "Modifications clamped to zero");
  });

  runner.runTest("Null timestamps mean never performed", [&]() {
    MockStatisticsSource source;
    auto r = MockStatisticsSource::row("public", "t", 100, 0);
    r.lastAnalyze.reset();
    r.lastAutoanalyze.reset();
    r.lastVacuum = "1699990000";
    source.rows = {r};
    CandidateCollector collector(source, TargetScope{}, false);
    auto c = collector.collect().at(0);
    runner.assertFalse(c.lastAnalyzed().has_value(), "Never analyzed");
    runner.assertFalse(c.staleness(testNow()).has_value(),
                       "Staleness undefined");
    runner.assertTrue(c.lastVacuum.has_value(), "Vacuum timestamp parsed");
  });

  runner.runTest("Malformed row aborts collection by default", [&]() {
    MockStatisticsSource source;
    auto bad = MockStatisticsSource::row("public", "bad", 100, 0);
    bad.liveTuples = "12abc";
    source.rows = {MockStatisticsSource::row("public", "good", 100, 1), bad};
    CandidateCollector collector(source, TargetScope{}, false);
    runner.assertThrows<CollectionError>([&]() { collector.collect(); },
                                         "CollectionError expected");
  });

  runner.runTest("Malformed row is skipped with partial collection", [&]() {
    MockStatisticsSource source;
    auto bad = MockStatisticsSource::row("public", "bad", 100, 0);
    bad.lastAnalyze = "yesterday";
    source.rows = {MockStatisticsSource::row("public", "good", 100, 1), bad};
    CandidateCollector collector(source, TargetScope{}, true);
    auto candidates = collector.collect();
    runner.assertEquals(1, static_cast<int>(candidates.size()),
                        "Good row kept");
    runner.assertEquals(1, static_cast<int>(collector.rejectedRows()),
                        "One row rejected");
  });

  runner.runTest("Source errors propagate unchanged", [&]() {
    MockStatisticsSource down;
    down.failConnect = true;
    CandidateCollector c1(down, TargetScope{}, true);
    runner.assertThrows<ConnectivityError>([&]() { c1.collect(); },
                                           "ConnectivityError propagates");

    MockStatisticsSource denied;
    denied.failQuery = true;
    CandidateCollector c2(denied, TargetScope{}, true);
    runner.assertThrows<CollectionError>([&]() { c2.collect(); },
                                         "CollectionError propagates");
  });

  runner.runTest("One snapshot per collection", [&]() {
    MockStatisticsSource source;
    source.rows = {MockStatisticsSource::row("public", "t", 1, 1)};
    CandidateCollector collector(source, TargetScope{}, false);
    collector.collect();
    runner.assertEquals(1, source.calls, "Source queried once");
  });

  runner.printSummary();
  return 0;
}
