#include "core/logger.h"
#include "maintenance/execution_scheduler.h"
#include "maintenance_mocks.h"
#include "test_runner.h"
#include <chrono>
#include <set>

namespace {
std::vector<Operation> makePlan(const std::vector<std::string> &tables,
                                OperationKind kind = OperationKind::Vacuum) {
  std::vector<Operation> plan;
  size_t rank = 1;
  for (const auto &table : tables) {
    Operation op(makeCandidate("public", table, 100, 50), kind,
                 {"Urgent", "test", 33.0}, 1);
    op.setRank(rank++);
    plan.push_back(std::move(op));
  }
  return plan;
}

int countState(const std::vector<Operation> &plan, OperationState state) {
  int n = 0;
  for (const auto &op : plan)
    if (op.state() == state)
      ++n;
  return n;
}

const ExecutionScheduler::StopPredicate neverStop = [] { return false; };
} // namespace

int main() {
  TestRunner runner;
  Logger::initialize(LogLevel::WARNING);

  std::cout << "\n========================================" << std::endl;
  std::cout << "EXECUTION SCHEDULER - TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Dry run never calls the executor", [&]() {
    MockMaintenanceExecutor executor;
    OutcomeRecorder recorder;
    recorder.start(true);
    auto plan = makePlan({"a", "b", "c"});
    ExecutionScheduler scheduler(executor, recorder, 4, true,
                                 CancelPolicy::FINISH);
    scheduler.run(plan, neverStop);
    runner.assertEquals(0, static_cast<int>(executor.executedCount()),
                        "No statements issued");
    runner.assertEquals(3, countState(plan, OperationState::DryRunReported),
                        "All reported");
    RunSummary summary = recorder.finish();
    runner.assertEquals(3, static_cast<int>(summary.dryRunReported),
                        "Summary has every operation");
  });

  runner.runTest("Concurrency 1 runs strictly in plan order", [&]() {
    MockMaintenanceExecutor executor;
    executor.minDelayMs = 20;
    OutcomeRecorder recorder;
    recorder.start(false);
    auto plan = makePlan({"first", "second", "third"});
    ExecutionScheduler scheduler(executor, recorder, 1, false,
                                 CancelPolicy::FINISH);
    scheduler.run(plan, neverStop);
    RunSummary summary = recorder.finish();

    runner.assertEquals(1, executor.peakRunning.load(), "Never overlapping");
    runner.assertEquals(std::string("public.first"), executor.executed[0],
                        "first");
    runner.assertEquals(std::string("public.second"), executor.executed[1],
                        "second");
    runner.assertEquals(std::string("public.third"), executor.executed[2],
                        "third");
    runner.assertEquals(3, static_cast<int>(summary.succeeded), "All ok");
    runner.assertGreaterOrEqual(static_cast<int>(summary.totalOperationMs()),
                                static_cast<int>(summary.elapsedMs),
                                "Elapsed covers the operations");
    runner.assertLessOrEqual(
        static_cast<int>(summary.totalOperationMs()) + 200,
        static_cast<int>(summary.elapsedMs),
        "Elapsed is close to the sum of durations");
  });

  runner.runTest("Randomized runs respect the worker bound and table tokens",
                 [&]() {
                   std::mt19937 rng(7);
                   for (int round = 0; round < 20; ++round) {
                     size_t workers = 1 + rng() % 6;
                     std::vector<std::string> tables;
                     size_t count = 5 + rng() % 20;
                     for (size_t i = 0; i < count; ++i) {
                       // Few distinct names so the same table repeats.
                       tables.push_back("t" + std::to_string(rng() % 4));
                     }
                     MockMaintenanceExecutor executor;
                     executor.minDelayMs = 1;
                     executor.maxDelayMs = 8;
                     OutcomeRecorder recorder;
                     recorder.start(false);
                     auto plan = makePlan(tables);
                     ExecutionScheduler scheduler(executor, recorder, workers,
                                                  false, CancelPolicy::FINISH);
                     scheduler.run(plan, neverStop);

                     runner.assertFalse(executor.sameTableOverlap.load(),
                                        "Same table never concurrent");
                     runner.assertLessOrEqual(static_cast<int>(workers),
                                              executor.peakRunning.load(),
                                              "At most N running");
                     runner.assertLessOrEqual(
                         static_cast<int>(workers),
                         static_cast<int>(scheduler.peakRunning()),
                         "Scheduler peak within bound");
                     runner.assertEquals(
                         static_cast<int>(count),
                         countState(plan, OperationState::Succeeded),
                         "Every operation ran");
                     runner.assertEquals(
                         static_cast<int>(count),
                         static_cast<int>(recorder.recordedCount()),
                         "Every operation recorded");
                   }
                 });

  runner.runTest("Workers run in parallel when allowed", [&]() {
    MockMaintenanceExecutor executor;
    executor.minDelayMs = 50;
    OutcomeRecorder recorder;
    recorder.start(false);
    auto plan = makePlan({"a", "b", "c", "d"});
    ExecutionScheduler scheduler(executor, recorder, 4, false,
                                 CancelPolicy::FINISH);
    scheduler.run(plan, neverStop);
    runner.assertGreaterOrEqual(2, executor.peakRunning.load(),
                                "More than one statement at once");
  });

  runner.runTest("A busy table does not idle the worker that popped it",
                 [&]() {
                   MockMaintenanceExecutor executor;
                   executor.minDelayMs = 200;
                   OutcomeRecorder recorder;
                   recorder.start(false);
                   auto plan = makePlan({"a", "a", "b", "b"});
                   plan[1] = Operation(makeCandidate("public", "a", 100, 50),
                                       OperationKind::Analyze,
                                       {"Stale", "test", 8.0}, 2);
                   plan[1].setRank(2);
                   plan[3] = Operation(makeCandidate("public", "b", 100, 50),
                                       OperationKind::Analyze,
                                       {"Stale", "test", 8.0}, 2);
                   plan[3].setRank(4);
                   ExecutionScheduler scheduler(executor, recorder, 2, false,
                                                CancelPolicy::FINISH);

                   auto start = std::chrono::steady_clock::now();
                   scheduler.run(plan, neverStop);
                   auto elapsed =
                       std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - start)
                           .count();

                   runner.assertEquals(
                       4, countState(plan, OperationState::Succeeded),
                       "All four ran");
                   runner.assertLessOrEqual(550, static_cast<int>(elapsed),
                                            "Two rounds of 200ms, not three");
                   runner.assertFalse(executor.sameTableOverlap.load(),
                                      "No table ran twice at once");
                   std::set<std::string> firstRound(executor.executed.begin(),
                                                    executor.executed.begin() +
                                                        2);
                   runner.assertTrue(firstRound.count("public.a") == 1 &&
                                         firstRound.count("public.b") == 1,
                                     "Both tables started first");
                   for (const std::string table : {"public.a", "public.b"}) {
                     int vacuumAt = -1, analyzeAt = -1;
                     for (size_t i = 0; i < executor.executed.size(); ++i) {
                       if (executor.executed[i] != table)
                         continue;
                       if (executor.executedKinds[i] == OperationKind::Vacuum)
                         vacuumAt = static_cast<int>(i);
                       else
                         analyzeAt = static_cast<int>(i);
                     }
                     runner.assertTrue(vacuumAt >= 0 && vacuumAt < analyzeAt,
                                       table + " keeps plan order");
                   }
                 });

  runner.runTest("A failure does not stop the rest", [&]() {
    MockMaintenanceExecutor executor;
    executor.failTables = {"public.broken"};
    OutcomeRecorder recorder;
    recorder.start(false);
    auto plan = makePlan({"ok1", "broken", "ok2", "ok3"});
    ExecutionScheduler scheduler(executor, recorder, 1, false,
                                 CancelPolicy::FINISH);
    scheduler.run(plan, neverStop);
    RunSummary summary = recorder.finish();

    runner.assertEquals(4, static_cast<int>(executor.executedCount()),
                        "All dispatched");
    runner.assertEquals(3, static_cast<int>(summary.succeeded), "Three ok");
    runner.assertEquals(1, static_cast<int>(summary.failed), "One failed");
    runner.assertTrue(plan[1].state() == OperationState::Failed,
                      "Broken table failed");
    runner.assertTrue(plan[1].errorText().find("does not exist") !=
                          std::string::npos,
                      "Error text kept");
    runner.assertEquals(1, summary.exitStatus(), "Non-zero exit status");
  });

  runner.runTest("Stop before dispatch skips everything", [&]() {
    MockMaintenanceExecutor executor;
    OutcomeRecorder recorder;
    recorder.start(false);
    auto plan = makePlan({"a", "b", "c"});
    ExecutionScheduler scheduler(executor, recorder, 2, false,
                                 CancelPolicy::FINISH);
    scheduler.run(plan, [] { return true; });
    runner.assertEquals(0, static_cast<int>(executor.executedCount()),
                        "Nothing executed");
    runner.assertEquals(3, countState(plan, OperationState::Skipped),
                        "All skipped");
    runner.assertEquals(std::string("cancelled before dispatch"),
                        plan[0].note(), "Cancellation note");
    runner.assertTrue(scheduler.stopped(), "Scheduler reports the stop");
  });

  runner.runTest("Stop mid-run lets in-flight work finish", [&]() {
    MockMaintenanceExecutor executor;
    executor.minDelayMs = 40;
    OutcomeRecorder recorder;
    recorder.start(false);
    auto plan = makePlan({"a", "b", "c", "d", "e", "f"});
    ExecutionScheduler scheduler(executor, recorder, 1, false,
                                 CancelPolicy::FINISH);
    scheduler.run(plan, [&executor] { return executor.executedCount() >= 1; });
    RunSummary summary = recorder.finish();

    int succeeded = countState(plan, OperationState::Succeeded);
    int skipped = countState(plan, OperationState::Skipped);
    runner.assertGreaterOrEqual(1, succeeded, "Running statement finished");
    runner.assertGreaterOrEqual(1, skipped, "Later operations skipped");
    runner.assertEquals(6, succeeded + skipped, "Every operation terminal");
    runner.assertEquals(0, static_cast<int>(summary.failed), "No failures");
    runner.assertFalse(executor.cancelCalled.load(),
                       "finish policy does not cancel statements");
  });

  runner.runTest("Abort policy cancels running statements", [&]() {
    MockMaintenanceExecutor executor;
    executor.blockUntilCancelled = true;
    OutcomeRecorder recorder;
    recorder.start(false);
    auto plan = makePlan({"a", "b", "c"});
    ExecutionScheduler scheduler(executor, recorder, 1, false,
                                 CancelPolicy::ABORT);
    scheduler.run(plan, [&executor] { return executor.executedCount() >= 1; });

    runner.assertTrue(executor.cancelCalled.load(), "Executor cancelled");
    runner.assertEquals(1, countState(plan, OperationState::Failed),
                        "Cancelled statement failed");
    runner.assertEquals(2, countState(plan, OperationState::Skipped),
                        "Rest never dispatched");
  });

  runner.runTest("Non-pending operations are left alone", [&]() {
    MockMaintenanceExecutor executor;
    OutcomeRecorder recorder;
    recorder.start(false);
    auto plan = makePlan({"a", "b"});
    plan[0].markSkipped("skipped: large table");
    ExecutionScheduler scheduler(executor, recorder, 2, false,
                                 CancelPolicy::FINISH);
    scheduler.run(plan, neverStop);
    runner.assertEquals(1, static_cast<int>(executor.executedCount()),
                        "Only the pending one ran");
    runner.assertEquals(std::string("skipped: large table"), plan[0].note(),
                        "Note untouched");
  });

  runner.printSummary();
  return 0;
}
