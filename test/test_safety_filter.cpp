#include "core/logger.h"
#include "maintenance/safety_filter.h"
#include "maintenance_mocks.h"
#include "test_runner.h"
#include <sstream>

namespace {
Operation makeOp(const std::string &table, OperationKind kind,
                 int64_t sizeBytes) {
  Candidate c = makeCandidate("public", table, 100, 90);
  c.sizeBytes = sizeBytes;
  return Operation(c, kind, {"Urgent", "test", 90.0}, 1);
}

constexpr int64_t GB = int64_t{1} << 30;
} // namespace

int main() {
  TestRunner runner;
  Logger::initialize(LogLevel::WARNING);

  std::cout << "\n========================================" << std::endl;
  std::cout << "SAFETY FILTER - TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Large table removed when skip_large is set", [&]() {
    SafetyPolicy policy;
    policy.skipLarge = true;
    policy.largeTableSizeBytes = 10 * GB;
    SafetyFilter filter(policy, false, nullptr);

    std::vector<Operation> ops;
    ops.push_back(makeOp("huge", OperationKind::Vacuum, 12 * GB));
    ops.push_back(makeOp("small", OperationKind::Vacuum, GB));
    auto result = filter.apply(std::move(ops));

    runner.assertEquals(1, static_cast<int>(result.plan.size()), "One kept");
    runner.assertEquals(std::string("small"), result.plan[0].target().table,
                        "Small table kept");
    runner.assertEquals(1, static_cast<int>(result.skipped.size()),
                        "One skipped");
    runner.assertTrue(result.skipped[0].state() == OperationState::Skipped,
                      "Skipped state");
    runner.assertEquals(std::string("skipped: large table"),
                        result.skipped[0].note(), "Skip reason recorded");
  });

  runner.runTest("Threshold is inclusive", [&]() {
    SafetyPolicy policy;
    policy.skipLarge = true;
    policy.largeTableSizeBytes = 10 * GB;
    SafetyFilter filter(policy, false, nullptr);
    std::vector<Operation> ops;
    ops.push_back(makeOp("exact", OperationKind::Analyze, 10 * GB));
    auto result = filter.apply(std::move(ops));
    runner.assertTrue(result.plan.empty(), "Exactly 10GB is large");
  });

  runner.runTest("Large tables kept when skip_large is off", [&]() {
    SafetyFilter filter(SafetyPolicy{}, false, nullptr);
    std::vector<Operation> ops;
    ops.push_back(makeOp("huge", OperationKind::Vacuum, 100 * GB));
    auto result = filter.apply(std::move(ops));
    runner.assertEquals(1, static_cast<int>(result.plan.size()), "Kept");
  });

  runner.runTest("VacuumFull without confirmation is skipped", [&]() {
    SafetyFilter filter(SafetyPolicy{}, false, nullptr);
    std::vector<Operation> ops;
    ops.push_back(makeOp("ledger", OperationKind::VacuumFull, GB));
    auto result = filter.apply(std::move(ops));
    runner.assertTrue(result.plan.empty(), "Nothing runs");
    runner.assertEquals(1, static_cast<int>(result.skipped.size()),
                        "Skipped");
    runner.assertTrue(result.skipped[0].kind() == OperationKind::VacuumFull,
                      "Never downgraded to plain vacuum");
    runner.assertEquals(std::string("requires confirmation"),
                        result.skipped[0].note(), "Reason recorded");
  });

  runner.runTest("Declined prompt skips destructive operations only", [&]() {
    MockConfirmationPrompt prompt;
    prompt.answer = false;
    SafetyFilter filter(SafetyPolicy{}, false, &prompt);
    std::vector<Operation> ops;
    ops.push_back(makeOp("a", OperationKind::Reindex, GB));
    ops.push_back(makeOp("b", OperationKind::Vacuum, GB));
    ops.push_back(makeOp("c", OperationKind::VacuumFull, GB));
    auto result = filter.apply(std::move(ops));
    runner.assertEquals(1, prompt.asked, "Asked exactly once");
    runner.assertTrue(filter.promptShown(), "Filter knows it asked");
    runner.assertEquals(1, static_cast<int>(result.plan.size()),
                        "Vacuum kept");
    runner.assertEquals(2, static_cast<int>(result.skipped.size()),
                        "Two skipped");
  });

  runner.runTest("Accepted prompt keeps everything in order", [&]() {
    MockConfirmationPrompt prompt;
    prompt.answer = true;
    SafetyFilter filter(SafetyPolicy{}, false, &prompt);
    std::vector<Operation> ops;
    ops.push_back(makeOp("a", OperationKind::Reindex, GB));
    ops.push_back(makeOp("b", OperationKind::Vacuum, GB));
    ops.push_back(makeOp("c", OperationKind::VacuumFull, GB));
    auto result = filter.apply(std::move(ops));
    runner.assertEquals(3, static_cast<int>(result.plan.size()), "All kept");
    runner.assertEquals(std::string("a"), result.plan[0].target().table, "a");
    runner.assertEquals(std::string("b"), result.plan[1].target().table, "b");
    runner.assertEquals(std::string("c"), result.plan[2].target().table, "c");
  });

  runner.runTest("confirm_destructive never prompts", [&]() {
    MockConfirmationPrompt prompt;
    SafetyPolicy policy;
    policy.confirmDestructive = true;
    SafetyFilter filter(policy, false, &prompt);
    std::vector<Operation> ops;
    ops.push_back(makeOp("a", OperationKind::VacuumFull, GB));
    auto result = filter.apply(std::move(ops));
    runner.assertEquals(0, prompt.asked, "No prompt");
    runner.assertEquals(1, static_cast<int>(result.plan.size()), "Kept");
  });

  runner.runTest("Dry run never prompts and reports the operation", [&]() {
    MockConfirmationPrompt prompt;
    SafetyFilter filter(SafetyPolicy{}, true, &prompt);
    std::vector<Operation> ops;
    ops.push_back(makeOp("a", OperationKind::VacuumFull, GB));
    auto result = filter.apply(std::move(ops));
    runner.assertEquals(0, prompt.asked, "No prompt in dry run");
    runner.assertEquals(1, static_cast<int>(result.plan.size()),
                        "Still listed");
    runner.assertEquals(std::string("requires confirmation"),
                        result.plan[0].note(), "Flagged in the note");
    runner.assertTrue(result.plan[0].state() == OperationState::Pending,
                      "Still pending");
  });

  runner.runTest("No prompt when there is nothing destructive", [&]() {
    MockConfirmationPrompt prompt;
    SafetyFilter filter(SafetyPolicy{}, false, &prompt);
    std::vector<Operation> ops;
    ops.push_back(makeOp("a", OperationKind::Analyze, GB));
    filter.apply(std::move(ops));
    runner.assertEquals(0, prompt.asked, "Not asked");
    runner.assertFalse(filter.promptShown(), "Filter did not ask");
  });

  runner.runTest("Stream prompt accepts only an exact yes", [&]() {
    std::ostringstream out;
    std::istringstream yes("yes\n");
    std::istringstream y("y\n");
    std::istringstream padded("  yes \n");
    std::istringstream eof("");
    runner.assertTrue(StreamConfirmationPrompt(yes, out).confirm("Go?"),
                      "yes accepted");
    runner.assertFalse(StreamConfirmationPrompt(y, out).confirm("Go?"),
                       "y rejected");
    runner.assertTrue(StreamConfirmationPrompt(padded, out).confirm("Go?"),
                      "Surrounding whitespace ignored");
    runner.assertFalse(StreamConfirmationPrompt(eof, out).confirm("Go?"),
                       "EOF rejected");
    runner.assertTrue(out.str().find("(yes/no)") != std::string::npos,
                      "Question shows the choices");
  });

  runner.printSummary();
  return 0;
}
