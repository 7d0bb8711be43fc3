#include "core/logger.h"
#include "maintenance/maintenance_command.h"
#include "maintenance_mocks.h"
#include "test_runner.h"
#include <cstdio>
#include <fstream>
#include <sstream>

namespace {
MockStatisticsSource vacuumSource() {
  MockStatisticsSource source;
  source.rows = {MockStatisticsSource::row("public", "orders", 600, 400),
                 MockStatisticsSource::row("public", "events", 750, 250)};
  return source;
}

MaintenanceConfig vacuumConfig() {
  MaintenanceConfig config;
  config.mode = OperationMode::VACUUM;
  config.parallelJobs = 2;
  return config;
}

const ExecutionScheduler::StopPredicate neverStop = [] { return false; };
} // namespace

int main() {
  TestRunner runner;
  Logger::initialize(LogLevel::WARNING);

  std::cout << "\n========================================" << std::endl;
  std::cout << "MAINTENANCE COMMAND EXIT CODES - TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Clean run exits 0 and prints the report", [&]() {
    MockStatisticsSource source = vacuumSource();
    MockMaintenanceExecutor executor;
    std::ostringstream out, err;
    int code = runMaintenanceCommand(vacuumConfig(), source, executor, nullptr,
                                     neverStop, out, err);
    runner.assertEquals(EXIT_SUCCESS_CODE, code, "Exit 0");
    runner.assertTrue(out.str().find("public.orders") != std::string::npos,
                      "Report printed");
    runner.assertTrue(err.str().empty(), "No errors");
  });

  runner.runTest("Failed operation exits 1", [&]() {
    MockStatisticsSource source = vacuumSource();
    MockMaintenanceExecutor executor;
    executor.failTables = {"public.events"};
    std::ostringstream out, err;
    int code = runMaintenanceCommand(vacuumConfig(), source, executor, nullptr,
                                     neverStop, out, err);
    runner.assertEquals(EXIT_OPERATION_FAILED, code, "Exit 1");
  });

  runner.runTest("Connectivity and collection failures exit 2", [&]() {
    MockMaintenanceExecutor executor;
    std::ostringstream out, err;

    MockStatisticsSource unreachable;
    unreachable.failConnect = true;
    runner.assertEquals(EXIT_PLAN_ERROR,
                        runMaintenanceCommand(vacuumConfig(), unreachable,
                                              executor, nullptr, neverStop,
                                              out, err),
                        "Connection refused");

    MockStatisticsSource denied;
    denied.failQuery = true;
    runner.assertEquals(EXIT_PLAN_ERROR,
                        runMaintenanceCommand(vacuumConfig(), denied, executor,
                                              nullptr, neverStop, out, err),
                        "Query denied");
    runner.assertTrue(out.str().empty(), "No report without a plan");
  });

  runner.runTest("Unexpected exception exits 2 instead of escaping", [&]() {
    MockStatisticsSource source = vacuumSource();
    source.failUnexpected = true;
    MockMaintenanceExecutor executor;
    std::ostringstream out, err;
    int code = -1;
    try {
      code = runMaintenanceCommand(vacuumConfig(), source, executor, nullptr,
                                   neverStop, out, err);
    } catch (const std::exception &e) {
      runner.assertTrue(false, "Escaped: " + std::string(e.what()));
    }
    runner.assertEquals(EXIT_PLAN_ERROR, code, "Exit 2");
    runner.assertTrue(err.str().find("out of memory") != std::string::npos,
                      "Error reported");
    runner.assertEquals(0, static_cast<int>(executor.executedCount()),
                        "Nothing executed");
  });

  runner.runTest("Unwritable report file exits 4", [&]() {
    MockStatisticsSource source = vacuumSource();
    MockMaintenanceExecutor executor;
    MaintenanceConfig config = vacuumConfig();
    config.outputFile = "/nonexistent-dir/report.json";
    std::ostringstream out, err;
    int code = runMaintenanceCommand(config, source, executor, nullptr,
                                     neverStop, out, err);
    runner.assertEquals(EXIT_REPORT_ERROR, code, "Exit 4");
    runner.assertTrue(err.str().find("Report error") != std::string::npos,
                      "Report error printed");
  });

  runner.runTest("Operation failure outranks the report error", [&]() {
    MockStatisticsSource source = vacuumSource();
    MockMaintenanceExecutor executor;
    executor.failTables = {"public.orders"};
    MaintenanceConfig config = vacuumConfig();
    config.outputFile = "/nonexistent-dir/report.json";
    std::ostringstream out, err;
    int code = runMaintenanceCommand(config, source, executor, nullptr,
                                     neverStop, out, err);
    runner.assertEquals(EXIT_OPERATION_FAILED, code, "Exit 1");
  });

  runner.runTest("Report file is written on success", [&]() {
    MockStatisticsSource source = vacuumSource();
    MockMaintenanceExecutor executor;
    MaintenanceConfig config = vacuumConfig();
    config.outputFile = "pgmaint_command_report.json";
    std::ostringstream out, err;
    int code = runMaintenanceCommand(config, source, executor, nullptr,
                                     neverStop, out, err);
    runner.assertEquals(EXIT_SUCCESS_CODE, code, "Exit 0");
    std::ifstream written(config.outputFile);
    runner.assertTrue(written.good(), "File exists");
    written.close();
    std::remove(config.outputFile.c_str());
  });

  runner.printSummary();
  return 0;
}
