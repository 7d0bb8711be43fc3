#include "maintenance/maintenance_command.h"
#include "core/errors.h"
#include "core/logger.h"
#include "maintenance/maintenance_runner.h"
#include "maintenance/report_writer.h"

int runMaintenanceCommand(const MaintenanceConfig &config,
                          IStatisticsSource &source,
                          IMaintenanceExecutor &executor,
                          IConfirmationPrompt *prompt,
                          const ExecutionScheduler::StopPredicate &shouldStop,
                          std::ostream &reportOut, std::ostream &errorOut) {
  MaintenanceRunner runner(config, source, executor, prompt);

  RunSummary summary;
  try {
    summary = runner.run(shouldStop);
  } catch (const ConnectivityError &e) {
    Logger::critical(LogCategory::DATABASE, "runMaintenanceCommand", e.what());
    errorOut << "Connection error: " << e.what() << std::endl;
    return EXIT_PLAN_ERROR;
  } catch (const CollectionError &e) {
    Logger::critical(LogCategory::DATABASE, "runMaintenanceCommand", e.what());
    errorOut << "Statistics collection error: " << e.what() << std::endl;
    return EXIT_PLAN_ERROR;
  } catch (const std::exception &e) {
    Logger::critical(LogCategory::SYSTEM, "runMaintenanceCommand",
                     "Unexpected error before execution: " +
                         std::string(e.what()));
    errorOut << "Error: " << e.what() << std::endl;
    return EXIT_PLAN_ERROR;
  }

  ReportWriter::writeText(summary, reportOut);

  int code = summary.exitStatus() != 0 ? EXIT_OPERATION_FAILED
                                       : EXIT_SUCCESS_CODE;
  if (!config.outputFile.empty()) {
    try {
      ReportWriter::writeToFile(summary, config.outputFile);
    } catch (const std::exception &e) {
      Logger::error(LogCategory::REPORT, "runMaintenanceCommand", e.what());
      errorOut << "Report error: " << e.what() << std::endl;
      if (code == EXIT_SUCCESS_CODE)
        code = EXIT_REPORT_ERROR;
    }
  }

  Logger::info(LogCategory::SYSTEM, "runMaintenanceCommand",
               "pgmaint finished with exit code " + std::to_string(code));
  return code;
}
