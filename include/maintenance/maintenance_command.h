#ifndef MAINTENANCE_COMMAND_H
#define MAINTENANCE_COMMAND_H

#include "core/maintenance_config.h"
#include "maintenance/execution_scheduler.h"
#include "maintenance/maintenance_executor.h"
#include "maintenance/safety_filter.h"
#include "maintenance/statistics_source.h"
#include <ostream>

constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_OPERATION_FAILED = 1;
constexpr int EXIT_PLAN_ERROR = 2;
constexpr int EXIT_CONFIG_ERROR = 3;
constexpr int EXIT_REPORT_ERROR = 4;
constexpr int EXIT_SCHEDULE_ERROR = 1;

// Runs one maintenance invocation and maps its outcome to a process exit
// code. The text report goes to reportOut, error lines to errorOut, and the
// file report to config.outputFile when one is set. Nothing escapes as an
// exception: anything that fails before a plan exists is EXIT_PLAN_ERROR.
int runMaintenanceCommand(const MaintenanceConfig &config,
                          IStatisticsSource &source,
                          IMaintenanceExecutor &executor,
                          IConfirmationPrompt *prompt,
                          const ExecutionScheduler::StopPredicate &shouldStop,
                          std::ostream &reportOut, std::ostream &errorOut);

#endif
