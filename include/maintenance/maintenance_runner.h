#ifndef MAINTENANCE_RUNNER_H
#define MAINTENANCE_RUNNER_H

#include "core/maintenance_config.h"
#include "maintenance/execution_scheduler.h"
#include "maintenance/maintenance_executor.h"
#include "maintenance/outcome_recorder.h"
#include "maintenance/safety_filter.h"
#include "maintenance/statistics_source.h"
#include <functional>

// One invocation: collect, evaluate and rank, filter, execute, summarize.
// ConnectivityError and CollectionError from the collection step propagate
// since no plan exists yet; everything after that ends up in the summary.
class MaintenanceRunner {
public:
  MaintenanceRunner(const MaintenanceConfig &config, IStatisticsSource &source,
                    IMaintenanceExecutor &executor,
                    IConfirmationPrompt *prompt);

  RunSummary run(const ExecutionScheduler::StopPredicate &shouldStop,
                 TimePoint now = std::chrono::system_clock::now());

  static RunContext describe(const MaintenanceConfig &config);

private:
  const MaintenanceConfig &config_;
  IStatisticsSource &source_;
  IMaintenanceExecutor &executor_;
  IConfirmationPrompt *prompt_;
};

#endif
