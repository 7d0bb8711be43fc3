#include "maintenance/maintenance_runner.h"
#include "core/logger.h"
#include "maintenance/candidate_collector.h"
#include "maintenance/plan_builder.h"
#include "maintenance/threshold_evaluator.h"

MaintenanceRunner::MaintenanceRunner(const MaintenanceConfig &config,
                                     IStatisticsSource &source,
                                     IMaintenanceExecutor &executor,
                                     IConfirmationPrompt *prompt)
    : config_(config), source_(source), executor_(executor), prompt_(prompt) {}

RunSummary
MaintenanceRunner::run(const ExecutionScheduler::StopPredicate &shouldStop,
                       TimePoint now) {
  Logger::info(LogCategory::MAINTENANCE, "MaintenanceRunner",
               "Starting " + operationModeToString(config_.mode) +
                   " run on " + config_.database.connectionStringForLogging() +
                   (config_.dryRun ? " (dry run)" : ""));

  OutcomeRecorder recorder;
  recorder.start(config_.dryRun, describe(config_));

  CandidateCollector collector(source_, config_.scope,
                               config_.allowPartialCollection);
  std::vector<Candidate> candidates = collector.collect();

  ThresholdEvaluator evaluator(config_.thresholds);
  PlanBuilder builder(evaluator, config_.mode);
  std::vector<Operation> proposed = builder.build(candidates, now);

  SafetyFilter filter(config_.safety, config_.dryRun, prompt_);
  SafetyResult filtered = filter.apply(std::move(proposed));

  for (auto &op : filtered.skipped) {
    op.setRank(0);
    recorder.record(op);
  }

  std::vector<Operation> plan = std::move(filtered.plan);
  PlanBuilder::assignRanks(plan);

  ExecutionScheduler scheduler(executor_, recorder, config_.parallelJobs,
                               config_.dryRun, config_.cancelPolicy);
  scheduler.run(plan, shouldStop);

  return recorder.finish();
}

RunContext MaintenanceRunner::describe(const MaintenanceConfig &config) {
  RunContext context;
  context.mode = operationModeToString(config.mode);
  context.database = config.database.displayName();
  context.parallelJobs = config.parallelJobs;
  context.deadTupleThresholdPct = config.thresholds.deadTupleRatio * 100.0;
  context.staleDays = config.thresholds.staleDays;
  context.churnThresholdPct = config.thresholds.modificationRatio * 100.0;
  context.bloatThresholdPct = config.thresholds.reindexBloatRatio * 100.0;
  context.skipLarge = config.safety.skipLarge;
  context.largeTableSizeBytes = config.safety.largeTableSizeBytes;
  return context;
}
