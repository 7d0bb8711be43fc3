#ifndef MAINTENANCE_CONFIG_H
#define MAINTENANCE_CONFIG_H

#include "core/database_config.h"
#include "core/logger.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

enum class OperationMode { VACUUM, ANALYZE, AUTO, FULL_VACUUM, REINDEX };

enum class CancelPolicy { FINISH, ABORT };

std::string operationModeToString(OperationMode mode);
bool parseOperationMode(const std::string &text, OperationMode &out);
std::string cancelPolicyToString(CancelPolicy policy);
bool parseCancelPolicy(const std::string &text, CancelPolicy &out);

// Ratios are fractions (0.20 == 20%).
struct ThresholdPolicy {
  double deadTupleRatio = 0.20;
  double staleDays = 7.0;
  double modificationRatio = 0.10;
  int64_t neverAnalyzedMinLiveRows = 1000;
  int64_t staleMinModifications = 1000;
  double reindexBloatRatio = 0.30;
};

struct SafetyPolicy {
  bool skipLarge = false;
  int64_t largeTableSizeBytes = int64_t{10} << 30;
  bool confirmDestructive = false;
};

struct TargetScope {
  std::string schemaPattern;
  std::vector<std::string> tablePatterns;
};

// One crontab line managed by `pgmaint schedule install`.
struct ScheduleEntry {
  std::string cronExpression;
  std::string arguments;
};

std::vector<ScheduleEntry> defaultScheduleEntries();

struct MaintenanceConfig {
  static constexpr size_t DEFAULT_PARALLEL_JOBS = 1;
  static constexpr size_t MIN_PARALLEL_JOBS = 1;
  static constexpr size_t MAX_PARALLEL_JOBS = 64;

  DatabaseConfig database;
  OperationMode mode = OperationMode::ANALYZE;
  TargetScope scope;
  ThresholdPolicy thresholds;
  SafetyPolicy safety;
  size_t parallelJobs = DEFAULT_PARALLEL_JOBS;
  bool dryRun = false;
  CancelPolicy cancelPolicy = CancelPolicy::FINISH;
  bool allowPartialCollection = false;
  int statementTimeoutMs = 0;
  int lockTimeoutMs = 0;
  std::string outputFile;
  LogLevel logLevel = LogLevel::INFO;
  std::string logFile;
  LogRotation logRotation;
  std::vector<ScheduleEntry> scheduleEntries = defaultScheduleEntries();
};

#endif
