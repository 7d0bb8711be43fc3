#ifndef OUTCOME_RECORDER_H
#define OUTCOME_RECORDER_H

#include "maintenance/operation.h"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

struct OutcomeRecord {
  size_t rank = 0;
  std::string target;
  OperationKind kind = OperationKind::Analyze;
  int tier = 0;
  std::string reason;
  OperationState state = OperationState::Pending;
  int64_t durationMs = 0;
  std::string errorText;
  std::string note;
};

// Settings the run was made with, repeated at the top of the report.
struct RunContext {
  std::string mode;
  std::string database;
  size_t parallelJobs = 1;
  double deadTupleThresholdPct = 0.0;
  double staleDays = 0.0;
  double churnThresholdPct = 0.0;
  double bloatThresholdPct = 0.0;
  bool skipLarge = false;
  int64_t largeTableSizeBytes = 0;
};

struct RunSummary {
  RunContext context;
  bool dryRun = false;
  std::string startedAt;
  int64_t elapsedMs = 0;
  size_t succeeded = 0;
  size_t failed = 0;
  size_t skipped = 0;
  size_t dryRunReported = 0;
  std::vector<OutcomeRecord> records;

  size_t total() const { return records.size(); }
  int64_t totalOperationMs() const;

  // 1 when any operation failed, 0 otherwise.
  int exitStatus() const { return failed > 0 ? 1 : 0; }
};

// Collects terminal operations from any worker thread and turns them into the
// run summary. A failed operation is data here, never an exception.
class OutcomeRecorder {
public:
  void start(bool dryRun, RunContext context = RunContext());
  void record(const Operation &op);
  RunSummary finish();

  size_t recordedCount();

private:
  std::mutex mutex_;
  bool dryRun_ = false;
  RunContext context_;
  std::chrono::steady_clock::time_point startTime_ =
      std::chrono::steady_clock::now();
  std::string startedAt_;
  std::vector<OutcomeRecord> records_;
};

#endif
