#include "maintenance/outcome_recorder.h"
#include "core/logger.h"
#include "utils/time_utils.h"
#include <algorithm>
#include <stdexcept>

int64_t RunSummary::totalOperationMs() const {
  int64_t sum = 0;
  for (const auto &record : records)
    sum += record.durationMs;
  return sum;
}

void OutcomeRecorder::start(bool dryRun, RunContext context) {
  std::lock_guard<std::mutex> lock(mutex_);
  dryRun_ = dryRun;
  context_ = std::move(context);
  startTime_ = std::chrono::steady_clock::now();
  startedAt_ = TimeUtils::getCurrentTimestamp();
  records_.clear();
}

void OutcomeRecorder::record(const Operation &op) {
  if (!op.isTerminal()) {
    throw std::logic_error("Cannot record " + op.target().qualifiedName() +
                           " in state " + operationStateToString(op.state()));
  }

  OutcomeRecord record;
  record.rank = op.rank();
  record.target = op.target().qualifiedName();
  record.kind = op.kind();
  record.tier = op.tier();
  record.reason = op.reason().toString();
  record.state = op.state();
  record.durationMs = op.durationMs();
  record.errorText = op.errorText();
  record.note = op.note();

  std::lock_guard<std::mutex> lock(mutex_);
  records_.push_back(std::move(record));
}

size_t OutcomeRecorder::recordedCount() {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

RunSummary OutcomeRecorder::finish() {
  std::lock_guard<std::mutex> lock(mutex_);
  RunSummary summary;
  summary.context = context_;
  summary.dryRun = dryRun_;
  summary.startedAt = startedAt_;
  summary.elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now() - startTime_)
                          .count();
  summary.records = records_;

  // Plan order first, unranked (filtered out) operations last.
  std::stable_sort(summary.records.begin(), summary.records.end(),
                   [](const OutcomeRecord &a, const OutcomeRecord &b) {
                     if ((a.rank == 0) != (b.rank == 0))
                       return b.rank == 0;
                     return a.rank < b.rank;
                   });

  for (const auto &record : summary.records) {
    switch (record.state) {
    case OperationState::Succeeded:
      ++summary.succeeded;
      break;
    case OperationState::Failed:
      ++summary.failed;
      break;
    case OperationState::Skipped:
      ++summary.skipped;
      break;
    case OperationState::DryRunReported:
      ++summary.dryRunReported;
      break;
    default:
      break;
    }
  }

  Logger::info(LogCategory::MAINTENANCE, "OutcomeRecorder",
               "Run finished in " + TimeUtils::formatDurationMs(summary.elapsedMs) +
                   " - Succeeded: " + std::to_string(summary.succeeded) +
                   " | Failed: " + std::to_string(summary.failed) +
                   " | Skipped: " + std::to_string(summary.skipped) +
                   " | Dry run: " + std::to_string(summary.dryRunReported));
  return summary;
}
