#include "maintenance/operation.h"
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string operationKindToString(OperationKind kind) {
  switch (kind) {
  case OperationKind::Analyze:
    return "ANALYZE";
  case OperationKind::Vacuum:
    return "VACUUM";
  case OperationKind::VacuumFull:
    return "VACUUM FULL";
  case OperationKind::Reindex:
    return "REINDEX";
  }
  return "UNKNOWN";
}

std::string operationStateToString(OperationState state) {
  switch (state) {
  case OperationState::Pending:
    return "PENDING";
  case OperationState::Skipped:
    return "SKIPPED";
  case OperationState::DryRunReported:
    return "DRY_RUN";
  case OperationState::Running:
    return "RUNNING";
  case OperationState::Succeeded:
    return "SUCCEEDED";
  case OperationState::Failed:
    return "FAILED";
  }
  return "UNKNOWN";
}

bool isDestructive(OperationKind kind) {
  return kind == OperationKind::VacuumFull || kind == OperationKind::Reindex;
}

std::string TriggerReason::toString() const {
  std::ostringstream oss;
  oss << label << ": " << text << " (" << std::fixed << std::setprecision(2)
      << metric << ")";
  return oss.str();
}

Operation::Operation(Candidate target, OperationKind kind,
                     TriggerReason reason, int tier)
    : target_(std::move(target)), kind_(kind), reason_(std::move(reason)),
      tier_(tier) {}

bool Operation::isValidTransition(OperationState from, OperationState to) {
  switch (from) {
  case OperationState::Pending:
    return to == OperationState::Skipped ||
           to == OperationState::DryRunReported ||
           to == OperationState::Running;
  case OperationState::Running:
    return to == OperationState::Succeeded || to == OperationState::Failed;
  default:
    return false;
  }
}

bool Operation::isTerminal() const {
  return state_ != OperationState::Pending && state_ != OperationState::Running;
}

void Operation::transitionTo(OperationState next) {
  if (!isValidTransition(state_, next)) {
    throw std::logic_error("Illegal state transition for " +
                           target_.qualifiedName() + " (" +
                           operationKindToString(kind_) + "): " +
                           operationStateToString(state_) + " -> " +
                           operationStateToString(next));
  }
  state_ = next;
}

void Operation::markSkipped(const std::string &note) {
  transitionTo(OperationState::Skipped);
  note_ = note;
}

void Operation::markDryRun() { transitionTo(OperationState::DryRunReported); }

void Operation::markRunning() { transitionTo(OperationState::Running); }

void Operation::markSucceeded(int64_t durationMs) {
  transitionTo(OperationState::Succeeded);
  durationMs_ = durationMs;
}

void Operation::markFailed(int64_t durationMs, const std::string &error) {
  transitionTo(OperationState::Failed);
  durationMs_ = durationMs;
  errorText_ = error;
}
