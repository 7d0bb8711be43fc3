#ifndef OPERATION_H
#define OPERATION_H

#include "maintenance/candidate.h"
#include <cstdint>
#include <string>

enum class OperationKind { Analyze, Vacuum, VacuumFull, Reindex };

enum class OperationState {
  Pending,
  Skipped,
  DryRunReported,
  Running,
  Succeeded,
  Failed
};

std::string operationKindToString(OperationKind kind);
std::string operationStateToString(OperationState state);

// VacuumFull and Reindex take exclusive locks and need confirmation.
bool isDestructive(OperationKind kind);

struct TriggerReason {
  std::string label;
  std::string text;
  double metric = 0.0;

  std::string toString() const;
};

// One planned unit of work. The kind is fixed at construction; only the state
// moves, and only along
//   Pending -> Skipped | DryRunReported | Running -> Succeeded | Failed.
class Operation {
public:
  Operation(Candidate target, OperationKind kind, TriggerReason reason,
            int tier);

  const Candidate &target() const { return target_; }
  OperationKind kind() const { return kind_; }
  const TriggerReason &reason() const { return reason_; }
  int tier() const { return tier_; }

  size_t rank() const { return rank_; }
  void setRank(size_t rank) { rank_ = rank; }

  OperationState state() const { return state_; }
  int64_t durationMs() const { return durationMs_; }
  const std::string &errorText() const { return errorText_; }
  const std::string &note() const { return note_; }
  void setNote(const std::string &note) { note_ = note; }

  bool isTerminal() const;

  // Throws std::logic_error on a transition the state machine forbids.
  void transitionTo(OperationState next);

  void markSkipped(const std::string &note);
  void markDryRun();
  void markRunning();
  void markSucceeded(int64_t durationMs);
  void markFailed(int64_t durationMs, const std::string &error);

  static bool isValidTransition(OperationState from, OperationState to);

private:
  Candidate target_;
  OperationKind kind_;
  TriggerReason reason_;
  int tier_;
  size_t rank_ = 0;
  OperationState state_ = OperationState::Pending;
  int64_t durationMs_ = 0;
  std::string errorText_;
  std::string note_;
};

#endif
