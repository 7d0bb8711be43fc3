#ifndef EXECUTION_SCHEDULER_H
#define EXECUTION_SCHEDULER_H

#include "core/maintenance_config.h"
#include "maintenance/maintenance_executor.h"
#include "maintenance/operation.h"
#include "maintenance/outcome_recorder.h"
#include "maintenance/table_lock_registry.h"
#include "utils/thread_safe_queue.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

// Bounded worker pool over a ranked plan. Workers take operations in plan
// order and never run two operations on the same table at once; an operation
// whose table is busy waits behind the worker holding it while the popping
// worker moves on. One run per instance.
class ExecutionScheduler {
public:
  using StopPredicate = std::function<bool()>;

  static constexpr const char *CANCELLED_NOTE = "cancelled before dispatch";

  ExecutionScheduler(IMaintenanceExecutor &executor, OutcomeRecorder &recorder,
                     size_t workers, bool dryRun, CancelPolicy cancelPolicy);

  ExecutionScheduler(const ExecutionScheduler &) = delete;
  ExecutionScheduler &operator=(const ExecutionScheduler &) = delete;

  // Runs every Pending operation of plan in order and records each one.
  // Returns once all of them reached a terminal state.
  void run(std::vector<Operation> &plan, const StopPredicate &shouldStop);

  size_t peakRunning() const { return peakRunning_.load(); }
  bool stopped() const { return stopRequested_.load(); }

private:
  void runDry(std::vector<Operation> &plan);
  void workerThread(size_t workerId, std::vector<Operation> &plan);
  void executeOne(size_t workerId, Operation &op, size_t total);
  void cancelQueued(std::vector<Operation> &plan);
  void skipCancelled(Operation &op);
  void notifyFinished();

  IMaintenanceExecutor &executor_;
  OutcomeRecorder &recorder_;
  size_t workers_;
  bool dryRun_;
  CancelPolicy cancelPolicy_;

  ThreadSafeQueue<size_t> queue_;
  TableLockRegistry locks_;
  std::atomic<bool> stopRequested_{false};
  std::atomic<size_t> running_{0};
  std::atomic<size_t> peakRunning_{0};
  std::atomic<size_t> finished_{0};
  std::mutex finishedMutex_;
  std::condition_variable finishedCv_;
};

#endif
