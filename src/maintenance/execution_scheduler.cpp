#include "maintenance/execution_scheduler.h"
#include "core/logger.h"
#include "utils/time_utils.h"
#include <algorithm>
#include <chrono>
#include <optional>
#include <thread>

namespace {
constexpr auto STOP_POLL_INTERVAL = std::chrono::milliseconds(50);
}

ExecutionScheduler::ExecutionScheduler(IMaintenanceExecutor &executor,
                                       OutcomeRecorder &recorder,
                                       size_t workers, bool dryRun,
                                       CancelPolicy cancelPolicy)
    : executor_(executor), recorder_(recorder),
      workers_(workers == 0 ? 1 : workers), dryRun_(dryRun),
      cancelPolicy_(cancelPolicy) {}

// Marks every operation as reported without touching the executor.
void ExecutionScheduler::runDry(std::vector<Operation> &plan) {
  for (auto &op : plan) {
    if (op.state() != OperationState::Pending)
      continue;
    op.markDryRun();
    Logger::info(LogCategory::SCHEDULER, "ExecutionScheduler",
                 "[DRY RUN] #" + std::to_string(op.rank()) + " " +
                     operationKindToString(op.kind()) + " " +
                     op.target().qualifiedName() + " - " +
                     op.reason().toString() +
                     (op.note().empty() ? "" : " (" + op.note() + ")"));
    recorder_.record(op);
  }
}

// Pushes the index of every Pending operation in plan order, starts the
// workers and then watches the stop predicate until all operations are done.
// On a stop request the queue is drained so nothing new is dispatched; with
// the abort policy running statements are also cancelled on the server.
void ExecutionScheduler::run(std::vector<Operation> &plan,
                             const StopPredicate &shouldStop) {
  if (dryRun_) {
    runDry(plan);
    return;
  }

  size_t pending = 0;
  for (size_t i = 0; i < plan.size(); ++i) {
    if (plan[i].state() == OperationState::Pending) {
      queue_.push(i);
      ++pending;
    }
  }
  queue_.finish();

  if (pending == 0) {
    Logger::info(LogCategory::SCHEDULER, "ExecutionScheduler",
                 "Nothing to execute");
    return;
  }

  size_t workerCount = std::min(workers_, pending);
  Logger::info(LogCategory::SCHEDULER, "ExecutionScheduler",
               "Executing " + std::to_string(pending) + " operations with " +
                   std::to_string(workerCount) + " workers");

  if (shouldStop && shouldStop()) {
    stopRequested_.store(true);
    Logger::warning(LogCategory::SCHEDULER, "ExecutionScheduler",
                    "Stop requested before dispatch");
  }

  std::vector<std::thread> threads;
  threads.reserve(workerCount);
  for (size_t i = 0; i < workerCount; ++i) {
    threads.emplace_back(&ExecutionScheduler::workerThread, this, i,
                         std::ref(plan));
  }

  {
    std::unique_lock<std::mutex> lock(finishedMutex_);
    while (finished_.load() < pending) {
      finishedCv_.wait_for(lock, STOP_POLL_INTERVAL);
      if (!stopRequested_.load() && shouldStop && shouldStop()) {
        lock.unlock();
        stopRequested_.store(true);
        Logger::warning(LogCategory::SCHEDULER, "ExecutionScheduler",
                        "Stop requested, no further operations will be "
                        "dispatched (cancel policy " +
                            cancelPolicyToString(cancelPolicy_) + ")");
        cancelQueued(plan);
        if (cancelPolicy_ == CancelPolicy::ABORT) {
          executor_.cancelAll();
        }
        lock.lock();
      }
    }
  }

  for (auto &thread : threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }

  Logger::info(LogCategory::SCHEDULER, "ExecutionScheduler",
               "All workers stopped (peak concurrency " +
                   std::to_string(peakRunning_.load()) + ")");
}

void ExecutionScheduler::workerThread(size_t workerId,
                                      std::vector<Operation> &plan) {
  Logger::debug(LogCategory::SCHEDULER, "ExecutionScheduler",
                "Worker #" + std::to_string(workerId) + " started");

  size_t index = 0;
  bool owned = false;
  auto claim = [&](size_t popped) {
    owned =
        locks_.acquireOrPark(plan[popped].target().qualifiedName(), popped);
  };
  while (queue_.popBlocking(index, claim)) {
    if (!owned)
      continue;

    // Holding the token: run this operation, then everything parked behind
    // it for the same table.
    std::string table = plan[index].target().qualifiedName();
    std::optional<size_t> next = index;
    while (next) {
      Operation &op = plan[*next];
      if (stopRequested_.load()) {
        skipCancelled(op);
      } else {
        executeOne(workerId, op, plan.size());
      }
      next = locks_.releaseOrHandOff(table);
    }
  }

  Logger::debug(LogCategory::SCHEDULER, "ExecutionScheduler",
                "Worker #" + std::to_string(workerId) + " stopped");
}

// Runs one operation; the caller holds its table token.
void ExecutionScheduler::executeOne(size_t workerId, Operation &op,
                                    size_t total) {
  op.markRunning();
  size_t now = ++running_;
  size_t peak = peakRunning_.load();
  while (now > peak && !peakRunning_.compare_exchange_weak(peak, now)) {
  }

  std::string label = "[" + std::to_string(op.rank()) + "/" +
                      std::to_string(total) + "] " +
                      operationKindToString(op.kind()) + " " +
                      op.target().qualifiedName();
  Logger::info(LogCategory::SCHEDULER, "ExecutionScheduler",
               "Worker #" + std::to_string(workerId) + " running " + label);

  auto start = std::chrono::steady_clock::now();
  auto elapsedMs = [&start] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
  };

  try {
    executor_.execute(op);
    --running_;
    op.markSucceeded(elapsedMs());
    Logger::info(LogCategory::SCHEDULER, "ExecutionScheduler",
                 label + " succeeded in " +
                     TimeUtils::formatDurationMs(op.durationMs()));
  } catch (const std::exception &e) {
    --running_;
    op.markFailed(elapsedMs(), e.what());
    Logger::error(LogCategory::SCHEDULER, "ExecutionScheduler",
                  label + " failed after " +
                      TimeUtils::formatDurationMs(op.durationMs()) + ": " +
                      e.what());
  }

  recorder_.record(op);
  notifyFinished();
}

void ExecutionScheduler::skipCancelled(Operation &op) {
  op.markSkipped(CANCELLED_NOTE);
  recorder_.record(op);
  notifyFinished();
}

void ExecutionScheduler::cancelQueued(std::vector<Operation> &plan) {
  auto drained = queue_.drain();
  size_t count = drained.size();
  while (!drained.empty()) {
    skipCancelled(plan[drained.front()]);
    drained.pop();
  }
  Logger::warning(LogCategory::SCHEDULER, "ExecutionScheduler",
                  std::to_string(count) + " queued operations cancelled");
}

void ExecutionScheduler::notifyFinished() {
  {
    std::lock_guard<std::mutex> lock(finishedMutex_);
    ++finished_;
  }
  finishedCv_.notify_all();
}
