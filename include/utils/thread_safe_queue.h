#ifndef THREAD_SAFE_QUEUE_H
#define THREAD_SAFE_QUEUE_H

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>

// FIFO work queue shared by the scheduler workers. popBlocking returns false
// once the queue is finished and drained.
template <typename T> class ThreadSafeQueue {
private:
  std::mutex mtx;
  std::queue<T> queue;
  std::condition_variable cv;
  std::atomic<bool> shutdown{false};

public:
  void push(T item) {
    std::lock_guard<std::mutex> lock(mtx);
    queue.push(std::move(item));
    cv.notify_one();
  }

  void finish() {
    {
      std::lock_guard<std::mutex> lock(mtx);
      shutdown = true;
    }
    cv.notify_all();
  }

  // Removes every queued item and returns them in FIFO order.
  std::queue<T> drain() {
    std::lock_guard<std::mutex> lock(mtx);
    std::queue<T> drained;
    queue.swap(drained);
    return drained;
  }

  // Pops the next item and runs claim(item) before the queue lock is
  // released, so claims happen in queue order across consumers.
  template <typename Claim> bool popBlocking(T &item, Claim &&claim) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [this] { return !queue.empty() || shutdown; });

    if (queue.empty()) {
      return false;
    }

    item = std::move(queue.front());
    queue.pop();
    claim(item);
    return true;
  }
};

#endif
