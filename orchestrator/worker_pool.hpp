#ifndef ORCHESTRATOR_WORKER_POOL_HPP
#define ORCHESTRATOR_WORKER_POOL_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace orchestrator {

// Fixed set of threads consuming a bounded queue of tasks.
class WorkerPool {
 public:
  // num_workers == 0 means one worker per hardware thread.
  WorkerPool(int num_workers, size_t queue_depth,
             std::chrono::milliseconds queue_timeout);

  // Queues a task. Returns false without queueing if the queue is full.
  // Exactly one of run and expired is eventually called: expired if the task
  // waited for longer than the queue timeout or the pool shut down first.
  // Neither may throw.
  bool TryEnqueue(std::function<void()> run, std::function<void()> expired);

  size_t NumWorkers() const { return threads_.size(); }

  // Expires the queued tasks, waits for the running ones and joins the
  // threads.
  void Shutdown();
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

 private:
  struct Task {
    std::function<void()> run;
    std::function<void()> expired;
    std::chrono::steady_clock::time_point enqueued;
  };

  void ThreadBody();

  const size_t queue_depth_;
  const std::chrono::milliseconds queue_timeout_;

  std::queue<Task> tasks_;
  std::mutex task_mutex_;
  std::condition_variable task_ready_;
  bool quitting_ = false;
  std::vector<std::thread> threads_;
};

}  // namespace orchestrator

#endif
