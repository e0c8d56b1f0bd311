#include "orchestrator/worker_pool.hpp"

#include "glog/logging.h"

namespace orchestrator {

WorkerPool::WorkerPool(int num_workers, size_t queue_depth,
                       std::chrono::milliseconds queue_timeout)
    : queue_depth_(queue_depth), queue_timeout_(queue_timeout) {
  if (num_workers <= 0) num_workers = std::thread::hardware_concurrency();
  if (num_workers <= 0) num_workers = 1;
  for (int i = 0; i < num_workers; i++)
    threads_.emplace_back(std::bind(&WorkerPool::ThreadBody, this));
  LOG(INFO) << "Started " << num_workers << " workers, queue depth "
            << queue_depth_;
}

bool WorkerPool::TryEnqueue(std::function<void()> run,
                            std::function<void()> expired) {
  {
    std::lock_guard<std::mutex> lck(task_mutex_);
    if (quitting_ || tasks_.size() >= queue_depth_) return false;
    tasks_.push(Task{std::move(run), std::move(expired),
                     std::chrono::steady_clock::now()});
  }
  task_ready_.notify_one();
  return true;
}

void WorkerPool::ThreadBody() {
  while (true) {
    std::unique_lock<std::mutex> lck(task_mutex_);
    while (!quitting_ && tasks_.empty()) {
      task_ready_.wait(lck);
    }
    if (tasks_.empty()) break;
    Task task = std::move(tasks_.front());
    tasks_.pop();
    bool stale = quitting_ || std::chrono::steady_clock::now() - task.enqueued >
                                  queue_timeout_;
    lck.unlock();
    if (stale) {
      VLOG(1) << "Task expired in queue";
      task.expired();
    } else {
      task.run();
    }
  }
}

void WorkerPool::Shutdown() {
  {
    std::lock_guard<std::mutex> lck(task_mutex_);
    if (quitting_) return;
    quitting_ = true;
  }
  task_ready_.notify_all();
  for (std::thread& thread : threads_) thread.join();
}

WorkerPool::~WorkerPool() { Shutdown(); }

}  // namespace orchestrator
