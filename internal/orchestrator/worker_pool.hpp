#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace dockyard::orchestrator {

/*
  Thread-safe blocking queue feeding the pool's workers.
*/
class TaskQueue {
 public:
  void Enqueue(std::packaged_task<void()> task);

  // blocking wait; nullopt once shut down and drained
  std::optional<std::packaged_task<void()>> Dequeue();

  void Shutdown();

 private:
  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::queue<std::packaged_task<void()>> queue_;
  bool                                   shutdown_ = false;
};

/*
  Fixed set of workers bounding how many builds/creates run at once.
  A task's exception is delivered through its future.
*/
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t workers);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  std::future<void> Submit(std::function<void()> task);

  // Finishes queued tasks, then joins the workers.
  void Shutdown();

  std::size_t size() const {
    return threads_.size();
  }

 private:
  void Run();

  TaskQueue                queue_;
  std::vector<std::thread> threads_;
  std::once_flag           shutdown_once_;
};

} // namespace dockyard::orchestrator
