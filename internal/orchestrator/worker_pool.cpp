#include "internal/orchestrator/worker_pool.hpp"

#include <stdexcept>

namespace dockyard::orchestrator {

void TaskQueue::Enqueue(std::packaged_task<void()> task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) throw std::runtime_error("worker pool is shut down");
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<std::packaged_task<void()>> TaskQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  auto task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void TaskQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

WorkerPool::WorkerPool(std::size_t workers) {
  if (workers == 0) workers = 1;
  threads_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) threads_.emplace_back(&WorkerPool::Run, this);
}

WorkerPool::~WorkerPool() {
  Shutdown();
}

std::future<void> WorkerPool::Submit(std::function<void()> task) {
  std::packaged_task<void()> packaged(std::move(task));
  auto                       future = packaged.get_future();
  queue_.Enqueue(std::move(packaged));
  return future;
}

void WorkerPool::Shutdown() {
  std::call_once(shutdown_once_, [this] {
    queue_.Shutdown();
    for (auto& thread : threads_) {
      if (thread.joinable()) thread.join();
    }
  });
}

void WorkerPool::Run() {
  while (auto task = queue_.Dequeue()) {
    (*task)();
  }
}

} // namespace dockyard::orchestrator
