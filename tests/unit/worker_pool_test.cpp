#include "internal/orchestrator/worker_pool.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

using dockyard::orchestrator::WorkerPool;

void TestTasksRunConcurrentlyUpToPoolSize() {
  WorkerPool       pool(3);
  std::atomic<int> active{0};
  std::atomic<int> peak{0};

  std::vector<std::future<void>> futures;
  for (int i = 0; i < 9; ++i) {
    futures.push_back(pool.Submit([&] {
      const int now = ++active;
      int       seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(30));
      --active;
    }));
  }
  for (auto& f : futures) f.get();

  assert(pool.size() == 3);
  assert(peak.load() <= 3);
  assert(peak.load() >= 2);
}

void TestExceptionsTravelThroughFuture() {
  WorkerPool pool(1);
  auto       failing = pool.Submit([] { throw std::runtime_error("boom"); });

  bool threw = false;
  try {
    failing.get();
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "boom";
  }
  assert(threw);

  // the worker survives a throwing task
  bool ran = false;
  pool.Submit([&ran] { ran = true; }).get();
  assert(ran);
}

void TestShutdownDrainsQueueAndRejectsNewWork() {
  std::atomic<int> done{0};
  WorkerPool       pool(1);
  for (int i = 0; i < 5; ++i) {
    pool.Submit([&done] {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      ++done;
    });
  }
  pool.Shutdown();
  assert(done.load() == 5);

  bool rejected = false;
  try {
    pool.Submit([] {});
  } catch (const std::runtime_error&) {
    rejected = true;
  }
  assert(rejected);

  // idempotent
  pool.Shutdown();
}

} // namespace

int main() {
  TestTasksRunConcurrentlyUpToPoolSize();
  TestExceptionsTravelThroughFuture();
  TestShutdownDrainsQueueAndRejectsNewWork();

  std::cout << "dockyard_unit_worker_pool: pass\n";
  return 0;
}
