#include "void_cmb/core/parallel.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace void_cmb::core {

int compute_worker_count(int requested_workers, size_t task_count) {
  int workers = requested_workers;
  if (workers < 1) {
    workers = 1;
  }
  int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
  if (cpu_cores > 0) {
    workers = std::min(workers, cpu_cores);
  }
  if (task_count > 0) {
    workers =
        std::min(workers, static_cast<int>(std::max<size_t>(1, task_count)));
  }
  return std::max(1, workers);
}

void parallel_for(size_t task_count, int workers,
                  const std::function<void(size_t)> &task) {
  if (task_count == 0) {
    return;
  }

  std::atomic<size_t> next{0};
  std::atomic<bool> failed{false};
  std::mutex error_mutex;
  std::exception_ptr first_error;

  auto worker = [&]() {
    while (!failed.load(std::memory_order_relaxed)) {
      const size_t i = next.fetch_add(1);
      if (i >= task_count) {
        break;
      }
      try {
        task(i);
      } catch (...) {
        failed.store(true, std::memory_order_relaxed);
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) {
          first_error = std::current_exception();
        }
      }
    }
  };

  const int n_workers = std::max(1, std::min<int>(workers, static_cast<int>(task_count)));
  if (n_workers > 1) {
    std::vector<std::thread> pool;
    pool.reserve(static_cast<size_t>(n_workers));
    for (int w = 0; w < n_workers; ++w) {
      pool.emplace_back(worker);
    }
    for (auto &t : pool) {
      if (t.joinable()) {
        t.join();
      }
    }
  } else {
    worker();
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

} // namespace void_cmb::core
