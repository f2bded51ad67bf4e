#pragma once

#include <cstddef>
#include <functional>

namespace void_cmb::core {

// Clamp the configured worker count to [1, hardware cores] and to the
// number of tasks.
int compute_worker_count(int requested_workers, size_t task_count);

// Runs task(i) for every i in [0, task_count) on `workers` threads that pull
// indices from a shared counter. Tasks must write only to their own slot.
// The first exception raised by a task stops further dispatch and is
// rethrown on the calling thread once all workers have joined.
void parallel_for(size_t task_count, int workers,
                  const std::function<void(size_t)> &task);

} // namespace void_cmb::core
