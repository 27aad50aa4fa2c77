#pragma once

#include <stylefix/logging.h>

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace stylefix {

// Hardware thread count, or 1 when it cannot be detected.
unsigned int HardwareConcurrency() noexcept;

// Runs indexed work on a bounded number of threads. The threads live for
// one ForEach call.
class WorkerPool {
public:
  // `max_workers == 0` uses HardwareConcurrency().
  explicit WorkerPool(std::shared_ptr<Logger> logger = nullptr,
                      unsigned int max_workers = 0);
  virtual ~WorkerPool() = default;

  // Calls `body(i)` once for every i in [0, count). The calling thread is
  // one of the workers, so every index still runs when no extra thread can
  // be started. An exception escaping `body(i)` is stored at index i of the
  // returned vector and the remaining indexes keep running.
  std::vector<std::exception_ptr>
  ForEach(std::size_t count, const std::function<void(std::size_t)> &body);

  unsigned int MaxWorkers() const { return max_workers_; }

protected:
  // Throws std::system_error when the thread cannot be created.
  virtual std::thread StartWorker(std::function<void()> work);

private:
  std::shared_ptr<Logger> logger_;
  unsigned int max_workers_;
};

} // namespace stylefix
