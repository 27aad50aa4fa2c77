#include <stylefix/worker_pool.h>

#include <algorithm>
#include <atomic>
#include <string>
#include <utility>

namespace stylefix {

unsigned int HardwareConcurrency() noexcept {
  const auto count = std::thread::hardware_concurrency();
  return count > 0 ? count : 1;
}

WorkerPool::WorkerPool(std::shared_ptr<Logger> logger,
                       unsigned int max_workers)
    : logger_(EnsureLogger(std::move(logger))),
      max_workers_(max_workers == 0 ? HardwareConcurrency() : max_workers) {}

std::vector<std::exception_ptr>
WorkerPool::ForEach(std::size_t count,
                    const std::function<void(std::size_t)> &body) {
  std::vector<std::exception_ptr> errors(count);
  std::atomic<std::size_t> next{0};
  const auto work = [&]() {
    for (auto index = next.fetch_add(1); index < count;
         index = next.fetch_add(1)) {
      try {
        body(index);
      } catch (...) {
        errors[index] = std::current_exception();
      }
    }
  };

  const auto workers =
      std::min<std::size_t>(static_cast<std::size_t>(max_workers_), count);
  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 1; i < workers; ++i) {
    try {
      threads.push_back(StartWorker(work));
    } catch (const std::exception &error) {
      logger_->Log(LogLevel::kWarn, "worker.start.failed",
                   {{"started", std::to_string(threads.size())},
                    {"wanted", std::to_string(workers - 1)},
                    {"error", error.what()}});
      break;
    }
  }

  work();
  for (auto &thread : threads) {
    thread.join();
  }
  logger_->Log(LogLevel::kTrace, "worker.pool.complete",
               {{"items", std::to_string(count)},
                {"threads", std::to_string(threads.size() + 1)}});
  return errors;
}

std::thread WorkerPool::StartWorker(std::function<void()> work) {
  return std::thread(std::move(work));
}

} // namespace stylefix
