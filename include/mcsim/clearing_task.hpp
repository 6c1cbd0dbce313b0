#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>

namespace mcsim {

// Background clearing pass. The body polls the cancel flag between cycles;
// cancellation is cooperative. The destructor requests cancel and joins.
class ClearingTask {
public:
  using Body = std::function<void(const std::atomic<bool>& cancel)>;

  explicit ClearingTask(Body body);
  ~ClearingTask();

  ClearingTask(const ClearingTask&) = delete;
  ClearingTask& operator=(const ClearingTask&) = delete;

  bool done() const;

  // True if the body finished within `d`.
  bool wait_for(std::chrono::milliseconds d) const;

  void request_cancel() noexcept { cancel_.store(true); }
  bool cancel_requested() const noexcept { return cancel_.load(); }

  void join();

  // Exception that escaped the body, if any.
  std::exception_ptr error() const;

private:
  void worker_(Body body);

  std::atomic<bool> cancel_{false};
  mutable std::mutex mtx_;
  mutable std::condition_variable cv_;
  bool done_{false};
  std::exception_ptr error_{};

  std::thread thread_; // started last
};

} // namespace mcsim
