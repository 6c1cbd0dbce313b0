#include "mcsim/clearing_task.hpp"

#include <utility>

namespace mcsim {

ClearingTask::ClearingTask(Body body) {
  thread_ = std::thread([this, b = std::move(body)]() mutable { worker_(std::move(b)); });
}

ClearingTask::~ClearingTask() {
  request_cancel();
  join();
}

void ClearingTask::worker_(Body body) {
  std::exception_ptr err;
  try {
    body(cancel_);
  } catch (...) {
    err = std::current_exception(); // surfaced through error()
  }
  {
    std::lock_guard<std::mutex> lk(mtx_);
    error_ = err;
    done_ = true;
  }
  cv_.notify_all();
}

bool ClearingTask::done() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return done_;
}

bool ClearingTask::wait_for(std::chrono::milliseconds d) const {
  std::unique_lock<std::mutex> lk(mtx_);
  return cv_.wait_for(lk, d, [&] { return done_; });
}

void ClearingTask::join() {
  if (!thread_.joinable()) return;
  if (thread_.get_id() == std::this_thread::get_id()) {
    thread_.detach(); // last handle dropped by the body itself
    return;
  }
  thread_.join();
}

std::exception_ptr ClearingTask::error() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return error_;
}

} // namespace mcsim
