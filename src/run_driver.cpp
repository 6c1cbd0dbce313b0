#include "mcsim/run_driver.hpp"

#include <utility>

#include "mcsim/log.hpp"

namespace mcsim {

RunDriver::RunDriver(TickOrchestrator& orch, std::string run_id, DriverConfig cfg)
  : orch_(orch), run_id_(std::move(run_id)), cfg_(cfg) {}

RunDriver::~RunDriver() {
  stop_.store(true);
  cv_.notify_all();
  join_();
}

bool RunDriver::start() {
  Run* run = orch_.find_run(run_id_);
  if (!run || run->is_winding_down()) return false;

  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) return false;
  join_(); // a previous loop that ended by itself
  stop_.store(false);
  worker_ = std::thread([this]() { loop_(); });
  return true;
}

bool RunDriver::pause() {
  Run* run = orch_.find_run(run_id_);
  return run && run->pause();
}

bool RunDriver::resume() {
  Run* run = orch_.find_run(run_id_);
  return run && run->resume();
}

bool RunDriver::set_intensity(int percent) {
  Run* run = orch_.find_run(run_id_);
  return run && run->set_intensity(percent);
}

bool RunDriver::stop() {
  Run* run = orch_.find_run(run_id_);
  if (!run || is_terminal(run->state())) {
    stop_.store(true);
    cv_.notify_all();
    join_();
    return false;
  }

  // the executor checks this between outcomes
  run->begin_stop();
  stop_.store(true);
  cv_.notify_all();
  join_();
  return orch_.stop_run(run_id_);
}

void RunDriver::wait() {
  join_();
}

void RunDriver::join_() {
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) worker_.join();
}

void RunDriver::loop_() {
  const SimMs tick_ms = orch_.config().tick_ms;
  MCSIM_LOG_INFO("driver.start run_id=" << run_id_ << " interval_ms=" << cfg_.wall_interval.count());

  for (;;) {
    if (stop_.load()) break;

    Run* run = orch_.find_run(run_id_);
    if (!run || run->is_winding_down()) break;

    if (run->is_running()) {
      const Tick t = run->advance_clock(tick_ms);
      const TickReport r = orch_.tick(run_id_);
      ++ticks_;
      MCSIM_LOG_DEBUG("driver.tick run_id=" << run_id_ << " tick=" << t << " planned=" << r.planned
                      << " committed=" << r.committed);
      if (cfg_.max_ticks && ticks_.load() >= *cfg_.max_ticks) break;
    }

    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait_for(lk, cfg_.wall_interval, [this] { return stop_.load(); });
  }

  running_.store(false);
  MCSIM_LOG_INFO("driver.exit run_id=" << run_id_ << " ticks=" << ticks_.load());
}

} // namespace mcsim
