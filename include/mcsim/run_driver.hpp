#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "mcsim/orchestrator.hpp"
#include "mcsim/types.hpp"

namespace mcsim {

struct DriverConfig {
  std::chrono::milliseconds wall_interval{1000}; // wall time between ticks
  std::optional<int64_t> max_ticks{};            // stop looping after this many ticks
};

// One worker thread per run: advances the simulated clock by tick_ms and
// runs a tick, on a fixed wall-clock cadence. Paused runs keep the loop
// alive without ticking.
class RunDriver {
public:
  RunDriver(TickOrchestrator& orch, std::string run_id, DriverConfig cfg = {});
  ~RunDriver();

  RunDriver(const RunDriver&) = delete;
  RunDriver& operator=(const RunDriver&) = delete;

  bool start();

  bool pause();
  bool resume();
  bool set_intensity(int percent);

  // Ends the loop, waits for the tick in progress, then completes the stop.
  bool stop();

  // Blocks until the loop exits by itself (max_ticks or a terminal run).
  void wait();

  bool looping() const noexcept { return running_.load(); }
  int64_t ticks_driven() const noexcept { return ticks_.load(); }

private:
  void loop_();
  void join_();

  TickOrchestrator& orch_;
  std::string run_id_;
  DriverConfig cfg_{};

  std::mutex mtx_;
  std::condition_variable cv_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_{false};
  std::atomic<int64_t> ticks_{0};

  std::thread worker_;
};

} // namespace mcsim
