#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mcsim/clearing_engine.hpp"
#include "mcsim/config.hpp"
#include "mcsim/debt_snapshot.hpp"
#include "mcsim/inject.hpp"
#include "mcsim/ledger.hpp"
#include "mcsim/payment_executor.hpp"
#include "mcsim/payment_planner.hpp"
#include "mcsim/run.hpp"
#include "mcsim/tick_metrics.hpp"

namespace mcsim {

// What one tick did. `executed` is false when the run was not running or
// had nothing to simulate.
struct TickReport {
  bool executed{false};
  Tick tick{};
  int planned{};
  int committed{};
  int rejected{};
  int errors{};
  int timeouts{};
  bool clearing_started{false};
  std::map<Currency, double> clearing_volume{};
  std::optional<std::string> failure{}; // error code when the tick failed or the run was failed
};

// Owns the runs and executes their ticks. tick() must not be called
// concurrently for the same run; different runs may tick in parallel.
class TickOrchestrator {
public:
  explicit TickOrchestrator(ILedger& ledger, SimConfig cfg = {}, IMetricsStore* store = nullptr);
  ~TickOrchestrator();

  TickOrchestrator(const TickOrchestrator&) = delete;
  TickOrchestrator& operator=(const TickOrchestrator&) = delete;

  // Throws std::invalid_argument on an empty or duplicate run id.
  Run& add_run(RunSpec spec, IEventSink* sink = nullptr);
  Run* find_run(const std::string& run_id);
  std::vector<std::string> run_ids() const;

  // Runs one tick at the run's current simulated time. Never throws.
  TickReport tick(const std::string& run_id);

  // Moves the run to error, publishes its status, flushes pending metrics
  // and cancels its clearing task. False if the run is unknown or already
  // terminal.
  bool fail_run(const std::string& run_id, const std::string& code, const std::string& message);

  // Completes a stop: cancels clearing, flushes pending metrics, marks the
  // run stopped. Accepts running, paused and stopping runs.
  bool stop_run(const std::string& run_id);

  // Wall-clock cap of one clearing pass, in seconds.
  double clearing_hard_timeout_sec() const noexcept;

  const SimConfig& config() const noexcept { return cfg_; }

private:
  struct ClearingPlanItem {
    Currency currency{};
    ClearingOptions options{};
  };

  void tick_body_(Run& run, ILedgerSession& session, TickReport& report);
  void finish_tick_(Run& run, ILedgerSession& session);
  void apply_due_events_(Run& run, ILedgerSession& session, Tick tick, SimMs sim_ms);
  std::vector<ClearingPlanItem> clearing_plan_(Run& run, const std::vector<Currency>& eqs,
                                               const PaymentsResult& payments, Tick tick);
  void run_clearing_(Run& run, ILedgerSession& session, const std::vector<ClearingPlanItem>& plan, Tick tick,
                     TickReport& report);
  void apply_decay_(Run& run, ILedgerSession& session, const DebtSnapshot& debts, Tick tick);
  void persist_(Run& run, ILedgerSession& session, const std::vector<Currency>& eqs,
                const PaymentsResult& payments, const TickReport& report, Tick tick, SimMs sim_ms);

  void await_pending_clearing_(Run& run);
  void on_tick_failed_(Run& run, const std::string& message, TickReport& report);
  // Requests cancel and waits up to `wait`; drops the handle once finished.
  void cancel_clearing_(Run& run, std::chrono::milliseconds wait);

  ILedger& ledger_;
  SimConfig cfg_;
  PaymentPlanner planner_;
  PaymentExecutor executor_;
  InjectExecutor inject_;
  AdaptiveClearingPolicy policy_;
  TickPersistence persistence_;

  mutable std::mutex runs_mtx_;
  std::map<std::string, std::unique_ptr<Run>> runs_{};

  // guards TickState::clearing of every run
  std::mutex clearing_mtx_;
};

} // namespace mcsim
