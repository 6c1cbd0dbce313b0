#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "mcsim/events.hpp"
#include "mcsim/payment_executor.hpp"
#include "mcsim/types.hpp"

namespace mcsim {

// Per-currency values computed at the end of a tick.
struct MetricValues {
  double avg_route_length{};
  double total_debt{};
  double clearing_volume{};
  double active_participants{};
  double active_trustlines{};
};

struct MetricPoint {
  Currency currency{};
  std::string key{};
  SimMs t_ms{};
  double value{};
};

struct BottleneckItem {
  EdgeRef target{}; // payment direction
  double score{};   // [0, 1]
  std::string reason_code{};
  std::string label{};
  std::string suggested_action{};
  EdgeStats stats{};
};

struct TickSummary {
  Tick tick{};
  SimMs sim_ms{};
  int planned{};
  int committed{};
  int rejected{};
  int errors{};
  int timeouts{};
};

// Everything the tail of a tick may write.
struct TickPayload {
  std::string run_id{};
  Tick tick{};
  SimMs t_ms{};
  std::map<Currency, CurrencyStats> per_currency{};
  std::map<Currency, MetricValues> values{};
  std::map<Currency, std::map<EdgeRef, EdgeStats>> edge_stats{};
};

// success_rate, bottlenecks_score, avg_route_length, total_debt,
// clearing_volume, active_participants and active_trustlines per currency.
std::vector<MetricPoint> metric_points(const TickPayload& p);

// Edges with a positive failure share, best first, at most `limit`.
std::vector<BottleneckItem> edge_bottlenecks(const std::map<EdgeRef, EdgeStats>& stats, std::size_t limit = 50);

class IMetricsStore {
public:
  virtual ~IMetricsStore() = default;

  // Upsert by (run, currency, key, t_ms).
  virtual void write_metrics(const std::string& run_id, const std::vector<MetricPoint>& points) = 0;
  // Replaces the bottleneck snapshot of (run, currency).
  virtual void write_bottlenecks(const std::string& run_id, const Currency& eq, SimMs t_ms,
                                 const std::vector<BottleneckItem>& items) = 0;
  virtual void write_last_tick(const std::string& run_id, const TickSummary& s) = 0;
};

class MemoryMetricsStore : public IMetricsStore {
public:
  void write_metrics(const std::string& run_id, const std::vector<MetricPoint>& points) override;
  void write_bottlenecks(const std::string& run_id, const Currency& eq, SimMs t_ms,
                         const std::vector<BottleneckItem>& items) override;
  void write_last_tick(const std::string& run_id, const TickSummary& s) override;

  std::optional<double> metric(const std::string& run_id, const Currency& eq, const std::string& key, SimMs t_ms) const;
  // Points of one series ordered by time.
  std::vector<MetricPoint> series(const std::string& run_id, const Currency& eq, const std::string& key) const;
  std::vector<BottleneckItem> bottlenecks(const std::string& run_id, const Currency& eq) const;
  std::optional<TickSummary> last_tick(const std::string& run_id) const;
  std::size_t metric_writes() const;

private:
  using MetricKey = std::tuple<std::string, Currency, std::string, SimMs>;

  mutable std::mutex mtx_;
  std::map<MetricKey, double> metrics_{};
  std::map<std::pair<std::string, Currency>, std::vector<BottleneckItem>> bottlenecks_{};
  std::map<std::string, TickSummary> last_tick_{};
  std::size_t metric_writes_{};
};

struct PersistenceConfig {
  int metrics_every_n_ticks{5};
  int bottlenecks_every_n_ticks{10};
  int64_t last_tick_write_every_ms{500};
};

// Per-run write cursors. Guarded by its own mutex since fail_run may flush
// from outside the tick.
struct PersistenceCursor {
  mutable std::mutex mtx;
  std::optional<TickPayload> last_payload{};
  Tick flushed_tick{-1};
  int64_t last_tick_written_at_ms{};
};

// Throttled writer for tick results. A null store disables writes but the
// last payload is still kept for flush_pending.
class TickPersistence {
public:
  explicit TickPersistence(IMetricsStore* store = nullptr, PersistenceConfig cfg = {})
    : store_(store), cfg_(cfg) {}

  void persist(TickPayload payload, const TickSummary& summary, PersistenceCursor& cur, int64_t now_ms) const;

  // Writes the last payload if it was not written yet. Best-effort.
  void flush_pending(PersistenceCursor& cur) const;

  const PersistenceConfig& config() const noexcept { return cfg_; }

private:
  void write_(const TickPayload& p, bool metrics, bool bottlenecks) const;

  IMetricsStore* store_{nullptr};
  PersistenceConfig cfg_{};
};

} // namespace mcsim
