#include "mcsim/tick_metrics.hpp"

#include <algorithm>

#include "mcsim/log.hpp"

namespace mcsim {

std::vector<MetricPoint> metric_points(const TickPayload& p) {
  std::vector<MetricPoint> out;
  for (const auto& [eq, v] : p.values) {
    CurrencyStats c{};
    if (const auto it = p.per_currency.find(eq); it != p.per_currency.end()) c = it->second;

    const double denom = static_cast<double>(c.committed + c.rejected);
    const double success_rate = denom > 0 ? static_cast<double>(c.committed) / denom * 100.0 : 0.0;
    const double attempts = static_cast<double>(c.committed + c.rejected + c.errors);
    const double bottlenecks_score = attempts > 0 ? static_cast<double>(c.errors + c.timeouts) / attempts * 100.0 : 0.0;

    out.push_back(MetricPoint{eq, "success_rate", p.t_ms, success_rate});
    out.push_back(MetricPoint{eq, "bottlenecks_score", p.t_ms, bottlenecks_score});
    out.push_back(MetricPoint{eq, "avg_route_length", p.t_ms, v.avg_route_length});
    out.push_back(MetricPoint{eq, "total_debt", p.t_ms, v.total_debt});
    out.push_back(MetricPoint{eq, "clearing_volume", p.t_ms, v.clearing_volume});
    out.push_back(MetricPoint{eq, "active_participants", p.t_ms, v.active_participants});
    out.push_back(MetricPoint{eq, "active_trustlines", p.t_ms, v.active_trustlines});
  }
  return out;
}

std::vector<BottleneckItem> edge_bottlenecks(const std::map<EdgeRef, EdgeStats>& stats, std::size_t limit) {
  std::vector<BottleneckItem> items;
  for (const auto& [edge, st] : stats) {
    if (st.attempts == 0) continue;
    const uint64_t bad = st.errors + st.timeouts + st.rejected;
    const double score = std::clamp(static_cast<double>(bad) / static_cast<double>(st.attempts), 0.0, 1.0);
    if (score <= 0.0) continue;

    BottleneckItem it{};
    it.target = edge;
    it.score = score;
    it.stats = st;
    if (st.timeouts > 0 && static_cast<double>(st.timeouts) / static_cast<double>(st.attempts) >= 0.2) {
      it.reason_code = "TOO_MANY_TIMEOUTS";
      it.label = "Too many timeouts";
      it.suggested_action = "Reduce load or increase routing timeouts";
    } else if (st.rejected > 0 || st.errors > 0) {
      it.reason_code = "FREQUENT_ABORTS";
      it.label = "Frequent failures";
      it.suggested_action = "Increase trust limits, add alternative routes, or clear";
    } else {
      it.reason_code = "HIGH_USED";
      it.label = "High utilization";
      it.suggested_action = "Consider clearing or adding alternative routes";
    }
    items.push_back(std::move(it));
  }

  std::sort(items.begin(), items.end(), [](const BottleneckItem& a, const BottleneckItem& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.target > b.target;
  });
  if (items.size() > limit) items.resize(limit);
  return items;
}

void MemoryMetricsStore::write_metrics(const std::string& run_id, const std::vector<MetricPoint>& points) {
  std::lock_guard<std::mutex> lk(mtx_);
  for (const auto& p : points) metrics_[MetricKey{run_id, p.currency, p.key, p.t_ms}] = p.value;
  ++metric_writes_;
}

void MemoryMetricsStore::write_bottlenecks(const std::string& run_id, const Currency& eq, SimMs,
                                           const std::vector<BottleneckItem>& items) {
  std::lock_guard<std::mutex> lk(mtx_);
  bottlenecks_[{run_id, eq}] = items;
}

void MemoryMetricsStore::write_last_tick(const std::string& run_id, const TickSummary& s) {
  std::lock_guard<std::mutex> lk(mtx_);
  last_tick_[run_id] = s;
}

std::optional<double> MemoryMetricsStore::metric(const std::string& run_id, const Currency& eq,
                                                 const std::string& key, SimMs t_ms) const {
  std::lock_guard<std::mutex> lk(mtx_);
  const auto it = metrics_.find(MetricKey{run_id, eq, key, t_ms});
  if (it == metrics_.end()) return std::nullopt;
  return it->second;
}

std::vector<MetricPoint> MemoryMetricsStore::series(const std::string& run_id, const Currency& eq,
                                                    const std::string& key) const {
  std::lock_guard<std::mutex> lk(mtx_);
  std::vector<MetricPoint> out;
  for (const auto& [k, v] : metrics_) {
    if (std::get<0>(k) == run_id && std::get<1>(k) == eq && std::get<2>(k) == key) {
      out.push_back(MetricPoint{eq, key, std::get<3>(k), v});
    }
  }
  return out; // map order is t_ms order within a series
}

std::vector<BottleneckItem> MemoryMetricsStore::bottlenecks(const std::string& run_id, const Currency& eq) const {
  std::lock_guard<std::mutex> lk(mtx_);
  const auto it = bottlenecks_.find({run_id, eq});
  if (it == bottlenecks_.end()) return {};
  return it->second;
}

std::optional<TickSummary> MemoryMetricsStore::last_tick(const std::string& run_id) const {
  std::lock_guard<std::mutex> lk(mtx_);
  const auto it = last_tick_.find(run_id);
  if (it == last_tick_.end()) return std::nullopt;
  return it->second;
}

std::size_t MemoryMetricsStore::metric_writes() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return metric_writes_;
}

static bool due(Tick tick, int every_n) noexcept {
  return every_n <= 1 || tick % every_n == 0;
}

void TickPersistence::write_(const TickPayload& p, bool metrics, bool bottlenecks) const {
  if (!store_) return;
  if (metrics) store_->write_metrics(p.run_id, metric_points(p));
  if (bottlenecks) {
    for (const auto& [eq, v] : p.values) {
      static const std::map<EdgeRef, EdgeStats> kNone;
      const auto it = p.edge_stats.find(eq);
      auto items = edge_bottlenecks(it == p.edge_stats.end() ? kNone : it->second);
      if (items.empty()) continue;
      store_->write_bottlenecks(p.run_id, eq, p.t_ms, items);
    }
  }
}

void TickPersistence::persist(TickPayload payload, const TickSummary& summary, PersistenceCursor& cur,
                              int64_t now_ms) const {
  const bool metrics = due(payload.tick, cfg_.metrics_every_n_ticks);
  const bool bottlenecks = due(payload.tick, cfg_.bottlenecks_every_n_ticks);

  std::lock_guard<std::mutex> lk(cur.mtx);
  try {
    write_(payload, metrics, bottlenecks);
    if (metrics || bottlenecks) cur.flushed_tick = payload.tick;

    if (store_ && cfg_.last_tick_write_every_ms > 0 &&
        now_ms - cur.last_tick_written_at_ms >= cfg_.last_tick_write_every_ms) {
      store_->write_last_tick(payload.run_id, summary);
      cur.last_tick_written_at_ms = now_ms;
    }
  } catch (const std::exception& e) {
    MCSIM_LOG_WARN("persistence.write_failed run_id=" << payload.run_id << " tick=" << payload.tick
                   << " err=" << e.what());
  }
  cur.last_payload = std::move(payload);
}

void TickPersistence::flush_pending(PersistenceCursor& cur) const {
  std::lock_guard<std::mutex> lk(cur.mtx);
  if (!cur.last_payload || cur.last_payload->tick <= cur.flushed_tick) return;
  try {
    write_(*cur.last_payload, true, true);
    cur.flushed_tick = cur.last_payload->tick;
  } catch (const std::exception& e) {
    MCSIM_LOG_WARN("persistence.flush_pending_failed run_id=" << cur.last_payload->run_id << " err=" << e.what());
  }
}

} // namespace mcsim
