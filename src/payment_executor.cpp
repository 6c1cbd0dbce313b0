#include "mcsim/payment_executor.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <thread>
#include <utility>

#include "mcsim/hash.hpp"
#include "mcsim/log.hpp"
#include "mcsim/patches.hpp"
#include "mcsim/rejection_codes.hpp"
#include "mcsim/run.hpp"

namespace mcsim {

namespace {

enum class OutcomeKind : uint8_t { Committed = 0, Rejected, Timeout, Error };

struct Outcome {
  int seq{};
  OutcomeKind kind{OutcomeKind::Error};
  std::vector<EdgeRef> route_edges{}; // payment direction
  double route_len{};
  std::string code{};
  std::string message{};
  std::optional<LedgerError> detail{};
  std::vector<EdgePatch> edge_patch{};
  std::vector<NodePatch> node_patch{};
};

// Completed outcomes travel from the workers to the emitting thread here.
struct Handoff {
  std::mutex mtx;
  std::condition_variable cv;
  std::deque<Outcome> done{};
  int workers_left{};
};

// Requests cancel and joins on every exit path.
struct WorkerGroup {
  std::atomic<bool>& cancel;
  std::vector<std::thread> threads{};

  ~WorkerGroup() { join(); }

  void join() {
    cancel.store(true);
    for (auto& t : threads) {
      if (t.joinable()) t.join();
    }
  }
};

Outcome run_one(Run& run, ILedgerSession& session, std::mutex& session_mtx, const PaymentIntent& p, Tick tick,
                const std::set<Pid>& known_senders) {
  Outcome o{};
  o.seq = p.seq;

  if (!known_senders.count(p.sender)) {
    o.kind = OutcomeKind::Error;
    o.code = "SENDER_NOT_FOUND";
    o.message = "Sender not found: " + p.sender;
    return o;
  }

  const PaymentRequest req{p.sender, p.receiver, p.currency, p.amount,
                           PaymentExecutor::idempotency_key(run.id(), tick, p)};

  run.locked([](RunStats& s) { ++s.in_flight; });
  try {
    std::lock_guard<std::mutex> lk(session_mtx);
    NestedScope scope(session);
    const PaymentResult res = session.attempt_payment(req);
    if (res.status == PaymentStatus::Committed) {
      scope.release();
      o.kind = OutcomeKind::Committed;
      for (std::size_t i = 0; i + 1 < res.route.size(); ++i) o.route_edges.emplace_back(res.route[i], res.route[i + 1]);
      o.route_len = static_cast<double>(o.route_edges.size());
    } else {
      o.kind = OutcomeKind::Rejected;
      o.detail = res.error;
    }
  } catch (const LedgerTimeout& e) {
    o.kind = OutcomeKind::Timeout;
    o.code = "PAYMENT_TIMEOUT";
    o.message = e.what();
  } catch (const LedgerRejection& e) {
    const int st = e.error().status_code;
    if (st >= 400 && st < 500) {
      o.kind = OutcomeKind::Rejected;
      o.detail = e.error();
    } else {
      o.kind = OutcomeKind::Error;
      o.code = "INTERNAL_ERROR";
      o.message = e.what();
    }
  } catch (const std::exception& e) {
    o.kind = OutcomeKind::Error;
    o.code = "INTERNAL_ERROR";
    o.message = e.what();
  }
  run.locked([](RunStats& s) { s.in_flight = std::max(0, s.in_flight - 1); });
  return o;
}

} // namespace

std::string PaymentExecutor::idempotency_key(const std::string& run_id, Tick tick, const PaymentIntent& p) {
  std::string text = run_id;
  text += '|';
  text += std::to_string(tick);
  text += '|';
  text += p.sender;
  text += '|';
  text += p.receiver;
  text += '|';
  text += p.currency;
  text += '|';
  text += format_amount(p.amount);
  text += '|';
  text += std::to_string(p.seq);
  return "sim:" + to_hex(fnv1a64(text));
}

PaymentsResult PaymentExecutor::execute(Run& run, ILedgerSession& session, const std::vector<PaymentIntent>& intents,
                                        const std::set<Pid>& known_senders,
                                        const std::vector<Currency>& equivalents) const {
  PaymentsResult out{};
  for (const auto& eq : equivalents) out.per_currency.emplace(eq, CurrencyStats{});

  const Tick tick = run.stats().tick_index;
  const int n = static_cast<int>(intents.size());

  std::mutex session_mtx;
  std::atomic<bool> cancel{false};
  std::atomic<int> next{0};
  Handoff handoff{};

  auto edge_inc = [&](const Currency& eq, const std::vector<EdgeRef>& edges, uint64_t EdgeStats::*field) {
    auto& m = out.edge_stats[eq];
    for (const auto& e : edges) {
      auto& st = m[e];
      ++st.attempts;
      if (field) ++(st.*field);
    }
  };

  auto emit = [&](Outcome& o) {
    const auto& p = intents[static_cast<std::size_t>(o.seq)];
    auto& cs = out.per_currency[p.currency];
    const std::vector<EdgeRef> edges = o.route_edges.empty() ? std::vector<EdgeRef>{EdgeRef{p.sender, p.receiver}}
                                                             : o.route_edges;

    if (o.kind == OutcomeKind::Timeout || o.kind == OutcomeKind::Error) {
      const bool timeout = o.kind == OutcomeKind::Timeout;
      ++out.errors;
      ++cs.errors;
      edge_inc(p.currency, edges, &EdgeStats::errors);
      if (timeout) {
        ++out.timeouts;
        ++cs.timeouts;
        for (const auto& e : edges) ++out.edge_stats[p.currency][e].timeouts;
      }
      run.locked([&](RunStats& s) {
        ++s.totals.attempts;
        if (timeout) ++s.totals.timeouts;
        s.record_error(o.code, o.message.empty() ? o.code : o.message, WallClock::now());
        s.last_event_type = "tx.failed";
      });
      run.events().publish(TxFailed{p.currency, p.sender, p.receiver, o.code, o.message.empty() ? o.code : o.message});
    } else if (o.kind == OutcomeKind::Committed) {
      ++out.committed;
      ++cs.committed;
      edge_inc(p.currency, edges, &EdgeStats::committed);
      if (o.route_len > 0) {
        cs.route_len_sum += o.route_len;
        ++cs.route_len_n;
      }

      TxUpdated ev{};
      ev.currency = p.currency;
      ev.from = p.sender;
      ev.to = p.receiver;
      ev.amount = p.amount;
      ev.edges = edges;
      ev.edge_patch = std::move(o.edge_patch);
      ev.node_patch = std::move(o.node_patch);
      run.events().publish(std::move(ev));
      run.locked([](RunStats& s) {
        s.last_event_type = "tx.updated";
        ++s.totals.attempts;
        ++s.totals.committed;
      });
    } else {
      ++out.rejected;
      ++cs.rejected;
      edge_inc(p.currency, edges, &EdgeStats::rejected);

      const std::string code = o.detail ? map_rejection_code(*o.detail) : std::string(kPaymentRejected);
      ++out.rejection_codes[p.currency][code];
      run.locked([](RunStats& s) {
        s.last_event_type = "tx.failed";
        ++s.totals.attempts;
        ++s.totals.rejected;
      });
      run.events().publish(TxFailed{p.currency, p.sender, p.receiver, code, code});
    }

    run.locked([](RunStats& s) { s.queue_depth = std::max(0, s.queue_depth - 1); });
  };

  std::map<int, Outcome> ready;
  int next_seq = 0;
  auto emit_if_ready = [&] {
    for (auto it = ready.find(next_seq); it != ready.end(); it = ready.find(next_seq)) {
      emit(it->second);
      ready.erase(it);
      ++next_seq;
    }
  };

  // Best-effort visualization state of a committed payment. Runs on the
  // emitting thread under the session token.
  auto attach_patches = [&](Outcome& o) {
    if (o.kind != OutcomeKind::Committed) return;
    const auto& p = intents[static_cast<std::size_t>(o.seq)];
    const std::vector<EdgeRef> hops = o.route_edges.empty() ? std::vector<EdgeRef>{EdgeRef{p.sender, p.receiver}}
                                                            : o.route_edges;
    try {
      std::lock_guard<std::mutex> lk(session_mtx);
      std::set<Pid> pids;
      for (const auto& [a, b] : hops) {
        pids.insert(a);
        pids.insert(b);
      }
      o.node_patch = node_patches(session, p.currency, {pids.begin(), pids.end()});
      o.edge_patch = route_patches(session, p.currency, hops);
    } catch (const std::exception& e) {
      if (run.should_warn_this_tick("edge_patch_failed:" + p.currency)) {
        MCSIM_LOG_WARN("executor.edge_patch_failed run_id=" << run.id() << " tick=" << tick << " eq=" << p.currency
                       << " err=" << e.what());
      }
      o.edge_patch.clear();
      o.node_patch.clear();
    }
  };

  if (n > 0) {
    const int workers = std::clamp(cfg_.max_in_flight, 1, n);
    handoff.workers_left = workers;

    WorkerGroup group{cancel};
    group.threads.reserve(static_cast<std::size_t>(workers));
    for (int w = 0; w < workers; ++w) {
      group.threads.emplace_back([&] {
        for (;;) {
          if (cancel.load()) break;
          const int i = next.fetch_add(1);
          if (i >= n) break;
          Outcome o = run_one(run, session, session_mtx, intents[static_cast<std::size_t>(i)], tick, known_senders);
          {
            std::lock_guard<std::mutex> lk(handoff.mtx);
            handoff.done.push_back(std::move(o));
          }
          handoff.cv.notify_one();
        }
        {
          std::lock_guard<std::mutex> lk(handoff.mtx);
          --handoff.workers_left;
        }
        handoff.cv.notify_one();
      });
    }

    for (;;) {
      Outcome o{};
      {
        std::unique_lock<std::mutex> lk(handoff.mtx);
        handoff.cv.wait(lk, [&] { return !handoff.done.empty() || handoff.workers_left == 0; });
        if (handoff.done.empty()) break;
        o = std::move(handoff.done.front());
        handoff.done.pop_front();
      }

      attach_patches(o);
      ready.emplace(o.seq, std::move(o));
      emit_if_ready();

      if (cfg_.max_timeouts_per_tick > 0 && out.timeouts >= cfg_.max_timeouts_per_tick) {
        out.abort_code = "REAL_MODE_TOO_MANY_TIMEOUTS";
        out.abort_message = "Too many payment timeouts in one tick: " + std::to_string(out.timeouts);
        break;
      }
      if (run.is_winding_down()) break;
    }

    group.join();

    // Every outcome has landed now; intents that never started leave gaps.
    // After an abort only commits are reported, so the session and the
    // counters agree.
    {
      std::lock_guard<std::mutex> lk(handoff.mtx);
      for (auto& o : handoff.done) ready.emplace(o.seq, std::move(o));
      handoff.done.clear();
    }
    std::size_t dropped = 0;
    for (auto& [seq, o] : ready) {
      if (out.abort_code && o.kind != OutcomeKind::Committed) {
        ++dropped;
        continue;
      }
      attach_patches(o);
      emit(o);
    }
    ready.clear();
    if (dropped > 0) {
      MCSIM_LOG_DEBUG("executor.unemitted run_id=" << run.id() << " tick=" << tick << " dropped=" << dropped);
    }
  }

  out.stall_ticks = run.locked([&](RunStats& s) {
    s.in_flight = 0;
    s.queue_depth = 0;
    s.phase = RunPhase::None;
    s.consec_tick_failures = 0;
    if (n > 0 && out.committed == 0 && out.errors == 0) {
      ++s.consec_all_rejected_ticks;
    } else {
      s.consec_all_rejected_ticks = 0;
    }
    return s.consec_all_rejected_ticks;
  });
  return out;
}

} // namespace mcsim
