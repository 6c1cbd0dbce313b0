#include "mcsim/payment_planner.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

#include "mcsim/log.hpp"

namespace mcsim {

namespace {

constexpr int kReachMaxDepth = 3;
constexpr std::size_t kReachMaxNodes = 200;
constexpr int kMaxItersPerAction = 50;
constexpr double kZ90 = 1.281551565545; // standard normal quantile at 0.90
constexpr double kMinRawAmount = 0.10;
constexpr double kStressMultMax = 10.0;
constexpr double kDefaultWarmupFloor = 0.1;
constexpr double kDefaultPeriodicityP50 = 50.0;

double clamp01(double v) noexcept {
  if (!std::isfinite(v)) return 0.0;
  return std::clamp(v, 0.0, 1.0);
}

// Preference of a currency relative to the sender's favourite one.
double norm_weight(const std::map<Currency, double>& weights, const Currency& eq) {
  if (weights.empty()) return 1.0;
  double max_w = 0.0;
  bool any = false;
  for (const auto& [k, w] : weights) {
    if (w > 0.0) {
      max_w = any ? std::max(max_w, w) : w;
      any = true;
    }
  }
  if (!any || max_w <= 0.0) return 0.0;
  const auto it = weights.find(eq);
  const double w = it == weights.end() ? 0.0 : it->second;
  if (w <= 0.0) return 0.0;
  return std::min(1.0, w / max_w);
}

std::optional<std::string> pick_group(Rng& rng, const BehaviorProfile* profile) {
  if (!profile || profile->recipient_group_weights.empty()) return std::nullopt;
  std::vector<std::pair<std::string, double>> items;
  double total = 0.0;
  for (const auto& [g, w] : profile->recipient_group_weights) {
    if (g.empty() || !(w > 0.0)) continue;
    items.emplace_back(g, w);
    total += w;
  }
  if (items.empty() || total <= 0.0) return std::nullopt;

  const double r = rng.uniform01() * total;
  double acc = 0.0;
  for (const auto& [g, w] : items) {
    acc += w;
    if (r <= acc) return g;
  }
  return items.back().first;
}

std::vector<Pid> reachable_nodes(const Adjacency& graph, const Pid& sender) {
  if (!graph.out.count(sender)) return {};

  std::set<Pid> visited{sender};
  std::vector<std::pair<Pid, int>> queue{{sender, 0}};
  std::size_t qi = 0;
  while (qi < queue.size() && visited.size() < kReachMaxNodes) {
    const auto [node, depth] = queue[qi++];
    if (depth >= kReachMaxDepth) continue;
    const auto it = graph.out.find(node);
    if (it == graph.out.end()) continue;
    for (const auto& n : it->second) {
      if (visited.count(n.pid)) continue;
      visited.insert(n.pid);
      queue.emplace_back(n.pid, depth + 1);
      if (visited.size() >= kReachMaxNodes) break;
    }
  }

  visited.erase(sender);
  return {visited.begin(), visited.end()};
}

struct ParticipantIndex {
  std::map<Pid, std::string> group{};
  std::map<Pid, const BehaviorProfile*> profile{};
  std::map<Pid, std::string> profile_id{};
};

ParticipantIndex index_participants(const Scenario& s) {
  ParticipantIndex idx{};
  for (const auto& p : s.participants) {
    if (p.id.empty()) continue;
    if (!p.group_id.empty()) idx.group[p.id] = p.group_id;
    if (!p.profile_id.empty()) {
      idx.profile_id[p.id] = p.profile_id;
      if (const auto* bp = s.find_profile(p.profile_id)) idx.profile[p.id] = bp;
    }
  }
  return idx;
}

template <class M>
const typename M::mapped_type* find_ptr(const M& m, const typename M::key_type& k) {
  const auto it = m.find(k);
  return it == m.end() ? nullptr : &it->second;
}

} // namespace

uint64_t PaymentPlanner::tick_seed(uint64_t run_seed, Tick tick) noexcept {
  return (run_seed * 1'000'003ull + static_cast<uint64_t>(tick)) & 0xFFFF'FFFFull;
}

uint64_t PaymentPlanner::action_seed(uint64_t tick_seed, int64_t i) noexcept {
  return (tick_seed * 1'000'003ull + static_cast<uint64_t>(i)) & 0xFFFF'FFFFull;
}

double PaymentPlanner::effective_intensity(const Scenario& s, Tick tick, int intensity_percent) noexcept {
  double intensity = clamp01(static_cast<double>(intensity_percent) / 100.0);

  const auto& wu = s.settings.warmup;
  if (wu.ticks > 0 && tick < wu.ticks) {
    const double floor = clamp01(wu.floor.value_or(kDefaultWarmupFloor));
    const double ramp = floor + (1.0 - floor) * (static_cast<double>(tick) / static_cast<double>(wu.ticks));
    intensity *= ramp;
  }
  return intensity;
}

StressMultipliers PaymentPlanner::stress_multipliers(const Scenario& s, SimMs sim_ms) {
  StressMultipliers m{};
  for (const auto& e : s.events) {
    if (!stress_active(e, sim_ms)) continue;
    for (const auto& eff : e.stress) {
      if (eff.op != "mult" || eff.field != "tx_rate") continue;
      if (!std::isfinite(eff.value) || eff.value <= 0.0) continue;
      const double v = std::min(kStressMultMax, eff.value);

      if (eff.scope.empty() || eff.scope == "all") {
        m.all *= v;
      } else if (eff.scope.rfind("group:", 0) == 0) {
        const std::string g = eff.scope.substr(6);
        if (!g.empty()) m.by_group.emplace(g, 1.0).first->second *= v;
      } else if (eff.scope.rfind("profile:", 0) == 0) {
        const std::string p = eff.scope.substr(8);
        if (!p.empty()) m.by_profile.emplace(p, 1.0).first->second *= v;
      }
    }
  }
  return m;
}

std::vector<Candidate> PaymentPlanner::candidates(const Scenario& s) {
  std::vector<Candidate> out;
  for (const auto& tl : s.trustlines) {
    if (tl.status != TrustLineStatus::Active) continue;
    if (tl.currency.empty() || tl.from.empty() || tl.to.empty()) continue;
    if (tl.limit <= 0) continue;
    out.push_back(Candidate{tl.currency, tl.to, tl.from, tl.limit});
  }
  std::sort(out.begin(), out.end(), [](const Candidate& a, const Candidate& b) {
    if (a.currency != b.currency) return a.currency < b.currency;
    if (a.receiver != b.receiver) return a.receiver < b.receiver;
    return a.sender < b.sender;
  });
  return out;
}

std::optional<Amount> PaymentPlanner::pick_amount(Rng& rng, Amount limit, const AmountModel* model) const {
  Amount cap = limit;
  if (cfg_.amount_cap) cap = std::min(cap, *cfg_.amount_cap);
  if (cap <= 0) return std::nullopt;

  const bool has_model = model && (model->p50 || model->p90 || model->min || model->max);

  std::optional<Amount> model_min{};
  if (has_model) {
    if (model->max) cap = std::min(cap, trunc2(*model->max));
    if (model->min) model_min = trunc2(*model->min);
  }
  if (cap <= 0) return std::nullopt;
  if (model_min && *model_min > cap) return std::nullopt;

  const double cap_u = to_units(cap);
  double raw = 0.0;

  if (has_model) {
    const double low = model_min ? to_units(*model_min) : kMinRawAmount;

    bool sampled = false;
    if (model->p50 && model->p90 && *model->p50 > 0.0 && *model->p90 > 0.0) {
      const double p50 = std::clamp(*model->p50, low, std::max(low, cap_u));
      const double p90 = std::clamp(*model->p90, p50, std::max(p50, cap_u));
      const double ratio = p50 > 0.0 ? p90 / p50 : 1.0;
      if (ratio > 1.0) {
        const double mu = std::log(p50);
        const double sigma = std::log(ratio) / kZ90;
        if (std::isfinite(mu) && std::isfinite(sigma) && sigma > 0.0) {
          raw = rng.lognormal(mu, sigma);
          sampled = true;
        }
      }
    }

    if (!sampled) {
      // triangular around p50, or the midpoint of [low, cap]
      double mode = model->p50 ? *model->p50 : (low + cap_u) / 2.0;
      mode = std::max(low, std::min(mode, cap_u));
      raw = rng.triangular(low, cap_u, mode);
    }
  } else {
    raw = kMinRawAmount + rng.uniform01() * cap_u;
  }

  Amount amt = std::min(trunc2(raw), cap);
  if (model_min && amt < *model_min) amt = *model_min;
  if (amt <= 0) return std::nullopt;
  return amt;
}

std::vector<PaymentIntent> PaymentPlanner::plan(const PlanContext& ctx, const Scenario& scenario,
                                                const DebtSnapshot* snapshot) const {
  std::map<Currency, std::shared_ptr<const Adjacency>> local;
  return plan_(ctx, scenario, snapshot, [&](const Currency& eq) {
    auto& g = local[eq];
    if (!g) g = std::make_shared<const Adjacency>(Adjacency::build(scenario, eq));
    return g;
  });
}

std::vector<PaymentIntent> PaymentPlanner::plan(const PlanContext& ctx, const std::shared_ptr<const Scenario>& scenario,
                                                const DebtSnapshot* snapshot, RoutingCache& cache) const {
  std::map<Currency, std::shared_ptr<const Adjacency>> held;
  return plan_(ctx, *scenario, snapshot, [&](const Currency& eq) {
    auto& g = held[eq];
    if (!g) g = cache.get(scenario, eq);
    return g;
  });
}

std::vector<PaymentIntent> PaymentPlanner::plan_(const PlanContext& ctx, const Scenario& scenario,
                                                 const DebtSnapshot* snapshot, const GraphFn& graph_of) const {
  const double intensity = effective_intensity(scenario, ctx.tick, ctx.intensity_percent);
  if (intensity <= 0.0) return {};

  const int target = std::max(1, static_cast<int>(cfg_.actions_per_tick_max * intensity));

  std::vector<Candidate> order = candidates(scenario);
  if (order.empty()) return {};

  const ParticipantIndex idx = index_participants(scenario);

  const uint64_t tseed = tick_seed(ctx.seed, ctx.tick);
  Rng tick_rng(tseed);
  tick_rng.shuffle(order);

  const StressMultipliers stress = stress_multipliers(scenario, ctx.sim_ms);

  const auto& flow = scenario.settings.flow;
  const double default_affinity = clamp01(flow.default_affinity);
  const double reciprocity_bonus = clamp01(flow.reciprocity_bonus);

  std::vector<std::string> all_groups;
  {
    std::set<std::string> gs;
    for (const auto& [pid, g] : idx.group) gs.insert(g);
    all_groups.assign(gs.begin(), gs.end());
  }

  auto members_of = [&](const std::vector<Pid>& pool, const std::string& group) {
    std::vector<Pid> out;
    for (const auto& pid : pool) {
      const auto* g = find_ptr(idx.group, pid);
      if (g && *g == group) out.push_back(pid);
    }
    return out;
  };

  auto choose_receiver = [&](Rng& rng, const Adjacency& graph, const Pid& sender,
                             const BehaviorProfile* profile) -> std::optional<Pid> {
    std::vector<Pid> reachable = reachable_nodes(graph, sender);
    if (reachable.empty()) {
      std::set<Pid> direct;
      if (const auto it = graph.out.find(sender); it != graph.out.end()) {
        for (const auto& n : it->second) {
          if (!n.pid.empty() && n.pid != sender) direct.insert(n.pid);
        }
      }
      reachable.assign(direct.begin(), direct.end());
    }
    if (reachable.empty()) return std::nullopt;

    // directed group flows
    if (flow.enabled && profile && !profile->flow_chains.empty()) {
      const auto* sender_group = find_ptr(idx.group, sender);
      if (sender_group) {
        const double affinity = profile->flow_affinity.value_or(default_affinity);
        if (rng.uniform01() < affinity) {
          std::vector<std::string> targets;
          for (const auto& [from_g, to_g] : profile->flow_chains) {
            if (from_g == *sender_group) targets.push_back(to_g);
          }
          if (!targets.empty()) {
            const std::string target_group = rng.choice(targets);
            const auto in_target = members_of(reachable, target_group);
            if (!in_target.empty()) return rng.choice(in_target);
          }
        }
      }
    }

    if (const auto g = pick_group(rng, profile)) {
      const auto in_group = members_of(reachable, *g);
      if (!in_group.empty()) return rng.choice(in_group);
    }

    // any group with a reachable member; the shuffle persists across candidates
    if (!all_groups.empty()) {
      rng.shuffle(all_groups);
      for (const auto& g : all_groups) {
        const auto in_group = members_of(reachable, g);
        if (!in_group.empty()) return rng.choice(in_group);
      }
    }

    return rng.choice(reachable);
  };

  std::vector<PaymentIntent> planned;
  planned.reserve(static_cast<std::size_t>(target));

  const int64_t max_iters = static_cast<int64_t>(target) * kMaxItersPerAction;
  for (int64_t i = 0; static_cast<int>(planned.size()) < target && i < max_iters; ++i) {
    const Candidate& c = order[static_cast<std::size_t>(i) % order.size()];

    const auto* profile_id = find_ptr(idx.profile_id, c.sender);
    const BehaviorProfile* const* pp = find_ptr(idx.profile, c.sender);
    const BehaviorProfile* profile = pp ? *pp : nullptr;

    const double base_rate = profile && profile->tx_rate ? clamp01(*profile->tx_rate) : 1.0;
    double mult = stress.all;
    if (const auto* g = find_ptr(idx.group, c.sender)) {
      if (const auto* gm = find_ptr(stress.by_group, *g)) mult *= *gm;
    }
    if (profile_id) {
      if (const auto* pm = find_ptr(stress.by_profile, *profile_id)) mult *= *pm;
    }
    const double tx_rate = clamp01(base_rate * mult);
    const double eq_weight = profile ? norm_weight(profile->equivalent_weights, c.currency) : 1.0;

    const double accept = tx_rate * eq_weight;
    if (accept <= 0.0) continue;

    Rng rng(action_seed(tseed, i));
    if (rng.uniform01() > accept) continue;

    const auto graph = graph_of(c.currency);
    if (!graph) continue;

    const auto receiver = choose_receiver(rng, *graph, c.sender, profile);
    if (!receiver) continue;

    // static bounds: sender's best outgoing, receiver's best incoming, direct edge
    const auto* out_raw = find_ptr(graph->max_outgoing_limit, c.sender);
    const Amount out_limit = out_raw ? *out_raw : c.limit;
    Amount limit = out_limit;

    const auto* recv_raw = find_ptr(graph->max_incoming_limit, *receiver);
    if (recv_raw && *recv_raw > 0) limit = std::min(limit, *recv_raw);

    const auto* direct_raw = find_ptr(graph->direct, std::make_pair(c.sender, *receiver));
    if (direct_raw && *direct_raw > 0) limit = std::min(limit, *direct_raw);

    // capacity already used by outstanding debt
    if (snapshot) {
      const Amount static_limit = limit;

      limit = std::min(limit, std::max<Amount>(0, out_limit - snapshot->outgoing_total(c.sender, c.currency)));
      if (recv_raw && *recv_raw > 0) {
        limit = std::min(limit, std::max<Amount>(0, *recv_raw - snapshot->incoming_total(*receiver, c.currency)));
      }
      if (direct_raw && *direct_raw > 0) {
        limit = std::min(limit, std::max<Amount>(0, *direct_raw - snapshot->get(c.sender, *receiver, c.currency)));
      }

      if (static_limit > 0 && limit * 2 < static_limit) {
        MCSIM_LOG_TRACE("planner.capacity_aware sender=" << c.sender << " receiver=" << *receiver
                        << " eq=" << c.currency << " static=" << format_amount(static_limit)
                        << " available=" << format_amount(limit));
      }

      // paying back nets the reverse debt first, so the bonus never
      // reaches past it
      const Amount reverse = snapshot->get(*receiver, c.sender, c.currency);
      if (reciprocity_bonus > 0.0 && reverse > 0) {
        const auto boosted = static_cast<Amount>(std::floor(static_cast<double>(limit) * (1.0 + reciprocity_bonus)));
        limit = std::min(boosted, limit + reverse);
      }
    }

    const AmountModel* model = nullptr;
    if (profile) {
      if (const auto* m = find_ptr(profile->amount_model, c.currency)) model = m;
    }

    const auto amount = pick_amount(rng, limit, model);
    if (!amount) continue;

    // larger-than-typical amounts become progressively rarer
    const double factor = profile && profile->periodicity_factor ? *profile->periodicity_factor : 1.0;
    if (factor != 1.0 && std::isfinite(factor)) {
      const double amt_u = to_units(*amount);
      const double p50 = model && model->p50 ? *model->p50 : kDefaultPeriodicityP50;
      if (amt_u > 0.0 && p50 > 0.0) {
        const double den = 1.0 + std::log(std::max(amt_u / p50, 0.1)) * factor;
        const double period_accept = den <= 0.0 ? 0.0 : clamp01(1.0 / den);
        if (rng.uniform01() > period_accept) continue;
      }
    }

    planned.push_back(PaymentIntent{static_cast<int>(planned.size()), c.currency, c.sender, *receiver, *amount});
  }

  return planned;
}

} // namespace mcsim
