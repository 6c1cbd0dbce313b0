#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "mcsim/types.hpp"

namespace mcsim {

class RoutingCache;

struct Participant {
  Pid id{};
  std::string name{};
  ParticipantKind kind{ParticipantKind::Person};
  ParticipantStatus status{ParticipantStatus::Active};
  std::string group_id{};
  std::string profile_id{};
};

// Credit relation: `from` (creditor) lets `to` (debtor) owe up to `limit`.
struct TrustLine {
  Pid from{};
  Pid to{};
  Currency currency{};
  Amount limit{};
  TrustLineStatus status{TrustLineStatus::Active};
};

// Per-currency amount distribution, in currency units.
struct AmountModel {
  std::optional<double> p50{};
  std::optional<double> p90{};
  std::optional<double> min{};
  std::optional<double> max{};
};

struct BehaviorProfile {
  std::string id{};
  std::optional<double> tx_rate{};
  std::map<Currency, double> equivalent_weights{};
  // insertion order matters for the weighted pick
  std::vector<std::pair<std::string, double>> recipient_group_weights{};
  std::map<Currency, AmountModel> amount_model{};
  // [from_group, to_group]
  std::vector<std::pair<std::string, std::string>> flow_chains{};
  std::optional<double> flow_affinity{};
  std::optional<double> periodicity_factor{};
};

struct StressEffect {
  std::string op{"mult"};
  std::string field{"tx_rate"};
  std::string scope{"all"}; // "all" | "group:<id>" | "profile:<id>"
  double value{1.0};
};

struct InjectDebt {
  Pid creditor{};
  Pid debtor{};
  Currency currency{};
  double amount{};
};

enum class SponsorDirection : uint8_t {
  SponsorCreditsNew = 0, // sponsor -> new participant
  NewCreditsSponsor = 1  // new participant -> sponsor
};

struct InitialTrustLine {
  Pid sponsor{};
  Currency currency{};
  double limit{};
  SponsorDirection direction{SponsorDirection::SponsorCreditsNew};
};

struct AddParticipant {
  Participant participant{};
  std::vector<InitialTrustLine> initial_trustlines{};
};

struct CreateTrustLine {
  Pid from{};
  Pid to{};
  Currency currency{};
  double limit{};
};

struct FreezeParticipant {
  Pid participant_id{};
  bool freeze_trustlines{true};
};

using InjectEffect = std::variant<InjectDebt, AddParticipant, CreateTrustLine, FreezeParticipant>;

enum class ScenarioEventKind : uint8_t { Note = 0, Stress, Inject };

struct ScenarioEvent {
  SimMs time_ms{};
  ScenarioEventKind kind{ScenarioEventKind::Note};
  std::optional<SimMs> duration_ms{};
  std::string description{};
  std::vector<StressEffect> stress{};
  std::vector<InjectEffect> inject{};
  std::optional<double> max_total_amount{};
};

// Debt present before the first tick.
struct SeedDebt {
  Pid debtor{};
  Pid creditor{};
  Currency currency{};
  Amount amount{};
};

struct WarmupSettings {
  int64_t ticks{0};
  std::optional<double> floor{}; // explicit 0 is honoured; missing means 0.1
};

struct FlowSettings {
  bool enabled{false};
  double default_affinity{0.7};
  double reciprocity_bonus{0.0};
};

struct TrustDriftConfig {
  bool enabled{false};
  double growth_rate{0.05};
  double decay_rate{0.02};
  double max_growth{2.0};
  double min_limit_ratio{0.3};
  double overload_threshold{0.8};
};

struct ScenarioSettings {
  WarmupSettings warmup{};
  FlowSettings flow{};
  TrustDriftConfig trust_drift{};
};

struct Scenario {
  std::string id{};
  std::vector<Currency> equivalents{};
  std::vector<Participant> participants{};
  std::vector<TrustLine> trustlines{};
  std::vector<BehaviorProfile> profiles{};
  std::vector<ScenarioEvent> events{};
  std::vector<SeedDebt> seed_debts{};
  ScenarioSettings settings{};

  const Participant* find_participant(const Pid& pid) const noexcept;
  const TrustLine* find_trustline(const Pid& from, const Pid& to, const Currency& eq) const noexcept;
  const BehaviorProfile* find_profile(const std::string& id) const noexcept;
};

// True while a stress window covers `sim_ms`. A zero-length window is active
// only at its start time.
bool stress_active(const ScenarioEvent& e, SimMs sim_ms) noexcept;

struct LimitUpdate {
  Pid from{};
  Pid to{};
  Currency currency{};
  Amount limit{};
};

// Owned mutable mirror of the scenario for one run. Readers take immutable
// snapshots; every mutation swaps in a new copy and evicts the routing
// cache for the currencies it touched.
class ScenarioState {
public:
  explicit ScenarioState(Scenario s, RoutingCache* cache = nullptr);

  ScenarioState(const ScenarioState&) = delete;
  ScenarioState& operator=(const ScenarioState&) = delete;

  std::shared_ptr<const Scenario> snapshot() const;

  void attach_cache(RoutingCache* cache) noexcept;

  // Each returns true if anything changed.
  bool set_trustline_limits(const std::vector<LimitUpdate>& updates);
  bool set_trustline_status(const Pid& from, const Pid& to, const Currency& eq, TrustLineStatus st);
  bool set_participant_status(const Pid& pid, ParticipantStatus st);
  bool add_participant(const Participant& p);
  bool add_trustline(const TrustLine& tl);

private:
  void invalidate_(const Currency& eq);

  mutable std::mutex mtx_;
  std::shared_ptr<const Scenario> doc_;
  RoutingCache* cache_{nullptr};
};

} // namespace mcsim
