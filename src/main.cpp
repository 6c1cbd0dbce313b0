#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "mcsim/config.hpp"
#include "mcsim/events.hpp"
#include "mcsim/memory_ledger.hpp"
#include "mcsim/orchestrator.hpp"
#include "mcsim/run_driver.hpp"
#include "mcsim/tick_metrics.hpp"

static const std::vector<std::string> kMetricKeys = {
  "success_rate", "bottlenecks_score", "avg_route_length", "total_debt",
  "clearing_volume", "active_participants", "active_trustlines"};

// Two neighbourhoods trading in UAH, a hub bridging them, a debt cycle to
// clear and a late joiner.
static mcsim::Scenario demo_scenario() {
  using namespace mcsim;

  Scenario s{};
  s.id = "demo-village";
  s.equivalents = {"UAH"};

  const std::vector<std::pair<Pid, std::string>> people = {
    {"alice", "north"}, {"bob", "north"}, {"carol", "north"},
    {"dave", "south"},  {"erin", "south"}, {"frank", "south"}};
  for (const auto& [pid, group] : people) {
    s.participants.push_back(Participant{pid, pid, ParticipantKind::Person, ParticipantStatus::Active, group, "household"});
  }
  s.participants.push_back(Participant{"market", "Market", ParticipantKind::Hub, ParticipantStatus::Active, "hub", "shop"});

  auto line = [&](const Pid& creditor, const Pid& debtor, int64_t units) {
    s.trustlines.push_back(TrustLine{creditor, debtor, "UAH", from_units(units), TrustLineStatus::Active});
  };
  // ring plus spokes to the market
  const std::vector<Pid> ring = {"alice", "bob", "carol", "dave", "erin", "frank"};
  for (std::size_t i = 0; i < ring.size(); ++i) {
    line(ring[i], ring[(i + 1) % ring.size()], 500);
    line(ring[(i + 1) % ring.size()], ring[i], 300);
    line("market", ring[i], 1000);
    line(ring[i], "market", 200);
  }

  BehaviorProfile household{};
  household.id = "household";
  household.tx_rate = 0.6;
  household.recipient_group_weights = {{"hub", 2.0}, {"north", 1.0}, {"south", 1.0}};
  household.amount_model["UAH"] = AmountModel{40.0, 120.0, 5.0, 250.0};
  household.flow_chains = {{"north", "south"}, {"south", "north"}};
  household.flow_affinity = 0.5;

  BehaviorProfile shop{};
  shop.id = "shop";
  shop.tx_rate = 0.9;
  shop.amount_model["UAH"] = AmountModel{80.0, 200.0, 10.0, 400.0};
  shop.periodicity_factor = 0.5;
  s.profiles = {household, shop};

  s.seed_debts = {
    SeedDebt{"bob", "alice", "UAH", from_units(60)},
    SeedDebt{"alice", "market", "UAH", from_units(60)},
    SeedDebt{"market", "bob", "UAH", from_units(60)}};

  ScenarioEvent note{};
  note.time_ms = 0;
  note.kind = ScenarioEventKind::Note;
  note.description = "market opens";

  ScenarioEvent rush{};
  rush.time_ms = 10'000;
  rush.kind = ScenarioEventKind::Stress;
  rush.duration_ms = 10'000;
  rush.description = "weekend rush";
  rush.stress.push_back(StressEffect{"mult", "tx_rate", "group:north", 1.5});

  ScenarioEvent joiner{};
  joiner.time_ms = 20'000;
  joiner.kind = ScenarioEventKind::Inject;
  joiner.description = "new neighbour";
  AddParticipant add{};
  add.participant = Participant{"grace", "grace", ParticipantKind::Person, ParticipantStatus::Active, "south", "household"};
  add.initial_trustlines.push_back(InitialTrustLine{"market", "UAH", 400.0, SponsorDirection::SponsorCreditsNew});
  add.initial_trustlines.push_back(InitialTrustLine{"market", "UAH", 150.0, SponsorDirection::NewCreditsSponsor});
  joiner.inject.push_back(add);

  s.events = {note, rush, joiner};

  s.settings.warmup.ticks = 5;
  s.settings.flow.enabled = true;
  s.settings.trust_drift.enabled = true;
  return s;
}

static void write_metrics_csv(const std::string& path, const mcsim::MemoryMetricsStore& store,
                              const std::string& run_id, const std::vector<mcsim::Currency>& eqs) {
  std::ofstream f(path);
  f << "t_ms,currency,key,value\n";
  for (const auto& eq : eqs) {
    for (const auto& key : kMetricKeys) {
      for (const auto& p : store.series(run_id, eq, key)) {
        f << p.t_ms << "," << p.currency << "," << p.key << "," << p.value << "\n";
      }
    }
  }
}

static void write_events_csv(const std::string& path, const std::vector<mcsim::EventEnvelope>& events) {
  std::ofstream f(path);
  f << "event_id,type\n";
  for (const auto& e : events) {
    f << e.event_id << "," << mcsim::to_string(mcsim::type_of(e.payload)) << "\n";
  }
}

static void usage() {
  std::cout
    << "Usage:\n"
    << "  mcsim_cli [seed] [ticks]\n"
    << "  mcsim_cli --live <seed> <ticks> [interval_ms]\n";
}

int main(int argc, char** argv) {
  const bool live = argc >= 2 && std::string(argv[1]) == "--live";
  if (live && argc < 4) { usage(); return 1; }

  uint64_t seed = 1;
  int64_t ticks = 60;
  int64_t interval_ms = 100;
  try {
    const int base = live ? 2 : 1;
    if (argc > base) seed = static_cast<uint64_t>(std::stoull(argv[base]));
    if (argc > base + 1) ticks = std::stoll(argv[base + 1]);
    if (live && argc > base + 2) interval_ms = std::stoll(argv[base + 2]);
  } catch (const std::exception&) {
    usage();
    return 1;
  }

  const mcsim::SimConfig cfg = mcsim::SimConfig::from_env();
  mcsim::MemoryLedger ledger;
  mcsim::MemoryMetricsStore store;
  mcsim::RecordingSink sink;
  mcsim::TickOrchestrator orch(ledger, cfg, &store);

  mcsim::RunSpec spec{};
  spec.run_id = "run-" + std::to_string(seed);
  spec.seed = seed;
  spec.scenario = demo_scenario();
  const auto eqs = spec.scenario.equivalents;
  mcsim::Run& run = orch.add_run(std::move(spec), &sink);

  if (live) {
    mcsim::DriverConfig dc{};
    dc.wall_interval = std::chrono::milliseconds(interval_ms);
    dc.max_ticks = ticks;
    mcsim::RunDriver driver(orch, run.id(), dc);
    if (!driver.start()) {
      std::cerr << "run " << run.id() << " could not be started\n";
      return 1;
    }
    driver.wait();
    driver.stop();
  } else {
    for (int64_t i = 0; i < ticks && run.is_running(); ++i) {
      run.advance_clock(cfg.tick_ms);
      orch.tick(run.id());
    }
    orch.stop_run(run.id());
  }

  write_metrics_csv("metrics.csv", store, run.id(), eqs);
  write_events_csv("events.csv", sink.events());

  const auto st = run.stats();
  std::cout << "RUN COMPLETE"
            << " state=" << mcsim::to_string(st.state)
            << " ticks=" << st.tick_index
            << " attempts=" << st.totals.attempts
            << " committed=" << st.totals.committed
            << " rejected=" << st.totals.rejected
            << " errors=" << st.totals.errors
            << " timeouts=" << st.totals.timeouts
            << " events=" << sink.events().size()
            << "\n";
  return st.state == mcsim::RunState::Error ? 2 : 0;
}
