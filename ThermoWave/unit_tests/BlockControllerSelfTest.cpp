#include <atomic>
#include <limits>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "SelfTestUtils.hpp"
#include "../src/config/BlockConfig.hpp"
#include "../src/config/ConfigError.h"
#include "../src/control/BlockController.hpp"
#include "../src/hw/SimulatedThermode.h"
#include "../src/hw/TcsCheck.h"
#include "../src/record/IBlockSink.h"

/* TEST COMPONENTS:
- whole blocks against the simulated thermode on a manual clock (instant):
    completed block record counts / phases / cycles / timing grid
    cancel after k ticks -> exactly k records, one return to baseline
    hardware fault mid-stimulation -> partial data kept, fault rethrown
    failing return to baseline never hides the original fault
    bad configuration rejected before any hardware call
    a failing sink ends the block as InternalError, not HardwareFault
    one slow tick does not shift later tick times
*/

// Collects everything the controller emits. Optionally raises the cancel
// flag once a given number of records has been seen.
class CollectingSink_C : public IBlockSink_S {
public:
    void on_block_start(const blockConfig_S& cfg) override { started = true; cfg_seen = cfg; }
    void on_record(const record_S& rec) override {
        records.push_back(rec);
        if (cancel_flag != nullptr && records.size() == cancel_after) {
            cancel_flag->store(true, std::memory_order_release);
        }
        if (records.size() == throw_after) {
            throw std::runtime_error("disk full");
        }
    }
    void on_cycle_summary(const qcSummary_S& s) override { summaries.push_back(s); }
    void on_phase(const phaseTiming_S& p) override { phases.push_back(p); }
    void on_block_end(const blockResult_S& r) override { n_ends++; ended = r; }

    bool started = false;
    blockConfig_S cfg_seen{};
    std::vector<record_S> records;
    std::vector<qcSummary_S> summaries;
    std::vector<phaseTiming_S> phases;
    int n_ends = 0;
    blockResult_S ended{};

    std::atomic<bool>* cancel_flag = nullptr;
    std::size_t cancel_after = 0;
    std::size_t throw_after = 0; // 0: never
};

// Wraps a channel and burns clock time inside one chosen set call
class SlowTickChannel_C : public IThermodeChannel_S {
public:
    SlowTickChannel_C(std::unique_ptr<IThermodeChannel_S> inner, ManualClock_C& clock,
                      std::size_t slow_set, double extra_s)
        : inner_(std::move(inner)), clock_(clock), slow_set_(slow_set), extra_s_(extra_s) {}

    void connect() override { inner_->connect(); }
    void set_zone_temperatures(const zoneTemps_T& temps) override {
        if (n_sets_++ == slow_set_) {
            clock_.advance_s(extra_s_);
        }
        inner_->set_zone_temperatures(temps);
    }
    zoneTemps_T read_zone_temperatures() override { return inner_->read_zone_temperatures(); }
    void return_to_baseline() override { inner_->return_to_baseline(); }
    void close() noexcept override { inner_->close(); }
    const char* backend_name() const override { return "slow-sim"; }

private:
    std::unique_ptr<IThermodeChannel_S> inner_;
    ManualClock_C& clock_;
    std::size_t slow_set_;
    double extra_s_;
    std::size_t n_sets_ = 0;
};

// Never comes up
class DeadChannel_C : public IThermodeChannel_S {
public:
    void connect() override { TCHECK(false, "no device on port"); }
    void set_zone_temperatures(const zoneTemps_T&) override { n_calls++; }
    zoneTemps_T read_zone_temperatures() override { n_calls++; return zoneTemps_T{}; }
    void return_to_baseline() override { TCHECK(false, "not connected"); }
    void close() noexcept override {}
    const char* backend_name() const override { return "dead"; }
    int n_calls = 0;
};

// 8 s triangle (A=2, r=1), 2 cycles, 1 s baselines, 10 Hz -> 10 + 160 + 10 ticks
static blockConfig_S small_cfg() {
    blockConfig_S cfg{};
    cfg.max_delta = 2.0;
    cfg.ramp_rate = 1.0;
    cfg.cycle_duration_s = 8.0;
    cfg.cycles_per_block = 2;
    cfg.baseline_duration_s = 1.0;
    cfg.update_hz = 10.0;
    cfg.start_offset_s = 0.5;
    cfg.tr_s = 1.5;
    cfg.mask_name = "P1_W";
    return cfg;
}

static SimulatedThermode_C::simConfigs_S sim_cfg() {
    SimulatedThermode_C::simConfigs_S s{};
    s.tau_s = 0.3;
    return s;
}

static constexpr std::size_t BASE_TICKS = 10, STIM_TICKS = 160, TOTAL_TICKS = 180;

static void check_completed_block() {
    ManualClock_C clock;
    CollectingSink_C sink;
    auto owned = std::make_unique<SimulatedThermode_C>(sim_cfg(), clock);
    SimulatedThermode_C* sim = owned.get();
    const blockConfig_S cfg = small_cfg();
    BlockController_C bc(cfg, std::move(owned), sink, clock);

    std::atomic<bool> cancel{false};
    const time_point_T trigger = clock.now();
    const blockResult_S r = bc.run_block(trigger, cancel);

    EXPECT(r.outcome == BlockOutcome_Completed, "outcome " << BlockOutcomeToString(r.outcome));
    EXPECT(bc.getPhase() == BlockPhase_Done, "final phase");
    EXPECT(r.n_records == TOTAL_TICKS && sink.records.size() == TOTAL_TICKS, "record count " << sink.records.size());
    EXPECT(r.n_stim_records == STIM_TICKS, "stimulation records = cycles * cycle * hz");
    EXPECT(r.n_return_to_baseline == 1 && sim->n_return_to_baseline() == 1, "one return to baseline");
    EXPECT(r.n_overruns == 0, "no overruns on a manual clock");
    EXPECT(sink.started && sink.n_ends == 1 && sink.ended.outcome == BlockOutcome_Completed, "sink lifecycle");
    EXPECT(sim->n_sets() == TOTAL_TICKS && sim->n_reads() == TOTAL_TICKS, "one set + one read per tick");

    EXPECT(r.cycles.size() == 2 && sink.summaries.size() == 2, "two cycle summaries");
    for (const auto& s : r.cycles) {
        EXPECT(!s.partial && s.n_samples == 80, "full cycle of 80 samples");
        EXPECT(std::isfinite(s.onset_latency_s) && s.onset_latency_s > 0.0, "onset latency measured");
    }

    EXPECT(sink.phases.size() == 3, "baseline / stimulation / baseline phases");
    if (sink.phases.size() == 3) {
        EXPECT(sink.phases[0].trial_type == "baseline" && selftest::near(sink.phases[0].onset_s, 0.5, 1e-6), "pre baseline");
        EXPECT(sink.phases[1].trial_type == "stimulation" && selftest::near(sink.phases[1].onset_s, 1.5, 1e-6)
               && selftest::near(sink.phases[1].duration_s, 16.0, 1e-9), "stimulation phase");
        EXPECT(selftest::near(sink.phases[2].onset_s, 17.5, 1e-6), "post baseline");
    }

    if (sink.records.size() == TOTAL_TICKS) {
        for (std::size_t k = 0; k < TOTAL_TICKS; ++k) {
            const record_S& rec = sink.records[k];
            const double expected_onset = 0.5 + 0.1 * static_cast<double>(k);
            EXPECT(selftest::near(rec.onset_s, expected_onset, 1e-6), "tick " << k << " onset " << rec.onset_s);
            EXPECT(rec.volume == static_cast<int>(std::floor(rec.onset_s / cfg.tr_s)) + 1, "volume at tick " << k);
            for (double v : rec.commanded) {
                EXPECT(v >= cfg.temp_min && v <= cfg.temp_max, "commanded out of bounds");
            }
            const bool stim = (k >= BASE_TICKS && k < BASE_TICKS + STIM_TICKS);
            if (!stim) {
                EXPECT(rec.cycle_index == -1 && rec.block_type == "NonTGI_baseline" && rec.delta == 0.0,
                       "baseline row at tick " << k);
            }
        }
        const record_S& first_stim = sink.records[BASE_TICKS];
        EXPECT(first_stim.cycle_index == 0 && first_stim.delta == 0.0 && first_stim.block_type == "NonTGI",
               "stimulation starts at delta 0");
        const record_S& peak = sink.records[BASE_TICKS + 20];
        EXPECT(selftest::near(peak.delta, 2.0, 1e-9) && selftest::near(peak.commanded[0], 32.0, 1e-9)
               && peak.commanded[2] == 30.0, "warm peak at P/4 on driven zones only");
        EXPECT(sink.records[BASE_TICKS + 80].cycle_index == 1, "second cycle index");
        EXPECT(sink.records[TOTAL_TICKS - 1].phase == BlockPhase_BaselinePost, "ends in post baseline");
    }
}

static void check_abort_after_k(std::size_t k) {
    ManualClock_C clock;
    CollectingSink_C sink;
    std::atomic<bool> cancel{false};
    sink.cancel_flag = &cancel;
    sink.cancel_after = k;
    auto owned = std::make_unique<SimulatedThermode_C>(sim_cfg(), clock);
    SimulatedThermode_C* sim = owned.get();
    BlockController_C bc(small_cfg(), std::move(owned), sink, clock);

    if (k == 0) cancel.store(true);
    const blockResult_S r = bc.run_block(clock.now(), cancel);

    EXPECT(r.outcome == BlockOutcome_Aborted, "k=" << k << " outcome " << BlockOutcomeToString(r.outcome));
    EXPECT(sink.records.size() == k && r.n_records == k, "k=" << k << " got " << sink.records.size() << " records");
    EXPECT(r.n_return_to_baseline == 1 && sim->n_return_to_baseline() == 1, "k=" << k << " one return to baseline");
    EXPECT(sink.n_ends == 1 && sink.ended.outcome == BlockOutcome_Aborted, "k=" << k << " sink told once");
    if (k > BASE_TICKS && k < BASE_TICKS + 80) {
        EXPECT(r.cycles.size() == 1 && r.cycles[0].partial
               && r.cycles[0].n_samples == static_cast<int>(k - BASE_TICKS), "k=" << k << " partial cycle kept");
    }
}

static void check_fault_mid_stimulation(bool return_also_fails) {
    ManualClock_C clock;
    CollectingSink_C sink;
    SimulatedThermode_C::simConfigs_S sc = sim_cfg();
    sc.fail_on_read = 40; // tick 39, stimulation tick 29
    sc.fail_return_to_baseline = return_also_fails;
    auto owned = std::make_unique<SimulatedThermode_C>(sc, clock);
    SimulatedThermode_C* sim = owned.get();
    BlockController_C bc(small_cfg(), std::move(owned), sink, clock);

    std::atomic<bool> cancel{false};
    std::string what;
    try {
        bc.run_block(clock.now(), cancel);
    } catch (const thermode_fault& e) {
        what = e.what();
    }
    EXPECT(what.find("injected read fault") != std::string::npos,
           "original read fault propagates (return_also_fails=" << return_also_fails << "): '" << what << "'");
    EXPECT(bc.result().outcome == BlockOutcome_HardwareFault, "outcome HardwareFault");
    EXPECT(bc.getPhase() == BlockPhase_Faulted, "final phase Faulted");
    EXPECT(sink.records.size() == 39, "records before the fault kept, got " << sink.records.size());
    EXPECT(sim->n_return_to_baseline() == 1, "exactly one best-effort return to baseline");
    EXPECT(sink.n_ends == 1 && sink.ended.outcome == BlockOutcome_HardwareFault, "sink sees the fault outcome");
    EXPECT(bc.result().cycles.size() == 1 && bc.result().cycles[0].partial
           && bc.result().cycles[0].n_samples == 29, "partial cycle closed");
}

static void check_return_failure_after_completion() {
    ManualClock_C clock;
    CollectingSink_C sink;
    SimulatedThermode_C::simConfigs_S sc = sim_cfg();
    sc.fail_return_to_baseline = true;
    BlockController_C bc(small_cfg(), std::make_unique<SimulatedThermode_C>(sc, clock), sink, clock);
    std::atomic<bool> cancel{false};
    EXPECT_THROWS(bc.run_block(clock.now(), cancel), thermode_fault, "failed safe state is a fault");
    EXPECT(bc.result().outcome == BlockOutcome_HardwareFault, "outcome HardwareFault");
    EXPECT(sink.records.size() == TOTAL_TICKS, "all records still written");
    EXPECT(sink.ended.outcome == BlockOutcome_HardwareFault, "sidecar would say HardwareFault");
}

static void check_sink_failure_is_not_hardware_fault() {
    ManualClock_C clock;
    CollectingSink_C sink;
    sink.throw_after = 25;
    auto owned = std::make_unique<SimulatedThermode_C>(sim_cfg(), clock);
    SimulatedThermode_C* sim = owned.get();
    BlockController_C bc(small_cfg(), std::move(owned), sink, clock);

    std::atomic<bool> cancel{false};
    bool threw_runtime = false;
    bool threw_thermode = false;
    try {
        bc.run_block(clock.now(), cancel);
    } catch (const thermode_fault&) {
        threw_thermode = true;
    } catch (const std::runtime_error& e) {
        threw_runtime = std::string(e.what()) == "disk full";
    }
    EXPECT(threw_runtime && !threw_thermode, "sink error rethrown as itself");
    EXPECT(bc.result().outcome == BlockOutcome_InternalError, "outcome InternalError, got "
           << BlockOutcomeToString(bc.result().outcome));
    EXPECT(bc.result().fault_text == "disk full", "fault text kept");
    EXPECT(bc.getPhase() == BlockPhase_Faulted, "final phase Faulted");
    EXPECT(sim->n_return_to_baseline() == 1, "safe shutdown still performed");
    EXPECT(sink.n_ends == 1 && sink.ended.outcome == BlockOutcome_InternalError, "sink sees InternalError");
    EXPECT(sink.records.size() == 25, "no ticks after the failure");
}

static void check_connect_failure() {
    ManualClock_C clock;
    CollectingSink_C sink;
    auto owned = std::make_unique<DeadChannel_C>();
    DeadChannel_C* dead = owned.get();
    BlockController_C bc(small_cfg(), std::move(owned), sink, clock);
    std::atomic<bool> cancel{false};
    EXPECT_THROWS(bc.run_block(clock.now(), cancel), thermode_fault, "connect failure");
    EXPECT(bc.result().outcome == BlockOutcome_HardwareFault, "connect failure outcome");
    EXPECT(sink.records.empty() && dead->n_calls == 0, "no ticks without a device");
    EXPECT(sink.n_ends == 1, "sink closed");
}

static void check_config_rejected_before_hardware() {
    ManualClock_C clock;
    {
        CollectingSink_C sink;
        blockConfig_S cfg = small_cfg();
        cfg.mask_name = "P9_X";
        auto owned = std::make_unique<SimulatedThermode_C>(sim_cfg(), clock);
        SimulatedThermode_C* sim = owned.get();
        BlockController_C bc(cfg, std::move(owned), sink, clock);
        std::atomic<bool> cancel{false};
        EXPECT_THROWS(bc.run_block(clock.now(), cancel), config_error, "unknown mask");
        EXPECT(sim->n_sets() == 0 && sim->n_reads() == 0 && sim->n_return_to_baseline() == 0,
               "no hardware call on bad config");
        EXPECT(!sink.started && sink.n_ends == 0, "nothing recorded");
    }
    {
        CollectingSink_C sink;
        blockConfig_S cfg = small_cfg();
        cfg.temp_min = 35.0; // baseline below the floor
        BlockController_C bc(cfg, std::make_unique<SimulatedThermode_C>(sim_cfg(), clock), sink, clock);
        std::atomic<bool> cancel{false};
        EXPECT_THROWS(bc.run_block(clock.now(), cancel), config_error, "baseline outside bounds");
    }
    // infinite amplitude / ramp / duration would turn every set-point into NaN
    const double inf = std::numeric_limits<double>::infinity();
    for (int which = 0; which < 4; ++which) {
        CollectingSink_C sink;
        blockConfig_S cfg = small_cfg();
        if (which == 0) cfg.max_delta = inf;
        if (which == 1) cfg.ramp_rate = inf;
        if (which == 2) cfg.cycle_duration_s = inf;
        if (which == 3) cfg.baseline_temp = std::numeric_limits<double>::quiet_NaN();
        auto owned = std::make_unique<SimulatedThermode_C>(sim_cfg(), clock);
        SimulatedThermode_C* sim = owned.get();
        BlockController_C bc(cfg, std::move(owned), sink, clock);
        std::atomic<bool> cancel{false};
        EXPECT_THROWS(bc.run_block(clock.now(), cancel), config_error, "non-finite parameter " << which);
        EXPECT(sim->n_sets() == 0 && !sink.started, "no set-point sent for non-finite parameter " << which);
    }
}

static void check_overrun_keeps_grid() {
    ManualClock_C clock;
    CollectingSink_C sink;
    auto sim = std::make_unique<SimulatedThermode_C>(sim_cfg(), clock);
    // tick 15 takes 150 ms of a 100 ms budget
    auto slow = std::make_unique<SlowTickChannel_C>(std::move(sim), clock, 15, 0.15);
    BlockController_C bc(small_cfg(), std::move(slow), sink, clock);
    std::atomic<bool> cancel{false};
    const blockResult_S r = bc.run_block(clock.now(), cancel);

    EXPECT(r.outcome == BlockOutcome_Completed, "overrun is not fatal");
    EXPECT(r.n_overruns == 1, "one overrun counted, got " << r.n_overruns);
    EXPECT(sink.records.size() == TOTAL_TICKS, "no tick skipped");
    if (sink.records.size() == TOTAL_TICKS) {
        EXPECT(selftest::near(sink.records[16].onset_s, 2.15, 1e-6), "late tick runs as soon as possible");
        EXPECT(selftest::near(sink.records[17].onset_s, 2.2, 1e-6), "next tick back on the grid");
        EXPECT(selftest::near(sink.records[100].onset_s, 10.5, 1e-6), "grid not shifted");
    }
}

int main() {
    logger::init();
    logger::tlabel = "BlockControllerSelfTest";
    LOG_ALWAYS("BlockControllerSelfTest starting...");

    check_completed_block();
    check_abort_after_k(0);
    check_abort_after_k(5);   // during the first baseline
    check_abort_after_k(25);  // mid first cycle
    check_abort_after_k(175); // during the last baseline
    check_fault_mid_stimulation(false);
    check_fault_mid_stimulation(true);
    check_return_failure_after_completion();
    check_connect_failure();
    check_sink_failure_is_not_hardware_fault();
    check_config_rejected_before_hardware();
    check_overrun_keeps_grid();

    return selftest::finish("BlockControllerSelfTest");
}
