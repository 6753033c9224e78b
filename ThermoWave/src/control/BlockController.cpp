#include "BlockController.hpp"
#include <cmath>
#include <utility>
#include "../utils/Logger.hpp"
#include "../waveform/Waveform.h"
#include "../hw/TcsCheck.h"

struct block_transition {
    BlockPhase_E from;
    BlockEvent_E event;
    BlockPhase_E to;
};

static const block_transition block_transition_table[] = {
    // from                      event                        to
    {BlockPhase_Idle,         BlockEvent_Start,            BlockPhase_BaselinePre},

    {BlockPhase_BaselinePre,  BlockEvent_PhaseElapsed,     BlockPhase_Stimulation},
    {BlockPhase_Stimulation,  BlockEvent_PhaseElapsed,     BlockPhase_BaselinePost},
    {BlockPhase_BaselinePost, BlockEvent_PhaseElapsed,     BlockPhase_Done},

    {BlockPhase_BaselinePre,  BlockEvent_Cancel,           BlockPhase_Aborted},
    {BlockPhase_Stimulation,  BlockEvent_Cancel,           BlockPhase_Aborted},
    {BlockPhase_BaselinePost, BlockEvent_Cancel,           BlockPhase_Aborted},

    {BlockPhase_Idle,         BlockEvent_HardwareFault,    BlockPhase_Faulted},
    {BlockPhase_BaselinePre,  BlockEvent_HardwareFault,    BlockPhase_Faulted},
    {BlockPhase_Stimulation,  BlockEvent_HardwareFault,    BlockPhase_Faulted},
    {BlockPhase_BaselinePost, BlockEvent_HardwareFault,    BlockPhase_Faulted},

    {BlockPhase_Idle,         BlockEvent_InternalError,    BlockPhase_Faulted},
    {BlockPhase_BaselinePre,  BlockEvent_InternalError,    BlockPhase_Faulted},
    {BlockPhase_Stimulation,  BlockEvent_InternalError,    BlockPhase_Faulted},
    {BlockPhase_BaselinePost, BlockEvent_InternalError,    BlockPhase_Faulted},
};

BlockController_C::BlockController_C(const blockConfig_S& cfg,
                                     std::unique_ptr<IThermodeChannel_S> channel,
                                     IBlockSink_S& sink,
                                     IClock_S& clock)
    : cfg_(cfg), channel_(std::move(channel)), sink_(sink), clock_(clock), ticks_(clock) {
}

void BlockController_C::processEvent(BlockEvent_E ev) {
    for (const auto& t : block_transition_table) {
        if (state_ == t.from && ev == t.event) {
            // match found
            onStateExit(state_, ev);
            prevState_ = state_;
            state_ = t.to;
            LOG_DBG("BC: " << BlockPhaseToString(prevState_) << " -> " << BlockPhaseToString(state_));
            onStateEnter(prevState_, state_);
            return;
        }
    }
    LOG_DBG("BC: event " << static_cast<int>(ev) << " ignored in " << BlockPhaseToString(state_));
}

std::optional<BlockEvent_E> BlockController_C::detectEvent(const std::atomic<bool>& cancel) const {
    // (1) operator / signal cancel, only ever observed between ticks
    if (cancel.load(std::memory_order_acquire)) {
        return BlockEvent_Cancel;
    }
    // (2) current phase consumed its tick budget
    if (phase_tick_ >= phase_len_) {
        return BlockEvent_PhaseElapsed;
    }
    return std::nullopt; // keep ticking
}

void BlockController_C::begin_phase(std::size_t n_ticks) {
    phase_len_ = n_ticks;
    phase_tick_ = 0;
    phase_onset_s_ = seconds_between(trigger_, ticks_.deadline(tick_));
    LOG_ALWAYS("BC: " << BlockPhaseToString(state_) << " for " << n_ticks << " ticks (onset "
               << phase_onset_s_ << " s)");
}

void BlockController_C::emit_phase(BlockPhase_E phase) {
    if (phase_tick_ == 0) {
        return; // nothing happened in this phase
    }
    phaseTiming_S p{};
    p.phase = phase;
    p.trial_type = (phase == BlockPhase_Stimulation) ? "stimulation" : "baseline";
    p.onset_s = phase_onset_s_;
    p.duration_s = static_cast<double>(phase_tick_) / cfg_.update_hz;
    sink_.on_phase(p);
}

void BlockController_C::onStateEnter(BlockPhase_E prevState, BlockPhase_E newState) {
    (void)prevState;
    switch (newState) {
        case BlockPhase_BaselinePre:
            begin_phase(blockcfg::baseline_ticks(cfg_));
            break;

        case BlockPhase_Stimulation:
            stim_tick_ = 0;
            begin_phase(blockcfg::stimulation_ticks(cfg_));
            break;

        case BlockPhase_BaselinePost:
            begin_phase(blockcfg::baseline_ticks(cfg_));
            break;

        case BlockPhase_Done:
            result_.outcome = BlockOutcome_Completed;
            shutdown_block(false);
            break;

        case BlockPhase_Aborted:
            LOG_WARN("BC: block aborted at tick " << tick_);
            result_.outcome = BlockOutcome_Aborted;
            shutdown_block(false);
            break;

        case BlockPhase_Faulted:
            if (hardware_fault_) {
                LOG_ERR("BC: hardware fault at tick " << tick_ << ": " << result_.fault_text);
                result_.outcome = BlockOutcome_HardwareFault;
            } else {
                LOG_ERR("BC: internal error at tick " << tick_ << ": " << result_.fault_text);
                result_.outcome = BlockOutcome_InternalError;
            }
            shutdown_block(true);
            break;

        default:
            break;
    }
}

void BlockController_C::onStateExit(BlockPhase_E state, BlockEvent_E ev) {
    (void)ev;
    switch (state) {
        case BlockPhase_BaselinePre:
        case BlockPhase_BaselinePost:
            emit_phase(state);
            break;

        case BlockPhase_Stimulation:
            // aborted / faulted mid-cycle: keep what the cycle collected
            if (qc_ && qc_->cycle_open()) {
                close_cycle(true);
            }
            emit_phase(state);
            break;

        default:
            break;
    }
}

void BlockController_C::close_cycle(bool partial) {
    const qcSummary_S s = qc_->finalize_cycle(partial);
    result_.cycles.push_back(s);
    sink_.on_cycle_summary(s);
    LOG_ALWAYS("QC cycle " << s.cycle_index << (partial ? " (partial)" : "")
        << ": onset=" << s.onset_latency_s << " s"
        << " ramp=" << s.mean_ramp_rate << "+/-" << s.std_ramp_rate << " C/s"
        << " warm=" << s.mean_warming_rate << " cool=" << s.mean_cooling_rate
        << " err=" << s.mean_temp_error << " (max " << s.max_temp_error << ") C"
        << " flags=" << s.n_ramp_flags << " n=" << s.n_samples);
}

void BlockController_C::run_tick() {
    const std::size_t k = tick_;
    ticks_.wait_for_tick(k);
    const time_point_T started = clock_.now();

    record_S rec{};
    rec.tick = k;
    rec.phase = state_;
    rec.block_index = cfg_.block_index;
    rec.mask_name = cfg_.mask_name;
    rec.warm_first = (cfg_.direction == WaveDirection_WarmFirst);

    const bool stimulating = (state_ == BlockPhase_Stimulation);
    if (stimulating) {
        const std::size_t j = stim_tick_;
        const int cycle = static_cast<int>(j / cycle_len_);
        if (j % cycle_len_ == 0) {
            qc_->start_cycle(cycle);
        }
        // nominal stimulation time keeps the waveform exact under jitter
        const double t = static_cast<double>(j) / cfg_.update_hz;
        rec.delta = waveform::delta_at(t, cfg_.max_delta, cfg_.ramp_rate, cfg_.direction);
        rec.commanded = masks::apply_mask(mask_, rec.delta, cfg_.baseline_temp, cfg_.temp_min, cfg_.temp_max);
        rec.block_type = block_type_;
        rec.cycle_index = cycle;
    } else {
        rec.delta = 0.0;
        rec.commanded.fill(cfg_.baseline_temp);
        rec.block_type = block_type_ + "_baseline";
        rec.cycle_index = -1;
    }

    channel_->set_zone_temperatures(rec.commanded);
    rec.actual = channel_->read_zone_temperatures();

    rec.onset_s = seconds_between(trigger_, started);
    rec.volume = static_cast<int>(std::floor(rec.onset_s / cfg_.tr_s)) + 1;

    sink_.on_record(rec);
    result_.n_records++;

    if (stimulating) {
        qc_->accumulate(rec);
        result_.n_stim_records++;
        stim_tick_++;
        if (stim_tick_ % cycle_len_ == 0) {
            close_cycle(false);
        }
    }

    phase_tick_++;
    tick_++;

    if (ticks_.check_tick_overrun(k)) {
        result_.n_overruns++;
        // first few in full, then a reminder every 100
        if (result_.n_overruns <= 5 || result_.n_overruns % 100 == 0) {
            LOG_WARN("BC: tick " << k << " overran its " << (1000.0 / cfg_.update_hz)
                     << " ms budget (took " << seconds_between(started, clock_.now()) * 1000.0
                     << " ms, overruns so far " << result_.n_overruns << ")");
        }
    }
}

// must be called from inside a catch block
void BlockController_C::fail_block(const char* what, bool hardware) {
    result_.fault_text = what;
    fault_ = std::current_exception();
    hardware_fault_ = hardware;
    processEvent(hardware ? BlockEvent_HardwareFault : BlockEvent_InternalError);
}

void BlockController_C::shutdown_block(bool best_effort) {
    // safe state first, bookkeeping second
    result_.n_return_to_baseline++;
    try {
        channel_->return_to_baseline();
    } catch (const std::exception& e) {
        if (best_effort) {
            // already faulted: log, never replace the original fault
            LOG_ERR("BC: best-effort return to baseline failed: " << e.what());
        } else {
            LOG_ERR("BC: return to baseline failed: " << e.what());
            const bool hardware = dynamic_cast<const thermode_fault*>(&e) != nullptr;
            result_.outcome = hardware ? BlockOutcome_HardwareFault : BlockOutcome_InternalError;
            result_.fault_text = e.what();
            fault_ = std::current_exception();
        }
    }
    channel_->close();
    ticks_.stop_timer();
    sink_.on_block_end(result_);
    LOG_ALWAYS("BC: block " << cfg_.block_index << " ended "
               << BlockOutcomeToString(result_.outcome)
               << " records=" << result_.n_records
               << " stim_records=" << result_.n_stim_records
               << " cycles=" << result_.cycles.size()
               << " overruns=" << result_.n_overruns);
}

blockResult_S BlockController_C::run_block(time_point_T trigger_time, const std::atomic<bool>& cancel) {
    logger::tlabel = "BlockController";

    // (1) everything that can be wrong with the request, before any hardware command
    blockcfg::validate_config(cfg_);
    mask_ = masks::find_mask(cfg_.mask_name);
    block_type_ = MaskFamilyToString(mask_.family);
    cycle_len_ = blockcfg::cycle_ticks(cfg_);
    qc_.emplace(cfg_, mask_);
    TCHECK(channel_ != nullptr, "block controller has no thermode channel");

    result_ = blockResult_S{};
    fault_ = nullptr;
    hardware_fault_ = true;
    state_ = BlockPhase_Idle;
    tick_ = 0;
    trigger_ = trigger_time;
    ticks_.start_timer(trigger_time + seconds_to_dur(cfg_.start_offset_s), cfg_.update_hz);

    blockcfg::log_config(cfg_);
    LOG_ALWAYS("BC: backend=" << channel_->backend_name()
               << " total_ticks=" << blockcfg::total_ticks(cfg_)
               << " (" << blockcfg::total_ticks(cfg_) / cfg_.update_hz << " s)");
    sink_.on_block_start(cfg_);

    // (2) bring up hardware
    try {
        channel_->connect();
    } catch (const thermode_fault& e) {
        fail_block(e.what(), true);
        std::rethrow_exception(fault_);
    } catch (const std::exception& e) {
        fail_block(e.what(), false);
        std::rethrow_exception(fault_);
    }

    // (3) tick until a terminal state
    processEvent(BlockEvent_Start);
    while (!isTerminalPhase(state_)) {
        std::optional<BlockEvent_E> ev = detectEvent(cancel);
        if (ev.has_value()) {
            processEvent(ev.value());
            continue;
        }
        try {
            run_tick();
        } catch (const thermode_fault& e) {
            fail_block(e.what(), true);
        } catch (const std::exception& e) {
            // sink or bookkeeping failure: same safe shutdown, different outcome
            fail_block(e.what(), false);
        }
    }

    if (fault_) {
        std::rethrow_exception(fault_);
    }
    return result_;
}
