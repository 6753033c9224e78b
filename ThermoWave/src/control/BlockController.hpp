/*
BLOCK CONTROLLER : the real-time loop for one stimulation block
- validates the block config before any hardware command (config_error)
- drives a table-driven state machine: BaselinePre -> Stimulation -> BaselinePost -> Done,
  with Cancel -> Aborted and HardwareFault / InternalError -> Faulted from any running phase
- one tick every 1/update_hz, fire times anchored at trigger + start_offset + k/hz (no drift)
- each tick: compute delta -> apply mask -> set -> read -> build record -> sink -> QC
- closes a QC cycle every cycle_duration of stimulation and hands the summary to the sink
- cancellation is polled between ticks only; abort at tick k leaves exactly k records
- terminal states always: finalize partial QC cycle, return to baseline, close channel, flush sink
- a hardware fault is rethrown to the caller after that shutdown; result() stays readable
- anything else thrown mid-block gets the same shutdown, outcome InternalError, and is rethrown
*/

#pragma once
#include <atomic>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include "../utils/Types.h"
#include "../utils/TickTimer.hpp"
#include "../config/BlockConfig.hpp"
#include "../waveform/SpatialMask.h"
#include "../hw/IThermodeChannel.h"
#include "../qc/QCTracker.h"
#include "../record/IBlockSink.h"

class BlockController_C {
public:
    BlockController_C(const blockConfig_S& cfg,
                      std::unique_ptr<IThermodeChannel_S> channel,
                      IBlockSink_S& sink,
                      IClock_S& clock);

    // Runs the whole block. Returns Completed / Aborted; throws config_error
    // before touching hardware, rethrows the hardware fault after shutdown.
    blockResult_S run_block(time_point_T trigger_time, const std::atomic<bool>& cancel);

    BlockPhase_E getPhase() const { return state_; }
    const blockResult_S& result() const { return result_; }
    IThermodeChannel_S& channel() { return *channel_; }

private:
    const blockConfig_S cfg_;
    std::unique_ptr<IThermodeChannel_S> channel_;
    IBlockSink_S& sink_;
    IClock_S& clock_;
    TickTimer_C ticks_;

    spatialMask_S mask_{};
    std::optional<QCTracker_C> qc_;
    std::string block_type_;

    BlockPhase_E state_ = BlockPhase_Idle;
    BlockPhase_E prevState_ = BlockPhase_Idle;
    time_point_T trigger_{};

    std::size_t tick_ = 0;        // next global tick
    std::size_t phase_tick_ = 0;  // ticks done in the current phase
    std::size_t phase_len_ = 0;   // tick budget of the current phase
    std::size_t stim_tick_ = 0;   // ticks done in stimulation
    std::size_t cycle_len_ = 1;   // ticks per cycle
    double phase_onset_s_ = 0.0;

    blockResult_S result_{};
    std::exception_ptr fault_;
    bool hardware_fault_ = true; // false: Faulted was entered on an internal error

    void processEvent(BlockEvent_E ev);
    void onStateEnter(BlockPhase_E prevState, BlockPhase_E newState);
    void onStateExit(BlockPhase_E state, BlockEvent_E ev);
    std::optional<BlockEvent_E> detectEvent(const std::atomic<bool>& cancel) const;

    void begin_phase(std::size_t n_ticks);
    void emit_phase(BlockPhase_E phase);
    void run_tick();
    void close_cycle(bool partial);
    void fail_block(const char* what, bool hardware);
    void shutdown_block(bool best_effort);
}; // BlockController_C
