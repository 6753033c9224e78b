/*
==============================================================================
	File: Types.h
	Desc: Common type definitions between modules.
	This header is used by:
  - Waveform / SpatialMask: zone temperature vectors, mask polarities.
  - BlockController (producer): builds one record_S per tick.
  - QCTracker, Recorder (consumers): fold / persist records, emit summaries.
  - Monitor: re-parses records from the log on disk.

==============================================================================
*/

#pragma once
#include <cstdint>
#include <vector>
#include <array>
#include <cstddef>
#include <string>
#include <chrono>
#include <limits>

// _T for type
// Use steady clock for time measurements (monotonic, not affected by system clock changes)
using clock_T = std::chrono::steady_clock;
using ms_T = std::chrono::milliseconds;
using time_point_T = std::chrono::time_point<clock_T>;
using dur_T = clock_T::duration;
using secs_T = std::chrono::duration<double>; // fractional seconds, convert at the edges only

/* START CONFIGS */

// TCS stimulator head: 5 independently driven peltier zones
inline constexpr std::size_t NUM_ZONES = 5;

// Record log layout: onset, volume, block_index, block_type, cycle_index,
// mask_name, warm_first, delta, 5x set, 5x actual
inline constexpr std::size_t RECORD_LOG_NUM_COLS = 8 + 2 * NUM_ZONES;

inline constexpr double NaN_D = std::numeric_limits<double>::quiet_NaN();

/* END CONFIGS */

using zoneTemps_T = std::array<double, NUM_ZONES>;
using zonePolarity_T = std::array<int, NUM_ZONES>;

/* START ENUMS */

enum WaveDirection_E {
	WaveDirection_WarmFirst, // delta rises first (0 -> +A -> 0 -> -A)
	WaveDirection_CoolFirst, // half-period shifted (0 -> -A -> 0 -> +A)
}; // WaveDirection_E

enum MaskFamily_E {
	MaskFamily_NonTGI,
	MaskFamily_TGI,
}; // MaskFamily_E

enum BlockPhase_E {
	BlockPhase_Idle,
	BlockPhase_BaselinePre,
	BlockPhase_Stimulation,
	BlockPhase_BaselinePost,
	BlockPhase_Done,
	BlockPhase_Aborted,
	BlockPhase_Faulted,
}; // BlockPhase_E

enum BlockEvent_E {
	BlockEvent_Start,
	BlockEvent_PhaseElapsed, // tick budget for the current phase consumed
	BlockEvent_Cancel,       // operator / signal requested stop
	BlockEvent_HardwareFault,
	BlockEvent_InternalError, // anything thrown that is not a thermode_fault
	BlockEvent_None,
}; // BlockEvent_E

enum BlockOutcome_E {
	BlockOutcome_None,
	BlockOutcome_Completed,
	BlockOutcome_Aborted,
	BlockOutcome_HardwareFault,
	BlockOutcome_InternalError,
}; // BlockOutcome_E

/* END ENUMS */

/* START STRUCTS */

// One row of the record log. Created once per tick by the controller and
// never mutated after it is handed to the sink.
struct record_S {
	std::size_t tick = 0;          // global tick index within the block
	double onset_s = 0.0;          // measured time since scanner trigger
	int volume = 0;                // MR volume, 1-based
	int block_index = 0;
	std::string block_type;        // "NonTGI", "TGI", "<type>_baseline"
	int cycle_index = -1;          // -1 during baseline phases
	std::string mask_name;
	bool warm_first = true;
	double delta = 0.0;
	zoneTemps_T commanded{};
	zoneTemps_T actual{};
	BlockPhase_E phase = BlockPhase_Idle;
}; // record_S

// Per-cycle quality summary. NaN where the cycle produced nothing to average.
struct qcSummary_S {
	int cycle_index = -1;
	double onset_latency_s = NaN_D;
	double mean_ramp_rate = NaN_D;
	double std_ramp_rate = NaN_D;
	double mean_warming_rate = NaN_D;
	double mean_cooling_rate = NaN_D;
	double warming_cooling_diff = NaN_D;
	double mean_temp_error = NaN_D;
	double max_temp_error = NaN_D;
	int n_ramp_flags = 0;
	int n_samples = 0;
	bool partial = false; // closed early by abort / fault
}; // qcSummary_S

// Events file row (one per phase)
struct phaseTiming_S {
	BlockPhase_E phase = BlockPhase_Idle;
	std::string trial_type; // "baseline" / "stimulation"
	double onset_s = 0.0;
	double duration_s = 0.0;
}; // phaseTiming_S

struct blockResult_S {
	BlockOutcome_E outcome = BlockOutcome_None;
	std::size_t n_records = 0;
	std::size_t n_stim_records = 0;
	std::size_t n_overruns = 0;
	std::size_t n_return_to_baseline = 0;
	std::vector<qcSummary_S> cycles;
	std::string fault_text;
}; // blockResult_S

/* END STRUCTS */

/* START HELPERS */

inline const char* BlockPhaseToString(BlockPhase_E phase) {
	switch (phase) {
		case BlockPhase_Idle:         return "Idle";
		case BlockPhase_BaselinePre:  return "BaselinePre";
		case BlockPhase_Stimulation:  return "Stimulation";
		case BlockPhase_BaselinePost: return "BaselinePost";
		case BlockPhase_Done:         return "Done";
		case BlockPhase_Aborted:      return "Aborted";
		case BlockPhase_Faulted:      return "Faulted";
		default:                      return "Unknown";
	}
}

inline const char* BlockOutcomeToString(BlockOutcome_E outcome) {
	switch (outcome) {
		case BlockOutcome_Completed:     return "Completed";
		case BlockOutcome_Aborted:       return "Aborted";
		case BlockOutcome_HardwareFault: return "HardwareFault";
		case BlockOutcome_InternalError: return "InternalError";
		case BlockOutcome_None:
		default:                         return "None";
	}
}

inline const char* MaskFamilyToString(MaskFamily_E family) {
	return (family == MaskFamily_TGI) ? "TGI" : "NonTGI";
}

inline bool isTerminalPhase(BlockPhase_E phase) {
	return phase == BlockPhase_Done || phase == BlockPhase_Aborted || phase == BlockPhase_Faulted;
}

/* END HELPERS */
