/*
==============================================================================
	File: BlockConfig.hpp
	Desc: Immutable parameters for one stimulation block. Built once (CLI or
	test), validated, then passed by const reference to every component.
	Defaults follow the lab protocol: 30 C baseline, +/-20 C triangle at
	1 C/s (80 s cycles), 8 cycles, 30 s baseline buffers, 10 Hz updates.
==============================================================================
*/

#pragma once
#include <string>
#include <cstddef>
#include "../utils/Types.h"
#include "ConfigError.h"

struct blockConfig_S {
	// waveform
	double baseline_temp = 30.0;      // C
	double temp_min = 10.0;           // C, hard safety floor
	double temp_max = 50.0;           // C, hard safety ceiling
	double max_delta = 20.0;          // C, triangle amplitude
	double ramp_rate = 1.0;           // C/s
	double cycle_duration_s = 80.0;
	int cycles_per_block = 8;
	double baseline_duration_s = 30.0; // before and after stimulation
	double update_hz = 10.0;

	// condition
	int block_index = 0;
	std::string mask_name = "P1_W";
	WaveDirection_E direction = WaveDirection_WarmFirst;

	// scanner timing
	double tr_s = 1.5;
	double start_offset_s = 6.0;      // trigger -> first baseline tick (4 dummy volumes)

	// recording
	std::size_t flush_every = 10;     // record log rows between flushes
}; // blockConfig_S

namespace blockcfg {

// throws config_error; logs (does not throw) for soft inconsistencies
void validate_config(const blockConfig_S& cfg);

std::size_t baseline_ticks(const blockConfig_S& cfg);
std::size_t cycle_ticks(const blockConfig_S& cfg);
std::size_t stimulation_ticks(const blockConfig_S& cfg);
std::size_t total_ticks(const blockConfig_S& cfg);

// "NonTGI" / "TGI" from the configured mask
std::string block_type(const blockConfig_S& cfg);

void log_config(const blockConfig_S& cfg);

} // namespace blockcfg
