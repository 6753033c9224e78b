/*
==============================================================================
	File: MonitorSnapshot.h
	Desc: Advisory live view of a running block, rebuilt from the record log
	(+ its sidecar) on every poll. Nothing here feeds back into control.
==============================================================================
*/

#pragma once
#include <array>
#include <filesystem>
#include <string>
#include <vector>
#include "../utils/Types.h"

// what the sidecar says about the block being written
struct sidecarInfo_S {
	bool loaded = false;
	std::string block_type;
	std::string mask_name;
	bool warm_first = true;
	std::string outcome;
	double sampling_hz = NaN_D;
	double baseline_temp = NaN_D;
	double cycle_duration_s = NaN_D;
	int cycles_per_block = 0;
	double baseline_duration_s = NaN_D;
}; // sidecarInfo_S

struct monitorSnapshot_S {
	std::string log_name;
	sidecarInfo_S sidecar;
	std::size_t n_rows = 0;
	std::size_t n_malformed = 0;
	std::size_t expected_rows = 0; // 0 when unknown
	double last_onset_s = NaN_D;
	int last_volume = 0;
	int last_cycle = -1;
	std::string last_block_type;
	double last_delta = NaN_D;
	std::array<bool, NUM_ZONES> zone_active{};
	zoneTemps_T last_set{};
	zoneTemps_T last_actual{};
	zoneTemps_T last_error{};
	double mean_abs_error = NaN_D; // stimulation rows, active zones
	double max_abs_error = NaN_D;
	double recent_ramp_rate = NaN_D; // last ~1 s, active zones
}; // monitorSnapshot_S

namespace monitor {

// commanded range above this marks a zone as driven
inline constexpr double ACTIVE_ZONE_MIN_RANGE = 0.5;

sidecarInfo_S read_sidecar(const std::filesystem::path& sidecar_json);

monitorSnapshot_S build_snapshot(const std::vector<record_S>& rows, const sidecarInfo_S& sidecar);

std::string snapshot_to_json(const monitorSnapshot_S& snap);

// single console line for the monitor loop
std::string snapshot_summary_line(const monitorSnapshot_S& snap);

} // namespace monitor
