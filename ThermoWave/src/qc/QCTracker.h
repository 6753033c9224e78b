/*
==============================================================================
	File: QCTracker.h
	Desc: Per-cycle quality metrics, folded incrementally (one record per
	tick) and closed at every cycle boundary.

	Per sample:
	  - ramp rate: mean over active zones of |d actual / dt|
	  - temp error: |commanded - actual| per active zone
	  - warming / cooling split by the sign of the commanded delta change
	Samples slower than RAMPING_MIN_RATE are treated as not ramping (turning
	points, holds) and excluded from the rate statistics and flags.

	Onset latency: per active zone, the time between the commanded deviation
	from baseline reaching 63.2% of the zone's clamped excursion and the
	actual deviation reaching the same level (same sign), both interpolated
	between samples. For a first-order plant this equals tau for a step and
	tends to tau for a ramp. Mean over the zones that crossed.

	finalize_cycle() never divides by zero: empty statistics come out NaN,
	counts come out 0.
==============================================================================
*/

#pragma once
#include <vector>
#include <cstddef>
#include "../utils/Types.h"
#include "../config/BlockConfig.hpp"
#include "../waveform/SpatialMask.h"

class QCTracker_C {
public:
	static constexpr double RAMPING_MIN_RATE = 0.05;     // C/s
	static constexpr double RAMP_RATE_TOLERANCE = 0.3;   // C/s
	static constexpr double TEMP_ERROR_WARN = 2.0;       // C
	static constexpr double ONSET_LEVEL_FRACTION = 0.6321205588285577; // 1 - 1/e
	static constexpr int MAX_FLAG_WARNINGS = 3;          // per cycle

	QCTracker_C(const blockConfig_S& cfg, const spatialMask_S& mask);

	void start_cycle(int cycle_index);
	void accumulate(const record_S& rec);
	qcSummary_S finalize_cycle(bool partial = false);

	bool cycle_open() const { return cycle_open_; }
	std::size_t samples_in_cycle() const { return n_samples_; }
	const std::vector<qcSummary_S>& summaries() const { return summaries_; }
	void reset_block();

private:
	struct zoneOnset_S {
		std::size_t zone = 0;
		double level = 0.0;       // C above/below baseline
		double cmd_cross_t = NaN_D;
		double act_cross_t = NaN_D;
		int sign = 0;             // direction of the first commanded excursion
		double prev_cmd_dev = NaN_D;
		double prev_act_dev = NaN_D;
	}; // zoneOnset_S

	double baseline_;
	double target_rate_;
	std::vector<std::size_t> active_;

	bool cycle_open_ = false;
	int cycle_index_ = 0;
	std::size_t n_samples_ = 0;
	std::vector<double> ramp_rates_;
	std::vector<double> warming_rates_;
	std::vector<double> cooling_rates_;
	double err_sum_ = 0.0;
	std::size_t err_count_ = 0;
	double err_max_ = NaN_D;
	int n_flags_ = 0;
	bool error_warned_ = false;
	std::vector<zoneOnset_S> onsets_;

	// previous sample (kept across cycle boundaries, the signal is continuous)
	bool has_prev_ = false;
	double prev_t_ = 0.0;
	double prev_delta_ = 0.0;
	zoneTemps_T prev_actual_{};

	std::vector<qcSummary_S> summaries_;

	void reset_cycle_state();
	void update_onsets(const record_S& rec);
	double sample_ramp_rate(const record_S& rec) const;
}; // QCTracker_C
