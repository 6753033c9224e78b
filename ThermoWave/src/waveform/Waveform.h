/*
==============================================================================
	File: Waveform.h
	Desc: Triangular temperature-offset (delta) generator.
	Pure functions of time: no state, no RNG, identical inputs give
	bit-identical outputs.

	Shape (warm-first), period P = 4A/r, slope magnitude r:
	    0 -> +A (P/4) -> 0 (P/2) -> -A (3P/4) -> 0 (P)
	Cool-first is the same triangle shifted by half a period:
	    delta_cool(t) == delta_warm(t + P/2)
==============================================================================
*/

#pragma once
#include <vector>
#include <cstddef>
#include "../utils/Types.h"

namespace waveform {

// 4A/r; A and r must be > 0 (validated upstream)
double triangle_period(double amplitude, double ramp_rate);

// t in seconds from stimulation onset
double delta_at(double t, double amplitude, double ramp_rate, WaveDirection_E direction);

// Vectorized delta_at over an arbitrary (monotonic) time grid, for previews
std::vector<double> delta_series(const std::vector<double>& times,
                                 double amplitude, double ramp_rate,
                                 WaveDirection_E direction);

// n = round(duration_s * update_hz) samples at i / update_hz
std::vector<double> time_grid(double duration_s, double update_hz);

} // namespace waveform
