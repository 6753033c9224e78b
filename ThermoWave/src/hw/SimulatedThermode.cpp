#include "SimulatedThermode.h"
#include <algorithm>
#include <cmath>
#include <string>
#include "TcsCheck.h"
#include "../utils/Logger.hpp"

SimulatedThermode_C::SimulatedThermode_C(const simConfigs_S& configs, IClock_S& clock)
	: configs_(configs),
	  clock_(clock),
	  rng_(configs.seed),
	  noise_(0.0, configs.noise_sigma > 0.0 ? configs.noise_sigma : 1.0) {
	plant_.fill(configs_.baseline_temp);
	target_.fill(configs_.baseline_temp);
}

void SimulatedThermode_C::connect() {
	connected_ = true;
	last_update_ = clock_.now();
	LOG_ALWAYS("sim thermode: connected (tau=" << configs_.tau_s
		<< " s, noise_sigma=" << configs_.noise_sigma
		<< " C, seed=" << configs_.seed << ")");
}

void SimulatedThermode_C::require_connected(const char* op) const {
	TCHECK(connected_, std::string(op) + " on closed simulated thermode");
}

void SimulatedThermode_C::advance_plant() {
	const time_point_T now = clock_.now();
	const double dt = seconds_between(last_update_, now);
	last_update_ = now;
	if (dt <= 0.0) {
		return;
	}
	// exact discretization of dx/dt = (target - x) / tau for piecewise-constant target
	const double alpha = (configs_.tau_s > 0.0) ? (1.0 - std::exp(-dt / configs_.tau_s)) : 1.0;
	for (std::size_t z = 0; z < plant_.size(); ++z) {
		plant_[z] += (target_[z] - plant_[z]) * alpha;
	}
}

void SimulatedThermode_C::simulate_io_latency() {
	if (configs_.io_latency_s > 0.0) {
		clock_.sleep_until(clock_.now() + seconds_to_dur(configs_.io_latency_s));
	}
}

double SimulatedThermode_C::draw_noise() {
	if (configs_.noise_sigma <= 0.0) {
		return 0.0;
	}
	const double n = noise_(rng_);
	return std::clamp(n, -configs_.noise_bound, configs_.noise_bound);
}

void SimulatedThermode_C::set_zone_temperatures(const zoneTemps_T& temps) {
	require_connected("set_zone_temperatures");
	simulate_io_latency();
	// plant tracked the previous target up to now
	advance_plant();
	target_ = temps;
	n_sets_++;
}

zoneTemps_T SimulatedThermode_C::read_zone_temperatures() {
	require_connected("read_zone_temperatures");
	n_reads_++;
	if (configs_.fail_on_read > 0 && static_cast<long>(n_reads_) == configs_.fail_on_read) {
		TCHECK(false, "injected read fault on read #" + std::to_string(n_reads_));
	}
	simulate_io_latency();
	advance_plant();

	zoneTemps_T out{};
	for (std::size_t z = 0; z < plant_.size(); ++z) {
		out[z] = plant_[z] + draw_noise();
	}
	return out;
}

void SimulatedThermode_C::return_to_baseline() {
	require_connected("return_to_baseline");
	n_return_to_baseline_++;
	TCHECK(!configs_.fail_return_to_baseline, "injected return_to_baseline fault");
	advance_plant();
	target_.fill(configs_.baseline_temp);
	LOG_DBG("sim thermode: return to baseline " << configs_.baseline_temp << " C");
}

void SimulatedThermode_C::close() noexcept {
	if (!connected_) {
		return;
	}
	connected_ = false;
	LOG_ALWAYS("sim thermode: closed after " << n_sets_ << " sets / " << n_reads_ << " reads");
}
