/*
==============================================================================
	File: SimulatedThermode.h
	Desc: Stand-in for the TCS stimulator. Each zone follows its commanded
	target through a first-order lag (time constant tau) integrated on the
	injected clock, plus small bounded gaussian read noise from a fixed-seed
	RNG. Same commands + same clock => same readings, every run.

	A read never returns the command instantaneously: the plant only moves
	when clock time passes between calls.

  NOTE: Not designed to be used across multiple threads (no atomics)
  (owned by the block controller for the lifetime of one block)

==============================================================================
*/

#pragma once
#include <cstddef>
#include <random>    // std::mt19937, std::normal_distribution
#include "../utils/Types.h"
#include "../utils/TickTimer.hpp" // IClock_S
#include "IThermodeChannel.h"

class SimulatedThermode_C : public IThermodeChannel_S {
public:
	struct simConfigs_S {
		double baseline_temp = 30.0;  // C, initial plant state + return target
		double tau_s = 1.0;           // first-order lag time constant
		double noise_sigma = 0.02;    // C, read noise std dev (0 = off)
		double noise_bound = 0.05;    // C, |noise| never exceeds this
		unsigned seed = 0xC0FFEEu;
		double io_latency_s = 0.0;    // simulated serial round trip per set/read

		// fault injection (tests)
		long fail_on_read = -1;       // 1-based read that throws, -1 = never
		bool fail_return_to_baseline = false;
	}; // simConfigs_S

	// Constructors/Destructors
	SimulatedThermode_C(const simConfigs_S& configs, IClock_S& clock);
	// should not be able to copy: delete copy constructor/assignment operator
	SimulatedThermode_C(const SimulatedThermode_C&) = delete;
	SimulatedThermode_C& operator=(const SimulatedThermode_C&) = delete;
	~SimulatedThermode_C() override = default;

	void connect() override;
	void set_zone_temperatures(const zoneTemps_T& temps) override;
	zoneTemps_T read_zone_temperatures() override;
	void return_to_baseline() override;
	void close() noexcept override;
	const char* backend_name() const override { return "simulated"; }

	// introspection for tests / logs
	zoneTemps_T plant_state() const { return plant_; }
	zoneTemps_T target() const { return target_; }
	std::size_t n_sets() const { return n_sets_; }
	std::size_t n_reads() const { return n_reads_; }
	std::size_t n_return_to_baseline() const { return n_return_to_baseline_; }

private:
	simConfigs_S configs_;
	IClock_S& clock_;
	std::mt19937 rng_;
	std::normal_distribution<double> noise_;

	bool connected_ = false;
	time_point_T last_update_{};
	zoneTemps_T plant_{};
	zoneTemps_T target_{};

	std::size_t n_sets_ = 0;
	std::size_t n_reads_ = 0;
	std::size_t n_return_to_baseline_ = 0;

	void advance_plant(); // integrate lag up to clock_.now()
	void simulate_io_latency();
	double draw_noise();
	void require_connected(const char* op) const;
}; // SimulatedThermode_C
