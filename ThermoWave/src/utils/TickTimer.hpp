/*
==============================================================================
	File: TickTimer.hpp
	Desc: Clock abstraction + anchored tick scheduling for the control loop.
	Tick k fires at anchor + k / update_hz. Deadlines are always computed
	from the anchor (never from "previous tick + period") so a late tick
	never shifts the ones after it.
	IClock_S lets tests swap in a manual clock; production uses steady_clock.
==============================================================================
*/

#pragma once
#include <cstddef> // for size_t
#include <chrono>
#include <thread>
#include "Types.h"

struct IClock_S {
	virtual time_point_T now() = 0;
	virtual void sleep_until(time_point_T t) = 0;
	virtual ~IClock_S() = default;
}; // IClock_S

class SteadyClock_C : public IClock_S {
public:
	time_point_T now() override { return clock_T::now(); }
	void sleep_until(time_point_T t) override { std::this_thread::sleep_until(t); }
}; // SteadyClock_C

inline double seconds_between(time_point_T from, time_point_T to) {
	return std::chrono::duration_cast<secs_T>(to - from).count();
}

inline dur_T seconds_to_dur(double s) {
	return std::chrono::duration_cast<dur_T>(secs_T(s));
}

class TickTimer_C {

public:
	explicit TickTimer_C(IClock_S& clock) : clock_(clock) {}

	// tick 0 fires at anchor
	void start_timer(time_point_T anchor, double update_hz) {
		anchor_ = anchor;
		update_hz_ = update_hz;
		timer_started = true;
	}

	void stop_timer() { timer_started = false; }

	bool is_started() const { return timer_started; }

	time_point_T anchor() const { return anchor_; }

	// fire time of tick k
	time_point_T deadline(std::size_t k) const {
		return anchor_ + seconds_to_dur(static_cast<double>(k) / update_hz_);
	}

	// blocks until tick k is due; returns immediately if already late
	void wait_for_tick(std::size_t k) {
		const time_point_T due = deadline(k);
		if (clock_.now() < due) {
			clock_.sleep_until(due);
		}
	}

	// tick k overran if its work finished after tick k+1 was due
	bool check_tick_overrun(std::size_t k) const {
		if (timer_started == false) {
			return false;
		}
		return clock_.now() > deadline(k + 1);
	}

	// elapsed ms since anchor (0ms if not started)
	std::chrono::milliseconds get_timer_value_ms() const {
		if (timer_started == false) {
			return std::chrono::milliseconds{ 0 };
		}
		return std::chrono::duration_cast<std::chrono::milliseconds>(clock_.now() - anchor_);
	}

private:
	IClock_S& clock_;
	bool timer_started = false;
	time_point_T anchor_{};
	double update_hz_ = 1.0;

}; // TickTimer_C
