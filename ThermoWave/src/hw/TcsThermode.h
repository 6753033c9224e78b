/*
==============================================================================
	File: TcsThermode.h
	Desc: Real TCS II.1 thermode channel. Runs the device in follow mode: we
	push new zone targets every tick and the device ramps toward each one at
	its (fast) internal ramp speed, so the waveform shape comes from the
	software update sequence.

	Init sequence:
	  quiet -> neutral(baseline) -> durations(max) -> ramp speed ->
	  return speed -> targets(baseline) -> follow mode
	Cleanup:
	  abort -> targets(baseline) -> close port

	Every communication failure is a thermode_fault. Temperature reads are
	retried a bounded number of times on malformed / missing replies first.
==============================================================================
*/

#pragma once
#include <memory>
#include <string>
#include <chrono>
#include "../utils/Types.h"
#include "IThermodeChannel.h"
#include "SerialPort.h"

class TcsThermode_C : public IThermodeChannel_S {
public:
	struct tcsConfigs_S {
		std::string port = "/dev/ttyACM0";
		int baud = 115200;
		double baseline_temp = 30.0;
		double device_ramp_speed = 100.0;   // C/s, fast so each 0.1 s micro-step completes
		double device_return_speed = 100.0; // C/s
		int max_duration_ms = 99999;        // keeps the device safety timer out of long blocks
		int reply_timeout_ms = 40;          // per attempt, must fit inside one tick
		int read_retries = 3;
		int retry_delay_ms = 5;
	}; // tcsConfigs_S

	TcsThermode_C(const tcsConfigs_S& configs, std::unique_ptr<ISerialLink_S> link);
	~TcsThermode_C() override;
	TcsThermode_C(const TcsThermode_C&) = delete;
	TcsThermode_C& operator=(const TcsThermode_C&) = delete;

	void connect() override;
	void set_zone_temperatures(const zoneTemps_T& temps) override;
	zoneTemps_T read_zone_temperatures() override;
	void return_to_baseline() override;
	void close() noexcept override;
	const char* backend_name() const override { return "tcs"; }

private:
	tcsConfigs_S configs_;
	std::unique_ptr<ISerialLink_S> link_;
	bool connected_ = false;
	// last value sent per zone in tenths, -1 = unknown (forces a send)
	std::array<int, NUM_ZONES> last_sent_tenths_{};

	void send(const std::string& cmd);
	void send_all_targets(double temp_c);
	void forget_sent_targets();
}; // TcsThermode_C
