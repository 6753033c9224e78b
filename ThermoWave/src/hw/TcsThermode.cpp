#include "TcsThermode.h"
#include <cmath>
#include <thread>
#include <utility>
#include "TcsCheck.h"
#include "TcsProtocol.h"
#include "../utils/Logger.hpp"

TcsThermode_C::TcsThermode_C(const tcsConfigs_S& configs, std::unique_ptr<ISerialLink_S> link)
	: configs_(configs), link_(std::move(link)) {
	forget_sent_targets();
}

TcsThermode_C::~TcsThermode_C() {
	close();
}

void TcsThermode_C::forget_sent_targets() {
	last_sent_tenths_.fill(-1);
}

void TcsThermode_C::send(const std::string& cmd) {
	TCHECK(link_ != nullptr && link_->is_open(), "serial link not open (cmd '" + cmd + "')");
	TCHECK(link_->write_line(cmd), "write of '" + cmd + "' to " + configs_.port);
}

void TcsThermode_C::connect() {
	TCHECK(link_ != nullptr, "no serial link");
	TCHECK(link_->open(), "open " + configs_.port);

	send(tcs::cmd_quiet());
	send(tcs::cmd_neutral(configs_.baseline_temp));
	send(tcs::cmd_duration(0, configs_.max_duration_ms));
	send(tcs::cmd_ramp_speed(0, configs_.device_ramp_speed));
	send(tcs::cmd_return_speed(0, configs_.device_return_speed));
	forget_sent_targets();
	send_all_targets(configs_.baseline_temp);
	send(tcs::cmd_follow_mode());

	connected_ = true;
	LOG_ALWAYS("TCS: connected on " << configs_.port << ", follow mode, baseline "
		<< configs_.baseline_temp << " C");
}

void TcsThermode_C::send_all_targets(double temp_c) {
	for (std::size_t z = 0; z < NUM_ZONES; ++z) {
		send(tcs::cmd_target(static_cast<int>(z) + 1, temp_c));
		last_sent_tenths_[z] = tcs::to_tenths(temp_c);
	}
}

void TcsThermode_C::set_zone_temperatures(const zoneTemps_T& temps) {
	TCHECK(connected_, "set_zone_temperatures before connect");
	for (std::size_t z = 0; z < temps.size(); ++z) {
		TCHECK(std::isfinite(temps[z]), "non-finite target for zone " + std::to_string(z + 1));
		const int tenths = tcs::to_tenths(temps[z]);
		// device holds its last target in follow mode; only send changes
		if (tenths == last_sent_tenths_[z]) {
			continue;
		}
		send(tcs::cmd_target(static_cast<int>(z) + 1, temps[z]));
		last_sent_tenths_[z] = tenths;
	}
}

zoneTemps_T TcsThermode_C::read_zone_temperatures() {
	TCHECK(connected_, "read_zone_temperatures before connect");
	const auto timeout = std::chrono::milliseconds{ configs_.reply_timeout_ms };
	const int attempts = (configs_.read_retries > 0) ? configs_.read_retries : 1;

	std::string last_problem;
	for (int attempt = 1; attempt <= attempts; ++attempt) {
		link_->discard_input();
		send(tcs::cmd_query_temperatures());
		std::optional<std::string> reply = link_->read_line(timeout);

		if (!reply.has_value()) {
			last_problem = "timeout after " + std::to_string(configs_.reply_timeout_ms) + " ms";
		} else if (tcs::is_error_reply(*reply)) {
			// device says something is wrong: no point retrying
			TCHECK(false, "device reported '" + *reply + "'");
		} else if (auto temps = tcs::parse_temperature_reply(*reply)) {
			return *temps;
		} else {
			last_problem = "malformed reply '" + *reply + "'";
		}

		LOG_WARN("TCS: read attempt " << attempt << "/" << attempts << " failed: " << last_problem);
		if (attempt < attempts && configs_.retry_delay_ms > 0) {
			std::this_thread::sleep_for(std::chrono::milliseconds{ configs_.retry_delay_ms });
		}
	}
	TCHECK(false, "temperature read gave up: " + last_problem);
	return zoneTemps_T{}; // unreachable, TCHECK(false) throws
}

void TcsThermode_C::return_to_baseline() {
	TCHECK(connected_, "return_to_baseline before connect");
	forget_sent_targets();
	send_all_targets(configs_.baseline_temp);
	LOG_ALWAYS("TCS: returned all zones to baseline " << configs_.baseline_temp << " C");
}

void TcsThermode_C::close() noexcept {
	if (!link_ || !link_->is_open()) {
		connected_ = false;
		return;
	}
	// best effort: every step is attempted even if an earlier one fails
	try {
		TWARN_IF_FAIL(link_->write_line(tcs::cmd_abort()), "abort on close");
		for (std::size_t z = 0; z < NUM_ZONES; ++z) {
			TWARN_IF_FAIL(link_->write_line(tcs::cmd_target(static_cast<int>(z) + 1, configs_.baseline_temp)),
			              "baseline on close");
		}
	} catch (const std::exception& e) {
		LOG_ERR("TCS: close sequence error: " << e.what());
	}
	link_->close();
	connected_ = false;
	LOG_ALWAYS("TCS: port closed");
}
