#include "TcsProtocol.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <vector>

namespace {

// readings are tenths of a degree, 0..99.9 C
constexpr int MAX_REPLY_DIGITS = 4;

std::string zone_field(char cmd, int zone, int value, int width) {
	char buf[32];
	std::snprintf(buf, sizeof(buf), "%c%d%0*d", cmd, zone, width, value);
	return buf;
}

} // namespace

int tcs::to_tenths(double value) {
	const long t = std::lround(value * 10.0);
	return static_cast<int>(std::clamp(t, 0L, 999L));
}

std::string tcs::cmd_quiet() { return "F"; }

std::string tcs::cmd_neutral(double temp_c) {
	char buf[16];
	std::snprintf(buf, sizeof(buf), "N%03d", to_tenths(temp_c));
	return buf;
}

std::string tcs::cmd_duration(int zone, int duration_ms) {
	return zone_field('D', zone, std::clamp(duration_ms, 0, 99999), 5);
}

std::string tcs::cmd_ramp_speed(int zone, double c_per_s) {
	const int tenths = static_cast<int>(std::clamp(std::lround(c_per_s * 10.0), 1L, 9999L));
	return zone_field('V', zone, tenths, 4);
}

std::string tcs::cmd_return_speed(int zone, double c_per_s) {
	const int tenths = static_cast<int>(std::clamp(std::lround(c_per_s * 10.0), 1L, 9999L));
	return zone_field('R', zone, tenths, 4);
}

std::string tcs::cmd_target(int zone, double temp_c) {
	return zone_field('C', zone, to_tenths(temp_c), 3);
}

std::string tcs::cmd_follow_mode() { return "Om"; }
std::string tcs::cmd_abort() { return "A"; }
std::string tcs::cmd_query_temperatures() { return "E"; }

std::optional<zoneTemps_T> tcs::parse_temperature_reply(const std::string& line) {
	std::vector<double> fields;
	std::size_t i = 0;
	while (i < line.size()) {
		const char c = line[i];
		if (c != '+' && c != '-') {
			++i;
			continue;
		}
		std::size_t j = i + 1;
		int value = 0;
		int digits = 0;
		while (j < line.size() && std::isdigit(static_cast<unsigned char>(line[j]))) {
			if (++digits > MAX_REPLY_DIGITS) {
				return std::nullopt; // longer than any reading the device can report
			}
			value = value * 10 + (line[j] - '0');
			++j;
		}
		if (digits == 0) {
			return std::nullopt; // sign with no number: corrupted frame
		}
		fields.push_back((c == '-' ? -value : value) / 10.0);
		i = j;
	}

	if (fields.size() < NUM_ZONES) {
		return std::nullopt;
	}
	zoneTemps_T temps{};
	const std::size_t first = fields.size() - NUM_ZONES;
	for (std::size_t z = 0; z < NUM_ZONES; ++z) {
		temps[z] = fields[first + z];
	}
	return temps;
}

bool tcs::is_error_reply(const std::string& line) {
	return (!line.empty() && line.front() == '!') || line.rfind("ERR", 0) == 0;
}
