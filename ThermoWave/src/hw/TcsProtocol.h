/*
==============================================================================
	File: TcsProtocol.h
	Desc: ASCII command encoding / reply decoding for the TCS II.1 stimulator.
	Temperatures travel as tenths of a degree, speeds as tenths of C/s,
	durations as ms. Zone 0 addresses all zones, 1..5 a single zone.

	  F            quiet mode (no unsolicited temperature stream)
	  Nttt         neutral / baseline temperature
	  Dzddddd      stimulation duration
	  Vzssss       ramp speed
	  Rzssss       return speed
	  Czttt        target temperature
	  Om           follow mode (track latest target continuously)
	  A            abort stimulation
	  E            query temperatures -> "xxx+0300+0301+0299+0300+0302"
==============================================================================
*/

#pragma once
#include <string>
#include <optional>
#include "../utils/Types.h"

namespace tcs {

std::string cmd_quiet();
std::string cmd_neutral(double temp_c);
std::string cmd_duration(int zone, int duration_ms);
std::string cmd_ramp_speed(int zone, double c_per_s);
std::string cmd_return_speed(int zone, double c_per_s);
std::string cmd_target(int zone, double temp_c);
std::string cmd_follow_mode();
std::string cmd_abort();
std::string cmd_query_temperatures();

// tenths of a degree, rounded, clamped to the device's 0..99.9 C range
int to_tenths(double value);

// Parses the reply to 'E'. Takes the last NUM_ZONES signed fields (the
// device prepends the neutral temperature on some firmware). nullopt if the
// line carries fewer than NUM_ZONES fields or garbage.
std::optional<zoneTemps_T> parse_temperature_reply(const std::string& line);

// Device-side error lines start with '!' or "ERR"
bool is_error_reply(const std::string& line);

} // namespace tcs
