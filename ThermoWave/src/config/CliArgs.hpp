/*
==============================================================================
	File: CliArgs.hpp
	Desc: Everything the orchestrator needs for one run, parsed from
	--key=value flags. Block parameters land in blockConfig_S; channel
	parameters in the channel's own config struct.

	Unknown flags and unparsable numbers are config_error (nothing touches
	hardware before parsing succeeds).
==============================================================================
*/

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "BlockConfig.hpp"
#include "../hw/SimulatedThermode.h"
#include "../hw/TcsThermode.h"

struct appConfig_S {
	blockConfig_S block;
	SimulatedThermode_C::simConfigs_S sim;
	TcsThermode_C::tcsConfigs_S tcs;

	std::string subject_id = "01";
	std::string session_id = "01";
	std::string run_label;        // empty -> "<block_index+1>"
	std::string data_root;        // empty -> <project root>/data

	bool simulate = false;        // SimulatedThermode_C instead of the serial device
	bool emulate_trigger = false; // Enter instead of the scanner's '5'
	bool preview = false;         // print one cycle as TSV and exit
	bool allow_rerun = false;     // run even if a completed sidecar exists
	bool show_help = false;
}; // appConfig_S

// ThermoWaveMonitor: [record_log.tsv] [--port=N] [--poll-ms=N]
struct monitorArgs_S {
	std::optional<std::string> log_path; // empty -> follow the newest log
	int port = 7778;
	long poll_ms = 2000;
};

namespace cli {

// throws config_error
appConfig_S parse_cli(int argc, char** argv);
appConfig_S parse_cli(const std::vector<std::string>& args);

std::string usage(const std::string& prog);

// throws config_error; port must be 1..65535, poll_ms 1..3600000
monitorArgs_S parse_monitor_cli(const std::vector<std::string>& args);

} // namespace cli
