#include "CliArgs.hpp"
#include <cerrno>
#include <cstdlib>
#include <functional>
#include <map>
#include <sstream>
#include "../waveform/SpatialMask.h"

namespace {

double to_double(const std::string& key, const std::string& v) {
    errno = 0;
    char* end = nullptr;
    const double d = std::strtod(v.c_str(), &end);
    CFG_CHECK(!v.empty() && end != nullptr && *end == '\0' && errno == 0,
              "--" + key + "=" + v + " is not a number");
    return d;
}

long to_long(const std::string& key, const std::string& v) {
    errno = 0;
    char* end = nullptr;
    const long n = std::strtol(v.c_str(), &end, 10);
    CFG_CHECK(!v.empty() && end != nullptr && *end == '\0' && errno == 0,
              "--" + key + "=" + v + " is not an integer");
    return n;
}

bool to_bool(const std::string& key, const std::string& v) {
    if (v.empty() || v == "1" || v == "true" || v == "yes") return true;
    if (v == "0" || v == "false" || v == "no") return false;
    CFG_CHECK(false, "--" + key + "=" + v + " is not a boolean");
    return false;
}

WaveDirection_E to_direction(const std::string& key, const std::string& v) {
    if (v == "warm" || v == "warm_first") return WaveDirection_WarmFirst;
    if (v == "cool" || v == "cool_first") return WaveDirection_CoolFirst;
    CFG_CHECK(false, "--" + key + "=" + v + " (expected warm|cool)");
    return WaveDirection_WarmFirst;
}

using setter_T = std::function<void(appConfig_S&, const std::string& key, const std::string& value)>;

const std::map<std::string, setter_T>& setters() {
    static const std::map<std::string, setter_T> table = {
        // block
        {"baseline",         [](appConfig_S& a, const std::string& k, const std::string& v){ a.block.baseline_temp = to_double(k, v); }},
        {"temp-min",         [](appConfig_S& a, const std::string& k, const std::string& v){ a.block.temp_min = to_double(k, v); }},
        {"temp-max",         [](appConfig_S& a, const std::string& k, const std::string& v){ a.block.temp_max = to_double(k, v); }},
        {"max-delta",        [](appConfig_S& a, const std::string& k, const std::string& v){ a.block.max_delta = to_double(k, v); }},
        {"ramp-rate",        [](appConfig_S& a, const std::string& k, const std::string& v){ a.block.ramp_rate = to_double(k, v); }},
        {"cycle-duration",   [](appConfig_S& a, const std::string& k, const std::string& v){ a.block.cycle_duration_s = to_double(k, v); }},
        {"cycles",           [](appConfig_S& a, const std::string& k, const std::string& v){ a.block.cycles_per_block = static_cast<int>(to_long(k, v)); }},
        {"baseline-duration",[](appConfig_S& a, const std::string& k, const std::string& v){ a.block.baseline_duration_s = to_double(k, v); }},
        {"hz",               [](appConfig_S& a, const std::string& k, const std::string& v){ a.block.update_hz = to_double(k, v); }},
        {"block",            [](appConfig_S& a, const std::string& k, const std::string& v){ a.block.block_index = static_cast<int>(to_long(k, v)); }},
        {"mask",             [](appConfig_S& a, const std::string&,   const std::string& v){ a.block.mask_name = v; }},
        {"direction",        [](appConfig_S& a, const std::string& k, const std::string& v){ a.block.direction = to_direction(k, v); }},
        {"tr",               [](appConfig_S& a, const std::string& k, const std::string& v){ a.block.tr_s = to_double(k, v); }},
        {"start-offset",     [](appConfig_S& a, const std::string& k, const std::string& v){ a.block.start_offset_s = to_double(k, v); }},
        {"flush-every",      [](appConfig_S& a, const std::string& k, const std::string& v){
            const long n = to_long(k, v);
            CFG_CHECK(n >= 1, "--flush-every must be >= 1");
            a.block.flush_every = static_cast<std::size_t>(n);
        }},
        // session
        {"subject",          [](appConfig_S& a, const std::string&,   const std::string& v){ a.subject_id = v; }},
        {"session",          [](appConfig_S& a, const std::string&,   const std::string& v){ a.session_id = v; }},
        {"run",              [](appConfig_S& a, const std::string&,   const std::string& v){ a.run_label = v; }},
        {"data-root",        [](appConfig_S& a, const std::string&,   const std::string& v){ a.data_root = v; }},
        // modes
        {"simulate",         [](appConfig_S& a, const std::string& k, const std::string& v){ a.simulate = to_bool(k, v); }},
        {"emulate",          [](appConfig_S& a, const std::string& k, const std::string& v){ a.emulate_trigger = to_bool(k, v); }},
        {"preview",          [](appConfig_S& a, const std::string& k, const std::string& v){ a.preview = to_bool(k, v); }},
        {"allow-rerun",      [](appConfig_S& a, const std::string& k, const std::string& v){ a.allow_rerun = to_bool(k, v); }},
        {"help",             [](appConfig_S& a, const std::string&,   const std::string&)  { a.show_help = true; }},
        // simulated channel
        {"sim-tau",          [](appConfig_S& a, const std::string& k, const std::string& v){ a.sim.tau_s = to_double(k, v); }},
        {"sim-noise",        [](appConfig_S& a, const std::string& k, const std::string& v){ a.sim.noise_sigma = to_double(k, v); }},
        {"sim-seed",         [](appConfig_S& a, const std::string& k, const std::string& v){ a.sim.seed = static_cast<unsigned>(to_long(k, v)); }},
        {"sim-latency",      [](appConfig_S& a, const std::string& k, const std::string& v){ a.sim.io_latency_s = to_double(k, v); }},
        // real channel
        {"port",             [](appConfig_S& a, const std::string&,   const std::string& v){ a.tcs.port = v; }},
        {"baud",             [](appConfig_S& a, const std::string& k, const std::string& v){ a.tcs.baud = static_cast<int>(to_long(k, v)); }},
        {"reply-timeout-ms", [](appConfig_S& a, const std::string& k, const std::string& v){ a.tcs.reply_timeout_ms = static_cast<int>(to_long(k, v)); }},
        {"read-retries",     [](appConfig_S& a, const std::string& k, const std::string& v){ a.tcs.read_retries = static_cast<int>(to_long(k, v)); }},
    };
    return table;
}

} // namespace

appConfig_S cli::parse_cli(const std::vector<std::string>& args) {
    appConfig_S app{};
    for (const auto& arg : args) {
        CFG_CHECK(arg.rfind("--", 0) == 0, "unexpected argument '" + arg + "'");
        const auto eq = arg.find('=');
        const std::string key = arg.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
        const std::string value = (eq == std::string::npos) ? std::string{} : arg.substr(eq + 1);

        const auto it = setters().find(key);
        CFG_CHECK(it != setters().end(), "unknown flag --" + key);
        it->second(app, key, value);
    }
    // the channels share the block's baseline
    app.sim.baseline_temp = app.block.baseline_temp;
    app.tcs.baseline_temp = app.block.baseline_temp;
    return app;
}

appConfig_S cli::parse_cli(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_cli(args);
}

monitorArgs_S cli::parse_monitor_cli(const std::vector<std::string>& args) {
    monitorArgs_S m{};
    for (const auto& arg : args) {
        if (arg.rfind("--port=", 0) == 0) {
            const long port = to_long("port", arg.substr(7));
            CFG_CHECK(port >= 1 && port <= 65535, "--port=" + std::to_string(port) + " out of range 1..65535");
            m.port = static_cast<int>(port);
        } else if (arg.rfind("--poll-ms=", 0) == 0) {
            m.poll_ms = to_long("poll-ms", arg.substr(10));
            CFG_CHECK(m.poll_ms >= 1 && m.poll_ms <= 3600000,
                      "--poll-ms=" + std::to_string(m.poll_ms) + " out of range 1..3600000");
        } else {
            CFG_CHECK(arg.rfind("--", 0) != 0, "unknown flag " + arg);
            CFG_CHECK(!m.log_path.has_value(), "more than one record log given");
            m.log_path = arg;
        }
    }
    return m;
}

std::string cli::usage(const std::string& prog) {
    std::ostringstream oss;
    oss << "usage: " << prog << " [--key=value ...]\n"
        << "  block:   --mask=<name> --direction=warm|cool --block=N --cycles=N\n"
        << "           --baseline=C --temp-min=C --temp-max=C --max-delta=C --ramp-rate=C/s\n"
        << "           --cycle-duration=s --baseline-duration=s --hz=N --tr=s --start-offset=s\n"
        << "           --flush-every=N\n"
        << "  session: --subject=ID --session=ID --run=LABEL --data-root=DIR --allow-rerun\n"
        << "  modes:   --simulate --emulate --preview --help\n"
        << "  sim:     --sim-tau=s --sim-noise=C --sim-seed=N --sim-latency=s\n"
        << "  device:  --port=DEV --baud=N --reply-timeout-ms=N --read-retries=N\n"
        << "  masks:  ";
    for (const auto& name : masks::mask_names()) {
        oss << " " << name;
    }
    oss << "\n";
    return oss.str();
}
