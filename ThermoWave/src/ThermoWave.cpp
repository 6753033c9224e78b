#include <atomic>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <poll.h>
#include <unistd.h>
#include "utils/Logger.hpp"
#include "utils/Types.h"
#include "utils/TickTimer.hpp"
#include "utils/SessionPaths.hpp"
#include "config/CliArgs.hpp"
#include "config/BlockConfig.hpp"
#include "waveform/Waveform.h"
#include "waveform/SpatialMask.h"
#include "hw/SimulatedThermode.h"
#include "hw/TcsThermode.h"
#include "hw/SerialPort.h"
#include "hw/TcsCheck.h"
#include "record/Recorder.h"
#include "control/BlockController.hpp"

namespace sp = thermowave::sesspaths;

// process exit codes, one per terminal outcome
enum ExitCode_E {
    ExitCode_Completed = 0,
    ExitCode_Other = 1,
    ExitCode_Aborted = 2,
    ExitCode_HardwareFault = 3,
    ExitCode_ConfigError = 4,
};

// Global "please stop" flag set by Ctrl+C (SIGINT); the controller only
// looks at it between ticks
static std::atomic<bool> g_stop{false};

void handle_sigint(int) {
    g_stop.store(true, std::memory_order_relaxed);
}

// one cycle of the configured waveform, no hardware involved
static void print_preview(const blockConfig_S& cfg) {
    const spatialMask_S mask = masks::find_mask(cfg.mask_name);
    const std::vector<double> times = waveform::time_grid(cfg.cycle_duration_s, cfg.update_hz);
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "time\tdelta";
    for (std::size_t z = 0; z < NUM_ZONES; ++z) {
        std::cout << "\tzone" << (z + 1);
    }
    std::cout << "\n";
    for (double t : times) {
        const double d = waveform::delta_at(t, cfg.max_delta, cfg.ramp_rate, cfg.direction);
        const zoneTemps_T temps = masks::apply_mask(mask, d, cfg.baseline_temp, cfg.temp_min, cfg.temp_max);
        std::cout << t << "\t" << d;
        for (double v : temps) {
            std::cout << "\t" << v;
        }
        std::cout << "\n";
    }
}

// Blocks until the scanner trigger (the '5' key the scanner's interface
// types) or, in emulation mode, until Enter. Returns false on Ctrl+C / EOF.
static bool wait_for_trigger(bool emulate) {
    if (emulate) {
        LOG_ALWAYS("emulation mode: press Enter to start the block");
    } else {
        LOG_ALWAYS("waiting for scanner trigger ('5')...");
    }
    while (!g_stop.load(std::memory_order_acquire)) {
        pollfd pfd{};
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        // short timeout keeps Ctrl+C responsive
        const int rc = ::poll(&pfd, 1, 100);
        if (rc <= 0) {
            continue;
        }
        char c = 0;
        const ssize_t n = ::read(STDIN_FILENO, &c, 1);
        if (n <= 0) {
            LOG_ERR("stdin closed while waiting for trigger");
            return false;
        }
        if ((emulate && c == '\n') || (!emulate && c == '5')) {
            return true;
        }
    }
    return false;
}

static std::unique_ptr<IThermodeChannel_S> make_channel(const appConfig_S& app, IClock_S& clock) {
    if (app.simulate) {
        LOG_ALWAYS("using simulated thermode (tau=" << app.sim.tau_s << " s)");
        return std::make_unique<SimulatedThermode_C>(app.sim, clock);
    }
    LOG_ALWAYS("using TCS thermode on " << app.tcs.port);
    auto link = std::make_unique<SerialPort_C>(app.tcs.port, app.tcs.baud);
    return std::make_unique<TcsThermode_C>(app.tcs, std::move(link));
}

static int run(const appConfig_S& app) {
    blockcfg::validate_config(app.block);

    if (app.preview) {
        print_preview(app.block);
        return ExitCode_Completed;
    }

    const std::filesystem::path data_root = app.data_root.empty()
        ? sp::find_project_root() / "data"
        : std::filesystem::path(app.data_root);
    const std::string run_label = app.run_label.empty()
        ? std::to_string(app.block.block_index + 1)
        : app.run_label;

    const auto done = sp::scan_completed_runs(data_root, app.subject_id, app.session_id);
    if (sp::run_completed(done, sp::sanitize_label(run_label))) {
        if (!app.allow_rerun) {
            LOG_ERR("run " << run_label << " already completed for sub-" << app.subject_id
                    << " ses-" << app.session_id << " (pass --allow-rerun to repeat it)");
            return ExitCode_ConfigError;
        }
        LOG_WARN("run " << run_label << " already completed; repeating it (--allow-rerun)");
    }

    const sp::BlockPaths paths = sp::create_block_paths(data_root, app.subject_id, app.session_id, run_label);
    LOG_ALWAYS("record log: " << paths.record_tsv.string());
    Recorder_C recorder(paths);

    SteadyClock_C clock;
    BlockController_C controller(app.block, make_channel(app, clock), recorder, clock);

    if (!wait_for_trigger(app.emulate_trigger)) {
        LOG_WARN("no trigger received; block not started");
        return ExitCode_Aborted;
    }
    const time_point_T trigger = clock.now();
    LOG_ALWAYS("trigger received, block " << app.block.block_index << " starting");

    const blockResult_S result = controller.run_block(trigger, g_stop);
    return (result.outcome == BlockOutcome_Completed) ? ExitCode_Completed : ExitCode_Aborted;
}

int main(int argc, char** argv) {
    logger::init();
    logger::tlabel = "main";
    std::signal(SIGINT, handle_sigint);

    try {
        const appConfig_S app = cli::parse_cli(argc, argv);
        if (app.show_help) {
            std::cout << cli::usage(argv[0]);
            return ExitCode_Completed;
        }
        return run(app);
    }
    catch (const config_error& e) {
        LOG_ERR(e.what());
        std::cerr << cli::usage(argv[0]);
        return ExitCode_ConfigError;
    }
    catch (const thermode_fault& e) {
        LOG_ERR("hardware fault: " << e.what());
        return ExitCode_HardwareFault;
    }
    catch (const std::exception& e) {
        LOG_ERR("fatal: " << e.what());
        return ExitCode_Other;
    }
}
