/*
Advisory monitor: tails the newest (or given) record log read-only, prints a
summary line every poll and serves the latest snapshot on GET /state.
Never writes to anything the block process owns.

usage: ThermoWaveMonitor [record_log.tsv] [--port=N] [--poll-ms=N]
*/
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "utils/Logger.hpp"
#include "utils/SessionPaths.hpp"
#include "config/CliArgs.hpp"
#include "config/ConfigError.h"
#include "monitor/RecordLogReader.h"
#include "monitor/MonitorSnapshot.h"
#include "monitor/MonitorState.hpp"
#include "monitor/MonitorServer.hpp"

namespace sp = thermowave::sesspaths;

static std::atomic<bool> g_stop{false};
static std::atomic<bool> g_http_done{false};

void handle_sigint(int) {
    g_stop.store(true, std::memory_order_relaxed);
}

void http_thread_fn(MonitorServer_C& server) {
    logger::tlabel = "HTTP Server";
    try {
        server.http_listen_for_poll_requests(); // blocks until http_close_server()
    }
    catch (const std::exception& e) {
        LOG_ERR("http thread exception: " << e.what());
    }
    g_http_done.store(true, std::memory_order_release);
}

// sleep in small steps so Ctrl+C is noticed quickly
static void sleep_interruptible(std::chrono::milliseconds total) {
    const auto end = std::chrono::steady_clock::now() + total;
    while (!g_stop.load(std::memory_order_acquire) && std::chrono::steady_clock::now() < end) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

int main(int argc, char** argv) {
    logger::init();
    logger::tlabel = "monitor";
    std::signal(SIGINT, handle_sigint);

    monitorArgs_S args;
    try {
        args = cli::parse_monitor_cli(std::vector<std::string>(argv + 1, argv + argc));
    }
    catch (const config_error& e) {
        LOG_ERR(e.what());
        LOG_ERR("usage: " << argv[0] << " [record_log.tsv] [--port=N] [--poll-ms=N]");
        return 4;
    }
    std::optional<std::filesystem::path> explicit_log;
    if (args.log_path) {
        explicit_log = *args.log_path;
    }
    const int port = args.port;
    const long poll_ms = args.poll_ms;

    MonitorState_s state;
    MonitorServer_C server(state, port);
    // routes are bound here so the http thread only ever listens
    if (!server.http_start_server()) {
        LOG_ERR("monitor http server failed to start");
        return 1;
    }
    std::thread http(http_thread_fn, std::ref(server));

    const std::filesystem::path data_root = sp::find_project_root() / "data";
    std::unique_ptr<RecordLogReader_C> reader;

    while (!g_stop.load(std::memory_order_acquire)) {
        // follow whichever log is newest unless one was given
        std::optional<std::filesystem::path> target = explicit_log;
        if (!target) {
            target = sp::find_latest_record_log(data_root);
        }
        if (!target) {
            LOG_DBG("no record log under " << data_root.string() << " yet");
            sleep_interruptible(std::chrono::milliseconds(poll_ms));
            continue;
        }
        if (!reader || reader->path() != *target) {
            LOG_ALWAYS("monitoring " << target->string());
            reader = std::make_unique<RecordLogReader_C>(*target);
        }

        reader->poll();
        monitorSnapshot_S snap = monitor::build_snapshot(
            reader->rows(), monitor::read_sidecar(sp::sidecar_for_record_log(reader->path())));
        snap.log_name = reader->path().filename().string();
        snap.n_malformed = reader->n_malformed();
        state.publish(snap);
        LOG_ALWAYS(monitor::snapshot_summary_line(snap));

        sleep_interruptible(std::chrono::milliseconds(poll_ms));
    }

    LOG_ALWAYS("stopping monitor");
    // stop() is a no-op until listen() is accepting, so wait for either
    while (!g_http_done.load(std::memory_order_acquire) && !server.is_listening()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    server.http_close_server();
    http.join();
    return 0;
}
