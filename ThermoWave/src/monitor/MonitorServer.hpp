/*
MONITOR HTTP SERVER : READER
- starts httplib::Server on 127.0.0.1 (read-only, advisory)
- answers GET /state with the latest snapshot the monitor loop published
- blocks inside listen(), so it lives on its own thread
*/
#pragma once
#include <atomic>
#include <string_view>
#include <httplib.h>
#include "MonitorState.hpp"

/*
GET /state:
{
  "seq": int,          // bumps on every poll that published a snapshot
  "has_log": bool,     // false until a record log has been found
  "snapshot": {...}    // monitor::snapshot_to_json, or null
}
*/

class MonitorServer_C {
public: // API
    explicit MonitorServer_C(MonitorState_s& stateRef, int port = 7778);
    ~MonitorServer_C();
    MonitorServer_C(const MonitorServer_C&) = delete;
    MonitorServer_C& operator=(const MonitorServer_C&) = delete;

    bool http_start_server(); // constructs httplib::Server + routes
    bool http_listen_for_poll_requests(); // blocking .listen()
    bool http_close_server(); // stop() so .listen() returns
    bool get_is_running() const { return is_running_.load(std::memory_order_acquire); }
    // true once the socket is bound and listen() is accepting
    bool is_listening() const { return liveServerRef_ != nullptr && liveServerRef_->is_running(); }
    int port() const { return port_; }

    // body served by GET /state; public so it can be checked without a socket
    std::string build_state_json() const;

private:
    MonitorState_s& stateRef_;
    httplib::Server* liveServerRef_;
    int port_;
    std::atomic<bool> is_running_ = false;

    void handle_get_state(const httplib::Request& req, httplib::Response& res);
    void handle_options_and_set(const httplib::Request& req, httplib::Response& res); // CORS preflight
    void write_json(httplib::Response& res, std::string_view json_body) const;
}; // MonitorServer_C
