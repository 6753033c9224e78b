#include "MonitorServer.hpp"
#include <sstream>
#include <string>
#include "../utils/Logger.hpp"

MonitorServer_C::MonitorServer_C(MonitorState_s& stateRef, int port)
    : stateRef_(stateRef), liveServerRef_(nullptr), port_(port) {
}

MonitorServer_C::~MonitorServer_C() {
    delete liveServerRef_;
}

// ============= Helpers ============
static inline void set_cors_headers(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

void MonitorServer_C::write_json(httplib::Response& res, std::string_view json_body) const {
    set_cors_headers(res);
    res.set_content(std::string(json_body), "application/json");
    res.status = 200;
}

void MonitorServer_C::handle_options_and_set(const httplib::Request& req, httplib::Response& res) {
    (void)req;
    set_cors_headers(res);
    res.status = 200;
}

std::string MonitorServer_C::build_state_json() const {
    const int seq = stateRef_.g_seq.load(std::memory_order_acquire);
    const bool has_log = stateRef_.g_has_log.load(std::memory_order_acquire);

    std::ostringstream oss;
    oss << "{"
        << "\"seq\":"     << seq                          << ","
        << "\"has_log\":" << (has_log ? "true" : "false") << ","
        << "\"snapshot\":";
    if (has_log) {
        oss << monitor::snapshot_to_json(stateRef_.get_snapshot());
    } else {
        oss << "null";
    }
    oss << "}";
    return oss.str();
}

// ============== Handlers ==================

void MonitorServer_C::handle_get_state(const httplib::Request& req, httplib::Response& res) {
    (void)req;
    write_json(res, build_state_json());
}

bool MonitorServer_C::http_start_server() {
    logger::tlabel = "HTTP Server";
    if (is_running_.load() || liveServerRef_ != nullptr) return false;

    liveServerRef_ = new httplib::Server();

    liveServerRef_->Get("/state",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_get_state(rq, rs); });

    liveServerRef_->Options("/state",
        [this](const httplib::Request& rq, httplib::Response& rs){ this->handle_options_and_set(rq, rs); });

    LOG_ALWAYS("HTTP Server successfully opened");
    return true;
}

bool MonitorServer_C::http_listen_for_poll_requests() {
    logger::tlabel = "HTTP Server";
    if (liveServerRef_ == nullptr) {
        LOG_ERR("HTTP server not initialized; cannot start listening");
        return false;
    }
    is_running_.store(true, std::memory_order_release);
    LOG_ALWAYS("HTTP listening on 127.0.0.1:" << port_);

    const bool ok = liveServerRef_->listen("127.0.0.1", port_);
    is_running_.store(false, std::memory_order_release);

    if (!ok) {
        LOG_WARN("HTTP listen failed on port " << port_);
    } else {
        LOG_ALWAYS("HTTP listen stopped");
    }
    return ok;
}

bool MonitorServer_C::http_close_server() {
    if (!liveServerRef_) return false;
    liveServerRef_->stop(); // breaks .listen()
    LOG_ALWAYS("HTTP Server closed");
    return true;
}
