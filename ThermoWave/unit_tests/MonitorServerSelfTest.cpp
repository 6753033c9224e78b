#include <chrono>
#include <string>
#include <thread>
#include <httplib.h>
#include "SelfTestUtils.hpp"
#include "../src/monitor/MonitorServer.hpp"
#include "../src/monitor/MonitorState.hpp"

/* TEST COMPONENTS:
- /state body before and after a snapshot is published (no socket)
- real round trip: server thread + httplib client on a loopback port,
  then a clean stop
*/

static void check_state_json() {
    MonitorState_s state;
    MonitorServer_C server(state, 0);
    const std::string before = server.build_state_json();
    EXPECT(before.find("\"has_log\":false") != std::string::npos, before);
    EXPECT(before.find("\"snapshot\":null") != std::string::npos, before);

    monitorSnapshot_S snap{};
    snap.log_name = "run-2";
    snap.n_rows = 12;
    state.publish(snap);
    const std::string after = server.build_state_json();
    EXPECT(after.find("\"seq\":1") != std::string::npos, after);
    EXPECT(after.find("\"n_rows\":12") != std::string::npos, after);
    EXPECT(after.find("\"log\":\"run-2\"") != std::string::npos, after);
}

static void check_round_trip() {
    const int port = 17778;
    MonitorState_s state;
    monitorSnapshot_S snap{};
    snap.n_rows = 3;
    state.publish(snap);

    MonitorServer_C server(state, port);
    EXPECT(server.http_start_server(), "start");
    EXPECT(!server.http_start_server(), "second start refused");
    std::thread http([&]() { server.http_listen_for_poll_requests(); });

    for (int i = 0; i < 200 && !server.is_listening(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT(server.is_listening(), "listening on " << port);

    httplib::Client client("127.0.0.1", port);
    auto res = client.Get("/state");
    EXPECT(res && res->status == 200, "GET /state answered");
    if (res) {
        EXPECT(res->body.find("\"n_rows\":3") != std::string::npos, res->body);
        EXPECT(res->get_header_value("Access-Control-Allow-Origin") == "*", "CORS header");
    }
    auto missing = client.Get("/nope");
    EXPECT(missing && missing->status == 404, "unknown route");

    server.http_close_server();
    http.join();
    EXPECT(!server.get_is_running(), "stopped");
}

int main() {
    logger::init();
    logger::tlabel = "MonitorServerSelfTest";
    LOG_ALWAYS("MonitorServerSelfTest starting...");

    check_state_json();
    check_round_trip();

    return selftest::finish("MonitorServerSelfTest");
}
