#include <algorithm>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "SelfTestUtils.hpp"
#include "../src/hw/SerialPort.h"
#include "../src/hw/TcsCheck.h"
#include "../src/hw/TcsProtocol.h"
#include "../src/hw/TcsThermode.h"

/* TEST COMPONENTS:
- TCS command encoding + temperature reply parsing
- TcsThermode_C over a scripted serial link (no device needed):
    init sequence, change-only target writes, read retries, hard faults,
    best-effort close
*/

// Serial link that records every written line and answers reads from a script.
// A std::nullopt entry in the script is a read timeout.
class ScriptedLink_C : public ISerialLink_S {
public:
    bool open() override { open_ = open_ok; return open_; }
    bool is_open() const override { return open_; }
    bool write_line(const std::string& line) override {
        written.push_back(line);
        return !fail_writes;
    }
    std::optional<std::string> read_line(std::chrono::milliseconds timeout) override {
        (void)timeout;
        if (replies.empty()) return std::nullopt;
        std::optional<std::string> r = replies.front();
        replies.pop_front();
        return r;
    }
    void discard_input() override { n_discards++; }
    void close() noexcept override { open_ = false; n_closes++; }

    std::size_t count(const std::string& line) const {
        return static_cast<std::size_t>(std::count(written.begin(), written.end(), line));
    }

    bool open_ok = true;
    bool fail_writes = false;
    std::vector<std::string> written;
    std::deque<std::optional<std::string>> replies;
    int n_discards = 0;
    int n_closes = 0;

private:
    bool open_ = false;
};

static TcsThermode_C::tcsConfigs_S fast_configs() {
    TcsThermode_C::tcsConfigs_S c{};
    c.port = "scripted";
    c.read_retries = 3;
    c.retry_delay_ms = 0;
    return c;
}

static void check_encoding() {
    EXPECT(tcs::cmd_quiet() == "F", tcs::cmd_quiet());
    EXPECT(tcs::cmd_neutral(30.0) == "N300", tcs::cmd_neutral(30.0));
    EXPECT(tcs::cmd_target(1, 30.0) == "C1300", tcs::cmd_target(1, 30.0));
    EXPECT(tcs::cmd_target(5, 12.34) == "C5123", tcs::cmd_target(5, 12.34));
    EXPECT(tcs::cmd_duration(0, 99999) == "D099999", tcs::cmd_duration(0, 99999));
    EXPECT(tcs::cmd_ramp_speed(0, 100.0) == "V01000", tcs::cmd_ramp_speed(0, 100.0));
    EXPECT(tcs::cmd_return_speed(3, 2.5) == "R30025", tcs::cmd_return_speed(3, 2.5));
    EXPECT(tcs::cmd_follow_mode() == "Om", "follow mode");
    EXPECT(tcs::to_tenths(120.0) == 999, "clamped to device ceiling");
    EXPECT(tcs::to_tenths(-5.0) == 0, "clamped to device floor");
}

static void check_reply_parsing() {
    auto t = tcs::parse_temperature_reply("+300+301+302+303+304");
    EXPECT(t.has_value(), "five fields parse");
    if (t) {
        EXPECT(selftest::near((*t)[0], 30.0, 1e-12) && selftest::near((*t)[4], 30.4, 1e-12), "values in tenths");
    }
    // some firmware prepends the neutral temperature: last five win
    t = tcs::parse_temperature_reply("+320+100+101+102+103+104");
    EXPECT(t.has_value() && selftest::near((*t)[0], 10.0, 1e-12), "leading neutral field skipped");
    EXPECT(!tcs::parse_temperature_reply("+300+301").has_value(), "too few fields");
    EXPECT(!tcs::parse_temperature_reply("+300+-301+302+303+304").has_value(), "sign without digits");
    EXPECT(!tcs::parse_temperature_reply("").has_value(), "empty reply");
    t = tcs::parse_temperature_reply("+0999+0300+0300+0300+0001");
    EXPECT(t.has_value() && selftest::near((*t)[0], 99.9, 1e-12) && selftest::near((*t)[4], 0.1, 1e-12),
           "four-digit fields");
    EXPECT(!tcs::parse_temperature_reply("+99999999999+0300+0300+0300+0300").has_value(), "oversized field rejected");
    EXPECT(!tcs::parse_temperature_reply("+300+301+302+303+30400").has_value(), "five-digit field rejected");

    EXPECT(tcs::is_error_reply("!E03"), "bang error");
    EXPECT(tcs::is_error_reply("ERR overheat"), "ERR error");
    EXPECT(!tcs::is_error_reply("+300+300+300+300+300"), "data line is not an error");
}

static void check_connect_and_set() {
    auto owned = std::make_unique<ScriptedLink_C>();
    ScriptedLink_C* link = owned.get();
    TcsThermode_C tcs(fast_configs(), std::move(owned));

    EXPECT_THROWS(tcs.set_zone_temperatures(zoneTemps_T{}), thermode_fault, "set before connect");

    tcs.connect();
    const std::vector<std::string> init = {
        "F", "N300", "D099999", "V01000", "R01000", "C1300", "C2300", "C3300", "C4300", "C5300", "Om"};
    EXPECT(link->written == init, "init sequence (" << link->written.size() << " lines)");

    // unchanged targets are not resent
    link->written.clear();
    zoneTemps_T temps{};
    temps.fill(30.0);
    tcs.set_zone_temperatures(temps);
    EXPECT(link->written.empty(), "no writes for unchanged targets");

    temps[0] = 31.0;
    temps[3] = 29.04; // rounds to the same tenth as 29.0
    tcs.set_zone_temperatures(temps);
    EXPECT((link->written == std::vector<std::string>{"C1310", "C4290"}), "only changed zones written");

    temps[0] = std::nan("");
    EXPECT_THROWS(tcs.set_zone_temperatures(temps), thermode_fault, "non-finite target");

    link->written.clear();
    tcs.return_to_baseline();
    EXPECT(link->written.size() == NUM_ZONES && link->count("C1300") == 1, "baseline on all zones");

    link->written.clear();
    tcs.close();
    EXPECT(!link->written.empty() && link->written.front() == "A", "close aborts first");
    EXPECT(link->count("C5300") == 1, "close returns zones to baseline");
    EXPECT(link->n_closes == 1 && !link->is_open(), "port closed");
}

static void check_read_retries() {
    auto owned = std::make_unique<ScriptedLink_C>();
    ScriptedLink_C* link = owned.get();
    TcsThermode_C tcs(fast_configs(), std::move(owned));
    tcs.connect();

    // timeout, garbage, then good: third attempt succeeds
    link->replies = {std::nullopt, std::string("#?"), std::string("+301+302+303+304+305")};
    link->written.clear();
    const zoneTemps_T t = tcs.read_zone_temperatures();
    EXPECT(selftest::near(t[2], 30.3, 1e-12), "read value after retries");
    EXPECT(link->count("E") == 3, "one query per attempt, got " << link->count("E"));
    EXPECT(link->n_discards == 3, "stale input dropped before each query");

    // garbled oversized frame counts as malformed and is retried
    link->replies = {std::string("+99999999999+0300+0300+0300+0300"), std::string("+310+310+310+310+310")};
    link->written.clear();
    const zoneTemps_T g = tcs.read_zone_temperatures();
    EXPECT(selftest::near(g[0], 31.0, 1e-12), "oversized frame skipped, got " << g[0]);
    EXPECT(link->count("E") == 2, "oversized frame retried once");

    link->replies = {std::string("+99999999999+0300+0300+0300+0300")};
    EXPECT_THROWS(tcs.read_zone_temperatures(), thermode_fault, "only oversized frames");

    // every attempt times out
    link->replies.clear();
    EXPECT_THROWS(tcs.read_zone_temperatures(), thermode_fault, "retries exhausted");

    // device error line: no retry
    link->written.clear();
    link->replies = {std::string("!E07"), std::string("+300+300+300+300+300")};
    EXPECT_THROWS(tcs.read_zone_temperatures(), thermode_fault, "device error reply");
    EXPECT(link->count("E") == 1, "error reply is not retried");
}

static void check_link_failures() {
    auto owned = std::make_unique<ScriptedLink_C>();
    owned->open_ok = false;
    TcsThermode_C closed(fast_configs(), std::move(owned));
    EXPECT_THROWS(closed.connect(), thermode_fault, "port open failure");

    auto owned2 = std::make_unique<ScriptedLink_C>();
    ScriptedLink_C* link = owned2.get();
    TcsThermode_C tcs(fast_configs(), std::move(owned2));
    tcs.connect();
    link->fail_writes = true;
    zoneTemps_T temps{};
    temps.fill(35.0);
    EXPECT_THROWS(tcs.set_zone_temperatures(temps), thermode_fault, "write failure");
    tcs.close(); // must not throw even though writes fail
    EXPECT(!link->is_open(), "closed despite failing writes");
}

int main() {
    logger::init();
    logger::tlabel = "TcsProtocolSelfTest";
    LOG_ALWAYS("TcsProtocolSelfTest starting...");

    check_encoding();
    check_reply_parsing();
    check_connect_and_set();
    check_read_retries();
    check_link_failures();

    return selftest::finish("TcsProtocolSelfTest");
}
