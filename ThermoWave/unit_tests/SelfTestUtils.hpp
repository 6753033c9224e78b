// SelfTestUtils.hpp
// Shared bits for the *SelfTest programs: a failure counter that logs each
// miss, and a clock that only moves when told to (instant, deterministic
// loop tests).
#pragma once
#include <atomic>
#include <cmath>
#include <filesystem>
#include <string>
#include <unistd.h>
#include "../src/utils/Logger.hpp"
#include "../src/utils/TickTimer.hpp"

namespace selftest {

inline int& failures() {
    static int n = 0;
    return n;
}

inline bool near(double a, double b, double tol) {
    return std::fabs(a - b) <= tol;
}

// fresh scratch dir under the system temp dir, removed first if left over
inline std::filesystem::path scratch_dir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path()
                   / ("thermowave_" + name + "_" + std::to_string(::getpid()));
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir);
    return dir;
}

inline int finish(const char* test_name) {
    if (failures() == 0) {
        LOG_ALWAYS(test_name << ": all checks passed");
        return 0;
    }
    LOG_ERR(test_name << ": " << failures() << " check(s) FAILED");
    return 1;
}

} // namespace selftest

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        ++::selftest::failures(); \
        LOG_ERR("FAIL " << __FILE__ << ":" << __LINE__ << " (" #cond ") " << msg); \
    } \
} while (0)

// Runs expr, expects it to throw ex_type
#define EXPECT_THROWS(expr, ex_type, msg) do { \
    bool threw_ = false; \
    try { expr; } catch (const ex_type&) { threw_ = true; } \
    EXPECT(threw_, "expected " #ex_type ": " << msg); \
} while (0)

// sleep_until jumps straight to the requested time (never backwards)
class ManualClock_C : public IClock_S {
public:
    time_point_T now() override { return now_; }
    void sleep_until(time_point_T t) override {
        if (t > now_) now_ = t;
        n_sleeps_++;
    }
    void advance_s(double s) { now_ += seconds_to_dur(s); }
    std::size_t n_sleeps() const { return n_sleeps_; }

private:
    time_point_T now_ = time_point_T{} + std::chrono::hours(1);
    std::size_t n_sleeps_ = 0;
}; // ManualClock_C
