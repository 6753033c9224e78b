// tcs_check.h
#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include "../utils/Logger.hpp"

// Simple exception type for hard thermode failures (timeout, malformed
// reply, write failure, device-reported error). Always fatal for the block.
struct thermode_fault : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Implementation helpers
inline void tcs_check_impl(bool ok,
                           const char* where,
                           const std::string& detail,
                           const char* file,
                           int line,
                           const char* func)
{
    if (ok) return;
    std::ostringstream oss;
    oss << where << " failed at " << file << ":" << line
        << " in " << func << " -> " << (detail.empty() ? "(no detail)" : detail);
    throw thermode_fault(oss.str());
}

inline bool tcs_warn_if_fail_impl(bool ok,
                                  const char* where,
                                  const std::string& detail,
                                  const char* file,
                                  int line)
{
    if (ok) return true;
    std::ostringstream oss;
    oss << where << " failed at " << file << ":" << line
        << " -> " << (detail.empty() ? "(no detail)" : detail);
    LOG_WARN(oss.str());
    return false;
}

// Caller-friendly wrappers/macros
#define TCHECK(expr, detail) \
    ::tcs_check_impl((expr), #expr, (detail), __FILE__, __LINE__, __func__)

#define TWARN_IF_FAIL(expr, detail) \
    ::tcs_warn_if_fail_impl((expr), #expr, (detail), __FILE__, __LINE__)
