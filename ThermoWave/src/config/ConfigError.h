// config_error.h
#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

// Bad block parameters / unknown mask / bad CLI flag.
// Always raised before the first hardware command of a block.
struct config_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

inline void cfg_check_impl(bool ok,
                           const char* what,
                           const std::string& detail)
{
    if (ok) return;
    std::ostringstream oss;
    oss << "invalid configuration: " << what;
    if (!detail.empty()) oss << " (" << detail << ")";
    throw config_error(oss.str());
}

// CFG_CHECK(cfg.update_hz > 0, "update_hz=" + std::to_string(cfg.update_hz))
#define CFG_CHECK(cond, detail) \
    ::cfg_check_impl((cond), #cond, (detail))
