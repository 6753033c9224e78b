// utils/SessionPaths.hpp
// -----------------------------------------------------------------------------
// Block output folder infrastructure
//
// Goal:
//   - Always write outputs under (BIDS-style):
//       <root>/data/sub-<subject>/ses-<session>/func/
//         <prefix>_events_<ts>.tsv
//         <prefix>_thermode_<ts>.tsv     (headerless record log)
//         <prefix>_thermode_<ts>.json    (sidecar describing the log)
//         <prefix>_qc_<ts>.tsv
//     prefix = sub-<subject>_ses-<session>_task-tprf_run-<run>
//   - Every block gets a fresh timestamp, nothing is ever overwritten.
//   - "Which runs are done" is answered by reading sidecars back (read-only).
// -----------------------------------------------------------------------------

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>
#include "Logger.hpp"

#define SESS_LOG(msg) LOG_ALWAYS("sesspaths: " << msg)

namespace thermowave {
namespace sesspaths {

namespace fs = std::filesystem;

inline constexpr const char* TASK_LABEL = "tprf";

struct BlockPaths {
    fs::path func_dir;
    std::string subject_id;
    std::string session_id;
    std::string run_id;
    std::string timestamp;
    std::string prefix;
    fs::path events_tsv;
    fs::path record_tsv;
    fs::path sidecar_json;
    fs::path qc_tsv;
};

struct CompletedRun {
    std::string run_id;
    fs::path sidecar;
    std::string outcome;    // "Completed", "Aborted", "HardwareFault", "InProgress"
    std::string block_type;
    std::string mask_name;
    bool warm_first = true;
};

//  Inline Helpers
inline std::string ec_str(const std::error_code& ec) {
    if (!ec) return "ok";
    return std::to_string(ec.value()) + " (" + ec.category().name() + "): " + ec.message();
}

// Allowed: [A-Za-z0-9]. BIDS labels cannot carry '_' or '-' either.
std::string sanitize_label(std::string s);

// e.g. 20250314T101502
std::string make_block_timestamp();

// Walks upward from cwd for a directory containing data/; falls back to cwd.
fs::path find_project_root(int max_depth = 12);

fs::path func_dir(const fs::path& data_root, const std::string& subject, const std::string& session);

// Creates the func/ dir and returns fresh, timestamped file names.
BlockPaths create_block_paths(const fs::path& data_root,
                              const std::string& subject,
                              const std::string& session,
                              const std::string& run);

// "sub-01_ses-01_task-tprf_run-03_thermode_..." -> "03"
std::optional<std::string> run_label_from_filename(const std::string& filename);

// Read-only: every *_thermode_*.json sidecar under the subject/session func dir
std::vector<CompletedRun> scan_completed_runs(const fs::path& data_root,
                                              const std::string& subject,
                                              const std::string& session);

bool run_completed(const std::vector<CompletedRun>& runs, const std::string& run);

// Newest *_thermode_*.tsv under root (recursive), for the monitor
std::optional<fs::path> find_latest_record_log(const fs::path& root);

// sidecar path for a record log path (same stem, .json)
fs::path sidecar_for_record_log(const fs::path& record_tsv);

} // namespace sesspaths
} // namespace thermowave
