#include "SessionPaths.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include "JsonUtils.hpp"

namespace thermowave {
namespace sesspaths {

std::string sanitize_label(std::string s) {
    s.erase(std::remove_if(s.begin(), s.end(),
                           [](char c) { return std::isalnum(static_cast<unsigned char>(c)) == 0; }),
            s.end());
    if (s.empty()) s = "unknown";
    return s;
}

std::string make_block_timestamp() {
    using clock = std::chrono::system_clock;
    const std::time_t t = clock::to_time_t(clock::now());

    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%dT%H%M%S");
    return oss.str();
}

fs::path find_project_root(int max_depth) {
    std::error_code ec;
    fs::path p = fs::current_path(ec);

    for (int i = 0; i < max_depth; ++i) {
        const fs::path data_dir = p / "data";
        if (fs::is_directory(data_dir, ec)) {
            SESS_LOG("find_project_root: FOUND root=" << p.string());
            return p;
        }
        if (!p.has_parent_path() || p.parent_path() == p) break;
        p = p.parent_path();
    }

    fs::path fallback = fs::current_path(ec);
    SESS_LOG("find_project_root: NOT FOUND (max_depth=" << max_depth
        << "), fallback=" << fallback.string());
    return fallback;
}

fs::path func_dir(const fs::path& data_root, const std::string& subject, const std::string& session) {
    return data_root / ("sub-" + sanitize_label(subject)) / ("ses-" + sanitize_label(session)) / "func";
}

BlockPaths create_block_paths(const fs::path& data_root,
                              const std::string& subject,
                              const std::string& session,
                              const std::string& run) {
    BlockPaths bp{};
    bp.subject_id = sanitize_label(subject);
    bp.session_id = sanitize_label(session);
    bp.run_id = sanitize_label(run);
    bp.timestamp = make_block_timestamp();
    bp.func_dir = func_dir(data_root, bp.subject_id, bp.session_id);
    bp.prefix = "sub-" + bp.subject_id + "_ses-" + bp.session_id
              + "_task-" + TASK_LABEL + "_run-" + bp.run_id;

    bp.events_tsv   = bp.func_dir / (bp.prefix + "_events_" + bp.timestamp + ".tsv");
    bp.record_tsv   = bp.func_dir / (bp.prefix + "_thermode_" + bp.timestamp + ".tsv");
    bp.sidecar_json = bp.func_dir / (bp.prefix + "_thermode_" + bp.timestamp + ".json");
    bp.qc_tsv       = bp.func_dir / (bp.prefix + "_qc_" + bp.timestamp + ".tsv");

    std::error_code ec;
    fs::create_directories(bp.func_dir, ec);
    SESS_LOG("create_block_paths: func_dir=" << bp.func_dir.string() << " -> " << ec_str(ec));
    if (!fs::is_directory(bp.func_dir)) {
        throw std::runtime_error("create_block_paths: cannot create " + bp.func_dir.string()
                                 + ": " + ec_str(ec));
    }
    return bp;
}

std::optional<std::string> run_label_from_filename(const std::string& filename) {
    std::istringstream parts(filename);
    std::string part;
    while (std::getline(parts, part, '_')) {
        if (part.rfind("run-", 0) == 0 && part.size() > 4) {
            return part.substr(4);
        }
    }
    return std::nullopt;
}

std::vector<CompletedRun> scan_completed_runs(const fs::path& data_root,
                                              const std::string& subject,
                                              const std::string& session) {
    std::vector<CompletedRun> runs;
    const fs::path dir = func_dir(data_root, subject, session);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return runs;

    for (const auto& de : fs::directory_iterator(dir, ec)) {
        if (ec) break;
        if (!de.is_regular_file(ec)) continue;
        const std::string name = de.path().filename().string();
        if (de.path().extension() != ".json" || name.find("_thermode_") == std::string::npos) continue;

        auto run = run_label_from_filename(name);
        if (!run) continue;

        std::ifstream in(de.path());
        const std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

        CompletedRun cr{};
        cr.run_id = *run;
        cr.sidecar = de.path();
        if (!JSON::extract_json_string(body, "outcome", cr.outcome)) {
            cr.outcome = "Unknown";
        }
        if (!JSON::extract_json_string(body, "block_type", cr.block_type)) {
            JSON::json_extract_fail(name.c_str(), "block_type");
        }
        if (!JSON::extract_json_string(body, "mask_name", cr.mask_name)) {
            JSON::json_extract_fail(name.c_str(), "mask_name");
        }
        if (!JSON::extract_json_bool(body, "warm_first", cr.warm_first)) {
            JSON::json_extract_fail(name.c_str(), "warm_first");
        }
        runs.push_back(cr);
    }

    std::sort(runs.begin(), runs.end(),
              [](const CompletedRun& a, const CompletedRun& b) {
                  return a.run_id != b.run_id ? a.run_id < b.run_id : a.sidecar < b.sidecar;
              });
    return runs;
}

bool run_completed(const std::vector<CompletedRun>& runs, const std::string& run) {
    const std::string label = sanitize_label(run);
    return std::any_of(runs.begin(), runs.end(), [&label](const CompletedRun& r) {
        return r.run_id == label && r.outcome == "Completed";
    });
}

std::optional<fs::path> find_latest_record_log(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return std::nullopt;

    std::optional<fs::path> best;
    fs::file_time_type best_t{};
    for (auto it = fs::recursive_directory_iterator(root, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const auto& de = *it;
        if (!de.is_regular_file(ec)) continue;
        const std::string name = de.path().filename().string();
        if (de.path().extension() != ".tsv" || name.find("_thermode_") == std::string::npos) continue;
        const auto t = de.last_write_time(ec);
        if (ec) { ec.clear(); continue; }
        if (!best || t > best_t) {
            best = de.path();
            best_t = t;
        }
    }
    return best;
}

fs::path sidecar_for_record_log(const fs::path& record_tsv) {
    fs::path p = record_tsv;
    p.replace_extension(".json");
    return p;
}

} // namespace sesspaths
} // namespace thermowave
