#include "MonitorSnapshot.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include "../utils/JsonUtils.hpp"

namespace {

void put_json_number(std::ostringstream& oss, double v) {
    if (!std::isfinite(v)) {
        oss << "null";
        return;
    }
    oss << v;
}

} // namespace

sidecarInfo_S monitor::read_sidecar(const std::filesystem::path& sidecar_json) {
    sidecarInfo_S info{};
    std::ifstream in(sidecar_json);
    if (!in.is_open()) {
        return info;
    }
    const std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    info.loaded = JSON::extract_json_string(body, "mask_name", info.mask_name);
    if (!info.loaded) {
        JSON::json_extract_fail("sidecar", "mask_name");
        return info;
    }
    JSON::extract_json_string(body, "block_type", info.block_type);
    JSON::extract_json_string(body, "outcome", info.outcome);
    JSON::extract_json_bool(body, "warm_first", info.warm_first);
    JSON::extract_json_double(body, "SamplingFrequency", info.sampling_hz);
    JSON::extract_json_double(body, "baseline_temp", info.baseline_temp);
    JSON::extract_json_double(body, "cycle_duration", info.cycle_duration_s);
    JSON::extract_json_int(body, "cycles_per_block", info.cycles_per_block);
    JSON::extract_json_double(body, "baseline_duration", info.baseline_duration_s);
    return info;
}

monitorSnapshot_S monitor::build_snapshot(const std::vector<record_S>& rows, const sidecarInfo_S& sidecar) {
    monitorSnapshot_S snap{};
    snap.sidecar = sidecar;
    snap.n_rows = rows.size();

    if (sidecar.loaded && std::isfinite(sidecar.sampling_hz) && std::isfinite(sidecar.cycle_duration_s)
        && std::isfinite(sidecar.baseline_duration_s)) {
        const double total_s = 2.0 * sidecar.baseline_duration_s
                             + sidecar.cycles_per_block * sidecar.cycle_duration_s;
        snap.expected_rows = static_cast<std::size_t>(std::lround(total_s * sidecar.sampling_hz));
    }

    if (rows.empty()) {
        return snap;
    }

    // zones whose command actually moved
    for (std::size_t z = 0; z < NUM_ZONES; ++z) {
        const auto [lo, hi] = std::minmax_element(rows.begin(), rows.end(),
            [z](const record_S& a, const record_S& b) { return a.commanded[z] < b.commanded[z]; });
        snap.zone_active[z] = (hi->commanded[z] - lo->commanded[z]) > ACTIVE_ZONE_MIN_RANGE;
    }

    const record_S& last = rows.back();
    snap.last_onset_s = last.onset_s;
    snap.last_volume = last.volume;
    snap.last_cycle = last.cycle_index;
    snap.last_block_type = last.block_type;
    snap.last_delta = last.delta;
    snap.last_set = last.commanded;
    snap.last_actual = last.actual;
    for (std::size_t z = 0; z < NUM_ZONES; ++z) {
        snap.last_error[z] = std::fabs(last.commanded[z] - last.actual[z]);
    }

    double err_sum = 0.0;
    std::size_t err_n = 0;
    for (const auto& r : rows) {
        if (r.cycle_index < 0) continue;
        for (std::size_t z = 0; z < NUM_ZONES; ++z) {
            if (!snap.zone_active[z] || !std::isfinite(r.actual[z])) continue;
            const double e = std::fabs(r.commanded[z] - r.actual[z]);
            err_sum += e;
            ++err_n;
            snap.max_abs_error = std::isnan(snap.max_abs_error) ? e : std::max(snap.max_abs_error, e);
        }
    }
    if (err_n > 0) {
        snap.mean_abs_error = err_sum / static_cast<double>(err_n);
    }

    // ramp over the trailing second (or whatever the sample rate gives)
    const std::size_t window = std::isfinite(sidecar.sampling_hz)
        ? static_cast<std::size_t>(std::max(1.0, std::round(sidecar.sampling_hz)))
        : 10;
    if (rows.size() > window) {
        const record_S& first = rows[rows.size() - 1 - window];
        const double dt = last.onset_s - first.onset_s;
        double sum = 0.0;
        int n = 0;
        for (std::size_t z = 0; z < NUM_ZONES && dt > 0.0; ++z) {
            if (!snap.zone_active[z]) continue;
            if (!std::isfinite(last.actual[z]) || !std::isfinite(first.actual[z])) continue;
            sum += std::fabs(last.actual[z] - first.actual[z]) / dt;
            ++n;
        }
        if (n > 0) snap.recent_ramp_rate = sum / n;
    }
    return snap;
}

std::string monitor::snapshot_to_json(const monitorSnapshot_S& snap) {
    std::ostringstream oss;
    oss << "{"
        << "\"log\":\"" << JSON::escape_json_string(snap.log_name) << "\","
        << "\"n_rows\":" << snap.n_rows << ","
        << "\"expected_rows\":" << snap.expected_rows << ","
        << "\"n_malformed\":" << snap.n_malformed << ","
        << "\"block_type\":\"" << JSON::escape_json_string(snap.sidecar.block_type) << "\","
        << "\"mask_name\":\"" << JSON::escape_json_string(snap.sidecar.mask_name) << "\","
        << "\"warm_first\":" << (snap.sidecar.warm_first ? "true" : "false") << ","
        << "\"outcome\":\"" << JSON::escape_json_string(snap.sidecar.outcome) << "\","
        << "\"last_onset_s\":"; put_json_number(oss, snap.last_onset_s); oss << ","
        << "\"last_volume\":" << snap.last_volume << ","
        << "\"last_cycle\":" << snap.last_cycle << ","
        << "\"last_delta\":"; put_json_number(oss, snap.last_delta); oss << ","
        << "\"mean_abs_error\":"; put_json_number(oss, snap.mean_abs_error); oss << ","
        << "\"max_abs_error\":"; put_json_number(oss, snap.max_abs_error); oss << ","
        << "\"recent_ramp_rate\":"; put_json_number(oss, snap.recent_ramp_rate); oss << ","
        << "\"zones\":[";
    for (std::size_t z = 0; z < NUM_ZONES; ++z) {
        if (z > 0) oss << ",";
        oss << "{\"zone\":" << (z + 1)
            << ",\"active\":" << (snap.zone_active[z] ? "true" : "false")
            << ",\"set\":"; put_json_number(oss, snap.last_set[z]);
        oss << ",\"actual\":"; put_json_number(oss, snap.last_actual[z]);
        oss << ",\"error\":"; put_json_number(oss, snap.last_error[z]);
        oss << "}";
    }
    oss << "]}";
    return oss.str();
}

std::string monitor::snapshot_summary_line(const monitorSnapshot_S& snap) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << snap.log_name << " rows=" << snap.n_rows;
    if (snap.expected_rows > 0) {
        oss << "/" << snap.expected_rows;
    }
    oss << " t=" << snap.last_onset_s << "s vol=" << snap.last_volume
        << " cycle=" << snap.last_cycle
        << " delta=" << snap.last_delta
        << " err(mean/max)=" << snap.mean_abs_error << "/" << snap.max_abs_error
        << " ramp=" << snap.recent_ramp_rate << " C/s";
    for (std::size_t z = 0; z < NUM_ZONES; ++z) {
        if (!snap.zone_active[z]) continue;
        oss << " z" << (z + 1) << "=" << snap.last_set[z] << "/" << snap.last_actual[z];
    }
    return oss.str();
}
