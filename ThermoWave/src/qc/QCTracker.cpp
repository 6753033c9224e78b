#include "QCTracker.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include "../utils/Logger.hpp"

namespace {

double mean_of(const std::vector<double>& v) {
    if (v.empty()) return NaN_D;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

// population std (ddof = 0)
double std_of(const std::vector<double>& v) {
    if (v.empty()) return NaN_D;
    const double m = mean_of(v);
    double acc = 0.0;
    for (double x : v) {
        acc += (x - m) * (x - m);
    }
    return std::sqrt(acc / static_cast<double>(v.size()));
}

// time where f reaches level between (t0, f0) and (t1, f1); falls back to t1
// when there is no usable previous sample
double interpolate_crossing(double t0, double f0, double t1, double f1, double level) {
    if (!std::isfinite(f0) || f0 >= level || f1 <= f0) {
        return t1;
    }
    return t0 + (level - f0) / (f1 - f0) * (t1 - t0);
}

} // namespace

QCTracker_C::QCTracker_C(const blockConfig_S& cfg, const spatialMask_S& mask)
    : baseline_(cfg.baseline_temp),
      target_rate_(cfg.ramp_rate),
      active_(masks::active_zones(mask)) {
    // excursion each zone can actually reach once the safety clamp applies
    const double up = std::min(cfg.baseline_temp + cfg.max_delta, cfg.temp_max) - cfg.baseline_temp;
    const double down = cfg.baseline_temp - std::max(cfg.baseline_temp - cfg.max_delta, cfg.temp_min);
    const double excursion = std::min(up, down);

    for (std::size_t z : active_) {
        zoneOnset_S zo{};
        zo.zone = z;
        zo.level = ONSET_LEVEL_FRACTION * excursion;
        onsets_.push_back(zo);
    }
    if (excursion <= 0.0) {
        LOG_WARN("QC: baseline sits on a safety bound, onset latency disabled");
    }
}

void QCTracker_C::reset_cycle_state() {
    n_samples_ = 0;
    ramp_rates_.clear();
    warming_rates_.clear();
    cooling_rates_.clear();
    err_sum_ = 0.0;
    err_count_ = 0;
    err_max_ = NaN_D;
    n_flags_ = 0;
    error_warned_ = false;
    for (auto& zo : onsets_) {
        zo.cmd_cross_t = NaN_D;
        zo.act_cross_t = NaN_D;
        zo.sign = 0;
    }
}

void QCTracker_C::start_cycle(int cycle_index) {
    reset_cycle_state();
    cycle_index_ = cycle_index;
    cycle_open_ = true;
}

void QCTracker_C::reset_block() {
    reset_cycle_state();
    cycle_open_ = false;
    cycle_index_ = 0;
    has_prev_ = false;
    for (auto& zo : onsets_) {
        zo.prev_cmd_dev = NaN_D;
        zo.prev_act_dev = NaN_D;
    }
    summaries_.clear();
}

double QCTracker_C::sample_ramp_rate(const record_S& rec) const {
    if (!has_prev_) return NaN_D;
    const double dt = rec.onset_s - prev_t_;
    if (dt <= 0.0) return NaN_D;

    double sum = 0.0;
    int n = 0;
    for (std::size_t z : active_) {
        if (!std::isfinite(rec.actual[z]) || !std::isfinite(prev_actual_[z])) continue;
        sum += std::fabs(rec.actual[z] - prev_actual_[z]) / dt;
        ++n;
    }
    return (n > 0) ? sum / n : NaN_D;
}

void QCTracker_C::update_onsets(const record_S& rec) {
    const double t = rec.onset_s;
    for (auto& zo : onsets_) {
        if (zo.level <= 0.0) continue;
        const double cmd_dev = rec.commanded[zo.zone] - baseline_;
        const double act = rec.actual[zo.zone];
        const double act_dev = std::isfinite(act) ? act - baseline_ : NaN_D;

        if (std::isnan(zo.cmd_cross_t) && std::fabs(cmd_dev) >= zo.level) {
            zo.sign = (cmd_dev > 0.0) ? 1 : -1;
            const double f0 = zo.sign * zo.prev_cmd_dev;
            zo.cmd_cross_t = has_prev_ ? interpolate_crossing(prev_t_, f0, t, zo.sign * cmd_dev, zo.level) : t;
        }

        if (!std::isnan(zo.cmd_cross_t) && std::isnan(zo.act_cross_t) && std::isfinite(act_dev)) {
            const double f1 = zo.sign * act_dev;
            if (f1 >= zo.level) {
                const double f0 = zo.sign * zo.prev_act_dev;
                zo.act_cross_t = has_prev_ ? interpolate_crossing(prev_t_, f0, t, f1, zo.level) : t;
            }
        }

        zo.prev_cmd_dev = cmd_dev;
        zo.prev_act_dev = act_dev;
    }
}

void QCTracker_C::accumulate(const record_S& rec) {
    if (!cycle_open_) {
        start_cycle(rec.cycle_index);
    }
    n_samples_++;

    // tracking error over the zones the mask drives
    for (std::size_t z : active_) {
        if (!std::isfinite(rec.actual[z])) continue;
        const double err = std::fabs(rec.commanded[z] - rec.actual[z]);
        err_sum_ += err;
        err_count_++;
        err_max_ = std::isnan(err_max_) ? err : std::max(err_max_, err);
        if (err > TEMP_ERROR_WARN && !error_warned_) {
            error_warned_ = true;
            LOG_WARN("QC: cycle " << cycle_index_ << " zone " << (z + 1) << " temp error "
                     << err << " C at t=" << rec.onset_s << " s");
        }
    }

    const double rate = sample_ramp_rate(rec);
    if (std::isfinite(rate) && rate > RAMPING_MIN_RATE) {
        ramp_rates_.push_back(rate);
        const double d_delta = rec.delta - prev_delta_;
        if (d_delta > 0.0) {
            warming_rates_.push_back(rate);
        } else if (d_delta < 0.0) {
            cooling_rates_.push_back(rate);
        }
        if (std::fabs(rate - target_rate_) > RAMP_RATE_TOLERANCE) {
            n_flags_++;
            if (n_flags_ <= MAX_FLAG_WARNINGS) {
                LOG_WARN("QC: cycle " << cycle_index_ << " ramp rate " << rate
                         << " C/s vs expected " << target_rate_ << " at t=" << rec.onset_s << " s");
            }
        }
    }

    update_onsets(rec);

    has_prev_ = true;
    prev_t_ = rec.onset_s;
    prev_delta_ = rec.delta;
    prev_actual_ = rec.actual;
}

qcSummary_S QCTracker_C::finalize_cycle(bool partial) {
    qcSummary_S s{};
    s.cycle_index = cycle_index_;
    s.partial = partial;
    s.n_samples = static_cast<int>(n_samples_);
    s.n_ramp_flags = n_flags_;

    s.mean_ramp_rate = mean_of(ramp_rates_);
    s.std_ramp_rate = std_of(ramp_rates_);
    s.mean_warming_rate = mean_of(warming_rates_);
    s.mean_cooling_rate = mean_of(cooling_rates_);
    s.warming_cooling_diff = s.mean_warming_rate - s.mean_cooling_rate; // NaN propagates
    s.mean_temp_error = (err_count_ > 0) ? err_sum_ / static_cast<double>(err_count_) : NaN_D;
    s.max_temp_error = err_max_;

    double lat_sum = 0.0;
    int lat_n = 0;
    for (const auto& zo : onsets_) {
        if (std::isnan(zo.cmd_cross_t) || std::isnan(zo.act_cross_t)) continue;
        lat_sum += zo.act_cross_t - zo.cmd_cross_t;
        ++lat_n;
    }
    s.onset_latency_s = (lat_n > 0) ? lat_sum / lat_n : NaN_D;

    summaries_.push_back(s);
    const int next_index = cycle_index_ + 1;
    reset_cycle_state();
    cycle_open_ = false;
    cycle_index_ = next_index;
    return s;
}
