#include "BlockConfig.hpp"
#include <cmath>
#include <string>
#include "../waveform/SpatialMask.h"
#include "../waveform/Waveform.h"
#include "../utils/Logger.hpp"

namespace {

std::size_t to_ticks(double seconds, double hz) {
    return static_cast<std::size_t>(std::lround(seconds * hz));
}

constexpr double MAX_PHASE_S = 24.0 * 3600.0;

bool is_whole(double x) {
    return std::fabs(x - std::round(x)) < 1e-6;
}

} // namespace

void blockcfg::validate_config(const blockConfig_S& cfg) {
    CFG_CHECK(std::isfinite(cfg.temp_min) && std::isfinite(cfg.temp_max), "non-finite bounds");
    CFG_CHECK(std::isfinite(cfg.baseline_temp), "non-finite baseline_temp");
    CFG_CHECK(std::isfinite(cfg.max_delta) && std::isfinite(cfg.ramp_rate), "non-finite max_delta/ramp_rate");
    CFG_CHECK(std::isfinite(cfg.cycle_duration_s) && std::isfinite(cfg.baseline_duration_s),
              "non-finite cycle/baseline duration");
    CFG_CHECK(std::isfinite(cfg.update_hz) && std::isfinite(cfg.tr_s) && std::isfinite(cfg.start_offset_s),
              "non-finite update_hz/tr_s/start_offset_s");
    CFG_CHECK(cfg.temp_min < cfg.temp_max,
              "temp_min=" + std::to_string(cfg.temp_min) + " temp_max=" + std::to_string(cfg.temp_max));
    CFG_CHECK(cfg.baseline_temp >= cfg.temp_min && cfg.baseline_temp <= cfg.temp_max,
              "baseline_temp=" + std::to_string(cfg.baseline_temp));
    CFG_CHECK(cfg.max_delta > 0.0, "max_delta=" + std::to_string(cfg.max_delta));
    CFG_CHECK(cfg.ramp_rate > 0.0, "ramp_rate=" + std::to_string(cfg.ramp_rate));
    CFG_CHECK(cfg.cycle_duration_s > 0.0, "cycle_duration_s=" + std::to_string(cfg.cycle_duration_s));
    CFG_CHECK(cfg.cycles_per_block >= 1, "cycles_per_block=" + std::to_string(cfg.cycles_per_block));
    CFG_CHECK(cfg.baseline_duration_s >= 0.0, "baseline_duration_s=" + std::to_string(cfg.baseline_duration_s));
    CFG_CHECK(cfg.update_hz > 0.0 && cfg.update_hz <= 1000.0, "update_hz=" + std::to_string(cfg.update_hz));
    // keeps the tick counts well inside lround's range
    CFG_CHECK(cfg.cycle_duration_s <= MAX_PHASE_S && cfg.baseline_duration_s <= MAX_PHASE_S
              && cfg.start_offset_s <= MAX_PHASE_S,
              "phase durations must be <= " + std::to_string(MAX_PHASE_S) + " s");
    CFG_CHECK(cycle_ticks(cfg) >= 1, "cycle shorter than one tick");
    CFG_CHECK(cfg.tr_s > 0.0, "tr_s=" + std::to_string(cfg.tr_s));
    CFG_CHECK(cfg.start_offset_s >= 0.0, "start_offset_s=" + std::to_string(cfg.start_offset_s));
    CFG_CHECK(cfg.flush_every >= 1, "flush_every must be >= 1");
    CFG_CHECK(masks::is_known_mask(cfg.mask_name), "mask_name=" + cfg.mask_name);

    // soft checks: the block still runs, the operator should know
    const double period = waveform::triangle_period(cfg.max_delta, cfg.ramp_rate);
    if (std::fabs(period - cfg.cycle_duration_s) > 1e-6) {
        LOG_WARN("config: triangle period 4A/r=" << period << " s differs from cycle_duration="
                 << cfg.cycle_duration_s << " s (cycles will not be phase aligned)");
    }
    if (!is_whole(cfg.cycle_duration_s * cfg.update_hz)) {
        LOG_WARN("config: cycle_duration*update_hz=" << cfg.cycle_duration_s * cfg.update_hz
                 << " is not whole, cycle boundaries rounded to " << cycle_ticks(cfg) << " ticks");
    }
    if (cfg.baseline_temp + cfg.max_delta > cfg.temp_max ||
        cfg.baseline_temp - cfg.max_delta < cfg.temp_min) {
        LOG_WARN("config: baseline +/- max_delta exceeds safety bounds, peaks will be clamped");
    }
}

std::size_t blockcfg::baseline_ticks(const blockConfig_S& cfg) {
    return to_ticks(cfg.baseline_duration_s, cfg.update_hz);
}

std::size_t blockcfg::cycle_ticks(const blockConfig_S& cfg) {
    return to_ticks(cfg.cycle_duration_s, cfg.update_hz);
}

std::size_t blockcfg::stimulation_ticks(const blockConfig_S& cfg) {
    return cycle_ticks(cfg) * static_cast<std::size_t>(cfg.cycles_per_block);
}

std::size_t blockcfg::total_ticks(const blockConfig_S& cfg) {
    return 2 * baseline_ticks(cfg) + stimulation_ticks(cfg);
}

std::string blockcfg::block_type(const blockConfig_S& cfg) {
    return MaskFamilyToString(masks::find_mask(cfg.mask_name).family);
}

void blockcfg::log_config(const blockConfig_S& cfg) {
    LOG_ALWAYS("config: block=" << cfg.block_index
        << " mask=" << cfg.mask_name
        << " warm_first=" << (cfg.direction == WaveDirection_WarmFirst ? 1 : 0)
        << " baseline=" << cfg.baseline_temp
        << " bounds=[" << cfg.temp_min << "," << cfg.temp_max << "]"
        << " A=" << cfg.max_delta
        << " r=" << cfg.ramp_rate
        << " cycle=" << cfg.cycle_duration_s << "s x" << cfg.cycles_per_block
        << " baseline_buffer=" << cfg.baseline_duration_s << "s"
        << " hz=" << cfg.update_hz
        << " TR=" << cfg.tr_s
        << " start_offset=" << cfg.start_offset_s << "s");
}
