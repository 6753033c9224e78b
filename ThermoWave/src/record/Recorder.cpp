#include "Recorder.h"
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include "../config/BlockConfig.hpp"
#include "../utils/JsonUtils.hpp"
#include "../utils/Logger.hpp"

namespace {

std::string iso_now() {
    using clock = std::chrono::system_clock;
    const std::time_t t = clock::to_time_t(clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

// fixed precision, "nan" for missing values
void put_fixed(std::ostringstream& oss, double v, int prec) {
    if (std::isnan(v)) {
        oss << "nan";
        return;
    }
    oss << std::fixed << std::setprecision(prec) << v;
}

// JSON has no NaN; emit null
void put_json_number(std::ostringstream& oss, double v) {
    if (!std::isfinite(v)) {
        oss << "null";
        return;
    }
    oss << v;
}

} // namespace

Recorder_C::Recorder_C(const thermowave::sesspaths::BlockPaths& paths) : paths_(paths) {
    record_out_.open(paths_.record_tsv, std::ios::out | std::ios::trunc);
    qc_out_.open(paths_.qc_tsv, std::ios::out | std::ios::trunc);
    events_out_.open(paths_.events_tsv, std::ios::out | std::ios::trunc);
    if (!record_out_.is_open() || !qc_out_.is_open() || !events_out_.is_open()) {
        throw record_io_error("recorder: cannot open block files under " + paths_.func_dir.string());
    }
    qc_out_ << qc_header() << '\n';
    qc_out_.flush();
    events_out_ << events_header() << '\n';
    events_out_.flush();
    LOG_ALWAYS("recorder: writing " << paths_.record_tsv.filename().string());
}

Recorder_C::~Recorder_C() {
    // normal path closes in on_block_end; this only covers early teardown
    if (record_out_.is_open()) record_out_.flush();
}

std::string Recorder_C::qc_header() {
    return "block_type\tmask_name\twarm_first\tcycle_index\tonset_latency_s\t"
           "mean_ramp_rate\tstd_ramp_rate\tmean_warming_rate\tmean_cooling_rate\t"
           "warming_cooling_diff\tmean_temp_error\tmax_temp_error\tn_ramp_flags\tn_samples";
}

std::string Recorder_C::events_header() {
    return "onset\tduration\ttrial_type\tblock_type\tmask_name\twarm_first\tresponse_value\tresponse_time";
}

std::string Recorder_C::format_record_row(const record_S& rec) {
    std::ostringstream oss;
    put_fixed(oss, rec.onset_s, 4);
    oss << '\t' << rec.volume
        << '\t' << rec.block_index
        << '\t' << rec.block_type
        << '\t' << rec.cycle_index
        << '\t' << rec.mask_name
        << '\t' << (rec.warm_first ? 1 : 0)
        << '\t';
    put_fixed(oss, rec.delta, 4);
    for (double v : rec.commanded) {
        oss << '\t';
        put_fixed(oss, v, 2);
    }
    for (double v : rec.actual) {
        oss << '\t';
        put_fixed(oss, v, 2);
    }
    return oss.str();
}

std::string Recorder_C::format_qc_row(const blockConfig_S& cfg, const qcSummary_S& s) {
    std::ostringstream oss;
    oss << blockcfg::block_type(cfg)
        << '\t' << cfg.mask_name
        << '\t' << (cfg.direction == WaveDirection_WarmFirst ? 1 : 0)
        << '\t' << s.cycle_index << '\t';
    put_fixed(oss, s.onset_latency_s, 3);      oss << '\t';
    put_fixed(oss, s.mean_ramp_rate, 4);       oss << '\t';
    put_fixed(oss, s.std_ramp_rate, 4);        oss << '\t';
    put_fixed(oss, s.mean_warming_rate, 4);    oss << '\t';
    put_fixed(oss, s.mean_cooling_rate, 4);    oss << '\t';
    put_fixed(oss, s.warming_cooling_diff, 4); oss << '\t';
    put_fixed(oss, s.mean_temp_error, 4);      oss << '\t';
    put_fixed(oss, s.max_temp_error, 4);
    oss << '\t' << s.n_ramp_flags
        << '\t' << s.n_samples;
    return oss.str();
}

std::string Recorder_C::make_sidecar_json(const blockConfig_S& cfg,
                                          const std::string& start_time,
                                          const std::string& outcome,
                                          const blockResult_S* result) {
    std::ostringstream oss;
    oss << "{\n"
        << "  \"SamplingFrequency\": "; put_json_number(oss, cfg.update_hz); oss << ",\n"
        << "  \"StartTime\": \"" << JSON::escape_json_string(start_time) << "\",\n"
        << "  \"Columns\": [\"onset\", \"volume\", \"block_index\", \"block_type\", \"cycle_index\", "
           "\"mask_name\", \"warm_first\", \"delta\"";
    for (std::size_t z = 1; z <= NUM_ZONES; ++z) oss << ", \"zone" << z << "_set\"";
    for (std::size_t z = 1; z <= NUM_ZONES; ++z) oss << ", \"zone" << z << "_actual\"";
    oss << "],\n"
        << "  \"block_index\": " << cfg.block_index << ",\n"
        << "  \"block_type\": \"" << blockcfg::block_type(cfg) << "\",\n"
        << "  \"mask_name\": \"" << JSON::escape_json_string(cfg.mask_name) << "\",\n"
        << "  \"warm_first\": " << (cfg.direction == WaveDirection_WarmFirst ? "true" : "false") << ",\n"
        << "  \"baseline_temp\": "; put_json_number(oss, cfg.baseline_temp); oss << ",\n"
        << "  \"temp_min\": "; put_json_number(oss, cfg.temp_min); oss << ",\n"
        << "  \"temp_max\": "; put_json_number(oss, cfg.temp_max); oss << ",\n"
        << "  \"max_delta\": "; put_json_number(oss, cfg.max_delta); oss << ",\n"
        << "  \"ramp_rate\": "; put_json_number(oss, cfg.ramp_rate); oss << ",\n"
        << "  \"cycle_duration\": "; put_json_number(oss, cfg.cycle_duration_s); oss << ",\n"
        << "  \"cycles_per_block\": " << cfg.cycles_per_block << ",\n"
        << "  \"baseline_duration\": "; put_json_number(oss, cfg.baseline_duration_s); oss << ",\n"
        << "  \"TR\": "; put_json_number(oss, cfg.tr_s); oss << ",\n";
    if (result != nullptr) {
        oss << "  \"n_records\": " << result->n_records << ",\n"
            << "  \"n_overruns\": " << result->n_overruns << ",\n"
            << "  \"n_cycles_closed\": " << result->cycles.size() << ",\n";
    }
    oss << "  \"outcome\": \"" << JSON::escape_json_string(outcome) << "\"\n"
        << "}\n";
    return oss.str();
}

void Recorder_C::write_sidecar(const std::string& outcome, const blockResult_S* result) {
    std::ofstream out(paths_.sidecar_json, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERR("recorder: cannot write sidecar " << paths_.sidecar_json.string());
        return;
    }
    out << make_sidecar_json(cfg_, start_time_, outcome, result);
    out.flush();
    if (!out) {
        LOG_ERR("recorder: sidecar write failed " << paths_.sidecar_json.string());
    }
}

void Recorder_C::check_stream(std::ofstream& out, const char* what) {
    if (out.good() || write_error_logged_) return;
    write_error_logged_ = true;
    LOG_ERR("recorder: write to " << what << " failed, data on disk may be incomplete");
}

void Recorder_C::on_block_start(const blockConfig_S& cfg) {
    cfg_ = cfg;
    start_time_ = iso_now();
    write_sidecar("InProgress", nullptr);
}

void Recorder_C::flush_records() {
    record_out_.flush();
    rows_flushed_ = rows_written_;
    rows_since_flush_ = 0;
    check_stream(record_out_, "record log");
}

void Recorder_C::on_record(const record_S& rec) {
    record_out_ << format_record_row(rec) << '\n';
    rows_written_++;
    rows_since_flush_++;
    if (rows_since_flush_ >= cfg_.flush_every) {
        flush_records();
    }
}

void Recorder_C::on_cycle_summary(const qcSummary_S& summary) {
    qc_out_ << format_qc_row(cfg_, summary) << '\n';
    qc_out_.flush();
    check_stream(qc_out_, "qc file");
}

void Recorder_C::on_phase(const phaseTiming_S& phase) {
    std::ostringstream oss;
    put_fixed(oss, phase.onset_s, 4);
    oss << '\t';
    put_fixed(oss, phase.duration_s, 4);
    const bool baseline = (phase.trial_type == "baseline");
    oss << '\t' << phase.trial_type
        << '\t' << blockcfg::block_type(cfg_) << (baseline ? "_baseline" : "")
        << '\t' << cfg_.mask_name
        << '\t' << (cfg_.direction == WaveDirection_WarmFirst ? 1 : 0)
        << "\tn/a\tn/a";
    events_out_ << oss.str() << '\n';
    events_out_.flush();
    check_stream(events_out_, "events file");
}

void Recorder_C::on_block_end(const blockResult_S& result) {
    if (ended_) return;
    ended_ = true;
    flush_records();
    record_out_.close();
    qc_out_.close();
    events_out_.close();
    write_sidecar(BlockOutcomeToString(result.outcome), &result);
    LOG_ALWAYS("recorder: " << rows_written_ << " rows in " << paths_.record_tsv.filename().string()
               << " (" << BlockOutcomeToString(result.outcome) << ")");
}
