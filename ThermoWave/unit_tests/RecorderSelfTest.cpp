#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>
#include "SelfTestUtils.hpp"
#include "../src/config/BlockConfig.hpp"
#include "../src/record/Recorder.h"
#include "../src/monitor/RecordLogReader.h"
#include "../src/utils/JsonUtils.hpp"
#include "../src/utils/SessionPaths.hpp"

/* TEST COMPONENTS:
- record row layout (18 tab-separated columns, nan for missing readings)
- flush cadence: rows reach the disk every flush_every rows + at block end
- sidecar outcome: InProgress while running, final outcome afterwards
- read-only completed-runs query over the written sidecars
*/

namespace sp = thermowave::sesspaths;

static std::string slurp(const std::filesystem::path& p) {
    std::ifstream in(p);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static std::size_t count_lines(const std::filesystem::path& p) {
    const std::string s = slurp(p);
    return static_cast<std::size_t>(std::count(s.begin(), s.end(), '\n'));
}

static std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> cols;
    std::istringstream iss(line);
    std::string c;
    while (std::getline(iss, c, '\t')) cols.push_back(c);
    return cols;
}

static record_S sample_record(std::size_t k) {
    record_S rec{};
    rec.tick = k;
    rec.onset_s = 6.0 + 0.1 * static_cast<double>(k);
    rec.volume = static_cast<int>(std::floor(rec.onset_s / 1.5)) + 1;
    rec.block_index = 2;
    rec.block_type = "TGI";
    rec.cycle_index = 0;
    rec.mask_name = "TGI_1";
    rec.warm_first = false;
    rec.delta = -0.1 * static_cast<double>(k);
    rec.commanded.fill(30.0);
    rec.actual.fill(30.01);
    return rec;
}

static void check_row_format() {
    record_S rec = sample_record(3);
    rec.actual[4] = NaN_D;
    const std::string row = Recorder_C::format_record_row(rec);
    const std::vector<std::string> cols = split_tabs(row);
    EXPECT(cols.size() == RECORD_LOG_NUM_COLS, "18 columns, got " << cols.size());
    if (cols.size() == RECORD_LOG_NUM_COLS) {
        EXPECT(cols[0] == "6.3000", "onset 4 decimals: " << cols[0]);
        EXPECT(cols[3] == "TGI" && cols[5] == "TGI_1" && cols[6] == "0", "condition columns");
        EXPECT(cols[7] == "-0.3000", "delta: " << cols[7]);
        EXPECT(cols[8] == "30.00" && cols[13] == "30.01", "temps 2 decimals");
        EXPECT(cols[17] == "nan", "missing reading written as nan");
    }
    // the monitor can read back what the recorder writes
    const auto parsed = monitor::parse_record_row(row);
    EXPECT(parsed.has_value() && parsed->volume == rec.volume && std::isnan(parsed->actual[4]),
           "row parses back");

    EXPECT(split_tabs(Recorder_C::qc_header()).size() == 14, "qc header columns");
    EXPECT(split_tabs(Recorder_C::events_header()).size() == 8, "events header columns");
}

static void check_block_files(const std::filesystem::path& root) {
    const sp::BlockPaths paths = sp::create_block_paths(root, "07", "02", "3");
    blockConfig_S cfg{};
    cfg.block_index = 2;
    cfg.mask_name = "TGI_1";
    cfg.direction = WaveDirection_CoolFirst;
    cfg.flush_every = 4;

    {
        Recorder_C rec(paths);
        rec.on_block_start(cfg);

        std::string outcome;
        EXPECT(JSON::extract_json_string(slurp(paths.sidecar_json), "outcome", outcome) && outcome == "InProgress",
               "sidecar written at start as InProgress");
        EXPECT(sp::scan_completed_runs(root, "07", "02").size() == 1, "sidecar visible to the query");
        EXPECT(!sp::run_completed(sp::scan_completed_runs(root, "07", "02"), "3"), "in-progress run is not completed");

        for (std::size_t k = 0; k < 3; ++k) rec.on_record(sample_record(k));
        EXPECT(rec.rows_flushed() == 0, "nothing flushed before flush_every rows");
        rec.on_record(sample_record(3));
        EXPECT(rec.rows_flushed() == 4, "flushed at flush_every");
        EXPECT(count_lines(paths.record_tsv) == 4, "flushed rows on disk");
        for (std::size_t k = 4; k < 6; ++k) rec.on_record(sample_record(k));

        phaseTiming_S ph{};
        ph.phase = BlockPhase_BaselinePre;
        ph.trial_type = "baseline";
        ph.onset_s = 6.0;
        ph.duration_s = 0.6;
        rec.on_phase(ph);

        qcSummary_S qs{};
        qs.cycle_index = 0;
        qs.n_samples = 6;
        rec.on_cycle_summary(qs);

        blockResult_S result{};
        result.outcome = BlockOutcome_Completed;
        result.n_records = 6;
        result.cycles.push_back(qs);
        rec.on_block_end(result);
        EXPECT(rec.rows_written() == 6 && rec.rows_flushed() == 6, "final flush at block end");
    }

    EXPECT(count_lines(paths.record_tsv) == 6, "all rows on disk");
    EXPECT(count_lines(paths.qc_tsv) == 2, "qc header + one cycle");
    const std::string events = slurp(paths.events_tsv);
    EXPECT(events.find("baseline\tTGI_baseline\tTGI_1\t0\tn/a\tn/a") != std::string::npos,
           "events row: " << events);

    const std::string sidecar = slurp(paths.sidecar_json);
    std::string outcome;
    int n_records = -1;
    bool warm_first = true;
    EXPECT(JSON::extract_json_string(sidecar, "outcome", outcome) && outcome == "Completed", "final outcome");
    EXPECT(JSON::extract_json_int(sidecar, "n_records", n_records) && n_records == 6, "n_records in sidecar");
    EXPECT(JSON::extract_json_bool(sidecar, "warm_first", warm_first) && !warm_first, "cool-first recorded");

    const auto runs = sp::scan_completed_runs(root, "07", "02");
    EXPECT(runs.size() == 1 && runs[0].run_id == "3" && runs[0].block_type == "TGI", "completed run listed");
    EXPECT(sp::run_completed(runs, "3"), "run 3 completed");
    EXPECT(!sp::run_completed(runs, "4"), "run 4 never ran");

    const auto latest = sp::find_latest_record_log(root);
    EXPECT(latest.has_value() && *latest == paths.record_tsv, "monitor finds the record log");
    EXPECT(sp::sidecar_for_record_log(paths.record_tsv) == paths.sidecar_json, "sidecar next to the log");
}

static void check_labels() {
    EXPECT(sp::sanitize_label("sub_0-1") == "sub01", "separators dropped");
    EXPECT(sp::sanitize_label("--") == "unknown", "empty label");
    const auto run = sp::run_label_from_filename("sub-01_ses-01_task-tprf_run-03_thermode_20250314T101502.json");
    EXPECT(run.has_value() && *run == "03", "run label from file name");
}

int main() {
    logger::init();
    logger::tlabel = "RecorderSelfTest";
    LOG_ALWAYS("RecorderSelfTest starting...");

    const std::filesystem::path root = selftest::scratch_dir("recorder");
    check_row_format();
    check_block_files(root);
    check_labels();

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    return selftest::finish("RecorderSelfTest");
}
