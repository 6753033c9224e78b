/*
==============================================================================
	File: Recorder.h
	Desc: File-backed block sink. Owns the four per-block output files:
	  - record log (headerless TSV, 18 cols), flushed every N rows
	  - sidecar JSON describing the record log; written at block start with
	    outcome "InProgress", rewritten at block end with the final outcome
	  - QC TSV (header + one row per closed cycle, flushed per row)
	  - events TSV (header + one row per phase, flushed per row)
	Writes happen synchronously inside the tick; a crash loses at most
	flush_every - 1 record rows.
==============================================================================
*/

#pragma once
#include <fstream>
#include <string>
#include <stdexcept>
#include <cstddef>
#include "IBlockSink.h"
#include "../utils/SessionPaths.hpp"

struct record_io_error : std::runtime_error {
	using std::runtime_error::runtime_error;
};

class Recorder_C : public IBlockSink_S {
public:
	// opens all files; throws record_io_error if any cannot be created
	explicit Recorder_C(const thermowave::sesspaths::BlockPaths& paths);
	~Recorder_C() override;
	Recorder_C(const Recorder_C&) = delete;
	Recorder_C& operator=(const Recorder_C&) = delete;

	void on_block_start(const blockConfig_S& cfg) override;
	void on_record(const record_S& rec) override;
	void on_cycle_summary(const qcSummary_S& summary) override;
	void on_phase(const phaseTiming_S& phase) override;
	void on_block_end(const blockResult_S& result) override;

	std::size_t rows_written() const { return rows_written_; }
	std::size_t rows_flushed() const { return rows_flushed_; }
	const thermowave::sesspaths::BlockPaths& paths() const { return paths_; }

	// formatting, shared with the monitor + tests
	static std::string format_record_row(const record_S& rec);
	static std::string format_qc_row(const blockConfig_S& cfg, const qcSummary_S& s);
	static std::string qc_header();
	static std::string events_header();
	static std::string make_sidecar_json(const blockConfig_S& cfg,
	                                     const std::string& start_time,
	                                     const std::string& outcome,
	                                     const blockResult_S* result);

private:
	thermowave::sesspaths::BlockPaths paths_;
	blockConfig_S cfg_{};
	std::string start_time_;
	std::ofstream record_out_;
	std::ofstream qc_out_;
	std::ofstream events_out_;
	std::size_t rows_written_ = 0;
	std::size_t rows_flushed_ = 0;
	std::size_t rows_since_flush_ = 0;
	bool write_error_logged_ = false;
	bool ended_ = false;

	void flush_records();
	void write_sidecar(const std::string& outcome, const blockResult_S* result);
	void check_stream(std::ofstream& out, const char* what);
}; // Recorder_C
