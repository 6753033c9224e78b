/*
==============================================================================
	File: RecordLogReader.h
	Desc: Read-only tail reader for a record log that another process is
	still appending to. Each poll() reopens the file, seeks to the end of the
	last complete line it consumed, and parses only newline-terminated
	lines. A partially written trailing line stays unread until the writer
	finishes it. Never opens the log for writing.
==============================================================================
*/

#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "../utils/Types.h"

namespace monitor {

// one log line -> record; nullopt unless it has exactly RECORD_LOG_NUM_COLS fields
std::optional<record_S> parse_record_row(const std::string& line);

} // namespace monitor

class RecordLogReader_C {
public:
	explicit RecordLogReader_C(std::filesystem::path path);

	// consume newly completed lines; returns how many rows were added
	std::size_t poll();

	const std::vector<record_S>& rows() const { return rows_; }
	std::size_t n_malformed() const { return n_malformed_; }
	std::uintmax_t offset() const { return offset_; }
	const std::filesystem::path& path() const { return path_; }

private:
	std::filesystem::path path_;
	std::uintmax_t offset_ = 0; // byte just past the last consumed '\n'
	std::vector<record_S> rows_;
	std::size_t n_malformed_ = 0;
}; // RecordLogReader_C
