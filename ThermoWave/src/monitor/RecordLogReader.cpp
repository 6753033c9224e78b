#include "RecordLogReader.h"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include "../utils/Logger.hpp"

namespace {

bool to_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end); // accepts "nan"
    return end != nullptr && *end == '\0';
}

bool to_int(const std::string& s, int& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (end == nullptr || *end != '\0') return false;
    out = static_cast<int>(v);
    return true;
}

} // namespace

std::optional<record_S> monitor::parse_record_row(const std::string& line) {
    std::vector<std::string> cols;
    std::istringstream iss(line);
    std::string col;
    while (std::getline(iss, col, '\t')) {
        cols.push_back(col);
    }
    if (cols.size() != RECORD_LOG_NUM_COLS) {
        return std::nullopt;
    }

    record_S rec{};
    int warm = 0;
    bool ok = to_double(cols[0], rec.onset_s)
           && to_int(cols[1], rec.volume)
           && to_int(cols[2], rec.block_index)
           && to_int(cols[4], rec.cycle_index)
           && to_int(cols[6], warm)
           && to_double(cols[7], rec.delta);
    rec.block_type = cols[3];
    rec.mask_name = cols[5];
    rec.warm_first = (warm != 0);
    for (std::size_t z = 0; z < NUM_ZONES && ok; ++z) {
        ok = to_double(cols[8 + z], rec.commanded[z])
          && to_double(cols[8 + NUM_ZONES + z], rec.actual[z]);
    }
    if (!ok) {
        return std::nullopt;
    }
    rec.phase = (rec.cycle_index >= 0) ? BlockPhase_Stimulation : BlockPhase_BaselinePre;
    return rec;
}

RecordLogReader_C::RecordLogReader_C(std::filesystem::path path) : path_(std::move(path)) {
}

std::size_t RecordLogReader_C::poll() {
    std::error_code ec;
    const std::uintmax_t size = std::filesystem::file_size(path_, ec);
    if (ec) {
        return 0; // not created yet
    }
    if (size < offset_) {
        // truncated / replaced underneath us: start over
        LOG_WARN("monitor: " << path_.filename().string() << " shrank, rereading from start");
        offset_ = 0;
        rows_.clear();
    }
    if (size == offset_) {
        return 0;
    }

    std::ifstream in(path_, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        return 0;
    }
    in.seekg(static_cast<std::streamoff>(offset_));
    std::string chunk(static_cast<std::size_t>(size - offset_), '\0');
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    chunk.resize(static_cast<std::size_t>(in.gcount()));

    const auto last_nl = chunk.rfind('\n');
    if (last_nl == std::string::npos) {
        return 0; // only a partial line so far
    }

    std::size_t added = 0;
    std::size_t start = 0;
    while (start <= last_nl) {
        const auto nl = chunk.find('\n', start);
        std::string line = chunk.substr(start, nl - start);
        start = nl + 1;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        if (auto rec = monitor::parse_record_row(line)) {
            rows_.push_back(std::move(*rec));
            ++added;
        } else {
            ++n_malformed_;
            LOG_DBG("monitor: skipped malformed line (" << line.size() << " bytes)");
        }
    }
    offset_ += last_nl + 1;
    return added;
}
