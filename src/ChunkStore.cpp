/**
 * ChunkStore.cpp - Implementation
 */

#include "tsarchive/ChunkStore.h"
#include "tsarchive/Frequency.h"
#include "tsarchive/TimeUtils.h"
#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <iostream>
#include <map>
#include <stdexcept>
#include <unistd.h>

namespace {
    constexpr bool VERBOSE_LOGGING = false;

    const char* COMPLETE_EXT = ".csv";
    const char* INCOMPLETE_EXT = ".incomplete";
    const char* TEMP_EXT = ".tmp";
    const char* BACKUP_EXT = ".bak";

    void log_info(const std::string& msg) {
        if (VERBOSE_LOGGING) std::cout << "ℹ️  " << msg << std::endl;
    }

    void log_error(const std::string& msg) {
        std::cerr << "❌ " << msg << std::endl;
    }

    bool ends_with(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    void rename_or_throw(const fs::path& from, const fs::path& to) {
        std::error_code ec;
        fs::rename(from, to, ec);
        if (ec) {
            throw chunk_file::make_store_error("Failed to rename " + from.string() + " -> " + to.string(), ec);
        }
    }
}

ChunkStore::ChunkStore(const std::string& archive_root, Series series)
    : series_(std::move(series)) {
    if (series_.id.empty() || series_.id[0] == '.' || series_.id.find('/') != std::string::npos) {
        throw std::invalid_argument("Invalid series identifier '" + series_.id + "'");
    }
    dir_ = fs::path(archive_root) / frequency_name(series_.frequency) / series_.id;
}

fs::path ChunkStore::complete_path(const std::string& name) const {
    return dir_ / (name + COMPLETE_EXT);
}

fs::path ChunkStore::incomplete_path(const std::string& name) const {
    return dir_ / (name + INCOMPLETE_EXT);
}

fs::path ChunkStore::temp_path(const std::string& file_name) const {
    return dir_ / ("." + file_name + TEMP_EXT);
}

fs::path ChunkStore::backup_path(const std::string& name, int64_t now) const {
    std::string base = "." + name + INCOMPLETE_EXT + "." + std::to_string(now);
    fs::path candidate = dir_ / (base + BACKUP_EXT);
    for (int n = 1; fs::exists(candidate); ++n) {
        candidate = dir_ / (base + "." + std::to_string(n) + BACKUP_EXT);
    }
    return candidate;
}

void ChunkStore::ensure_directory_exists() const {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw chunk_file::make_store_error("Failed to create directory " + dir_.string(), ec);
    }
}

void ChunkStore::sync_directory() const {
    int fd = ::open(dir_.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        throw chunk_file::make_store_error("Failed to open directory " + dir_.string(), errno);
    }
    int rc = ::fsync(fd);
    int err = errno;
    ::close(fd);
    if (rc != 0) {
        throw chunk_file::make_store_error("Failed to sync directory " + dir_.string(), err);
    }
}

std::vector<Chunk> ChunkStore::list_chunks() const {
    std::map<int64_t, Chunk> by_start;

    std::error_code ec;
    if (!fs::exists(dir_, ec)) {
        if (ec) throw chunk_file::make_store_error("Failed to stat " + dir_.string(), ec);
        return {};
    }

    fs::directory_iterator it(dir_, ec);
    if (ec) throw chunk_file::make_store_error("Failed to list " + dir_.string(), ec);

    for (const auto& entry : it) {
        std::string file_name = entry.path().filename().string();
        if (file_name.empty() || file_name[0] == '.') continue;

        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;

        std::string stem;
        bool incomplete = false;
        if (ends_with(file_name, COMPLETE_EXT)) {
            stem = file_name.substr(0, file_name.size() - std::char_traits<char>::length(COMPLETE_EXT));
        } else if (ends_with(file_name, INCOMPLETE_EXT)) {
            stem = file_name.substr(0, file_name.size() - std::char_traits<char>::length(INCOMPLETE_EXT));
            incomplete = true;
        } else {
            log_info("Ignoring unrecognized file " + entry.path().string());
            continue;
        }

        auto start = parse_chunk_name(series_.frequency, stem);
        if (!start) {
            log_error("Ignoring chunk with unparseable name " + entry.path().string());
            continue;
        }

        Chunk chunk;
        chunk.series = series_;
        chunk.range_start = *start;
        chunk.range_end = next_boundary(series_.frequency, *start);
        chunk.file_path = entry.path().string();
        if (incomplete) {
            chunk.status = ChunkStatus::Incomplete;
        } else {
            auto size = entry.file_size(entry_ec);
            if (entry_ec) throw chunk_file::make_store_error("Failed to stat " + chunk.file_path, entry_ec);
            chunk.status = (size == 0) ? ChunkStatus::Empty : ChunkStatus::Complete;
        }

        auto existing = by_start.find(*start);
        if (existing != by_start.end()) {
            // A finalized chunk always wins over a leftover incomplete one.
            if (existing->second.status != ChunkStatus::Incomplete) {
                log_error("Ignoring " + chunk.file_path + ": window already finalized");
                continue;
            }
            if (chunk.status == ChunkStatus::Incomplete) continue;
        }
        by_start[*start] = chunk;
    }

    std::vector<Chunk> chunks;
    chunks.reserve(by_start.size());
    for (auto& [start, chunk] : by_start) {
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

void ChunkStore::backup_incomplete(const fs::path& path, const std::string& name, int64_t now) const {
    fs::path backup = backup_path(name, now);
    rename_or_throw(path, backup);
    log_info("Backed up " + path.string() + " -> " + backup.string());
}

void ChunkStore::backup_stale_incompletes(int64_t before, int64_t now) const {
    for (const auto& chunk : list_chunks()) {
        if (chunk.status != ChunkStatus::Incomplete || chunk.range_start >= before) continue;
        log_info("Superseding stale incomplete chunk " + chunk.file_path);
        backup_incomplete(chunk.file_path, chunk_name(series_.frequency, chunk.range_start), now);
    }
}

Chunk ChunkStore::commit(const Chunk& chunk, const RowTable& rows, bool is_elapsed) {
    return commit(chunk, rows, is_elapsed, utc_now_seconds());
}

Chunk ChunkStore::commit(const Chunk& chunk, const RowTable& rows, bool is_elapsed, int64_t now) {
    const std::string name = chunk_name(series_.frequency, chunk.range_start);
    const fs::path final_complete = complete_path(name);
    const fs::path final_incomplete = incomplete_path(name);

    std::error_code ec;
    if (fs::exists(final_complete, ec)) {
        throw StoreIOError(StoreIOError::Kind::Conflict,
                           "Refusing to overwrite finalized chunk " + final_complete.string());
    }

    ensure_directory_exists();

    const fs::path target = is_elapsed ? final_complete : final_incomplete;
    const fs::path tmp = temp_path(target.filename().string());

    try {
        chunk_file::write_rows(tmp.string(), rows);
    } catch (const StoreIOError&) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        throw;
    }

    // An earlier incomplete window left behind by a failed or cancelled run
    // becomes absent, so it is planned and fetched again.
    backup_stale_incompletes(align_down(series_.frequency, chunk.range_start), now);
    if (fs::exists(final_incomplete, ec)) {
        backup_incomplete(final_incomplete, name, now);
    }
    rename_or_throw(tmp, target);
    sync_directory();

    Chunk committed;
    committed.series = series_;
    committed.range_start = align_down(series_.frequency, chunk.range_start);
    committed.range_end = next_boundary(series_.frequency, committed.range_start);
    committed.file_path = target.string();
    if (!is_elapsed) {
        committed.status = ChunkStatus::Incomplete;
    } else {
        committed.status = rows.empty() ? ChunkStatus::Empty : ChunkStatus::Complete;
    }

    log_info("Committed " + series_label(series_) + " " + name + " as " + chunk_status_name(committed.status));
    return committed;
}

size_t ChunkStore::recover() {
    std::error_code ec;
    if (!fs::exists(dir_, ec)) return 0;

    size_t removed = 0;
    fs::directory_iterator it(dir_, ec);
    if (ec) throw chunk_file::make_store_error("Failed to list " + dir_.string(), ec);

    for (const auto& entry : it) {
        std::string file_name = entry.path().filename().string();
        if (file_name.empty() || file_name[0] != '.' || !ends_with(file_name, TEMP_EXT)) continue;

        std::error_code rm_ec;
        if (fs::remove(entry.path(), rm_ec)) {
            ++removed;
            log_info("Removed stale temporary " + entry.path().string());
        } else if (rm_ec) {
            throw chunk_file::make_store_error("Failed to remove " + entry.path().string(), rm_ec);
        }
    }
    return removed;
}

RowTable ChunkStore::read_rows(const Chunk& chunk) const {
    if (chunk.status == ChunkStatus::Empty) return RowTable{};
    return chunk_file::read_rows(chunk.file_path);
}

std::vector<std::string> ChunkStore::list_backups() const {
    std::vector<std::string> backups;
    std::error_code ec;
    if (!fs::exists(dir_, ec)) return backups;

    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        std::string file_name = entry.path().filename().string();
        if (!file_name.empty() && file_name[0] == '.' && ends_with(file_name, BACKUP_EXT)) {
            backups.push_back(entry.path().string());
        }
    }
    std::sort(backups.begin(), backups.end());
    return backups;
}

uint64_t ChunkStore::disk_usage() const {
    uint64_t total = 0;
    std::error_code ec;
    if (!fs::exists(dir_, ec)) return 0;

    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        std::error_code size_ec;
        if (entry.is_regular_file(size_ec)) {
            auto size = entry.file_size(size_ec);
            if (!size_ec) total += size;
        }
    }
    return total;
}
