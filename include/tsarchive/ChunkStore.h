/**
 * ChunkStore.h - Crash-safe on-disk archive for one series at one frequency
 *
 * Layout:
 * <root>/<frequency>/<series>/<chunk>.csv          Complete (rows) or Empty (zero bytes)
 * <root>/<frequency>/<series>/<chunk>.incomplete   current, still-accumulating period
 *
 * Hidden files are never chunks:
 * .<file>.tmp                                      write in progress
 * .<chunk>.incomplete.<unix_seconds>[.<n>].bak     superseded incomplete version
 *
 * Every commit writes a temporary, syncs it, and renames it into place, so a
 * crash never exposes a half-written file under a canonical name.
 */

#pragma once

#include "tsarchive/ArchiveTypes.h"
#include "tsarchive/ChunkFile.h"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class ChunkStore {
public:
    /**
     * @brief Open (without creating) the archive of one series.
     * @param archive_root Root directory holding every frequency.
     * @param series Series identifier and frequency.
     */
    ChunkStore(const std::string& archive_root, Series series);

    const Series& series() const { return series_; }
    std::string directory() const { return dir_.string(); }

    /**
     * @brief Committed chunks ascending by range_start.
     * @throws StoreIOError on I/O errors. A missing directory is an empty archive.
     */
    std::vector<Chunk> list_chunks() const;

    static bool is_period_elapsed(int64_t range_end, int64_t now) { return range_end <= now; }

    /**
     * @brief Persist rows for the window of `chunk`.
     *
     * Elapsed windows become Complete (rows) or Empty (no rows) and are never
     * overwritten afterwards. Non-elapsed windows become Incomplete; the
     * previous Incomplete version is moved to a backup name, never deleted.
     * Any Incomplete chunk of an earlier window is backed up the same way, so
     * the Incomplete chunk, if any, is always the latest one.
     *
     * @return The chunk as committed (aligned range, final status, path).
     * @throws StoreIOError on filesystem failure or when the window already
     *         holds a Complete/Empty chunk (kind Conflict).
     */
    Chunk commit(const Chunk& chunk, const RowTable& rows, bool is_elapsed);

    /// Same as above; `now` stamps the names of any backups taken.
    Chunk commit(const Chunk& chunk, const RowTable& rows, bool is_elapsed, int64_t now);

    /**
     * @brief Remove temporaries left behind by an interrupted commit.
     * @return Number of temporaries removed.
     */
    size_t recover();

    RowTable read_rows(const Chunk& chunk) const;

    std::vector<std::string> list_backups() const;
    uint64_t disk_usage() const;

private:
    Series series_;
    fs::path dir_;

    fs::path complete_path(const std::string& name) const;
    fs::path incomplete_path(const std::string& name) const;
    fs::path temp_path(const std::string& file_name) const;
    fs::path backup_path(const std::string& name, int64_t now) const;

    void ensure_directory_exists() const;
    void backup_incomplete(const fs::path& path, const std::string& name, int64_t now) const;
    void backup_stale_incompletes(int64_t before, int64_t now) const;
    void sync_directory() const;
};
