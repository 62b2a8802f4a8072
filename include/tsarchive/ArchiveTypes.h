/**
 * ArchiveTypes.h - Core data model for the chunked time-series archive
 *
 * All instants are int64_t seconds since the Unix epoch (UTC).
 * Chunk ranges are half-open: [range_start, range_end).
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

enum class Frequency {
    Tick,
    Minute,
    Hour,
    Daily
};

enum class ChunkStatus {
    Complete,     // fully elapsed period, rows present, immutable
    Incomplete,   // current period, may still receive rows
    Empty         // fully elapsed period, confirmed zero rows
};

struct Series {
    std::string id;
    Frequency frequency;

    bool operator==(const Series& other) const {
        return id == other.id && frequency == other.frequency;
    }
    bool operator!=(const Series& other) const { return !(*this == other); }
};

struct Chunk {
    Series series;
    int64_t range_start = 0;
    int64_t range_end = 0;
    ChunkStatus status = ChunkStatus::Complete;
    std::string file_path;
};

/**
 * ChunkTask - One window the planner wants fetched.
 */
struct ChunkTask {
    int64_t range_start = 0;
    int64_t range_end = 0;
    ChunkStatus expected_status = ChunkStatus::Complete;  // Complete covers Empty too
    bool supersedes_incomplete = false;
};

/**
 * RowTable - Opaque tabular payload returned by a data source.
 * Only the per-row timestamp is interpreted by the engine.
 */
struct RowTable {
    struct Row {
        int64_t timestamp = 0;
        std::vector<std::string> values;
    };

    std::vector<std::string> columns;
    std::vector<Row> rows;

    bool empty() const { return rows.empty(); }
    size_t size() const { return rows.size(); }
};

// ============================================================================
// Error taxonomy
// ============================================================================

class ArchiveError : public std::runtime_error {
public:
    explicit ArchiveError(const std::string& what) : std::runtime_error(what) {}
};

class StoreIOError : public ArchiveError {
public:
    enum class Kind {
        Io,
        NoSpace,
        Permission,
        Conflict
    };

    StoreIOError(Kind kind, const std::string& what) : ArchiveError(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

class FetchError : public ArchiveError {
public:
    enum class Category {
        Transient,
        Fatal
    };

    FetchError(Category category, const std::string& what) : ArchiveError(what), category_(category) {}

    Category category() const { return category_; }
    bool is_fatal() const { return category_ == Category::Fatal; }

private:
    Category category_;
};

class QuotaExceededError : public ArchiveError {
public:
    explicit QuotaExceededError(const std::string& what) : ArchiveError(what) {}
};

class CancellationError : public ArchiveError {
public:
    CancellationError() : ArchiveError("operation cancelled") {}
};

std::string chunk_status_name(ChunkStatus status);
std::string store_error_kind_name(StoreIOError::Kind kind);
