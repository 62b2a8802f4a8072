/**
 * ChunkFile.h - CSV encoding of a single chunk's rows
 *
 * Format:
 *   Date,<column>,<column>...
 *   2021-10-25T14:00:00Z,<value>,<value>...
 *
 * An empty RowTable is written as a zero-byte file; zero-byte files read back
 * as "empty" regardless of name.
 */

#pragma once

#include "tsarchive/ArchiveTypes.h"
#include <cstdint>
#include <string>
#include <system_error>

struct ChunkBounds {
    int64_t first_timestamp = 0;
    int64_t last_timestamp = 0;
    size_t row_count = 0;
    bool empty = true;
};

namespace chunk_file {

/**
 * @brief Write rows to path and flush them to stable storage.
 * @throws StoreIOError on any filesystem failure.
 */
void write_rows(const std::string& path, const RowTable& table);

/**
 * @brief Read the first and last row timestamps without materializing rows.
 * @throws StoreIOError if the file cannot be opened or a row is malformed.
 */
ChunkBounds read_chunk_bounds(const std::string& path);

RowTable read_rows(const std::string& path);

/**
 * @brief Parse CSV text (same format as the chunk files) into a RowTable.
 * @throws std::runtime_error on malformed content.
 */
RowTable parse_csv(const std::string& text);

std::string to_csv(const RowTable& table);

StoreIOError make_store_error(const std::string& context, int err);
StoreIOError make_store_error(const std::string& context, const std::error_code& ec);

}  // namespace chunk_file
