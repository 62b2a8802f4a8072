/**
 * ArchiveCatalog.h - Enumerate the series present in an archive
 *
 * Scans <root>/<frequency>/<series>/ and summarizes each series' committed
 * chunks. Used by the CLI listing and by the admin API to present choices.
 */

#pragma once

#include "tsarchive/ArchiveTypes.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct SeriesSummary {
    Series series;
    std::optional<int64_t> observed_start;   // first row timestamp, absent when no rows
    std::optional<int64_t> observed_end;     // last row timestamp
    size_t chunk_count = 0;
    bool has_incomplete = false;

    json to_json() const;
};

/**
 * @brief Summaries of every series stored under archive_root.
 *
 * Results are ordered by frequency, then series id. Directories that are not
 * valid frequency or series names are ignored. A missing root yields an
 * empty list.
 *
 * @param frequency_filter Restrict the scan to one frequency.
 * @throws StoreIOError if a series directory cannot be read.
 */
std::vector<SeriesSummary> list_selectable_series(const std::string& archive_root,
                                                  std::optional<Frequency> frequency_filter = std::nullopt);
