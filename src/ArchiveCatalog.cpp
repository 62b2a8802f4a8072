/**
 * ArchiveCatalog.cpp - Implementation
 */

#include "tsarchive/ArchiveCatalog.h"
#include "tsarchive/ChunkFile.h"
#include "tsarchive/ChunkStore.h"
#include "tsarchive/Frequency.h"
#include "tsarchive/TimeUtils.h"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace {
    void log_error(const std::string& msg) {
        std::cerr << "❌ " << msg << std::endl;
    }

    std::vector<std::string> series_directories(const fs::path& frequency_dir) {
        std::vector<std::string> names;
        std::error_code ec;
        if (!fs::is_directory(frequency_dir, ec)) return names;

        for (fs::directory_iterator it(frequency_dir, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (!it->is_directory(type_ec)) continue;
            std::string name = it->path().filename().string();
            if (name.empty() || name[0] == '.') continue;
            names.push_back(name);
        }
        if (ec) {
            throw chunk_file::make_store_error("Failed to list " + frequency_dir.string(), ec);
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    SeriesSummary summarize(const std::string& archive_root, const Series& series) {
        SeriesSummary summary;
        summary.series = series;

        ChunkStore store(archive_root, series);
        auto chunks = store.list_chunks();
        summary.chunk_count = chunks.size();

        for (const auto& chunk : chunks) {
            if (chunk.status == ChunkStatus::Incomplete) summary.has_incomplete = true;
            if (chunk.status == ChunkStatus::Empty) continue;

            // A running update may supersede the chunk after it was listed.
            ChunkBounds bounds;
            try {
                bounds = chunk_file::read_chunk_bounds(chunk.file_path);
            } catch (const StoreIOError& e) {
                log_error("Skipping bounds of " + chunk.file_path + ": " + e.what());
                continue;
            }
            if (bounds.empty) continue;

            if (!summary.observed_start || bounds.first_timestamp < *summary.observed_start) {
                summary.observed_start = bounds.first_timestamp;
            }
            if (!summary.observed_end || bounds.last_timestamp > *summary.observed_end) {
                summary.observed_end = bounds.last_timestamp;
            }
        }
        return summary;
    }
}

json SeriesSummary::to_json() const {
    json j = {
        {"series", series.id},
        {"frequency", frequency_name(series.frequency)},
        {"chunk_count", chunk_count},
        {"has_incomplete", has_incomplete}
    };
    if (observed_start && observed_end) {
        j["observed_start"] = format_utc_iso(*observed_start);
        j["observed_end"] = format_utc_iso(*observed_end);
    } else {
        j["observed_start"] = nullptr;
        j["observed_end"] = nullptr;
    }
    return j;
}

std::vector<SeriesSummary> list_selectable_series(const std::string& archive_root,
                                                  std::optional<Frequency> frequency_filter) {
    std::vector<SeriesSummary> result;

    for (Frequency frequency : ALL_FREQUENCIES) {
        if (frequency_filter && *frequency_filter != frequency) continue;

        fs::path frequency_dir = fs::path(archive_root) / frequency_name(frequency);
        for (const auto& id : series_directories(frequency_dir)) {
            Series series{id, frequency};
            try {
                result.push_back(summarize(archive_root, series));
            } catch (const std::invalid_argument& e) {
                log_error("Skipping " + series_label(series) + ": " + e.what());
            } catch (const StoreIOError& e) {
                log_error("Skipping " + series_label(series) + ": " + e.what());
            }
        }
    }
    return result;
}
