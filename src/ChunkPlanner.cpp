/**
 * ChunkPlanner.cpp - Implementation
 */

#include "tsarchive/ChunkPlanner.h"
#include <map>

namespace {
    const Chunk* find_covering(const std::map<int64_t, const Chunk*>& by_start,
                               int64_t window_start, int64_t window_end) {
        auto it = by_start.upper_bound(window_start);
        if (it == by_start.begin()) return nullptr;
        --it;
        const Chunk* chunk = it->second;
        if (chunk->range_start <= window_start && chunk->range_end >= window_end) {
            return chunk;
        }
        return nullptr;
    }
}

std::vector<ChunkTask> plan_chunks(const std::vector<Chunk>& existing,
                                   const FrequencySpec& spec,
                                   int64_t now) {
    std::vector<ChunkTask> tasks;

    std::map<int64_t, const Chunk*> by_start;
    for (const auto& chunk : existing) {
        by_start[chunk.range_start] = &chunk;
    }

    const Frequency frequency = spec.frequency;
    int64_t window_start = earliest_boundary(spec, now);

    while (window_start < now) {
        int64_t window_end = next_boundary(frequency, align_down(frequency, window_start));
        bool elapsed = window_end <= now;

        ChunkTask task;
        task.range_start = window_start;
        task.range_end = window_end;
        task.expected_status = elapsed ? ChunkStatus::Complete : ChunkStatus::Incomplete;

        const Chunk* covering = find_covering(by_start, window_start, window_end);
        if (!covering) {
            tasks.push_back(task);
        } else if (covering->status == ChunkStatus::Incomplete) {
            task.supersedes_incomplete = true;
            tasks.push_back(task);
        }

        window_start = window_end;
    }

    return tasks;
}
