/**
 * test_chunk_planner.cpp - Window planning from existing archive state
 */

#include "tsarchive/ChunkPlanner.h"
#include "tsarchive/TimeUtils.h"
#include <iostream>

namespace {
    void log_info(const std::string& msg) {
        std::cout << "ℹ️  " << msg << std::endl;
    }

    void log_success(const std::string& msg) {
        std::cout << "✅ " << msg << std::endl;
    }

    void log_error(const std::string& msg) {
        std::cerr << "❌ " << msg << std::endl;
    }

    int64_t at(int year, int month, int day, int hour = 0, int minute = 0) {
        return utc_from_civil(CivilTime{year, month, day, hour, minute});
    }

    Chunk existing(Frequency frequency, int64_t start, ChunkStatus status) {
        Chunk chunk;
        chunk.series = Series{"TEST", frequency};
        chunk.range_start = start;
        chunk.range_end = next_boundary(frequency, start);
        chunk.status = status;
        return chunk;
    }
}

int main() {
    log_info("=== Chunk Planner Tests ===\n");

    FrequencySpec daily = default_frequency_spec(Frequency::Daily);

    // Test 1: Only the current year is missing
    {
        log_info("Test 1: Complete history up to last year");
        std::vector<Chunk> chunks;
        for (int year = 1980; year <= 2020; ++year) {
            chunks.push_back(existing(Frequency::Daily, at(year, 1, 1), ChunkStatus::Complete));
        }
        auto tasks = plan_chunks(chunks, daily, at(2021, 10, 25, 14));
        if (tasks.size() != 1 || tasks[0].range_start != at(2021, 1, 1) ||
            tasks[0].range_end != at(2022, 1, 1) ||
            tasks[0].expected_status != ChunkStatus::Incomplete ||
            tasks[0].supersedes_incomplete) {
            log_error("Test 1 failed: expected a single incomplete 2021 task, got " +
                      std::to_string(tasks.size()));
            return 1;
        }
        log_success("Test 1 passed");
    }

    // Test 2: Empty archive plans every window, oldest first
    {
        log_info("\nTest 2: Empty archive");
        auto tasks = plan_chunks({}, daily, at(1982, 3, 1));
        if (tasks.size() != 3 || tasks[0].range_start != at(1980, 1, 1) ||
            tasks[1].expected_status != ChunkStatus::Complete ||
            tasks[2].expected_status != ChunkStatus::Incomplete) {
            log_error("Test 2 failed: got " + std::to_string(tasks.size()) + " tasks");
            return 1;
        }
        for (size_t i = 1; i < tasks.size(); ++i) {
            if (tasks[i].range_start != tasks[i - 1].range_end) {
                log_error("Test 2 failed: windows not contiguous");
                return 1;
            }
        }
        log_success("Test 2 passed");
    }

    // Test 3: now exactly on a boundary
    {
        log_info("\nTest 3: now on a granularity boundary");
        auto tasks = plan_chunks({}, daily, at(1982, 1, 1));
        if (tasks.size() != 2 || tasks.back().range_end != at(1982, 1, 1) ||
            tasks.back().expected_status != ChunkStatus::Complete) {
            log_error("Test 3 failed: the window ending at now is the last one");
            return 1;
        }
        log_success("Test 3 passed");
    }

    // Test 4: Horizon in the middle of a window
    {
        log_info("\nTest 4: Truncated first window");
        FrequencySpec tick{Frequency::Tick, 3 * SECONDS_PER_HOUR + 30 * 60, 0};
        int64_t now = at(2021, 10, 25, 12);
        auto tasks = plan_chunks({}, tick, now);
        if (tasks.size() != 4 || tasks[0].range_start != at(2021, 10, 25, 8, 30) ||
            tasks[0].range_end != at(2021, 10, 25, 9) ||
            tasks[3].range_end != now) {
            log_error("Test 4 failed: got " + std::to_string(tasks.size()) + " tasks");
            return 1;
        }
        log_success("Test 4 passed");
    }

    // Test 5: Elapsed incomplete window is re-requested for finalization
    {
        log_info("\nTest 5: Elapsed incomplete window");
        FrequencySpec minute{Frequency::Minute, 2 * SECONDS_PER_DAY, 0};
        int64_t now = at(2021, 10, 25, 10);
        std::vector<Chunk> chunks = {
            existing(Frequency::Minute, at(2021, 10, 23), ChunkStatus::Complete),
            existing(Frequency::Minute, at(2021, 10, 24), ChunkStatus::Incomplete)
        };
        auto tasks = plan_chunks(chunks, minute, now);
        if (tasks.size() != 2 ||
            tasks[0].range_start != at(2021, 10, 24) || !tasks[0].supersedes_incomplete ||
            tasks[0].expected_status != ChunkStatus::Complete ||
            tasks[1].range_start != at(2021, 10, 25) || tasks[1].supersedes_incomplete ||
            tasks[1].expected_status != ChunkStatus::Incomplete) {
            log_error("Test 5 failed: got " + std::to_string(tasks.size()) + " tasks");
            return 1;
        }
        log_success("Test 5 passed");
    }

    // Test 6: Empty windows are settled
    {
        log_info("\nTest 6: Empty windows are not re-requested");
        FrequencySpec minute{Frequency::Minute, 7 * SECONDS_PER_DAY, 0};
        int64_t now = at(2021, 10, 25, 10);
        std::vector<Chunk> chunks;
        for (int d = 18; d <= 24; ++d) {
            // 23rd and 24th are a weekend
            ChunkStatus status = (d == 23 || d == 24) ? ChunkStatus::Empty : ChunkStatus::Complete;
            chunks.push_back(existing(Frequency::Minute, at(2021, 10, d), status));
        }
        auto tasks = plan_chunks(chunks, minute, now);
        if (tasks.size() != 1 || tasks[0].range_start != at(2021, 10, 25)) {
            log_error("Test 6 failed: got " + std::to_string(tasks.size()) + " tasks");
            return 1;
        }
        log_success("Test 6 passed");
    }

    // Test 7: Gaps inside the archive are filled
    {
        log_info("\nTest 7: Gap in the middle");
        std::vector<Chunk> chunks = {
            existing(Frequency::Daily, at(1980, 1, 1), ChunkStatus::Complete),
            existing(Frequency::Daily, at(1982, 1, 1), ChunkStatus::Complete)
        };
        auto tasks = plan_chunks(chunks, daily, at(1983, 1, 1));
        if (tasks.size() != 1 || tasks[0].range_start != at(1981, 1, 1)) {
            log_error("Test 7 failed");
            return 1;
        }
        log_success("Test 7 passed");
    }

    log_info("\n=== Chunk planner tests completed ===");
    return 0;
}
