/**
 * ChunkPlanner.h - Decide which windows of an archive still need fetching
 *
 * Pure function of (existing chunks, frequency horizon, now); performs no I/O
 * so it can be exercised without a filesystem or network.
 */

#pragma once

#include "tsarchive/ArchiveTypes.h"
#include "tsarchive/Frequency.h"
#include <cstdint>
#include <vector>

/**
 * @brief Ascending list of windows to request.
 *
 * Windows run from the frequency's earliest retrievable instant up to the
 * window containing `now` (the window ending exactly at `now` when `now` sits
 * on a boundary). Complete and Empty windows are skipped; an Incomplete
 * window is re-requested, finalizing it once it has elapsed; absent windows
 * are requested. The first window is truncated to start at the horizon when
 * the horizon falls mid-period.
 *
 * @param existing Chunks as returned by ChunkStore::list_chunks().
 * @param spec Frequency and retrievable horizon.
 * @param now Current UTC instant in seconds.
 */
std::vector<ChunkTask> plan_chunks(const std::vector<Chunk>& existing,
                                   const FrequencySpec& spec,
                                   int64_t now);
