/**
 * Frequency.h - Sampling frequency catalog
 *
 * Each frequency is an independent archive with its own chunk granularity:
 *   tick   -> 1 hour      (chunk name YYYY-MM-DDTHH)
 *   minute -> 1 day       (chunk name YYYY-MM-DD)
 *   hour   -> 1 day       (chunk name YYYY-MM-DD)
 *   daily  -> 1 year      (chunk name YYYY)
 */

#pragma once

#include "tsarchive/ArchiveTypes.h"
#include <array>
#include <cstdint>
#include <optional>
#include <string>

constexpr std::array<Frequency, 4> ALL_FREQUENCIES = {
    Frequency::Daily, Frequency::Hour, Frequency::Minute, Frequency::Tick
};

/**
 * FrequencySpec - How far back the remote source serves a frequency.
 *
 * The earliest retrievable instant is max(earliest_epoch, now - lookback_seconds).
 * A lookback of 0 means "no relative limit".
 */
struct FrequencySpec {
    Frequency frequency = Frequency::Daily;
    int64_t lookback_seconds = 0;
    int64_t earliest_epoch = 0;
};

std::string frequency_name(Frequency frequency);
Frequency parse_frequency(const std::string& text);

FrequencySpec default_frequency_spec(Frequency frequency);

int64_t align_down(Frequency frequency, int64_t t);
int64_t next_boundary(Frequency frequency, int64_t aligned_start);
int64_t earliest_boundary(const FrequencySpec& spec, int64_t now);

std::string chunk_name(Frequency frequency, int64_t window_start);
std::optional<int64_t> parse_chunk_name(Frequency frequency, const std::string& name);

/**
 * Size-class guess for one chunk request, used by the rate limiter before
 * the true payload size is known.
 */
size_t default_estimated_payload_bytes(Frequency frequency);

Series parse_series(const std::string& text);
std::string series_label(const Series& series);
