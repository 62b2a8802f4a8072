/**
 * Frequency.cpp - Implementation
 */

#include "tsarchive/Frequency.h"
#include "tsarchive/TimeUtils.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

std::string frequency_name(Frequency frequency) {
    switch (frequency) {
        case Frequency::Tick: return "tick";
        case Frequency::Minute: return "minute";
        case Frequency::Hour: return "hour";
        case Frequency::Daily: return "daily";
    }
    return "unknown";
}

Frequency parse_frequency(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "tick") return Frequency::Tick;
    if (lower == "minute") return Frequency::Minute;
    if (lower == "hour" || lower == "hourly") return Frequency::Hour;
    if (lower == "daily") return Frequency::Daily;
    throw std::invalid_argument("Unknown frequency: " + text);
}

FrequencySpec default_frequency_spec(Frequency frequency) {
    FrequencySpec spec;
    spec.frequency = frequency;
    switch (frequency) {
        case Frequency::Tick:
            spec.lookback_seconds = 90 * SECONDS_PER_DAY;
            break;
        case Frequency::Minute:
            spec.lookback_seconds = 366 * SECONDS_PER_DAY;
            break;
        case Frequency::Hour:
            spec.lookback_seconds = 730 * SECONDS_PER_DAY;
            break;
        case Frequency::Daily:
            spec.lookback_seconds = 0;
            spec.earliest_epoch = utc_from_civil(CivilTime{1980, 1, 1});
            break;
    }
    return spec;
}

namespace {
    // Floor division; epoch seconds before 1970 must still align downwards.
    int64_t floor_to(int64_t t, int64_t step) {
        int64_t q = t / step;
        if (t % step != 0 && t < 0) --q;
        return q * step;
    }
}

int64_t align_down(Frequency frequency, int64_t t) {
    switch (frequency) {
        case Frequency::Tick:
            return floor_to(t, SECONDS_PER_HOUR);
        case Frequency::Minute:
        case Frequency::Hour:
            return floor_to(t, SECONDS_PER_DAY);
        case Frequency::Daily: {
            CivilTime c = civil_from_utc(t);
            return utc_from_civil(CivilTime{c.year, 1, 1});
        }
    }
    return t;
}

int64_t next_boundary(Frequency frequency, int64_t aligned_start) {
    switch (frequency) {
        case Frequency::Tick:
            return aligned_start + SECONDS_PER_HOUR;
        case Frequency::Minute:
        case Frequency::Hour:
            return aligned_start + SECONDS_PER_DAY;
        case Frequency::Daily: {
            CivilTime c = civil_from_utc(aligned_start);
            return utc_from_civil(CivilTime{c.year + 1, 1, 1});
        }
    }
    return aligned_start;
}

int64_t earliest_boundary(const FrequencySpec& spec, int64_t now) {
    int64_t earliest = spec.earliest_epoch;
    if (spec.lookback_seconds > 0) {
        earliest = std::max(earliest, now - spec.lookback_seconds);
    }
    return earliest;
}

std::string chunk_name(Frequency frequency, int64_t window_start) {
    CivilTime c = civil_from_utc(align_down(frequency, window_start));
    char buf[32];
    switch (frequency) {
        case Frequency::Tick:
            std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d", c.year, c.month, c.day, c.hour);
            break;
        case Frequency::Minute:
        case Frequency::Hour:
            std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", c.year, c.month, c.day);
            break;
        case Frequency::Daily:
            std::snprintf(buf, sizeof(buf), "%04d", c.year);
            break;
    }
    return buf;
}

std::optional<int64_t> parse_chunk_name(Frequency frequency, const std::string& name) {
    CivilTime c;
    int consumed = 0;
    int fields = 0;

    switch (frequency) {
        case Frequency::Tick:
            fields = std::sscanf(name.c_str(), "%4d-%2d-%2dT%2d%n", &c.year, &c.month, &c.day, &c.hour, &consumed);
            if (fields != 4) return std::nullopt;
            break;
        case Frequency::Minute:
        case Frequency::Hour:
            fields = std::sscanf(name.c_str(), "%4d-%2d-%2d%n", &c.year, &c.month, &c.day, &consumed);
            if (fields != 3) return std::nullopt;
            break;
        case Frequency::Daily:
            fields = std::sscanf(name.c_str(), "%4d%n", &c.year, &consumed);
            if (fields != 1) return std::nullopt;
            break;
    }

    if (static_cast<size_t>(consumed) != name.size()) return std::nullopt;
    if (c.month < 1 || c.month > 12 || c.day < 1 || c.day > 31 || c.hour < 0 || c.hour > 23) {
        return std::nullopt;
    }

    int64_t start = utc_from_civil(c);
    // Reject names that do not round-trip (e.g. 2021-02-30).
    if (chunk_name(frequency, start) != name) return std::nullopt;
    return start;
}

size_t default_estimated_payload_bytes(Frequency frequency) {
    switch (frequency) {
        case Frequency::Tick: return 4 * 1024 * 1024;
        case Frequency::Minute: return 512 * 1024;
        case Frequency::Hour: return 64 * 1024;
        case Frequency::Daily: return 32 * 1024;
    }
    return 64 * 1024;
}

Series parse_series(const std::string& text) {
    size_t colon = text.find_last_of(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
        throw std::invalid_argument("Series must look like ID:frequency, got '" + text + "'");
    }
    Series series;
    series.id = text.substr(0, colon);
    series.frequency = parse_frequency(text.substr(colon + 1));
    return series;
}

std::string series_label(const Series& series) {
    return series.id + ":" + frequency_name(series.frequency);
}
