/**
 * TimeUtils.h - UTC calendar helpers on int64_t epoch seconds
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;

struct CivilTime {
    int year = 1970;
    int month = 1;     // 1-12
    int day = 1;       // 1-31
    int hour = 0;
    int minute = 0;
    int second = 0;
};

int64_t utc_from_civil(const CivilTime& civil);
CivilTime civil_from_utc(int64_t seconds);

// "2021-10-25T14:03:07Z"
std::string format_utc_iso(int64_t seconds);

// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS" and "YYYY-MM-DD HH:MM:SS",
// optionally suffixed with 'Z'.
std::optional<int64_t> parse_utc_iso(const std::string& text);

int64_t utc_now_seconds();
