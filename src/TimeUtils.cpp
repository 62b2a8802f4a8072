/**
 * TimeUtils.cpp - Implementation
 */

#include "tsarchive/TimeUtils.h"
#include <chrono>
#include <cstdio>
#include <ctime>

int64_t utc_from_civil(const CivilTime& civil) {
    std::tm tm{};
    tm.tm_year = civil.year - 1900;
    tm.tm_mon = civil.month - 1;
    tm.tm_mday = civil.day;
    tm.tm_hour = civil.hour;
    tm.tm_min = civil.minute;
    tm.tm_sec = civil.second;
    tm.tm_isdst = 0;
    return static_cast<int64_t>(timegm(&tm));
}

CivilTime civil_from_utc(int64_t seconds) {
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm utc_tm{};
    gmtime_r(&t, &utc_tm);

    CivilTime civil;
    civil.year = utc_tm.tm_year + 1900;
    civil.month = utc_tm.tm_mon + 1;
    civil.day = utc_tm.tm_mday;
    civil.hour = utc_tm.tm_hour;
    civil.minute = utc_tm.tm_min;
    civil.second = utc_tm.tm_sec;
    return civil;
}

std::string format_utc_iso(int64_t seconds) {
    CivilTime c = civil_from_utc(seconds);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                  c.year, c.month, c.day, c.hour, c.minute, c.second);
    return buf;
}

std::optional<int64_t> parse_utc_iso(const std::string& text) {
    CivilTime c;
    char sep = 'T';
    int consumed = 0;

    int fields = std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &c.year, &c.month, &c.day, &consumed);
    if (fields != 3) return std::nullopt;

    if (static_cast<size_t>(consumed) < text.size()) {
        int rest = 0;
        fields = std::sscanf(text.c_str() + consumed, "%c%2d:%2d:%2d%n",
                             &sep, &c.hour, &c.minute, &c.second, &rest);
        if (fields != 4 || (sep != 'T' && sep != ' ')) return std::nullopt;
        consumed += rest;
        if (static_cast<size_t>(consumed) < text.size()) {
            if (text.substr(consumed) != "Z") return std::nullopt;
        }
    }

    if (c.month < 1 || c.month > 12 || c.day < 1 || c.day > 31 ||
        c.hour < 0 || c.hour > 23 || c.minute < 0 || c.minute > 59 ||
        c.second < 0 || c.second > 60) {
        return std::nullopt;
    }
    return utc_from_civil(c);
}

int64_t utc_now_seconds() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}
