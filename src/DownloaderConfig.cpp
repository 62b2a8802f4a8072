/**
 * DownloaderConfig.cpp - Implementation
 */

#include "tsarchive/DownloaderConfig.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace {
    void log_info(const std::string& msg) {
        std::cout << "ℹ️  " << msg << std::endl;
    }

    void log_error(const std::string& msg) {
        std::cerr << "❌ " << msg << std::endl;
    }

    int64_t parse_integer(const char* name, const std::string& value) {
        size_t consumed = 0;
        long long parsed = 0;
        try {
            parsed = std::stoll(value, &consumed);
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string(name) + " is not a number: " + value);
        }
        if (consumed != value.size()) {
            throw std::invalid_argument(std::string(name) + " is not a number: " + value);
        }
        return parsed;
    }

    const char* env(const char* name) {
        const char* value = std::getenv(name);
        return (value && *value) ? value : nullptr;
    }
}

RateLimitConfig DownloaderConfig::rate_limit_config() const {
    RateLimitConfig rate;
    rate.min_spacing = std::chrono::milliseconds(min_spacing_ms);
    rate.rolling_window = std::chrono::milliseconds(rolling_window_ms);
    rate.payload_cap_bytes = payload_budget_bytes;
    return rate;
}

S3ClientSettings DownloaderConfig::s3_settings() const {
    S3ClientSettings settings;
    settings.region = s3_region;
    settings.endpoint_override = s3_endpoint;
    settings.anonymous = s3_anonymous;
    return settings;
}

json DownloaderConfig::to_json() const {
    json data;
    data["archive_root"] = archive_root;
    data["selection"] = selection;
    data["min_spacing_ms"] = min_spacing_ms;
    data["rolling_window_ms"] = rolling_window_ms;
    data["payload_budget_bytes"] = payload_budget_bytes;
    data["fatal_on_disk_errors"] = fatal_on_disk_errors;
    data["s3_bucket"] = s3_bucket;
    data["s3_prefix"] = s3_prefix;
    data["s3_region"] = s3_region;
    data["s3_endpoint"] = s3_endpoint;
    data["s3_anonymous"] = s3_anonymous;
    data["admin_enabled"] = admin_enabled;
    data["admin_port"] = admin_port;
    return data;
}

void DownloaderConfig::merge_json(const json& data) {
    if (data.contains("archive_root")) archive_root = data["archive_root"].get<std::string>();
    if (data.contains("selection")) selection = data["selection"].get<std::vector<std::string>>();
    if (data.contains("min_spacing_ms")) min_spacing_ms = data["min_spacing_ms"].get<int64_t>();
    if (data.contains("rolling_window_ms")) rolling_window_ms = data["rolling_window_ms"].get<int64_t>();
    if (data.contains("payload_budget_bytes")) payload_budget_bytes = data["payload_budget_bytes"].get<size_t>();
    if (data.contains("fatal_on_disk_errors")) fatal_on_disk_errors = data["fatal_on_disk_errors"].get<bool>();
    if (data.contains("s3_bucket")) s3_bucket = data["s3_bucket"].get<std::string>();
    if (data.contains("s3_prefix")) s3_prefix = data["s3_prefix"].get<std::string>();
    if (data.contains("s3_region")) s3_region = data["s3_region"].get<std::string>();
    if (data.contains("s3_endpoint")) s3_endpoint = data["s3_endpoint"].get<std::string>();
    if (data.contains("s3_anonymous")) s3_anonymous = data["s3_anonymous"].get<bool>();
    if (data.contains("admin_enabled")) admin_enabled = data["admin_enabled"].get<bool>();
    if (data.contains("admin_port")) admin_port = data["admin_port"].get<int>();
}

bool load_config_from_file(const std::string& path, DownloaderConfig& config) {
    std::ifstream f(path);
    if (!f.is_open()) return false;

    try {
        json data;
        f >> data;
        DownloaderConfig merged = config;
        merged.merge_json(data);
        config = merged;
        log_info("Loaded configuration from " + path);
        return true;
    } catch (const json::exception& e) {
        log_error("Ignoring malformed configuration " + path + ": " + e.what());
        return false;
    }
}

bool save_config_to_file(const std::string& path, const DownloaderConfig& config) {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            log_error("Failed to create " + parent.string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream f(path);
    if (!f.is_open()) {
        log_error("Failed to write configuration " + path);
        return false;
    }
    f << config.to_json().dump(4);
    return static_cast<bool>(f);
}

void apply_env_overrides(DownloaderConfig& config) {
    if (const char* v = env("TSARCHIVE_ARCHIVE_DIR")) config.archive_root = v;
    if (const char* v = env("TSARCHIVE_SELECTION")) config.selection = split_selection(v);
    if (const char* v = env("TSARCHIVE_SPACING_MS")) config.min_spacing_ms = parse_integer("TSARCHIVE_SPACING_MS", v);
    if (const char* v = env("TSARCHIVE_BUDGET_BYTES")) {
        int64_t budget = parse_integer("TSARCHIVE_BUDGET_BYTES", v);
        if (budget <= 0) throw std::invalid_argument("TSARCHIVE_BUDGET_BYTES must be positive");
        config.payload_budget_bytes = static_cast<size_t>(budget);
    }
    if (const char* v = env("TSARCHIVE_S3_BUCKET")) config.s3_bucket = v;
    if (const char* v = env("TSARCHIVE_S3_PREFIX")) config.s3_prefix = v;
    if (const char* v = env("TSARCHIVE_S3_REGION")) config.s3_region = v;
    if (const char* v = env("TSARCHIVE_S3_ENDPOINT")) config.s3_endpoint = v;
}

std::vector<std::string> split_selection(const std::string& text) {
    std::vector<std::string> entries;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find(',', start);
        if (end == std::string::npos) end = text.size();
        std::string entry = text.substr(start, end - start);
        size_t first = entry.find_first_not_of(" \t");
        size_t last = entry.find_last_not_of(" \t");
        if (first != std::string::npos) {
            entries.push_back(entry.substr(first, last - first + 1));
        }
        start = end + 1;
    }
    return entries;
}
