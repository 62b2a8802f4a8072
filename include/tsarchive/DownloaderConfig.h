/**
 * DownloaderConfig.h - Settings of the downloader service
 *
 * Sources, lowest priority first: built-in defaults, a JSON config file,
 * TSARCHIVE_* environment variables, command line flags.
 */

#pragma once

#include "tsarchive/AWSInitializer.h"
#include "tsarchive/RateLimiter.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct DownloaderConfig {
    std::string archive_root = "./database";
    std::vector<std::string> selection;           // "ID:frequency" entries

    // Rate limiting
    int64_t min_spacing_ms = 5000;
    int64_t rolling_window_ms = 60000;
    size_t payload_budget_bytes = 64 * 1024 * 1024;

    bool fatal_on_disk_errors = true;

    // Remote source
    std::string s3_bucket;
    std::string s3_prefix;
    std::string s3_region = "us-east-1";
    std::string s3_endpoint;
    bool s3_anonymous = false;

    // Admin server
    bool admin_enabled = true;
    int admin_port = 13480;

    RateLimitConfig rate_limit_config() const;
    S3ClientSettings s3_settings() const;

    json to_json() const;

    /**
     * @brief Overwrite the fields present in `data`; absent keys keep their value.
     * @throws nlohmann::json::exception on a field of the wrong type.
     */
    void merge_json(const json& data);
};

/**
 * @brief Merge a JSON config file into `config`.
 * @return false when the file is missing or malformed (the error is logged
 *         and `config` is left as it was).
 */
bool load_config_from_file(const std::string& path, DownloaderConfig& config);

/**
 * @brief Write `config` as indented JSON, creating parent directories.
 * @return false if the file could not be written.
 */
bool save_config_to_file(const std::string& path, const DownloaderConfig& config);

/**
 * @brief Apply TSARCHIVE_* environment variables.
 * @throws std::invalid_argument on a non-numeric value for a numeric setting.
 */
void apply_env_overrides(DownloaderConfig& config);

std::vector<std::string> split_selection(const std::string& text);
