/**
 * test_config_manager.cpp - Tests for downloader configuration layering
 */

#include "tsarchive/DownloaderConfig.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

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
}

int main() {
    log_info("=== Configuration Manager Tests ===\n");

    fs::path dir = fs::temp_directory_path() / "tsarchive_test_config";
    fs::remove_all(dir);
    std::string path = (dir / "nested" / "config.json").string();

    // Test 1: Defaults
    {
        log_info("Test 1: Defaults");
        DownloaderConfig config;
        auto rate = config.rate_limit_config();
        if (config.archive_root != "./database" || rate.min_spacing != std::chrono::milliseconds(5000) ||
            !config.admin_enabled || config.admin_port != 13480) {
            log_error("Test 1 failed");
            return 1;
        }
        log_success("Test 1 passed");
    }

    // Test 2: Save and load
    {
        log_info("\nTest 2: Persist to disk and reload");
        DownloaderConfig config;
        config.archive_root = "/srv/archive";
        config.selection = {"AAPL.O:daily", "VOD.L:tick"};
        config.min_spacing_ms = 250;
        config.s3_bucket = "market-mirror";
        if (!save_config_to_file(path, config)) {
            log_error("Test 2 failed: save");
            return 1;
        }

        DownloaderConfig loaded;
        if (!load_config_from_file(path, loaded) || loaded.archive_root != "/srv/archive" ||
            loaded.selection.size() != 2 || loaded.min_spacing_ms != 250 ||
            loaded.s3_bucket != "market-mirror" || loaded.s3_region != "us-east-1") {
            log_error("Test 2 failed: reload");
            return 1;
        }
        log_success("Test 2 passed");
    }

    // Test 3: Partial and malformed files
    {
        log_info("\nTest 3: Partial and malformed files");
        {
            std::ofstream f(path);
            f << R"({"admin_port": 9000})";
        }
        DownloaderConfig config;
        if (!load_config_from_file(path, config) || config.admin_port != 9000 ||
            config.archive_root != "./database") {
            log_error("Test 3 failed: partial file");
            return 1;
        }

        {
            std::ofstream f(path);
            f << R"({"admin_port": "not a number", "archive_root": "/elsewhere"})";
        }
        if (load_config_from_file(path, config) || config.admin_port != 9000 ||
            config.archive_root != "./database") {
            log_error("Test 3 failed: malformed file must leave config untouched");
            return 1;
        }

        if (load_config_from_file((dir / "missing.json").string(), config)) {
            log_error("Test 3 failed: missing file reported as loaded");
            return 1;
        }
        log_success("Test 3 passed");
    }

    // Test 4: Environment overrides
    {
        log_info("\nTest 4: Environment overrides");
        setenv("TSARCHIVE_ARCHIVE_DIR", "/data/ts", 1);
        setenv("TSARCHIVE_SELECTION", " AAPL.O:daily, EUR:USD:tick ,,", 1);
        setenv("TSARCHIVE_SPACING_MS", "1500", 1);
        setenv("TSARCHIVE_S3_BUCKET", "env-bucket", 1);

        DownloaderConfig config;
        apply_env_overrides(config);
        if (config.archive_root != "/data/ts" || config.selection.size() != 2 ||
            config.selection[1] != "EUR:USD:tick" || config.min_spacing_ms != 1500 ||
            config.s3_bucket != "env-bucket") {
            log_error("Test 4 failed");
            return 1;
        }

        setenv("TSARCHIVE_BUDGET_BYTES", "lots", 1);
        bool rejected = false;
        try {
            apply_env_overrides(config);
        } catch (const std::invalid_argument&) {
            rejected = true;
        }
        unsetenv("TSARCHIVE_ARCHIVE_DIR");
        unsetenv("TSARCHIVE_SELECTION");
        unsetenv("TSARCHIVE_SPACING_MS");
        unsetenv("TSARCHIVE_S3_BUCKET");
        unsetenv("TSARCHIVE_BUDGET_BYTES");
        if (!rejected) {
            log_error("Test 4 failed: non-numeric budget accepted");
            return 1;
        }
        log_success("Test 4 passed");
    }

    fs::remove_all(dir);
    log_info("\n=== Configuration Manager tests completed ===");
    return 0;
}
