/*
 * Time-series archive downloader - Standalone service
 *
 * Brings the local chunk archive of the selected series up to date from the
 * remote mirror, one rate-limited request at a time. With the admin API
 * enabled it keeps running and accepts further update requests over HTTP.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "tsarchive/AWSInitializer.h"
#include "tsarchive/ArchiveCatalog.h"
#include "tsarchive/DownloaderConfig.h"
#include "tsarchive/Frequency.h"
#include "tsarchive/RateLimiter.h"
#include "tsarchive/S3DataSource.h"
#include "tsarchive/TimeUtils.h"
#include "tsarchive/UpdateOrchestrator.h"
#include "tsarchive/admin/AdminServer.h"

static std::atomic<bool> shutdown_requested(false);

void signal_handler(int) {
    shutdown_requested = true;
}

namespace {
    void print_usage(const char* program) {
        std::cout << "Usage: " << program << " [options]\n"
                  << "Options:\n"
                  << "  --archive DIR          Archive root (default ./database)\n"
                  << "  --select ID:FREQ[,..]  Series to update, e.g. AAPL.O:daily\n"
                  << "  --list                 List the series stored in the archive and exit\n"
                  << "  --no-http              Disable the HTTP admin API\n"
                  << "  --port N               Admin API port (default 13480)\n"
                  << "  --spacing-ms N         Minimum spacing between requests\n"
                  << "  --budget-bytes N       Payload budget per rolling window\n"
                  << "  --config FILE          JSON config file (default <archive>/config.json)\n"
                  << "  --help                 Show this help message\n";
    }

    void print_catalog(const std::string& archive_root) {
        auto summaries = list_selectable_series(archive_root);
        if (summaries.empty()) {
            std::cout << "No series in " << archive_root << std::endl;
            return;
        }
        for (const auto& summary : summaries) {
            std::cout << "  " << series_label(summary.series) << "  ";
            if (summary.observed_start && summary.observed_end) {
                std::cout << format_utc_iso(*summary.observed_start) << " .. "
                          << format_utc_iso(*summary.observed_end);
            } else {
                std::cout << "no data";
            }
            std::cout << "  (" << summary.chunk_count << " chunks"
                      << (summary.has_incomplete ? ", current period incomplete" : "") << ")"
                      << std::endl;
        }
    }

    int exit_code_for(RunState state) {
        switch (state) {
            case RunState::Completed: return 0;
            case RunState::Cancelled: return 130;
            default: return 1;
        }
    }
}

int main(int argc, char* argv[]) {
    // Keep SDK start-up fast when not running on EC2.
    setenv("AWS_METADATA_SERVICE_TIMEOUT", "1", 0);
    setenv("AWS_METADATA_SERVICE_NUM_ATTEMPTS", "1", 0);

    std::string cmd_archive;
    std::string cmd_select;
    std::string cmd_config;
    bool list_only = false;
    bool use_http = true;
    int cmd_port = -1;
    long long cmd_spacing_ms = -1;
    long long cmd_budget_bytes = -1;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--archive" && i + 1 < argc) {
                cmd_archive = argv[++i];
            } else if (arg == "--select" && i + 1 < argc) {
                cmd_select = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                cmd_config = argv[++i];
            } else if (arg == "--list") {
                list_only = true;
            } else if (arg == "--no-http") {
                use_http = false;
            } else if (arg == "--port" && i + 1 < argc) {
                cmd_port = std::stoi(argv[++i]);
            } else if (arg == "--spacing-ms" && i + 1 < argc) {
                cmd_spacing_ms = std::stoll(argv[++i]);
            } else if (arg == "--budget-bytes" && i + 1 < argc) {
                cmd_budget_bytes = std::stoll(argv[++i]);
            } else if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "❌ Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 2;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "❌ Invalid numeric argument: " << e.what() << std::endl;
        return 2;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGHUP, signal_handler);

    try {
        // Priority: CLI > Environment > Config file > Default
        DownloaderConfig config;
        std::string archive_hint = cmd_archive;
        if (archive_hint.empty()) {
            const char* env_archive = std::getenv("TSARCHIVE_ARCHIVE_DIR");
            archive_hint = (env_archive && *env_archive) ? env_archive : config.archive_root;
        }
        std::string config_path = cmd_config.empty() ? archive_hint + "/config.json" : cmd_config;
        load_config_from_file(config_path, config);
        apply_env_overrides(config);

        if (!cmd_archive.empty()) config.archive_root = cmd_archive;
        if (!cmd_select.empty()) config.selection = split_selection(cmd_select);
        if (cmd_port > 0) config.admin_port = cmd_port;
        if (cmd_spacing_ms >= 0) config.min_spacing_ms = cmd_spacing_ms;
        if (cmd_budget_bytes > 0) config.payload_budget_bytes = static_cast<size_t>(cmd_budget_bytes);
        if (!use_http) config.admin_enabled = false;

        if (list_only) {
            std::cout << "📁 Archive: " << config.archive_root << std::endl;
            print_catalog(config.archive_root);
            return 0;
        }

        std::vector<Series> selection;
        for (const auto& entry : config.selection) {
            selection.push_back(parse_series(entry));
        }

        if (config.s3_bucket.empty()) {
            std::cerr << "❌ No remote bucket configured (set s3_bucket or TSARCHIVE_S3_BUCKET)" << std::endl;
            return 2;
        }
        if (selection.empty() && !config.admin_enabled) {
            std::cerr << "❌ Nothing to do: no selection and the admin API is disabled" << std::endl;
            return 2;
        }

        std::cout << "🚀 Archive downloader starting" << std::endl;
        std::cout << "📁 Archive: " << config.archive_root << std::endl;
        std::cout << "⚙️  Rate limit: " << config.min_spacing_ms << "ms spacing, "
                  << config.payload_budget_bytes << " bytes per "
                  << config.rolling_window_ms << "ms window" << std::endl;

        AWSInitializer::instance().initialize(config.s3_settings());

        auto source = std::make_shared<S3DataSource>(config.s3_bucket, config.s3_prefix);
        auto limiter = std::make_shared<RateLimiter>(config.rate_limit_config());

        OrchestratorOptions options = OrchestratorOptions::defaults();
        options.fatal_on_disk_errors = config.fatal_on_disk_errors;
        auto orchestrator = std::make_shared<UpdateOrchestrator>(config.archive_root, source, limiter, options);

        std::shared_ptr<AdminServer> admin_server;
        if (config.admin_enabled) {
            admin_server = std::make_shared<AdminServer>(orchestrator, config, config_path, config.admin_port);
            admin_server->start();
        }

        std::shared_ptr<UpdateHandle> handle;
        if (!selection.empty()) {
            handle = orchestrator->start_update(selection,
                [](const std::string& series_id, Frequency frequency, int64_t start, int64_t,
                   ProgressPhase phase) {
                    if (phase == ProgressPhase::FetchStarted) return;
                    std::cout << "   " << series_id << ":" << frequency_name(frequency) << " "
                              << chunk_name(frequency, start) << " " << progress_phase_name(phase)
                              << std::endl;
                });
        }

        int exit_code = 0;
        while (!shutdown_requested) {
            if (handle && handle->wait_for(std::chrono::milliseconds(200))) {
                auto report = handle->wait();
                exit_code = exit_code_for(report.state);
                std::cout << "✅ Update " << run_state_name(report.state) << ": "
                          << report.chunks_committed << " committed, "
                          << report.tasks_failed << " failed" << std::endl;
                if (!report.fatal_error.empty()) {
                    std::cerr << "❌ " << report.fatal_error << std::endl;
                }
                handle.reset();
                if (!admin_server) break;
            } else if (!handle) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        }

        if (shutdown_requested) {
            std::cout << "\n🛑 Shutting down archive downloader..." << std::endl;
        }

        if (admin_server) {
            admin_server->shutdown_all();
            admin_server.reset();
        }
        orchestrator->stop();
        if (handle) {
            exit_code = exit_code_for(handle->wait().state);
        }
        orchestrator.reset();
        source.reset();

        // Shut down the SDK while still in main
        AWSInitializer::instance().shutdown();

        std::cout << "✅ Archive downloader stopped cleanly" << std::endl;
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "❌ Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
