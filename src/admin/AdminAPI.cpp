#include "tsarchive/admin/AdminAPI.h"
#include "tsarchive/admin/WebServer.h"
#include "tsarchive/ArchiveCatalog.h"
#include "tsarchive/Frequency.h"
#include "tsarchive/UpdateOrchestrator.h"
#include <chrono>
#include <ctime>

static auto g_start_time = std::chrono::system_clock::now();

AdminAPI::AdminAPI(std::shared_ptr<UpdateOrchestrator> orchestrator,
                   DownloaderConfig config,
                   std::string config_path)
    : orchestrator_(std::move(orchestrator)),
      config_(std::move(config)),
      config_path_(std::move(config_path)) {}

void AdminAPI::register_routes(WebServer& server) {
    server.add_route("GET", "/api/series", [this](const WebRequest& req) {
        auto it = req.query.find("frequency");
        return handle_get_series(it != req.query.end() ? it->second : "").dump();
    });

    server.add_route("POST", "/api/update", [this](const WebRequest& req) {
        return handle_post_update(req.body).dump();
    });

    server.add_route("POST", "/api/cancel", [this](const WebRequest&) {
        return handle_post_cancel().dump();
    });

    server.add_route("GET", "/api/status", [this](const WebRequest&) {
        return handle_get_status().dump();
    });

    server.add_route("GET", "/api/metrics", [this](const WebRequest&) {
        return handle_get_metrics().dump();
    });

    server.add_route("GET", "/api/config", [this](const WebRequest&) {
        return handle_get_config().dump();
    });

    server.add_route("POST", "/api/config", [this](const WebRequest& req) {
        return handle_post_config(req.body).dump();
    });
}

json AdminAPI::handle_get_series(const std::string& frequency) {
    if (!orchestrator_) return json{{"error", "Orchestrator not initialized"}};

    try {
        std::optional<Frequency> filter;
        if (!frequency.empty()) filter = parse_frequency(frequency);

        json response = json::array();
        for (const auto& summary : list_selectable_series(orchestrator_->archive_root(), filter)) {
            response.push_back(summary.to_json());
        }
        return response;
    } catch (const std::exception& e) {
        return json{{"error", e.what()}};
    }
}

json AdminAPI::handle_post_update(const std::string& body) {
    if (!orchestrator_) return json{{"error", "Orchestrator not initialized"}};

    try {
        auto data = json::parse(body);
        if (!data.contains("selection") || !data["selection"].is_array()) {
            return json{{"error", "selection array required"}};
        }

        std::vector<Series> selection;
        for (const auto& entry : data["selection"]) {
            selection.push_back(parse_series(entry.get<std::string>()));
        }
        if (selection.empty()) {
            return json{{"error", "selection is empty"}};
        }

        auto handle = orchestrator_->start_update(selection);
        json series = json::array();
        for (const auto& s : handle->selection()) series.push_back(series_label(s));
        return json{
            {"success", true},
            {"state", run_state_name(handle->state())},
            {"selection", series}
        };
    } catch (const std::exception& e) {
        return json{{"error", e.what()}};
    }
}

json AdminAPI::handle_post_cancel() {
    if (!orchestrator_) return json{{"error", "Orchestrator not initialized"}};

    auto run = orchestrator_->current_run();
    if (!run || run->is_finished()) {
        return json{{"success", true}, {"status", "no active run"}};
    }
    orchestrator_->cancel(run);
    return json{{"success", true}, {"status", "cancelling"}};
}

json AdminAPI::handle_get_status() {
    json status{
        {"status", "operational"},
        {"running", false},
        {"timestamp", std::time(nullptr)}
    };
    if (!orchestrator_) return status;

    status["running"] = orchestrator_->is_running();
    auto run = orchestrator_->current_run();
    if (run) {
        status["last_run"] = run->report().to_json();
    }
    return status;
}

json AdminAPI::handle_get_metrics() {
    auto now = std::chrono::system_clock::now();
    auto uptime_seconds = std::chrono::duration_cast<std::chrono::seconds>(now - g_start_time).count();

    json metrics{{"uptime_seconds", uptime_seconds}};
    if (orchestrator_) {
        auto stats = orchestrator_->get_statistics();
        metrics.update(stats);
        uint64_t committed = stats.value("chunks_committed", uint64_t{0});
        uint64_t failed = stats.value("tasks_failed", uint64_t{0});
        metrics["success_rate"] = (committed + failed) > 0
            ? (double(committed) / double(committed + failed)) * 100.0
            : 0.0;
    }
    return metrics;
}

json AdminAPI::handle_get_config() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    json config = config_.to_json();
    if (orchestrator_) {
        auto rate = orchestrator_->rate_limiter()->get_config();
        config["min_spacing_ms"] = static_cast<int64_t>(rate.min_spacing.count());
        config["rolling_window_ms"] = static_cast<int64_t>(rate.rolling_window.count());
        config["payload_budget_bytes"] = rate.payload_cap_bytes;
    }
    return config;
}

json AdminAPI::handle_post_config(const std::string& body) {
    if (!orchestrator_) return json{{"error", "Orchestrator not initialized"}};

    try {
        auto data = json::parse(body);
        bool persisted = true;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            DownloaderConfig updated = config_;
            if (data.contains("min_spacing_ms")) updated.min_spacing_ms = data["min_spacing_ms"].get<int64_t>();
            if (data.contains("rolling_window_ms")) updated.rolling_window_ms = data["rolling_window_ms"].get<int64_t>();
            if (data.contains("payload_budget_bytes")) updated.payload_budget_bytes = data["payload_budget_bytes"].get<size_t>();

            orchestrator_->rate_limiter()->reconfigure(updated.rate_limit_config());
            config_ = updated;
            if (!config_path_.empty()) {
                persisted = save_config_to_file(config_path_, config_);
            }
        }
        json response{{"success", true}, {"config", handle_get_config()}};
        if (!persisted) response["warning"] = "configuration applied but not saved to " + config_path_;
        return response;
    } catch (const std::exception& e) {
        return json{{"error", e.what()}};
    }
}
