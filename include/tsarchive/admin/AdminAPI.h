/**
 * AdminAPI.h - Archive administration API handlers
 *
 * JSON endpoints used by a front end to list the archive, start and cancel
 * update runs, and inspect or change the rate limit settings.
 */

#pragma once

#include "tsarchive/DownloaderConfig.h"
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

class WebServer;
class UpdateOrchestrator;

class AdminAPI {
public:
    /**
     * @param config_path Where POST /api/config persists changes; empty disables saving.
     */
    AdminAPI(std::shared_ptr<UpdateOrchestrator> orchestrator,
             DownloaderConfig config,
             std::string config_path = "");

    void register_routes(WebServer& server);

    json handle_get_series(const std::string& frequency);
    json handle_post_update(const std::string& body);
    json handle_post_cancel();
    json handle_get_status();
    json handle_get_metrics();
    json handle_get_config();
    json handle_post_config(const std::string& body);

private:
    std::shared_ptr<UpdateOrchestrator> orchestrator_;
    DownloaderConfig config_;
    std::string config_path_;
    std::mutex config_mutex_;
};
