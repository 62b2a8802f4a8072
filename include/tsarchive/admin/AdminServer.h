/**
 * AdminServer.h - Localhost administration server for the archive downloader
 *
 * Serves the JSON API of AdminAPI (default port 13480) so a front end can
 * list series, start or cancel updates and tune rate limits. The server runs
 * on a background thread and does not block the downloader.
 */

#pragma once

#include "tsarchive/DownloaderConfig.h"
#include <atomic>
#include <memory>
#include <string>

class UpdateOrchestrator;
class WebServer;
class AdminAPI;

class AdminServer {
public:
    AdminServer(std::shared_ptr<UpdateOrchestrator> orchestrator,
                DownloaderConfig config,
                std::string config_path = "",
                int port = 13480);

    ~AdminServer();

    void start();
    void stop();
    void shutdown_all();
    bool is_running() const { return is_running_; }

private:
    std::shared_ptr<UpdateOrchestrator> orchestrator_;
    DownloaderConfig config_;
    std::string config_path_;
    int port_;
    std::atomic<bool> is_running_{false};
    std::unique_ptr<WebServer> web_server_;
    std::unique_ptr<AdminAPI> api_;
};
