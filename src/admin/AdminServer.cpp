#include "tsarchive/admin/AdminServer.h"
#include "tsarchive/admin/AdminAPI.h"
#include "tsarchive/admin/WebServer.h"
#include "tsarchive/UpdateOrchestrator.h"
#include <iostream>

AdminServer::AdminServer(std::shared_ptr<UpdateOrchestrator> orchestrator,
                         DownloaderConfig config,
                         std::string config_path,
                         int port)
    : orchestrator_(std::move(orchestrator)),
      config_(std::move(config)),
      config_path_(std::move(config_path)),
      port_(port) {}

AdminServer::~AdminServer() {
    stop();
}

void AdminServer::start() {
    if (is_running_) return;

    is_running_ = true;
    web_server_ = std::make_unique<WebServer>("127.0.0.1", port_);
    api_ = std::make_unique<AdminAPI>(orchestrator_, config_, config_path_);

    api_->register_routes(*web_server_);

    web_server_->start();
    std::cout << "📊 Admin API started on http://127.0.0.1:" << port_ << std::endl;
}

void AdminServer::stop() {
    if (!is_running_) return;

    is_running_ = false;
    if (web_server_) {
        web_server_->stop();
        web_server_.reset();
    }
    api_.reset();
}

void AdminServer::shutdown_all() {
    if (orchestrator_) {
        std::cout << "🛑 Stopping update run..." << std::endl;
        orchestrator_->stop();
    }
    stop();
    std::cout << "✅ All services stopped" << std::endl;
}
