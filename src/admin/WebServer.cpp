#include "tsarchive/admin/WebServer.h"
#include <httplib.h>
#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>

namespace {
    WebRequest to_web_request(const httplib::Request& req) {
        WebRequest request;
        request.body = req.body;
        if (!req.path_params.empty()) request.param = req.path_params.begin()->second;
        for (const auto& [key, value] : req.params) {
            request.query.emplace(key, value);
        }
        return request;
    }
}

class WebServer::Impl {
public:
    httplib::Server server;
    std::unique_ptr<std::thread> thread;
    std::atomic<bool> running{false};
};

WebServer::WebServer(const std::string& host, int port)
    : pimpl_(std::make_unique<Impl>()), host_(host), port_(port) {
    pimpl_->server.set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type"}
    });

    pimpl_->server.Options(R"(/.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 200;
    });
}

WebServer::~WebServer() {
    stop();
}

void WebServer::add_route(const std::string& method, const std::string& path,
                          RequestHandler handler) {
    auto adapter = [handler](const httplib::Request& req, httplib::Response& res) {
        res.set_content(handler(to_web_request(req)), "application/json");
    };

    if (method == "GET") {
        pimpl_->server.Get(path, adapter);
    } else if (method == "POST") {
        pimpl_->server.Post(path, adapter);
    } else if (method == "DELETE") {
        pimpl_->server.Delete(path, adapter);
    } else {
        std::cerr << "❌ Unsupported HTTP method for " << path << ": " << method << std::endl;
    }
}

void WebServer::start() {
    if (pimpl_->running) return;
    if (pimpl_->thread && pimpl_->thread->joinable()) {
        pimpl_->thread->join();
    }

    pimpl_->running = true;
    pimpl_->thread = std::make_unique<std::thread>([this]() {
        if (!pimpl_->server.listen(host_.c_str(), port_)) {
            std::cerr << "❌ Admin server could not listen on " << host_ << ":" << port_ << std::endl;
            pimpl_->running = false;
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
}

void WebServer::stop() {
    if (pimpl_->thread && pimpl_->thread->joinable()) {
        pimpl_->server.stop();
        pimpl_->thread->join();
    }
    pimpl_->thread.reset();
    pimpl_->running = false;
}

bool WebServer::is_running() const {
    return pimpl_->running;
}
