/**
 * WebServer.h - Pure C++ HTTP server abstraction
 *
 * Thin wrapper around httplib for serving JSON endpoints. Hides the
 * implementation and provides a small interface for route registration.
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

struct WebRequest {
    std::string body;
    std::string param;                              // first path parameter, if any
    std::map<std::string, std::string> query;       // query string parameters
};

class WebServer {
public:
    using RequestHandler = std::function<std::string(const WebRequest& request)>;

    explicit WebServer(const std::string& host = "127.0.0.1", int port = 13480);
    ~WebServer();

    void add_route(const std::string& method, const std::string& path,
                   RequestHandler handler);

    void start();
    void stop();
    bool is_running() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;

    std::string host_;
    int port_;
};
