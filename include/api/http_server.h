#pragma once

#include <httplib.h>
#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace modelcat {

class AdminEndpoints;
class ModelEndpoints;

using Logger = std::function<void(const httplib::Request&, const httplib::Response&)>;

class HttpServer {
public:
    HttpServer(int port, AdminEndpoints& admin, ModelEndpoints& models, std::string bind_address = "0.0.0.0");
    ~HttpServer();

    // Returns false if the listener could not be started (port in use, bad address).
    bool start();
    void stop();

    void enableCors(bool enable) { enable_cors_ = enable; }
    void setCorsOrigin(std::string origin) { cors_allow_origin_ = std::move(origin); }
    void enableCompression(bool enable) { enable_compression_ = enable; }
    void setLogger(Logger logger) { logger_ = std::move(logger); }

    int port() const { return port_; }

    httplib::Server& getServer() { return server_; }

private:
    void applyCors(httplib::Response& res);

    int port_;
    std::string bind_address_;
    AdminEndpoints& admin_;
    ModelEndpoints& models_;
    httplib::Server server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> listen_failed_{false};
    bool enable_cors_{true};
    bool enable_compression_{true};
    std::string cors_allow_origin_{"*"};
    std::string cors_allow_methods_{"GET, POST, OPTIONS"};
    std::string cors_allow_headers_{"Content-Type, Accept-Language, X-Request-Id"};
    Logger logger_{};
};

}  // namespace modelcat
