#include "api/http_server.h"

#include "api/admin_endpoints.h"
#include "api/model_endpoints.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <zlib.h>
#include "utils/json_utils.h"
#include "utils/request_id.h"

namespace modelcat {

namespace {
bool accepts_gzip(const httplib::Request& req) {
    if (!req.has_header("Accept-Encoding")) return false;
    auto enc = req.get_header_value("Accept-Encoding");
    std::transform(enc.begin(), enc.end(), enc.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return enc.find("gzip") != std::string::npos;
}

// gzip wrapper (windowBits 15 + 16), empty string on zlib failure
std::string gzip_compress(const std::string& input) {
    if (input.empty()) return {};

    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return {};
    }
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    std::string output;
    char buffer[16384];
    int ret = Z_OK;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = static_cast<uInt>(sizeof(buffer));
        ret = deflate(&zs, Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
            deflateEnd(&zs);
            return {};
        }
        output.append(buffer, sizeof(buffer) - zs.avail_out);
    } while (ret != Z_STREAM_END);

    deflateEnd(&zs);
    return output;
}
}  // namespace

HttpServer::HttpServer(int port, AdminEndpoints& admin, ModelEndpoints& models, std::string bind_address)
    : port_(port), bind_address_(std::move(bind_address)), admin_(admin), models_(models) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::applyCors(httplib::Response& res) {
    if (!enable_cors_) return;
    if (!res.has_header("Access-Control-Allow-Origin"))
        res.set_header("Access-Control-Allow-Origin", cors_allow_origin_);
    if (!res.has_header("Access-Control-Allow-Methods"))
        res.set_header("Access-Control-Allow-Methods", cors_allow_methods_);
    if (!res.has_header("Access-Control-Allow-Headers"))
        res.set_header("Access-Control-Allow-Headers", cors_allow_headers_);
}

bool HttpServer::start() {
    if (running_) return true;

    server_.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (enable_cors_) {
            applyCors(res);
            if (req.method == "OPTIONS") {
                res.status = 204;
                return httplib::Server::HandlerResponse::Handled;
            }
        }

        std::string req_id = req.get_header_value("X-Request-Id");
        if (req_id.empty()) req_id = generate_request_id();
        res.set_header("X-Request-Id", req_id);
        res.set_header("traceparent", next_traceparent(req.get_header_value("traceparent")));
        return httplib::Server::HandlerResponse::Unhandled;
    });

    server_.set_post_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        applyCors(res);
        if (!enable_compression_) return;
        if (!accepts_gzip(req)) return;
        if (res.body.empty()) return;
        if (res.has_header("Content-Encoding")) return;

        auto compressed = gzip_compress(res.body);
        if (compressed.empty()) return;

        const auto content_type = res.get_header_value("Content-Type");
        res.set_content(compressed, content_type.empty() ? "application/octet-stream" : content_type);
        res.set_header("Content-Encoding", "gzip");
        res.set_header("Vary", "Accept-Encoding");
    });

    if (logger_) {
        server_.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
            logger_(req, res);
        });
    }

    server_.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) {
            if (!res.has_header("Content-Type")) {
                res.set_header("Content-Type", "text/plain");
            }
            return;
        }
        nlohmann::json body = {
            {"error", res.status == 404 ? "not_found" : "http_error"},
            {"status", res.status},
            {"path", req.path}
        };
        res.set_content(json_to_string(body), "application/json");
    });

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown";
        if (ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            } catch (...) {
                what = "non-standard exception";
            }
        }
        spdlog::error("Unhandled exception on {} {}: {}", req.method, req.path, what);
        nlohmann::json body = {
            {"error", "internal_error"},
            {"path", req.path},
            {"message", what}
        };
        res.status = 500;
        res.set_content(json_to_string(body), "application/json");
    });

    admin_.registerRoutes(server_);
    models_.registerRoutes(server_);

    listen_failed_ = false;
    running_ = true;
    thread_ = std::thread([this]() {
        if (!server_.listen(bind_address_.c_str(), port_)) {
            listen_failed_ = true;
        }
    });
    while (!server_.is_running() && !listen_failed_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (listen_failed_) {
        spdlog::error("Failed to listen on {}:{}", bind_address_, port_);
        if (thread_.joinable()) thread_.join();
        running_ = false;
        return false;
    }
    return true;
}

void HttpServer::stop() {
    if (!running_) return;
    server_.stop();
    if (thread_.joinable()) thread_.join();
    running_ = false;
}

}  // namespace modelcat
