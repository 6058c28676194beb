#include "api/admin_endpoints.h"

#include <cctype>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "models/model_catalog.h"
#include "models/model_json.h"
#include "runtime/state.h"
#include "utils/json_utils.h"
#include "utils/logger.h"
#include "utils/url_encode.h"
#include "utils/version.h"

namespace modelcat {

namespace {

bool is_known_level(const std::string& text) {
    static const char* kLevels[] = {"trace", "debug", "info", "warn", "warning", "error", "critical", "fatal", "off"};
    std::string lower;
    for (unsigned char c : text) lower.push_back(static_cast<char>(std::tolower(c)));
    for (const char* l : kLevels) {
        if (lower == l) return true;
    }
    return false;
}

}  // namespace

AdminEndpoints::AdminEndpoints(ModelCatalog& catalog, ServiceConfig config)
    : catalog_(catalog), config_(std::move(config)) {}

std::pair<std::string, std::string> AdminEndpoints::refreshDirs() const {
    auto cfg = catalog_.toPublicConfig();
    std::string model_dir = cfg.model_dir.empty() ? config_.models_dir : cfg.model_dir;
    std::string log_dir = cfg.model_log_dir.empty() ? config_.models_log_dir : cfg.model_log_dir;
    return {model_dir, log_dir};
}

void AdminEndpoints::registerRoutes(httplib::Server& server) {
    start_time_ = std::chrono::steady_clock::now();

    server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", "application/json");
    });

    server.Get("/startup", [](const httplib::Request&, httplib::Response& res) {
        if (is_ready()) {
            res.set_content(R"({"status":"ready"})", "application/json");
        } else {
            res.status = 503;
            res.set_content(R"({"status":"starting"})", "application/json");
        }
    });

    server.Get("/api/service/state", [this](const httplib::Request&, httplib::Response& res) {
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start_time_).count();
        nlohmann::json body = {
            {"version", MODELCAT_VERSION},
            {"ready", is_ready()},
            {"uptime_seconds", uptime},
            {"service", {
                {"port", config_.port},
                {"bind_address", config_.bind_address},
                {"models_dir", config_.models_dir},
                {"models_log_dir", config_.models_log_dir},
            }},
            {"catalog", catalogConfigToJson(catalog_.toPublicConfig())},
            {"models", modelListToJson(catalog_.allModels())},
        };
        res.set_content(json_to_string(body), "application/json");
    });

    server.Post("/api/admin/all-models/refresh", [this](const httplib::Request&, httplib::Response& res) {
        const auto dirs = refreshDirs();
        const std::string& model_dir = dirs.first;
        if (model_dir.empty()) {
            res.status = 400;
            res.set_content("Model directory is not defined or empty", "text/plain");
            return;
        }

        auto result = catalog_.refresh(model_dir, dirs.second);
        if (!result.success) {
            spdlog::error("Model catalog refresh failed: {}: {}", to_string(result.error_code), result.error_message);
            res.status = 400;
            res.set_content("Model catalog refresh failed: " + result.error_message, "text/plain");
            return;
        }

        nlohmann::json body = {
            {"model_dir", model_dir},
            {"model_count", catalog_.modelCount()},
        };
        if (!result.ok()) {
            spdlog::warn("Model catalog refreshed with errors: {}", result.error_message);
            body["warning"] = result.error_message;
        }
        res.set_header("Content-Location", "/api/admin/all-models/refresh/" + urlEncodePathSegment(model_dir));
        res.set_content(json_to_string(body), "application/json");
    });

    server.Post("/api/admin/all-models/close", [this](const httplib::Request&, httplib::Response& res) {
        const std::string model_dir = catalog_.getModelDir().first;

        auto result = catalog_.close();
        if (!result.ok()) {
            spdlog::error("Model catalog close failed: {}", result.error_message);
            res.status = 400;
            res.set_content("Model catalog close failed: " + result.error_message, "text/plain");
            return;
        }

        nlohmann::json body = {{"model_dir", model_dir}};
        res.set_header("Content-Location", "/api/admin/all-models/close/" + urlEncodePathSegment(model_dir));
        res.set_content(json_to_string(body), "application/json");
    });

    server.Get("/log/level", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json body = {{"level", logger::current_level()}};
        res.set_content(json_to_string(body), "application/json");
    });

    server.Post("/log/level", [](const httplib::Request& req, httplib::Response& res) {
        auto j = nlohmann::json::parse(req.body, nullptr, false);
        if (j.is_discarded() || !j.is_object() || !j.contains("level") || !j["level"].is_string()) {
            res.status = 400;
            res.set_content(R"({"error":"level required"})", "application/json");
            return;
        }
        const auto level_str = j["level"].get<std::string>();
        if (!is_known_level(level_str)) {
            res.status = 400;
            nlohmann::json body = {{"error", "unknown level: " + level_str}};
            res.set_content(json_to_string(body), "application/json");
            return;
        }
        spdlog::set_level(logger::parse_level(level_str));
        spdlog::info("Log level set to {}", logger::current_level());
        nlohmann::json body = {{"level", logger::current_level()}};
        res.set_content(json_to_string(body), "application/json");
    });
}

}  // namespace modelcat
