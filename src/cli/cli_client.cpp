// HTTP client for the admin and model endpoints of a running service

#include "cli/cli_client.h"

#include <cstdlib>
#include <httplib.h>
#include <spdlog/spdlog.h>

#include "utils/json_utils.h"

namespace modelcat {
namespace cli {

namespace {

constexpr uint16_t kDefaultPort = 4040;

uint16_t portFromEnv() {
    const char* env_port = std::getenv("MODELCAT_PORT");
    if (!env_port) return kDefaultPort;
    try {
        int v = std::stoi(env_port);
        if (v > 0 && v < 65536) return static_cast<uint16_t>(v);
    } catch (const std::exception&) {
    }
    spdlog::warn("Ignoring invalid MODELCAT_PORT: {}", env_port);
    return kDefaultPort;
}

std::string errorFromBody(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_object() && json.contains("error") && json["error"].is_string()) {
        return json["error"].get<std::string>();
    }
    return body;
}

CliResponse<nlohmann::json> toResponse(const httplib::Result& res) {
    if (!res) {
        return {CliError::ConnectionError, "Failed to connect to server", std::nullopt};
    }
    if (res->status != 200) {
        std::string msg = errorFromBody(res->body);
        if (msg.empty()) msg = "HTTP " + std::to_string(res->status);
        return {CliError::GeneralError, msg, std::nullopt};
    }
    auto json = nlohmann::json::parse(res->body, nullptr, false);
    if (json.is_discarded()) {
        return {CliError::GeneralError, "JSON parse error in server response", std::nullopt};
    }
    return {CliError::Success, "", json};
}

}  // namespace

CliClient::CliClient(const std::string& host, uint16_t port) {
    if (host.empty()) {
        const char* env_host = std::getenv("MODELCAT_HOST");
        host_ = env_host ? env_host : "127.0.0.1";
    } else {
        host_ = host;
    }
    port_ = port == 0 ? portFromEnv() : port;
}

bool CliClient::isServerRunning() const {
    httplib::Client client(host_, port_);
    client.set_connection_timeout(2, 0);  // 2 seconds
    client.set_read_timeout(2, 0);

    auto res = client.Get("/health");
    return res && res->status == 200;
}

CliResponse<nlohmann::json> CliClient::refreshCatalog() {
    return httpPost("/api/admin/all-models/refresh", nlohmann::json::object());
}

CliResponse<nlohmann::json> CliClient::closeCatalog() {
    return httpPost("/api/admin/all-models/close", nlohmann::json::object());
}

CliResponse<nlohmann::json> CliClient::httpPost(const std::string& path, const nlohmann::json& body) {
    httplib::Client client(host_, port_);
    client.set_connection_timeout(5, 0);
    // refresh opens every store file under the model directory
    client.set_read_timeout(120, 0);

    return toResponse(client.Post(path, json_to_string(body), "application/json"));
}

}  // namespace cli
}  // namespace modelcat
