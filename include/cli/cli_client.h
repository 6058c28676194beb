#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace modelcat {
namespace cli {

/// Error codes for CLI operations
enum class CliError {
    Success = 0,
    GeneralError = 1,
    ConnectionError = 2,
};

/// Result of CLI operations (generic template)
template<typename T>
struct CliResponse {
    CliError error{CliError::Success};
    std::string error_message;
    std::optional<T> data;

    bool ok() const { return error == CliError::Success; }
};

/// CLI client for talking to a running modelcat service
class CliClient {
public:
    /// @param host Service host (default from MODELCAT_HOST env, then 127.0.0.1)
    /// @param port Service port (default from MODELCAT_PORT env, then 4040)
    explicit CliClient(const std::string& host = "", uint16_t port = 0);

    /// Check if service is running
    bool isServerRunning() const;

    /// POST /api/admin/all-models/refresh
    CliResponse<nlohmann::json> refreshCatalog();

    /// POST /api/admin/all-models/close
    CliResponse<nlohmann::json> closeCatalog();

    const std::string& getHost() const { return host_; }
    uint16_t getPort() const { return port_; }

private:
    std::string host_;
    uint16_t port_;

    CliResponse<nlohmann::json> httpPost(const std::string& path, const nlohmann::json& body);
};

}  // namespace cli
}  // namespace modelcat
