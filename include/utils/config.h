#pragma once

#include <string>
#include <utility>

namespace modelcat {

struct ServiceConfig {
    std::string models_dir;       // root of the model store tree
    std::string models_log_dir;   // default model run log directory, empty = disabled
    int port{4040};
    std::string bind_address{"0.0.0.0"};
    bool cors_enabled{true};
    std::string cors_allow_origin{"*"};
    bool gzip_enabled{true};
};

// Defaults, then JSON file (MODELCAT_CONFIG or ~/.modelcat/config.json), then environment.
ServiceConfig loadServiceConfig();

// Same as loadServiceConfig(), second is a short description of the sources used.
std::pair<ServiceConfig, std::string> loadServiceConfigWithLog();

}  // namespace modelcat
