#pragma once

#include <httplib.h>
#include <chrono>
#include <string>

#include "utils/config.h"

namespace modelcat {

class ModelCatalog;

// Service health, readiness, catalog administration and log level routes.
class AdminEndpoints {
public:
    AdminEndpoints(ModelCatalog& catalog, ServiceConfig config);
    void registerRoutes(httplib::Server& server);

private:
    // Model directory for refresh: the catalog's current one, else the configured one.
    std::pair<std::string, std::string> refreshDirs() const;

    ModelCatalog& catalog_;
    ServiceConfig config_;
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace modelcat
