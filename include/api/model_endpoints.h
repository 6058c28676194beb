#pragma once

#include <httplib.h>

namespace modelcat {

class ModelCatalog;

// Read-only model queries: list and per-model info with language negotiation.
class ModelEndpoints {
public:
    explicit ModelEndpoints(ModelCatalog& catalog);
    void registerRoutes(httplib::Server& server);

private:
    ModelCatalog& catalog_;
};

}  // namespace modelcat
