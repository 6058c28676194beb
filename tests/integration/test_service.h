#pragma once

#include <memory>
#include <string>

#include "api/admin_endpoints.h"
#include "api/http_server.h"
#include "api/model_endpoints.h"
#include "fake_store.h"
#include "models/model_catalog.h"
#include "runtime/state.h"
#include "temp_dir.h"
#include "utils/config.h"

namespace modelcat::test {

// Catalog service on 127.0.0.1:port backed by a fake store driver and a temp model directory.
class TestService {
public:
    explicit TestService(int port) : port_(port), models_dir_("modelcat-svc") {
        set_ready(true);
        config_.port = port;
        config_.bind_address = "127.0.0.1";
        config_.models_dir = models_dir_.str();
    }

    ~TestService() { stop(); }

    // Store file on disk plus its scripted content.
    std::string addStore(const std::string& rel, std::vector<ModelDicRow> rows,
                         std::vector<std::string> langs = {"EN"}) {
        auto path = models_dir_.touch(rel);
        FakeStoreSpec spec;
        spec.models = std::move(rows);
        spec.lang_codes = std::move(langs);
        driver_.add(path, spec);
        return path;
    }

    // Must be called before server() or start().
    void setModelsDir(const std::string& dir) { config_.models_dir = dir; }

    bool start() { return server().start(); }

    void stop() {
        if (server_) server_->stop();
    }

    HttpServer& server() {
        if (!server_) {
            admin_ = std::make_unique<AdminEndpoints>(catalog_, config_);
            models_ = std::make_unique<ModelEndpoints>(catalog_);
            server_ = std::make_unique<HttpServer>(port_, *admin_, *models_, "127.0.0.1");
        }
        return *server_;
    }
    ModelCatalog& catalog() { return catalog_; }
    FakeStoreDriver& driver() { return driver_; }
    const TempDir& modelsDir() const { return models_dir_; }

private:
    int port_;
    TempDir models_dir_;
    ServiceConfig config_;
    FakeStoreDriver driver_;
    ModelCatalog catalog_{driver_};
    std::unique_ptr<AdminEndpoints> admin_;
    std::unique_ptr<ModelEndpoints> models_;
    std::unique_ptr<HttpServer> server_;
};

}  // namespace modelcat::test
