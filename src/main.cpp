#include <chrono>
#include <iostream>
#include <signal.h>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "api/admin_endpoints.h"
#include "api/http_server.h"
#include "api/model_endpoints.h"
#include "cli/commands.h"
#include "models/model_catalog.h"
#include "runtime/state.h"
#include "store/sqlite_store.h"
#include "utils/cli.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/version.h"

int run_service(const modelcat::ServiceConfig& cfg) {
    modelcat::g_running_flag.store(true);

    try {
        modelcat::logger::init_from_env();
        modelcat::set_ready(false);

        spdlog::info("Model directory: {}", cfg.models_dir);
        if (!cfg.models_log_dir.empty()) {
            spdlog::info("Model log directory: {}", cfg.models_log_dir);
        }

        modelcat::SqliteStoreDriver driver;
        modelcat::ModelCatalog catalog(driver);

        modelcat::AdminEndpoints admin(catalog, cfg);
        modelcat::ModelEndpoints models(catalog);

        modelcat::HttpServer server(cfg.port, admin, models, cfg.bind_address);
        server.enableCors(cfg.cors_enabled);
        server.setCorsOrigin(cfg.cors_allow_origin);
        server.enableCompression(cfg.gzip_enabled);
        server.setLogger([](const httplib::Request& req, const httplib::Response& res) {
            spdlog::debug("{} {} {} rid={}", req.method, req.path, res.status,
                          res.get_header_value("X-Request-Id"));
        });

        std::cout << "Starting HTTP server on " << cfg.bind_address << ":" << cfg.port << "..." << std::endl;
        if (!server.start()) {
            std::cerr << "Error: failed to start HTTP server on port " << cfg.port << std::endl;
            return 1;
        }

        // Service stays up with an empty catalog if the model directory is unusable,
        // refresh can be retried through the admin endpoint.
        auto result = catalog.refresh(cfg.models_dir, cfg.models_log_dir);
        if (!result.success) {
            spdlog::error("Initial model catalog refresh failed: {}: {}",
                          modelcat::to_string(result.error_code), result.error_message);
        } else if (!result.ok()) {
            spdlog::warn("Initial model catalog refresh: {}", result.error_message);
        }
        spdlog::info("Model catalog: {} models", catalog.modelCount());

        modelcat::set_ready(true);
        std::cout << "modelcat ready to serve requests" << std::endl;

        while (modelcat::is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::cout << "Shutting down..." << std::endl;
        modelcat::set_ready(false);
        server.stop();

        auto closed = catalog.close();
        if (!closed.ok()) {
            spdlog::error("Model catalog close failed: {}", closed.error_message);
        }

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "modelcat shutdown complete" << std::endl;
    return 0;
}

void signalHandler(int signal) {
    (void)signal;
    modelcat::request_shutdown();
}

int main(int argc, char* argv[]) {
    auto cli_result = modelcat::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }

    switch (cli_result.subcommand) {
        case modelcat::Subcommand::List:
            return modelcat::cli::commands::list(cli_result.list_options);

        case modelcat::Subcommand::Refresh:
            return modelcat::cli::commands::refresh(cli_result.remote_options);

        case modelcat::Subcommand::Close:
            return modelcat::cli::commands::close(cli_result.remote_options);

        case modelcat::Subcommand::Serve:
        case modelcat::Subcommand::None:
        default: {
            signal(SIGINT, signalHandler);
            signal(SIGTERM, signalHandler);

            std::cout << "modelcat v" << MODELCAT_VERSION << " starting..." << std::endl;
            auto config_info = modelcat::loadServiceConfigWithLog();
            auto cfg = config_info.first;
            const auto& opts = cli_result.serve_options;
            if (opts.port != 0) cfg.port = opts.port;
            if (!opts.host.empty()) cfg.bind_address = opts.host;
            if (!opts.models_dir.empty()) cfg.models_dir = opts.models_dir;
            if (!opts.log_dir.empty()) cfg.models_log_dir = opts.log_dir;
            std::cout << "Config: " << config_info.second << std::endl;
            return run_service(cfg);
        }
    }
}
