#include "utils/config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils/file_lock.h"

namespace modelcat {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

std::filesystem::path defaultDataDir() {
    auto home = getEnvValue("HOME");
    if (home && !home->empty()) return std::filesystem::path(*home) / ".modelcat";
    return std::filesystem::path(".modelcat");
}

bool readJsonWithLock(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;

    FileLock lock(path, FileLock::Mode::Shared);
    if (!lock.locked()) {
        spdlog::warn("Config file is locked by another process, reading anyway: {}", path.string());
    }
    std::ifstream ifs(path);
    if (!ifs.is_open()) return false;

    out = nlohmann::json::parse(ifs, nullptr, false);
    if (out.is_discarded()) {
        spdlog::warn("Config file is not valid JSON, ignored: {}", path.string());
        return false;
    }
    return true;
}

}  // namespace

std::pair<ServiceConfig, std::string> loadServiceConfigWithLog() {
    ServiceConfig cfg;
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    // defaults: ~/.modelcat/models
    cfg.models_dir = (defaultDataDir() / "models").string();

    auto apply_json = [&](const nlohmann::json& j) {
        if (!j.is_object()) return;
        if (j.contains("models_dir") && j["models_dir"].is_string()) {
            cfg.models_dir = j["models_dir"].get<std::string>();
        }
        if (j.contains("models_log_dir") && j["models_log_dir"].is_string()) {
            cfg.models_log_dir = j["models_log_dir"].get<std::string>();
        }
        if (j.contains("port") && j["port"].is_number_integer()) {
            cfg.port = j["port"].get<int>();
        }
        if (j.contains("bind_address") && j["bind_address"].is_string()) {
            cfg.bind_address = j["bind_address"].get<std::string>();
        }
        cfg.cors_enabled = j.value("cors_enabled", cfg.cors_enabled);
        cfg.cors_allow_origin = j.value("cors_allow_origin", cfg.cors_allow_origin);
        cfg.gzip_enabled = j.value("gzip_enabled", cfg.gzip_enabled);
    };

    std::filesystem::path cfg_path;
    if (auto env = getEnvValue("MODELCAT_CONFIG")) {
        cfg_path = *env;
    } else {
        cfg_path = defaultDataDir() / "config.json";
    }

    if (!cfg_path.empty()) {
        nlohmann::json j;
        if (readJsonWithLock(cfg_path, j)) {
            try {
                apply_json(j);
                log << "file=" << cfg_path << " ";
                used_file = true;
            } catch (const nlohmann::json::exception& e) {
                spdlog::warn("Config file has invalid values, ignored: {}: {}", cfg_path.string(), e.what());
            }
        }
    }

    if (auto v = getEnvValue("MODELCAT_MODELS_DIR")) {
        cfg.models_dir = *v;
        log << "env:MODELS_DIR=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("MODELCAT_MODELS_LOG_DIR")) {
        cfg.models_log_dir = *v;
        log << "env:MODELS_LOG_DIR=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("MODELCAT_PORT")) {
        try {
            int port = std::stoi(*v);
            if (port > 0 && port < 65536) {
                cfg.port = port;
                log << "env:PORT=" << port << " ";
                used_env = true;
            }
        } catch (const std::exception&) {
            spdlog::warn("Ignoring invalid MODELCAT_PORT: {}", *v);
        }
    }
    if (auto v = getEnvValue("MODELCAT_BIND_ADDRESS")) {
        cfg.bind_address = *v;
        log << "env:BIND_ADDRESS=" << *v << " ";
        used_env = true;
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

ServiceConfig loadServiceConfig() {
    auto info = loadServiceConfigWithLog();
    return info.first;
}

}  // namespace modelcat
