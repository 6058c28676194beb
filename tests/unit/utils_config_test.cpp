#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unordered_map>

#include "temp_dir.h"
#include "utils/config.h"

using namespace modelcat;
using modelcat::test::TempDir;
namespace fs = std::filesystem;

class EnvGuard {
public:
    EnvGuard(const std::vector<std::string>& keys) : keys_(keys) {
        for (const auto& k : keys_) {
            const char* v = std::getenv(k.c_str());
            if (v) saved_[k] = v;
        }
    }
    ~EnvGuard() {
        for (const auto& k : keys_) {
            if (auto it = saved_.find(k); it != saved_.end()) {
                setenv(k.c_str(), it->second.c_str(), 1);
            } else {
                unsetenv(k.c_str());
            }
        }
    }
private:
    std::vector<std::string> keys_;
    std::unordered_map<std::string, std::string> saved_;
};

static const std::vector<std::string> kConfigEnv{
    "MODELCAT_CONFIG", "MODELCAT_MODELS_DIR", "MODELCAT_MODELS_LOG_DIR",
    "MODELCAT_PORT", "MODELCAT_BIND_ADDRESS", "HOME"};

static void clearConfigEnv() {
    for (const auto& k : kConfigEnv) {
        if (k != "HOME") unsetenv(k.c_str());
    }
}

TEST(UtilsConfigTest, LoadsServiceConfigFromFileWithLock) {
    EnvGuard guard(kConfigEnv);
    clearConfigEnv();
    TempDir tmp("modelcat-config");

    fs::path cfg_file = tmp.base / "config.json";
    std::ofstream(cfg_file) << R"({
        "models_dir": "/srv/models",
        "models_log_dir": "/srv/models/log",
        "port": 18080,
        "bind_address": "127.0.0.1",
        "cors_enabled": false,
        "gzip_enabled": false
    })";
    setenv("MODELCAT_CONFIG", cfg_file.string().c_str(), 1);

    auto info = loadServiceConfigWithLog();
    auto cfg = info.first;

    EXPECT_EQ(cfg.models_dir, "/srv/models");
    EXPECT_EQ(cfg.models_log_dir, "/srv/models/log");
    EXPECT_EQ(cfg.port, 18080);
    EXPECT_EQ(cfg.bind_address, "127.0.0.1");
    EXPECT_FALSE(cfg.cors_enabled);
    EXPECT_FALSE(cfg.gzip_enabled);
    EXPECT_NE(info.second.find("file="), std::string::npos);
    EXPECT_NE(info.second.find("sources=file"), std::string::npos);
}

TEST(UtilsConfigTest, EnvOverridesFile) {
    EnvGuard guard(kConfigEnv);
    clearConfigEnv();
    TempDir tmp("modelcat-config");

    fs::path cfg_file = tmp.base / "config.json";
    std::ofstream(cfg_file) << R"({"models_dir": "/file/models", "port": 18081})";
    setenv("MODELCAT_CONFIG", cfg_file.string().c_str(), 1);
    setenv("MODELCAT_MODELS_DIR", "/env/models", 1);
    setenv("MODELCAT_MODELS_LOG_DIR", "/env/log", 1);
    setenv("MODELCAT_PORT", "19000", 1);
    setenv("MODELCAT_BIND_ADDRESS", "10.0.0.1", 1);

    auto [cfg, log] = loadServiceConfigWithLog();
    EXPECT_EQ(cfg.models_dir, "/env/models");
    EXPECT_EQ(cfg.models_log_dir, "/env/log");
    EXPECT_EQ(cfg.port, 19000);
    EXPECT_EQ(cfg.bind_address, "10.0.0.1");
    EXPECT_NE(log.find("sources=env,file"), std::string::npos);
}

TEST(UtilsConfigTest, InvalidPortEnvIsIgnored) {
    EnvGuard guard(kConfigEnv);
    clearConfigEnv();
    TempDir home("modelcat-home");
    setenv("HOME", home.str().c_str(), 1);

    setenv("MODELCAT_PORT", "not-a-port", 1);
    EXPECT_EQ(loadServiceConfig().port, 4040);
    setenv("MODELCAT_PORT", "70000", 1);
    EXPECT_EQ(loadServiceConfig().port, 4040);
}

TEST(UtilsConfigTest, MalformedConfigFileFallsBackToDefaults) {
    EnvGuard guard(kConfigEnv);
    clearConfigEnv();
    TempDir tmp("modelcat-config");

    fs::path cfg_file = tmp.base / "config.json";
    std::ofstream(cfg_file) << "{ not json";
    setenv("MODELCAT_CONFIG", cfg_file.string().c_str(), 1);

    auto [cfg, log] = loadServiceConfigWithLog();
    EXPECT_EQ(cfg.port, 4040);
    EXPECT_EQ(cfg.bind_address, "0.0.0.0");
    EXPECT_NE(log.find("sources=default"), std::string::npos);
}

TEST(UtilsConfigTest, DefaultConfigPathIsModelcatDir) {
    EnvGuard guard(kConfigEnv);
    clearConfigEnv();
    TempDir home("modelcat-home");

    fs::create_directories(home.base / ".modelcat");
    std::ofstream(home.base / ".modelcat" / "config.json") << R"({"port": 12345})";
    setenv("HOME", home.str().c_str(), 1);

    auto [cfg, log] = loadServiceConfigWithLog();
    EXPECT_EQ(cfg.port, 12345);
    EXPECT_NE(log.find(".modelcat/config.json"), std::string::npos);
}

TEST(UtilsConfigTest, DefaultModelsDirIsUnderModelcatDir) {
    EnvGuard guard(kConfigEnv);
    clearConfigEnv();
    TempDir home("modelcat-home");
    setenv("HOME", home.str().c_str(), 1);

    auto cfg = loadServiceConfig();
    EXPECT_EQ(cfg.models_dir, (home.base / ".modelcat" / "models").string());
    EXPECT_TRUE(cfg.models_log_dir.empty());
    EXPECT_TRUE(cfg.cors_enabled);
    EXPECT_TRUE(cfg.gzip_enabled);
}
