#include "store/model_store.h"

#include <filesystem>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace modelcat {

const LangRow* LangMeta::findByCode(const std::string& code) const {
    for (const auto& lang : langs) {
        if (lang.code == code) return &lang;
    }
    return nullptr;
}

std::vector<std::string> LangMeta::codes() const {
    std::vector<std::string> out;
    out.reserve(langs.size());
    for (const auto& lang : langs) {
        out.push_back(lang.code);
    }
    return out;
}

ModelStore::ModelStore(std::string path, std::unique_ptr<StoreConnection> conn)
    : path_(std::move(path)), conn_(std::move(conn)) {
    dir_ = fs::path(path_).parent_path().string();
}

ModelStore::~ModelStore() {
    std::string error;
    if (!close(&error)) {
        spdlog::error("Error: close db connection error: {}: {}", path_, error);
    }
}

bool ModelStore::close(std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!conn_) return true;

    std::unique_ptr<StoreConnection> conn = std::move(conn_);
    std::string err;
    if (!conn->close(&err)) {
        if (error) *error = err;
        return false;
    }
    return true;
}

bool ModelStore::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conn_ && conn_->isOpen();
}

}  // namespace modelcat
