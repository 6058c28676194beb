#include "models/model_catalog.h"

#include <filesystem>
#include <unordered_set>
#include <spdlog/spdlog.h>

#include "models/catalog_builder.h"
#include "models/model_discovery.h"

namespace fs = std::filesystem;

namespace modelcat {

namespace {

// empty or "." is treated as not configured
bool is_dir_usable(const std::string& dir) {
    if (dir.empty() || dir == ".") return false;
    std::error_code ec;
    return fs::is_directory(dir, ec);
}

}  // namespace

CatalogResult closeModelStores(std::vector<ModelDef>& models) {
    CatalogResult result;
    std::unordered_set<const ModelStore*> seen;

    for (auto& def : models) {
        if (!def.store || !seen.insert(def.store.get()).second) continue;

        std::string error;
        if (!def.store->close(&error)) {
            spdlog::error("Error: close db connection error: {}: {}", def.store->path(), error);
            if (result.ok()) {
                result.error_code = CatalogErrorCode::kCloseFailed;
                result.error_message = def.store->path() + ": " + error;
            }
        }
    }
    return result;
}

ModelCatalog::ModelCatalog(StoreDriver& driver) : driver_(driver) {}

ModelCatalog::~ModelCatalog() {
    auto result = close();
    if (!result.ok()) {
        spdlog::warn("ModelCatalog: {} at shutdown: {}", to_string(result.error_code), result.error_message);
    }
}

CatalogResult ModelCatalog::refresh(const std::string& model_dir, const std::string& model_log_dir) {
    // model directory must exist
    const bool is_dir = is_dir_usable(model_dir);
    if (!is_dir) {
        return CatalogResult::failure(CatalogErrorCode::kModelDirNotFound,
                                      "model directory not exist or not accessible: " + model_dir);
    }

    // model log directory is optional: if empty or not exists then model log is disabled
    const bool is_log_dir = is_dir_usable(model_log_dir);

    std::vector<std::string> paths;
    std::string error;
    if (!findStoreFiles(model_dir, kStoreFileSuffix, &paths, &error)) {
        spdlog::error("Error: fail to list model directory: {}", error);
        return CatalogResult::failure(CatalogErrorCode::kListFailed, "fail to list model directory: " + model_dir);
    }

    CatalogBuilder builder(driver_, model_log_dir, is_log_dir);
    std::vector<ModelDef> models = builder.build(paths);
    const size_t count = models.size();

    std::vector<ModelDef> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        model_dir_ = model_dir;
        is_dir_enabled_ = is_dir;
        model_log_dir_ = model_log_dir;
        is_log_dir_enabled_ = is_log_dir;

        previous = std::move(models_);
        models_ = std::move(models);
    }

    spdlog::info("Model catalog refreshed: {} models, {} store files, model dir: {}", count, paths.size(), model_dir);

    // previous list is owned only by this call now
    auto result = closeModelStores(previous);
    previous.clear();
    return result;
}

CatalogResult ModelCatalog::close() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto result = closeModelStores(models_);
    models_.clear();
    return result;
}

std::pair<std::string, bool> ModelCatalog::getModelDir() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {model_dir_, is_dir_enabled_};
}

std::pair<std::string, bool> ModelCatalog::getModelLogDir() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {model_log_dir_, is_log_dir_enabled_};
}

ModelCatalogConfig ModelCatalog::toPublicConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ModelCatalogConfig cfg;
    cfg.model_dir = model_dir_;
    cfg.model_log_dir = model_log_dir_;
    cfg.is_log_dir_enabled = is_log_dir_enabled_;
    return cfg;
}

std::optional<size_t> ModelCatalog::indexByDigest(const std::string& digest) const {
    for (size_t k = 0; k < models_.size(); ++k) {
        if (models_[k].digest() == digest) return k;
    }
    return std::nullopt;
}

// If digest exists then return its index, else the first index of the name.
std::optional<size_t> ModelCatalog::indexByDigestOrName(const std::string& dn) const {
    std::optional<size_t> by_name;
    for (size_t k = 0; k < models_.size(); ++k) {
        if (models_[k].digest() == dn) return k;
        if (!by_name && models_[k].name() == dn) by_name = k;
    }
    return by_name;
}

ModelBasic ModelCatalog::basicAt(size_t idx) const {
    const auto& def = models_[idx];
    return ModelBasic{def.name(), def.digest(), def.bin_dir, def.log_dir, def.is_log_dir};
}

std::vector<std::string> ModelCatalog::allModelDigests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(models_.size());
    for (const auto& def : models_) {
        out.push_back(def.digest());
    }
    return out;
}

std::vector<ModelBasic> ModelCatalog::allModels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ModelBasic> out;
    out.reserve(models_.size());
    for (size_t k = 0; k < models_.size(); ++k) {
        out.push_back(basicAt(k));
    }
    return out;
}

size_t ModelCatalog::modelCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return models_.size();
}

std::optional<ModelBasic> ModelCatalog::modelBasicByDigest(const std::string& digest) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto idx = indexByDigest(digest);
    if (!idx) return std::nullopt;
    return basicAt(*idx);
}

std::optional<ModelBasic> ModelCatalog::modelBasicByDigestOrName(const std::string& dn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto idx = indexByDigestOrName(dn);
    if (!idx) return std::nullopt;
    return basicAt(*idx);
}

std::optional<std::vector<std::string>> ModelCatalog::languageCodes(const std::string& dn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto idx = indexByDigestOrName(dn);
    if (!idx) return std::nullopt;
    return models_[*idx].lang_codes;
}

std::optional<std::string> ModelCatalog::matchLanguage(const std::string& dn,
                                                       const std::vector<std::string>& preferred) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto idx = indexByDigestOrName(dn);
    if (!idx) return std::nullopt;

    auto match = models_[*idx].matcher.match(preferred);
    if (!match) return std::nullopt;
    return match->code;
}

}  // namespace modelcat
