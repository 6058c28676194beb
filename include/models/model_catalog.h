#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "models/catalog_error.h"
#include "models/model_def.h"
#include "store/model_store.h"

namespace modelcat {

// Catalog of models found in store files under the model directory.
// All fields are guarded by one mutex; refresh builds the new model list
// without holding it and only swaps under the lock.
class ModelCatalog {
public:
    explicit ModelCatalog(StoreDriver& driver);
    ~ModelCatalog();

    ModelCatalog(const ModelCatalog&) = delete;
    ModelCatalog& operator=(const ModelCatalog&) = delete;

    // Rescan model_dir, open every store file and replace the model list.
    // If multiple versions of the same model (equal by digest) exist then the first file in path order is used.
    // Previously opened store connections are closed after the swap.
    CatalogResult refresh(const std::string& model_dir, const std::string& model_log_dir);

    // Close all store connections and clear the model list.
    CatalogResult close();

    std::pair<std::string, bool> getModelDir() const;
    std::pair<std::string, bool> getModelLogDir() const;
    ModelCatalogConfig toPublicConfig() const;

    std::vector<std::string> allModelDigests() const;
    std::vector<ModelBasic> allModels() const;
    size_t modelCount() const;

    std::optional<ModelBasic> modelBasicByDigest(const std::string& digest) const;
    std::optional<ModelBasic> modelBasicByDigestOrName(const std::string& dn) const;

    std::optional<std::vector<std::string>> languageCodes(const std::string& dn) const;

    // Best supported language for the preferred tags, default language if none match.
    std::optional<std::string> matchLanguage(const std::string& dn,
                                             const std::vector<std::string>& preferred) const;

private:
    // Must be called with mutex_ held.
    std::optional<size_t> indexByDigest(const std::string& digest) const;
    std::optional<size_t> indexByDigestOrName(const std::string& dn) const;
    ModelBasic basicAt(size_t idx) const;

    StoreDriver& driver_;

    mutable std::mutex mutex_;
    std::string model_dir_;
    bool is_dir_enabled_{false};
    std::string model_log_dir_;
    bool is_log_dir_enabled_{false};
    std::vector<ModelDef> models_;
};

// Close every distinct store referenced by models, once each.
// Continues past failures and returns the first one.
CatalogResult closeModelStores(std::vector<ModelDef>& models);

}  // namespace modelcat
