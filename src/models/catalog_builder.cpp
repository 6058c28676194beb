#include "models/catalog_builder.h"

#include <unordered_set>
#include <spdlog/spdlog.h>

namespace modelcat {

namespace {

void close_rejected(StoreConnection& conn) {
    std::string error;
    if (!conn.close(&error)) {
        spdlog::error("Error: close db connection error: {}: {}", conn.path(), error);
    }
}

}  // namespace

CatalogBuilder::CatalogBuilder(StoreDriver& driver, std::string log_dir, bool is_log_dir)
    : driver_(driver), log_dir_(std::move(log_dir)), is_log_dir_(is_log_dir) {}

std::unique_ptr<StoreConnection> CatalogBuilder::openStore(const std::string& path,
                                                           std::vector<ModelDicRow>* rows,
                                                           LangMeta* langs) const {
    std::string error;
    auto conn = driver_.open(path, &error);
    if (!conn) {
        spdlog::error("Error: {} : {}", path, error);
        return nullptr;
    }

    int version = 0;
    if (!conn->schemaVersion(&version, &error) || version < kMinSchemaVersion) {
        spdlog::error("Error: invalid database, likely not a model database: {}", path);
        close_rejected(*conn);
        return nullptr;
    }

    if (!conn->listModels(rows, &error) || rows->empty()) {
        spdlog::warn("Warning: empty database, no models found: {}", path);
        close_rejected(*conn);
        return nullptr;
    }

    if (!conn->listLanguages(langs, &error) || langs->langs.empty()) {
        spdlog::warn("Warning: no languages found in database: {}", path);
        close_rejected(*conn);
        return nullptr;
    }
    return conn;
}

std::vector<ModelDef> CatalogBuilder::build(const std::vector<std::string>& paths) const {
    std::vector<ModelDef> models;
    std::unordered_set<std::string> digests;

    for (const auto& path : paths) {
        std::vector<ModelDicRow> rows;
        LangMeta langs;
        auto conn = openStore(path, &rows, &langs);
        if (!conn) continue;

        auto store = std::make_shared<ModelStore>(path, std::move(conn));
        auto lang_meta = std::make_shared<const LangMeta>(std::move(langs));
        const auto all_codes = lang_meta->codes();

        size_t accepted = 0;
        for (auto& row : rows) {
            if (digests.count(row.digest) > 0) {
                spdlog::warn("Skip: model already exist in other database: {} {}", row.name, row.digest);
                continue;
            }

            ModelDef def;
            def.lang_codes = orderLanguageCodes(all_codes, row.default_lang_code);
            def.matcher = LanguageMatcher(def.lang_codes);
            def.dic = std::move(row);
            def.store = store;
            def.bin_dir = store->dir();
            def.log_dir = log_dir_;
            def.is_log_dir = is_log_dir_;
            def.lang_meta = lang_meta;

            digests.insert(def.dic.digest);
            models.push_back(std::move(def));
            ++accepted;
        }

        // every model of this store is a duplicate: do not keep the connection
        if (accepted == 0) {
            std::string error;
            if (!store->close(&error)) {
                spdlog::error("Error: close db connection error: {}: {}", path, error);
            }
        }
    }

    spdlog::debug("CatalogBuilder::build: {} models from {} files", models.size(), paths.size());
    return models;
}

}  // namespace modelcat
