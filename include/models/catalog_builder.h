#pragma once

#include <string>
#include <vector>

#include "models/model_def.h"
#include "store/model_store.h"

namespace modelcat {

// Builds a deduplicated model list from store files.
// Runs without touching any live catalog: the result is handed to ModelCatalog for installation.
class CatalogBuilder {
public:
    CatalogBuilder(StoreDriver& driver, std::string log_dir, bool is_log_dir);

    // Stores are read in the given order; for a duplicate digest the first store wins.
    std::vector<ModelDef> build(const std::vector<std::string>& paths) const;

private:
    // Open and validate one store. Returns nullptr (connection already closed) if it is unusable.
    std::unique_ptr<StoreConnection> openStore(const std::string& path,
                                               std::vector<ModelDicRow>* rows,
                                               LangMeta* langs) const;

    StoreDriver& driver_;
    std::string log_dir_;
    bool is_log_dir_;
};

}  // namespace modelcat
