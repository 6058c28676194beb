// list command: open every store under the model directory and print the catalog

#include "cli/commands.h"
#include "models/model_catalog.h"
#include "models/model_json.h"
#include "store/sqlite_store.h"
#include "utils/config.h"
#include "utils/json_utils.h"

#include <iomanip>
#include <iostream>
#include <string>

namespace modelcat {
namespace cli {
namespace commands {

int list(const ListOptions& options) {
    auto cfg = loadServiceConfig();
    if (!options.models_dir.empty()) cfg.models_dir = options.models_dir;
    if (!options.log_dir.empty()) cfg.models_log_dir = options.log_dir;

    SqliteStoreDriver driver;
    ModelCatalog catalog(driver);

    auto result = catalog.refresh(cfg.models_dir, cfg.models_log_dir);
    if (!result.success) {
        std::cerr << "Error: " << result.error_message << std::endl;
        return 1;
    }
    if (!result.ok()) {
        std::cerr << "Warning: " << result.error_message << std::endl;
    }

    const auto models = catalog.allModels();

    if (options.json) {
        std::cout << json_to_string(modelListToJson(models), 2) << std::endl;
        return 0;
    }

    if (models.empty()) {
        std::cout << "No models found in " << cfg.models_dir << std::endl;
        return 0;
    }

    std::cout << std::left
              << std::setw(32) << "NAME"
              << std::setw(36) << "DIGEST"
              << "DIR"
              << std::endl;

    for (const auto& m : models) {
        std::cout << std::left
                  << std::setw(32) << m.name
                  << std::setw(36) << m.digest
                  << m.bin_dir
                  << std::endl;
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace modelcat
