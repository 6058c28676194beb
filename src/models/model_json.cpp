#include "models/model_json.h"

namespace modelcat {

nlohmann::json modelBasicToJson(const ModelBasic& basic) {
    return {
        {"name", basic.name},
        {"digest", basic.digest},
        {"bin_dir", basic.bin_dir},
        {"log_dir", basic.log_dir},
        {"is_log_dir", basic.is_log_dir},
    };
}

nlohmann::json modelListToJson(const std::vector<ModelBasic>& models) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& m : models) {
        arr.push_back(modelBasicToJson(m));
    }
    return arr;
}

nlohmann::json catalogConfigToJson(const ModelCatalogConfig& cfg) {
    return {
        {"model_dir", cfg.model_dir},
        {"model_log_dir", cfg.model_log_dir},
        {"is_log_dir_enabled", cfg.is_log_dir_enabled},
    };
}

}  // namespace modelcat
