#pragma once

#include <nlohmann/json.hpp>

#include "models/model_def.h"

namespace modelcat {

nlohmann::json modelBasicToJson(const ModelBasic& basic);
nlohmann::json modelListToJson(const std::vector<ModelBasic>& models);
nlohmann::json catalogConfigToJson(const ModelCatalogConfig& cfg);

}  // namespace modelcat
