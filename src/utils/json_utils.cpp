#include "utils/json_utils.h"

namespace modelcat {

std::string json_to_string(const nlohmann::json& j, int indent) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace modelcat
