// json_utils.h - JSON serialization for responses and CLI output
#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace modelcat {

// Serialize JSON; invalid UTF-8 in strings (names and paths read from stores
// or the file system) is written as U+FFFD instead of throwing.
std::string json_to_string(const nlohmann::json& j, int indent = -1);

}  // namespace modelcat
