#pragma once

#include <string>
#include <vector>

namespace modelcat {

// Case-insensitive suffix match (".sqlite" matches "Model.SQLite").
bool hasStoreSuffix(const std::string& path, const std::string& suffix);

// Collect files under root_dir matching suffix, sorted by path.
// Returns false only if root_dir itself cannot be listed; unreadable
// sub-directories are logged and skipped.
bool findStoreFiles(const std::string& root_dir,
                    const std::string& suffix,
                    std::vector<std::string>* paths,
                    std::string* error);

}  // namespace modelcat
