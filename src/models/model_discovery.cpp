#include "models/model_discovery.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace modelcat {

namespace {

void walk_dir(const fs::path& dir, const std::string& suffix, std::vector<std::string>& out) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        spdlog::warn("Error at refresh model catalog, path: {} : {}", dir.string(), ec.message());
        return;
    }

    while (it != fs::directory_iterator()) {
        const fs::path path = it->path();

        // symlinks are listed but never followed into
        std::error_code st_ec;
        auto st = fs::symlink_status(path, st_ec);
        if (st_ec) {
            spdlog::warn("Error at refresh model catalog, path: {} : {}", path.string(), st_ec.message());
        } else if (st.type() == fs::file_type::directory) {
            walk_dir(path, suffix, out);
        } else if (hasStoreSuffix(path.filename().string(), suffix) &&
                   !(st.type() == fs::file_type::symlink && fs::is_directory(path, st_ec))) {
            out.push_back(path.string());
        }

        it.increment(ec);
        if (ec) {
            spdlog::warn("Error at refresh model catalog, path: {} : {}", dir.string(), ec.message());
            return;
        }
    }
}

}  // namespace

bool hasStoreSuffix(const std::string& path, const std::string& suffix) {
    if (suffix.empty() || path.size() < suffix.size()) return false;
    const size_t offset = path.size() - suffix.size();
    for (size_t i = 0; i < suffix.size(); ++i) {
        const auto lhs = static_cast<unsigned char>(path[offset + i]);
        const auto rhs = static_cast<unsigned char>(suffix[i]);
        if (std::tolower(lhs) != std::tolower(rhs)) return false;
    }
    return true;
}

bool findStoreFiles(const std::string& root_dir,
                    const std::string& suffix,
                    std::vector<std::string>* paths,
                    std::string* error) {
    std::error_code ec;
    if (root_dir.empty() || !fs::is_directory(root_dir, ec)) {
        if (error) *error = "not a directory: " + root_dir;
        return false;
    }

    // the root must be readable, failures below it are not fatal
    fs::directory_iterator probe(root_dir, ec);
    if (ec) {
        spdlog::error("Error: fail to list model directory: {} : {}", root_dir, ec.message());
        if (error) *error = ec.message();
        return false;
    }

    std::vector<std::string> out;
    walk_dir(fs::path(root_dir), suffix, out);

    // sort by path: same as sort by model name for the usual directory layout
    std::sort(out.begin(), out.end());
    if (paths) *paths = std::move(out);
    return true;
}

}  // namespace modelcat
