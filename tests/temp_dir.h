#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace modelcat::test {

// mkdtemp based scratch directory, removed with its content on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "modelcat-test") {
        auto tmpl = (std::filesystem::temp_directory_path() / (prefix + "-XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        char* created = mkdtemp(buf.data());
        base = created ? std::filesystem::path(created) : std::filesystem::temp_directory_path() / prefix;
        std::error_code ec;
        std::filesystem::create_directories(base, ec);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(base, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    // Create an empty (or text) file at base/rel, parent directories included.
    std::string touch(const std::string& rel, const std::string& content = "") const {
        auto p = base / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream(p) << content;
        return p.string();
    }

    std::string mkdir(const std::string& rel) const {
        auto p = base / rel;
        std::filesystem::create_directories(p);
        return p.string();
    }

    std::string str() const { return base.string(); }

    std::filesystem::path base;
};

}  // namespace modelcat::test
