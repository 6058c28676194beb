#pragma once

#include <memory>
#include <string>
#include <vector>

#include "models/language_matcher.h"
#include "store/model_store.h"

namespace modelcat {

// Registry entry: one per unique model digest.
struct ModelDef {
    ModelDicRow dic;
    std::shared_ptr<ModelStore> store;     // shared by all models of the same store file
    std::string bin_dir;                   // directory of the store file, model executables expected there
    std::string log_dir;
    bool is_log_dir{false};
    bool is_meta_full{false};
    std::vector<std::string> lang_codes;   // default language first
    std::shared_ptr<const LangMeta> lang_meta;
    LanguageMatcher matcher;

    const std::string& digest() const { return dic.digest; }
    const std::string& name() const { return dic.name; }
};

// Basic model info, safe to hand out without exposing the store connection.
struct ModelBasic {
    std::string name;
    std::string digest;
    std::string bin_dir;
    std::string log_dir;
    bool is_log_dir{false};
};

struct ModelCatalogConfig {
    std::string model_dir;
    std::string model_log_dir;
    bool is_log_dir_enabled{false};
};

}  // namespace modelcat
