// model_store.h - store access layer used by the model catalog
// A store is a self-contained file holding one or more models and their languages.
#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace modelcat {

// Minimal store schema version accepted by the catalog.
constexpr int kMinSchemaVersion = 1001;

// Store file suffix, compared case-insensitively.
constexpr const char* kStoreFileSuffix = ".sqlite";

// model_dic row
struct ModelDicRow {
    int model_id{0};
    std::string name;
    std::string digest;
    int type{0};
    std::string version;
    std::string create_dt;
    std::string default_lang_code;
};

struct LangRow {
    int lang_id{0};
    std::string code;
    std::string name;
    std::unordered_map<std::string, std::string> words;  // word_code -> word_value
};

// Language metadata of a store, in lang_id order.
struct LangMeta {
    std::vector<LangRow> langs;

    const LangRow* findByCode(const std::string& code) const;
    std::vector<std::string> codes() const;
};

class StoreConnection {
public:
    virtual ~StoreConnection() = default;

    virtual const std::string& path() const = 0;

    // Schema version stored in the file; false if it cannot be read.
    virtual bool schemaVersion(int* version, std::string* error) = 0;

    virtual bool listModels(std::vector<ModelDicRow>* rows, std::string* error) = 0;
    virtual bool listLanguages(LangMeta* meta, std::string* error) = 0;

    // Release the underlying handle. Calling close() again is a no-op returning true.
    virtual bool close(std::string* error) = 0;
    virtual bool isOpen() const = 0;
};

class StoreDriver {
public:
    virtual ~StoreDriver() = default;

    // Returns nullptr and sets error if the store cannot be opened.
    virtual std::unique_ptr<StoreConnection> open(const std::string& path, std::string* error) = 0;
};

// Store-level resource record: owns one connection shared by every model read from it.
class ModelStore {
public:
    ModelStore(std::string path, std::unique_ptr<StoreConnection> conn);
    ~ModelStore();

    ModelStore(const ModelStore&) = delete;
    ModelStore& operator=(const ModelStore&) = delete;

    const std::string& path() const { return path_; }
    const std::string& dir() const { return dir_; }

    // Idempotent: only the first call closes the connection.
    bool close(std::string* error);
    bool isOpen() const;

private:
    std::string path_;
    std::string dir_;
    mutable std::mutex mutex_;
    std::unique_ptr<StoreConnection> conn_;
};

}  // namespace modelcat
