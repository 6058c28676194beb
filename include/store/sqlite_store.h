// sqlite_store.h - SQLite backed model store
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "store/model_store.h"

struct sqlite3;

namespace modelcat {

class SqliteStoreConnection final : public StoreConnection {
public:
    SqliteStoreConnection(std::string path, sqlite3* db);
    ~SqliteStoreConnection() override;

    SqliteStoreConnection(const SqliteStoreConnection&) = delete;
    SqliteStoreConnection& operator=(const SqliteStoreConnection&) = delete;

    const std::string& path() const override { return path_; }

    bool schemaVersion(int* version, std::string* error) override;
    bool listModels(std::vector<ModelDicRow>* rows, std::string* error) override;
    bool listLanguages(LangMeta* meta, std::string* error) override;
    bool close(std::string* error) override;
    bool isOpen() const override { return db_ != nullptr; }

private:
    std::string path_;
    sqlite3* db_{nullptr};
};

class SqliteStoreDriver final : public StoreDriver {
public:
    // busy_timeout_ms: how long a query waits on a locked database file.
    explicit SqliteStoreDriver(int busy_timeout_ms = 5000) : busy_timeout_ms_(busy_timeout_ms) {}

    std::unique_ptr<StoreConnection> open(const std::string& path, std::string* error) override;

private:
    int busy_timeout_ms_;
};

}  // namespace modelcat
