#include "store/sqlite_store.h"

#include <filesystem>
#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace modelcat {

namespace {

class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }
    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_{nullptr};
    int rc_{SQLITE_ERROR};
};

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

void set_error(std::string* error, sqlite3* db, const std::string& what) {
    if (!error) return;
    *error = what + ": " + (db ? sqlite3_errmsg(db) : "database is closed");
}

// Runs stmt to completion, calling on_row for each result row.
template <typename RowFn>
bool step_all(sqlite3* db, const Statement& stmt, RowFn on_row, std::string* error, const char* what) {
    for (;;) {
        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW) {
            on_row(stmt.get());
            continue;
        }
        if (rc == SQLITE_DONE) return true;
        set_error(error, db, what);
        return false;
    }
}

}  // namespace

SqliteStoreConnection::SqliteStoreConnection(std::string path, sqlite3* db)
    : path_(std::move(path)), db_(db) {}

SqliteStoreConnection::~SqliteStoreConnection() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

bool SqliteStoreConnection::schemaVersion(int* version, std::string* error) {
    if (!db_) {
        set_error(error, nullptr, "schema version");
        return false;
    }
    Statement stmt(db_, "SELECT id_value FROM id_lst WHERE id_key = 'openmpp'");
    if (!stmt.ok()) {
        set_error(error, db_, "schema version");
        return false;
    }
    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        if (version) *version = sqlite3_column_int(stmt.get(), 0);
        return true;
    }
    if (rc == SQLITE_DONE) {
        if (error) *error = "schema version not found";
        return false;
    }
    set_error(error, db_, "schema version");
    return false;
}

bool SqliteStoreConnection::listModels(std::vector<ModelDicRow>* rows, std::string* error) {
    if (!db_) {
        set_error(error, nullptr, "model list");
        return false;
    }
    Statement stmt(db_,
                   "SELECT M.model_id, M.model_name, M.model_digest, M.model_type, M.model_ver,"
                   " M.create_dt, L.lang_code"
                   " FROM model_dic M"
                   " INNER JOIN lang_lst L ON (L.lang_id = M.default_lang_id)"
                   " ORDER BY 1");
    if (!stmt.ok()) {
        set_error(error, db_, "model list");
        return false;
    }

    std::vector<ModelDicRow> out;
    bool ok = step_all(db_, stmt, [&out](sqlite3_stmt* s) {
        ModelDicRow row;
        row.model_id = sqlite3_column_int(s, 0);
        row.name = column_text(s, 1);
        row.digest = column_text(s, 2);
        row.type = sqlite3_column_int(s, 3);
        row.version = column_text(s, 4);
        row.create_dt = column_text(s, 5);
        row.default_lang_code = column_text(s, 6);
        out.push_back(std::move(row));
    }, error, "model list");
    if (!ok) return false;

    if (rows) *rows = std::move(out);
    return true;
}

bool SqliteStoreConnection::listLanguages(LangMeta* meta, std::string* error) {
    if (!db_) {
        set_error(error, nullptr, "language list");
        return false;
    }

    LangMeta out;
    {
        Statement stmt(db_, "SELECT lang_id, lang_code, lang_name FROM lang_lst ORDER BY 1");
        if (!stmt.ok()) {
            set_error(error, db_, "language list");
            return false;
        }
        bool ok = step_all(db_, stmt, [&out](sqlite3_stmt* s) {
            LangRow lang;
            lang.lang_id = sqlite3_column_int(s, 0);
            lang.code = column_text(s, 1);
            lang.name = column_text(s, 2);
            out.langs.push_back(std::move(lang));
        }, error, "language list");
        if (!ok) return false;
    }

    Statement words(db_, "SELECT lang_id, word_code, word_value FROM lang_word ORDER BY 1, 2");
    if (!words.ok()) {
        set_error(error, db_, "language words");
        return false;
    }
    bool ok = step_all(db_, words, [&out](sqlite3_stmt* s) {
        const int lang_id = sqlite3_column_int(s, 0);
        for (auto& lang : out.langs) {
            if (lang.lang_id == lang_id) {
                lang.words[column_text(s, 1)] = column_text(s, 2);
                break;
            }
        }
    }, error, "language words");
    if (!ok) return false;

    if (meta) *meta = std::move(out);
    return true;
}

bool SqliteStoreConnection::close(std::string* error) {
    if (!db_) return true;
    int rc = sqlite3_close(db_);
    if (rc != SQLITE_OK) {
        set_error(error, db_, "close " + path_);
        return false;
    }
    db_ = nullptr;
    return true;
}

std::unique_ptr<StoreConnection> SqliteStoreDriver::open(const std::string& path, std::string* error) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        if (error) *error = "not a regular file";
        return nullptr;
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        if (error) *error = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db) sqlite3_close_v2(db);
        return nullptr;
    }
    sqlite3_busy_timeout(db, busy_timeout_ms_);

    spdlog::debug("SqliteStoreDriver::open: {}", path);
    return std::make_unique<SqliteStoreConnection>(path, db);
}

}  // namespace modelcat
