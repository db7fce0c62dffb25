#include <vectrix/storage/sqlite_file_storage.hpp>
#include <vectrix/storage/storage_utils.hpp>
#include <vectrix/core/logger.hpp>
#include <vectrix/core/utils.hpp>

namespace vectrix {

// ============================================================================
// Helpers
// ============================================================================

int64_t SqliteFileStorage::now_ms() {
    return current_timestamp_ms();
}

std::string SqliteFileStorage::key_for(const std::string& path) {
    std::string key = normalize_path(path);
    return key == "." ? "" : key;
}

Status SqliteFileStorage::require_open() const {
    if (!db_) {
        return Status::fail(ErrorKind::STATE, "SQLite storage is not open");
    }
    return Status::ok();
}

Status SqliteFileStorage::db_failure(const char* op) const {
    const char* msg = db_ ? sqlite3_errmsg(db_) : "database not open";
    LOG_ERROR("[SqliteStorage] %s failed: %s", op, msg);
    return Status::fail(ErrorKind::IO, std::string(op) + " failed: " + msg);
}

// ============================================================================
// Connection
// ============================================================================

SqliteFileStorage::SqliteFileStorage() : db_(nullptr) {}

SqliteFileStorage::~SqliteFileStorage() {
    close();
}

Status SqliteFileStorage::open(const std::string& db_path) {
    if (db_) {
        close();
    }

    if (db_path != ":memory:" && !create_parent_directory(db_path)) {
        LOG_ERROR("[SqliteStorage] Failed to create parent directory for '%s'", db_path.c_str());
        return Status::fail(ErrorKind::IO, "cannot create parent directory for " + db_path);
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
        LOG_ERROR("[SqliteStorage] Failed to open database '%s': %s",
                  db_path.c_str(), err.c_str());
        close();
        return Status::fail(ErrorKind::IO, "cannot open database " + db_path + ": " + err);
    }

    if (db_path != ":memory:") {
        exec_sql("PRAGMA journal_mode=WAL");
        exec_sql("PRAGMA synchronous=NORMAL");
    }
    exec_sql("PRAGMA busy_timeout=5000");

    if (!init_tables()) {
        LOG_ERROR("[SqliteStorage] Failed to initialize tables");
        close();
        return Status::fail(ErrorKind::IO, "cannot initialize storage tables in " + db_path);
    }

    LOG_DEBUG("[SqliteStorage] Database opened: %s", db_path.c_str());
    return Status::ok();
}

void SqliteFileStorage::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteFileStorage::exec_sql(const std::string& sql) {
    if (!db_) return false;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);

    if (rc != SQLITE_OK) {
        LOG_ERROR("[SqliteStorage] SQL error: %s\n  Query: %s",
                  err_msg ? err_msg : "unknown", sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }

    return true;
}

bool SqliteFileStorage::init_tables() {
    bool ok = exec_sql(
        "CREATE TABLE IF NOT EXISTS entries ("
        "  path TEXT PRIMARY KEY,"
        "  parent TEXT NOT NULL,"
        "  is_folder INTEGER NOT NULL DEFAULT 0,"
        "  content BLOB,"
        "  created_at INTEGER NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ")"
    );
    if (!ok) return false;

    return exec_sql("CREATE INDEX IF NOT EXISTS idx_entries_parent ON entries(parent)");
}

// ============================================================================
// Row access
// ============================================================================

Status SqliteFileStorage::lookup(const std::string& key, bool& exists, bool& is_folder) {
    exists = false;
    is_folder = false;

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "SELECT is_folder FROM entries WHERE path = ?",
                                -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_failure("lookup prepare");
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        exists = true;
        is_folder = sqlite3_column_int(stmt, 0) != 0;
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return db_failure("lookup step");
    }
    return Status::ok();
}

Status SqliteFileStorage::write_file_row(const std::string& key, const std::string& content,
                                         bool replace) {
    const char* sql = replace
        ? "INSERT INTO entries (path, parent, is_folder, content, created_at, updated_at) "
          "VALUES (?, ?, 0, ?, ?, ?) "
          "ON CONFLICT(path) DO UPDATE SET content = excluded.content, "
          "updated_at = excluded.updated_at"
        : "INSERT INTO entries (path, parent, is_folder, content, created_at, updated_at) "
          "VALUES (?, ?, 0, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_failure("write prepare");
    }

    int64_t now = now_ms();
    std::string parent = parent_path(key);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, parent.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 3, content.data(), static_cast<int>(content.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, now);
    sqlite3_bind_int64(stmt, 5, now);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return db_failure("write step");
    }
    return Status::ok();
}

// ============================================================================
// FileStorage
// ============================================================================

Status SqliteFileStorage::create_file(const std::string& path, const std::string& content) {
    Status s = require_open();
    if (!s.success) return s;

    std::string key = key_for(path);
    bool exists = false, is_folder = false;
    s = lookup(key, exists, is_folder);
    if (!s.success) return s;
    if (exists) {
        return Status::fail(ErrorKind::IO, "File already exists: " + key);
    }
    return write_file_row(key, content, false);
}

Status SqliteFileStorage::create_folder(const std::string& path) {
    Status s = require_open();
    if (!s.success) return s;

    std::string key = key_for(path);
    std::vector<std::string> parts = split(key, '/');
    std::string current = (!key.empty() && key[0] == '/') ? "/" : "";

    for (const auto& part : parts) {
        if (part.empty()) continue;
        std::string parent = current;
        current = (current.empty() || current == "/") ? current + part : current + "/" + part;

        bool exists = false, is_folder = false;
        s = lookup(current, exists, is_folder);
        if (!s.success) return s;
        if (exists) {
            if (!is_folder) {
                return Status::fail(ErrorKind::IO, "Cannot create folder: " + current + " is a file");
            }
            continue;
        }

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_,
            "INSERT INTO entries (path, parent, is_folder, content, created_at, updated_at) "
            "VALUES (?, ?, 1, NULL, ?, ?)", -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return db_failure("create_folder prepare");
        }
        int64_t now = now_ms();
        sqlite3_bind_text(stmt, 1, current.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, parent.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 3, now);
        sqlite3_bind_int64(stmt, 4, now);
        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return db_failure("create_folder step");
        }
    }
    return Status::ok();
}

Status SqliteFileStorage::delete_file(const std::string& path) {
    Status s = require_open();
    if (!s.success) return s;

    std::string key = key_for(path);
    bool exists = false, is_folder = false;
    s = lookup(key, exists, is_folder);
    if (!s.success) return s;
    if (!exists) return Status::ok();
    if (is_folder) {
        return Status::fail(ErrorKind::IO, "Cannot delete file: " + key + " is a folder");
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "DELETE FROM entries WHERE path = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_failure("delete_file prepare");
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return db_failure("delete_file step");
    }
    return Status::ok();
}

Status SqliteFileStorage::delete_folder(const std::string& path) {
    Status s = require_open();
    if (!s.success) return s;

    std::string key = key_for(path);
    bool exists = false, is_folder = false;
    s = lookup(key, exists, is_folder);
    if (!s.success) return s;
    if (!exists) return Status::ok();
    if (!is_folder) {
        return Status::fail(ErrorKind::IO, "Cannot delete folder: " + key + " is a file");
    }

    std::string prefix = key + "/";
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_,
        "DELETE FROM entries WHERE path = ?1 OR substr(path, 1, length(?2)) = ?2",
        -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_failure("delete_folder prepare");
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, prefix.c_str(), -1, SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return db_failure("delete_folder step");
    }
    LOG_DEBUG("[SqliteStorage] Deleted folder %s (%d rows)", key.c_str(), sqlite3_changes(db_));
    return Status::ok();
}

Status SqliteFileStorage::get_details(const std::string& path, FileDetails& out) {
    Status s = require_open();
    if (!s.success) return s;

    std::string key = key_for(path);
    bool exists = false, is_folder = false;
    s = lookup(key, exists, is_folder);
    if (!s.success) return s;
    if (!exists) {
        return Status::fail(ErrorKind::NOT_FOUND, "Path not found: " + key);
    }

    out = FileDetails();
    out.name = base_name(key);
    out.path = key;
    out.is_folder = is_folder;
    if (!is_folder) {
        out.file_type = storage_utils::get_file_type(key);
    }
    return Status::ok();
}

Status SqliteFileStorage::list_files(const std::string& folder,
                                     std::vector<FileDetails>& out,
                                     ListFilesFilter filter) {
    out.clear();
    Status s = require_open();
    if (!s.success) return s;

    std::string key = key_for(folder);
    if (!key.empty() && key != "/") {
        bool exists = false, is_folder = false;
        s = lookup(key, exists, is_folder);
        if (!s.success) return s;
        if (!exists) {
            return Status::fail(ErrorKind::NOT_FOUND, "Folder not found: " + key);
        }
        if (!is_folder) {
            return Status::fail(ErrorKind::IO, "Cannot list files: " + key + " is a file");
        }
    }

    std::string sql = "SELECT path, is_folder FROM entries WHERE parent = ?";
    if (filter == ListFilesFilter::FILES) {
        sql += " AND is_folder = 0";
    } else if (filter == ListFilesFilter::FOLDERS) {
        sql += " AND is_folder = 1";
    }
    sql += " ORDER BY path";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_failure("list_files prepare");
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const unsigned char* p = sqlite3_column_text(stmt, 0);
        FileDetails details;
        details.path = p ? reinterpret_cast<const char*>(p) : "";
        details.name = base_name(details.path);
        details.is_folder = sqlite3_column_int(stmt, 1) != 0;
        if (!details.is_folder) {
            details.file_type = storage_utils::get_file_type(details.path);
        }
        if (details.path == key) continue;
        out.push_back(details);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return db_failure("list_files step");
    }
    return Status::ok();
}

bool SqliteFileStorage::path_exists(const std::string& path) {
    if (!db_) return false;
    bool exists = false, is_folder = false;
    Status s = lookup(key_for(path), exists, is_folder);
    return s.success && exists;
}

Status SqliteFileStorage::read_file(const std::string& path, std::string& out) {
    Status s = require_open();
    if (!s.success) return s;

    std::string key = key_for(path);
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "SELECT is_folder, content FROM entries WHERE path = ?",
                                -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_failure("read_file prepare");
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return Status::fail(ErrorKind::NOT_FOUND, "File not found: " + key);
    }
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return db_failure("read_file step");
    }
    if (sqlite3_column_int(stmt, 0) != 0) {
        sqlite3_finalize(stmt);
        return Status::fail(ErrorKind::IO, "Cannot read file: " + key + " is a folder");
    }

    const void* blob = sqlite3_column_blob(stmt, 1);
    int size = sqlite3_column_bytes(stmt, 1);
    out.assign(blob ? static_cast<const char*>(blob) : "", blob ? static_cast<size_t>(size) : 0);
    sqlite3_finalize(stmt);
    return Status::ok();
}

Status SqliteFileStorage::upsert_file(const std::string& path, const std::string& content) {
    Status s = require_open();
    if (!s.success) return s;

    std::string key = key_for(path);
    bool exists = false, is_folder = false;
    s = lookup(key, exists, is_folder);
    if (!s.success) return s;
    if (exists && is_folder) {
        return Status::fail(ErrorKind::IO, "Cannot write file: " + key + " is a folder");
    }
    return write_file_row(key, content, true);
}

} // namespace vectrix
