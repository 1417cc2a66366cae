/*
 * decoyfs - Capture catalog implementation
 */
#include <decoyfs/capture/catalog.hpp>
#include <decoyfs/core/logger.hpp>
#include <decoyfs/core/utils.hpp>

namespace decoyfs {

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

const char* kSelectColumns =
    "SELECT id, stored_name, original_name, protocol, size, sha256, "
    "       started_at, finished_at FROM captures ";

} // namespace

CaptureCatalog::CaptureCatalog() : db_(nullptr) {}

CaptureCatalog::~CaptureCatalog() {
    close();
}

bool CaptureCatalog::open(const std::string& db_path) {
    if (db_) {
        close();
    }

    if (!create_parent_directory(db_path)) {
        last_error_ = "cannot create parent directory for " + db_path;
        LOG_ERROR("[Catalog] %s", last_error_.c_str());
        return false;
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        set_error_from_db("open");
        LOG_ERROR("[Catalog] Failed to open '%s': %s", db_path.c_str(), last_error_.c_str());
        close();
        return false;
    }

    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");
    exec("PRAGMA busy_timeout=5000");

    if (!ensure_schema()) {
        LOG_ERROR("[Catalog] Failed to initialize schema: %s", last_error_.c_str());
        close();
        return false;
    }

    LOG_INFO("[Catalog] Database opened: %s", db_path.c_str());
    return true;
}

void CaptureCatalog::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool CaptureCatalog::exec(const std::string& sql) {
    if (!db_) return false;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        last_error_ = err_msg ? err_msg : "unknown error";
        LOG_ERROR("[Catalog] SQL error: %s\n  Query: %s", last_error_.c_str(), sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }
    return true;
}

void CaptureCatalog::set_error_from_db(const char* context) {
    last_error_ = std::string(context) + ": " + (db_ ? sqlite3_errmsg(db_) : "no database");
}

bool CaptureCatalog::ensure_schema() {
    bool ok = exec(
        "CREATE TABLE IF NOT EXISTS captures ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  stored_name TEXT NOT NULL UNIQUE,"
        "  original_name TEXT NOT NULL,"
        "  protocol TEXT NOT NULL,"
        "  size INTEGER NOT NULL,"
        "  sha256 TEXT NOT NULL,"
        "  started_at INTEGER NOT NULL,"
        "  finished_at INTEGER NOT NULL"
        ")"
    );
    if (!ok) return false;

    ok = exec("CREATE INDEX IF NOT EXISTS idx_captures_sha256 ON captures(sha256)");
    if (!ok) return false;
    return exec("CREATE INDEX IF NOT EXISTS idx_captures_finished ON captures(finished_at)");
}

CaptureRecord CaptureCatalog::read_row(sqlite3_stmt* stmt) {
    CaptureRecord r;
    r.id = sqlite3_column_int64(stmt, 0);
    r.stored_name = column_text(stmt, 1);
    r.original_name = column_text(stmt, 2);
    r.protocol = column_text(stmt, 3);
    r.size = sqlite3_column_int64(stmt, 4);
    r.sha256 = column_text(stmt, 5);
    r.started_at = sqlite3_column_int64(stmt, 6);
    r.finished_at = sqlite3_column_int64(stmt, 7);
    return r;
}

bool CaptureCatalog::record(CaptureRecord& record) {
    if (!db_) {
        last_error_ = "catalog is not open";
        return false;
    }

    const char* sql =
        "INSERT INTO captures "
        "(stored_name, original_name, protocol, size, sha256, started_at, finished_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db("record prepare");
        LOG_ERROR("[Catalog] %s", last_error_.c_str());
        return false;
    }

    sqlite3_bind_text(stmt, 1, record.stored_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, record.original_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, record.protocol.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, record.size);
    sqlite3_bind_text(stmt, 5, record.sha256.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 6, record.started_at);
    sqlite3_bind_int64(stmt, 7, record.finished_at);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        set_error_from_db("record step");
        LOG_ERROR("[Catalog] %s", last_error_.c_str());
        return false;
    }

    record.id = sqlite3_last_insert_rowid(db_);
    LOG_DEBUG("[Catalog] Recorded id=%lld '%s' sha256=%s",
              static_cast<long long>(record.id), record.stored_name.c_str(), record.sha256.c_str());
    return true;
}

std::vector<CaptureRecord> CaptureCatalog::list(int limit) {
    std::vector<CaptureRecord> results;
    if (!db_) return results;

    std::string sql = std::string(kSelectColumns) + "ORDER BY finished_at DESC, id DESC LIMIT ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db("list prepare");
        LOG_ERROR("[Catalog] %s", last_error_.c_str());
        return results;
    }
    sqlite3_bind_int(stmt, 1, limit);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.push_back(read_row(stmt));
    }
    sqlite3_finalize(stmt);
    return results;
}

int CaptureCatalog::count() {
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM captures", -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db("count prepare");
        return 0;
    }
    int n = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        n = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return n;
}

bool CaptureCatalog::find_by_digest(const std::string& sha256, CaptureRecord& out) {
    if (!db_ || sha256.empty()) return false;

    std::string sql = std::string(kSelectColumns) + "WHERE sha256 = ? ORDER BY id ASC LIMIT 1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db("find prepare");
        return false;
    }
    sqlite3_bind_text(stmt, 1, sha256.c_str(), -1, SQLITE_TRANSIENT);

    bool found = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        out = read_row(stmt);
        found = true;
    }
    sqlite3_finalize(stmt);
    return found;
}

} // namespace decoyfs
