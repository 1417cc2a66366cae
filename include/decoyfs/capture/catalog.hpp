/*
 * decoyfs - Capture catalog (SQLite)
 *
 * One row per completed upload so captured artifacts can be reviewed
 * without walking the data directory:
 *
 *   captures(id, stored_name, original_name, protocol, size, sha256,
 *            started_at, finished_at)
 */
#ifndef decoyfs_CAPTURE_CATALOG_HPP
#define decoyfs_CAPTURE_CATALOG_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <sqlite3.h>

namespace decoyfs {

struct CaptureRecord {
    int64_t id;
    std::string stored_name;    // name inside the data directory
    std::string original_name;  // name the client asked for
    std::string protocol;
    int64_t size;
    std::string sha256;         // lowercase hex
    int64_t started_at;         // unix ms
    int64_t finished_at;        // unix ms

    CaptureRecord() : id(0), size(0), started_at(0), finished_at(0) {}
};

class CaptureCatalog {
public:
    CaptureCatalog();
    ~CaptureCatalog();

    bool open(const std::string& db_path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    // Insert a row; record.id is filled in
    bool record(CaptureRecord& record);

    // Newest first
    std::vector<CaptureRecord> list(int limit = 100);
    int count();
    bool find_by_digest(const std::string& sha256, CaptureRecord& out);

    std::string last_error() const { return last_error_; }

private:
    CaptureCatalog(const CaptureCatalog&);
    CaptureCatalog& operator=(const CaptureCatalog&);

    bool exec(const std::string& sql);
    bool ensure_schema();
    void set_error_from_db(const char* context);
    static CaptureRecord read_row(sqlite3_stmt* stmt);

    sqlite3* db_;
    std::string last_error_;
};

} // namespace decoyfs

#endif // decoyfs_CAPTURE_CATALOG_HPP
