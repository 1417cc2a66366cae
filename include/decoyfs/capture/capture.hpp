/*
 * decoyfs - Upload capture service
 *
 * Owns the persistent store (a data directory shared by every session and
 * disjoint from the jail tree) and the optional catalog. Sessions stream
 * inbound transfers through capture().
 */
#ifndef decoyfs_CAPTURE_CAPTURE_HPP
#define decoyfs_CAPTURE_CAPTURE_HPP

#include <decoyfs/capture/upload.hpp>
#include <decoyfs/capture/catalog.hpp>
#include <decoyfs/fs/store.hpp>
#include <istream>
#include <string>

namespace decoyfs {

struct CaptureConfig {
    std::string data_dir;
    std::string catalog_path;   // empty disables the catalog
    size_t chunk_size;

    CaptureConfig() : chunk_size(8192) {}
};

class UploadCapture {
public:
    UploadCapture();

    bool open(const CaptureConfig& config);
    void close();
    bool is_open() const { return store_.is_open(); }

    BackingStore& store() { return store_; }
    const std::string& data_dir() const { return store_.host_root(); }
    CaptureCatalog& catalog() { return catalog_; }

    // Sanitize original_name and open an exclusive writer for it
    FsStatus begin(const std::string& original_name, UploadWriter& writer);

    // Stream everything from in into a new capture and catalog it.
    // A name collision is returned as AlreadyExists, never retried. A failing
    // input stream is IoError; the bytes received so far stay in the store
    // but are not cataloged.
    FsStatus capture(const std::string& protocol, const std::string& original_name,
                     std::istream& in, CaptureRecord& out);

    const std::string& last_error() const { return last_error_; }

private:
    LocalStore store_;
    CaptureCatalog catalog_;
    size_t chunk_size_;
    std::string last_error_;
};

} // namespace decoyfs

#endif // decoyfs_CAPTURE_CAPTURE_HPP
