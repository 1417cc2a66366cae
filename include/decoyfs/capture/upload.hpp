/*
 * decoyfs - Upload naming and capture writer
 *
 * Every inbound transfer lands in the persistent store under a fresh name
 * "<YYYY-MM-DD HH:MM:SS> - <slug>", created exclusively so nothing already
 * captured is ever overwritten. The writer hashes (SHA-256) what it accepts.
 */
#ifndef decoyfs_CAPTURE_UPLOAD_HPP
#define decoyfs_CAPTURE_UPLOAD_HPP

#include <decoyfs/fs/status.hpp>
#include <decoyfs/fs/store.hpp>
#include <openssl/evp.h>
#include <string>
#include <memory>
#include <cstdint>
#include <ctime>

namespace decoyfs {

// Local-time stamp to the second, then the slug of name.
// Two uploads of one name within the same second produce the same result.
std::string sanitize_file_name(const std::string& name);
std::string sanitize_file_name(const std::string& name, time_t now);

class UploadWriter {
public:
    UploadWriter();
    // Closes a still-open handle; a failing flush/close is logged as an error
    ~UploadWriter();

    // Exclusively create sanitized_name at the top of store.
    // AlreadyExists if the name is taken.
    FsStatus open(BackingStore& store, const std::string& sanitized_name);

    // Append bytes; accepted is what reached the file even on failure
    FsStatus write_chunk(const char* data, size_t len, size_t& accepted);
    FsStatus write_chunk(const std::string& data, size_t& accepted);

    // fsync and close. Errors from either are returned, the handle is
    // released regardless.
    FsStatus close();

    bool is_open() const { return fd_ >= 0; }
    const std::string& name() const { return name_; }
    uint64_t bytes_written() const { return bytes_written_; }

    // Hex SHA-256 of all accepted bytes, available after close()
    const std::string& sha256_hex() const { return digest_; }

private:
    UploadWriter(const UploadWriter&);
    UploadWriter& operator=(const UploadWriter&);

    struct DigestFree {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };

    int fd_;
    std::string name_;
    uint64_t bytes_written_;
    std::unique_ptr<EVP_MD_CTX, DigestFree> digest_ctx_;
    std::string digest_;
};

} // namespace decoyfs

#endif // decoyfs_CAPTURE_UPLOAD_HPP
