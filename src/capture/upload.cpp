#include <decoyfs/capture/upload.hpp>
#include <decoyfs/core/logger.hpp>
#include <decoyfs/core/utils.hpp>

#include <cerrno>
#include <unistd.h>

namespace decoyfs {

std::string sanitize_file_name(const std::string& name) {
    return sanitize_file_name(name, time(NULL));
}

std::string sanitize_file_name(const std::string& name, time_t now) {
    return format_local_timestamp(static_cast<int64_t>(now)) + " - " + slugify(name);
}

// ============================================================================
// UploadWriter
// ============================================================================

UploadWriter::UploadWriter()
    : fd_(-1)
    , bytes_written_(0)
{}

UploadWriter::~UploadWriter() {
    if (is_open()) {
        FsStatus status = close();
        if (!status.is_ok()) {
            LOG_ERROR("[Upload] Closing '%s' on release failed: %s",
                      name_.c_str(), status.to_string().c_str());
        }
    }
}

FsStatus UploadWriter::open(BackingStore& store, const std::string& sanitized_name) {
    if (is_open()) {
        return FsStatus::fail(FsError::InvalidArgument, "writer already open for " + name_);
    }
    if (sanitized_name.empty() || sanitized_name == "." || sanitized_name == ".." ||
        sanitized_name.find('/') != std::string::npos) {
        return FsStatus::fail(FsError::InvalidArgument, "bad upload name '" + sanitized_name + "'");
    }

    std::unique_ptr<EVP_MD_CTX, DigestFree> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), NULL) != 1) {
        return FsStatus::fail(FsError::IoError, "cannot initialize SHA-256");
    }

    int fd = -1;
    FsStatus status = store.create_exclusive("/" + sanitized_name, fd);
    if (!status.is_ok()) {
        return status;
    }

    fd_ = fd;
    name_ = sanitized_name;
    bytes_written_ = 0;
    digest_.clear();
    digest_ctx_ = std::move(ctx);
    LOG_DEBUG("[Upload] Opened '%s'", name_.c_str());
    return FsStatus::ok();
}

FsStatus UploadWriter::write_chunk(const char* data, size_t len, size_t& accepted) {
    accepted = 0;
    if (!is_open()) {
        return FsStatus::fail(FsError::InvalidArgument, "writer is not open");
    }
    while (accepted < len) {
        ssize_t n = ::write(fd_, data + accepted, len - accepted);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            EVP_DigestUpdate(digest_ctx_.get(), data, accepted);
            bytes_written_ += accepted;
            return FsStatus::from_errno(err, "write " + name_);
        }
        accepted += static_cast<size_t>(n);
    }
    EVP_DigestUpdate(digest_ctx_.get(), data, accepted);
    bytes_written_ += accepted;
    return FsStatus::ok();
}

FsStatus UploadWriter::write_chunk(const std::string& data, size_t& accepted) {
    return write_chunk(data.data(), data.size(), accepted);
}

FsStatus UploadWriter::close() {
    if (!is_open()) {
        return FsStatus::ok();
    }

    FsStatus status;
    if (fsync(fd_) != 0) {
        status = FsStatus::from_errno(errno, "flush " + name_);
    }
    if (::close(fd_) != 0 && status.is_ok()) {
        status = FsStatus::from_errno(errno, "close " + name_);
    }
    fd_ = -1;

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(digest_ctx_.get(), md, &md_len) == 1) {
        digest_ = to_hex(md, md_len);
    }
    digest_ctx_.reset();

    if (status.is_ok()) {
        LOG_DEBUG("[Upload] Closed '%s' (%llu bytes)", name_.c_str(),
                  static_cast<unsigned long long>(bytes_written_));
    }
    return status;
}

} // namespace decoyfs
