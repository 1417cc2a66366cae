#include <decoyfs/capture/capture.hpp>
#include <decoyfs/core/logger.hpp>
#include <decoyfs/core/utils.hpp>

#include <vector>

namespace decoyfs {

UploadCapture::UploadCapture() : chunk_size_(8192) {}

bool UploadCapture::open(const CaptureConfig& config) {
    FsStatus status = store_.open(config.data_dir, true);
    if (!status.is_ok()) {
        last_error_ = status.to_string();
        LOG_ERROR("[Capture] Cannot open data directory %s: %s",
                  config.data_dir.c_str(), last_error_.c_str());
        return false;
    }

    if (!config.catalog_path.empty() && !catalog_.open(config.catalog_path)) {
        last_error_ = catalog_.last_error();
        store_ = LocalStore();
        return false;
    }

    chunk_size_ = config.chunk_size > 0 ? config.chunk_size : 8192;
    LOG_INFO("[Capture] Uploads go to %s (catalog: %s)", store_.host_root().c_str(),
             catalog_.is_open() ? config.catalog_path.c_str() : "disabled");
    return true;
}

void UploadCapture::close() {
    catalog_.close();
    store_ = LocalStore();
}

FsStatus UploadCapture::begin(const std::string& original_name, UploadWriter& writer) {
    if (!is_open()) {
        return FsStatus::fail(FsError::InvalidArgument, "capture store is not open");
    }
    std::string stored_name = sanitize_file_name(original_name);
    FsStatus status = writer.open(store_, stored_name);
    if (status.code == FsError::AlreadyExists) {
        LOG_WARN("[Capture] Upload name collision on '%s'", stored_name.c_str());
    }
    return status;
}

FsStatus UploadCapture::capture(const std::string& protocol, const std::string& original_name,
                                std::istream& in, CaptureRecord& out) {
    int64_t started = current_timestamp_ms();

    UploadWriter writer;
    FsStatus status = begin(original_name, writer);
    if (!status.is_ok()) return status;

    // peek() pulls more input; readsome() only copies what the stream already
    // holds, so a transport failure never swallows bytes that were received.
    std::vector<char> buffer(chunk_size_);
    const std::streamsize want = static_cast<std::streamsize>(buffer.size());
    for (;;) {
        if (std::istream::traits_type::eq_int_type(in.peek(), std::istream::traits_type::eof())) {
            break;
        }
        std::streamsize got = in.readsome(&buffer[0], want);
        if (got <= 0) {
            // Unbuffered source: take the peeked byte
            in.read(&buffer[0], 1);
            got = in.gcount();
            if (got <= 0) break;
        }
        size_t accepted = 0;
        status = writer.write_chunk(&buffer[0], static_cast<size_t>(got), accepted);
        if (!status.is_ok()) {
            LOG_ERROR("[Capture] %s: write to '%s' failed after %llu bytes: %s",
                      protocol.c_str(), writer.name().c_str(),
                      static_cast<unsigned long long>(writer.bytes_written()),
                      status.to_string().c_str());
            FsStatus closed = writer.close();
            if (!closed.is_ok()) {
                LOG_ERROR("[Capture] %s", closed.to_string().c_str());
            }
            return status;
        }
    }
    if (in.bad()) {
        // The partial file stays in the store, uncataloged
        LOG_ERROR("[Capture] %s: input failed for '%s' after %llu bytes",
                  protocol.c_str(), writer.name().c_str(),
                  static_cast<unsigned long long>(writer.bytes_written()));
        FsStatus closed = writer.close();
        if (!closed.is_ok()) {
            LOG_ERROR("[Capture] %s", closed.to_string().c_str());
        }
        return FsStatus::fail(FsError::IoError, "read " + writer.name());
    }

    status = writer.close();
    if (!status.is_ok()) return status;

    out = CaptureRecord();
    out.stored_name = writer.name();
    out.original_name = original_name;
    out.protocol = protocol;
    out.size = static_cast<int64_t>(writer.bytes_written());
    out.sha256 = writer.sha256_hex();
    out.started_at = started;
    out.finished_at = current_timestamp_ms();

    LOG_INFO("[Capture] %s: stored '%s' as '%s' (%lld bytes, sha256 %s)",
             protocol.c_str(), original_name.c_str(), out.stored_name.c_str(),
             static_cast<long long>(out.size), out.sha256.c_str());

    if (catalog_.is_open() && !catalog_.record(out)) {
        return FsStatus::fail(FsError::IoError, "catalog: " + catalog_.last_error());
    }
    return FsStatus::ok();
}

} // namespace decoyfs
