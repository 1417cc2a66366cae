#include <decoyfs/fs/status.hpp>

#include <cerrno>
#include <cstring>

namespace decoyfs {

const char* fs_error_name(FsError code) {
    switch (code) {
        case FsError::None: return "None";
        case FsError::AlreadyExists: return "AlreadyExists";
        case FsError::NotFound: return "NotFound";
        case FsError::NotADirectory: return "NotADirectory";
        case FsError::NotASymlink: return "NotASymlink";
        case FsError::NotImplemented: return "NotImplemented";
        case FsError::InvalidArgument: return "InvalidArgument";
        case FsError::IoError: return "IoError";
        default: return "Unknown";
    }
}

FsStatus FsStatus::from_errno(int err, const std::string& context) {
    switch (err) {
        case EEXIST:
            return fail(FsError::AlreadyExists, context);
        case ENOENT:
            return fail(FsError::NotFound, context);
        case ENOTDIR:
            return fail(FsError::NotADirectory, context);
        default:
            return fail(FsError::IoError, context + ": " + strerror(err));
    }
}

std::string FsStatus::to_string() const {
    if (is_ok()) return "OK";
    if (message.empty()) return fs_error_name(code);
    return std::string(fs_error_name(code)) + ": " + message;
}

} // namespace decoyfs
