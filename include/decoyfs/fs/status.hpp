/*
 * decoyfs - Filesystem operation status
 *
 * Every jail, store and capture operation reports through FsStatus. The
 * protocol adapter maps the code onto a client-facing reply.
 */
#ifndef decoyfs_FS_STATUS_HPP
#define decoyfs_FS_STATUS_HPP

#include <string>

namespace decoyfs {

enum class FsError {
    None = 0,
    AlreadyExists,
    NotFound,
    NotADirectory,
    NotASymlink,
    NotImplemented,
    InvalidArgument,
    IoError
};

const char* fs_error_name(FsError code);

struct FsStatus {
    FsError code;
    std::string message;

    FsStatus() : code(FsError::None) {}

    bool is_ok() const { return code == FsError::None; }

    static FsStatus ok() {
        return FsStatus();
    }

    static FsStatus fail(FsError code, const std::string& message) {
        FsStatus s;
        s.code = code;
        s.message = message;
        return s;
    }

    // EEXIST/ENOENT/ENOTDIR map onto their codes, anything else is IoError
    // with the strerror text appended to context
    static FsStatus from_errno(int err, const std::string& context);

    // "NotFound: /etc/passwd"
    std::string to_string() const;
};

} // namespace decoyfs

#endif // decoyfs_FS_STATUS_HPP
