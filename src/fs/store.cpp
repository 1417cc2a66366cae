/*
 * decoyfs - Local backing store
 *
 * Plain POSIX calls against a host directory. Mirroring copies regular
 * files byte for byte, recreates directories and symlinks (targets kept
 * verbatim) and carries over permission bits and timestamps.
 */
#include <decoyfs/fs/store.hpp>
#include <decoyfs/core/logger.hpp>
#include <decoyfs/core/utils.hpp>

#include <algorithm>
#include <memory>
#include <vector>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace decoyfs {

namespace {

// Recursion bound for pathological source trees
const int kMaxMirrorDepth = 64;
const size_t kCopyBufferSize = 64 * 1024;

class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() { if (fd_ >= 0) ::close(fd_); }
    int get() const { return fd_; }
    // Close now so the caller sees the result
    int close() {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }
private:
    ScopedFd(const ScopedFd&);
    ScopedFd& operator=(const ScopedFd&);
    int fd_;
};

struct DirCloser {
    void operator()(DIR* d) const { if (d) closedir(d); }
};
typedef std::unique_ptr<DIR, DirCloser> DirHandle;

bool write_all(int fd, const char* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

void fill_times(struct timespec times[2], int64_t atime, int64_t mtime) {
    times[0].tv_sec = static_cast<time_t>(atime);
    times[0].tv_nsec = 0;
    times[1].tv_sec = static_cast<time_t>(mtime);
    times[1].tv_nsec = 0;
}

} // namespace

// ============================================================================
// EntryInfo
// ============================================================================

bool EntryInfo::is_dir() const { return S_ISDIR(mode); }
bool EntryInfo::is_symlink() const { return S_ISLNK(mode); }
bool EntryInfo::is_regular() const { return S_ISREG(mode); }

// ============================================================================
// LocalStore
// ============================================================================

LocalStore::LocalStore() {}

FsStatus LocalStore::open(const std::string& host_root, bool create) {
    if (host_root.empty()) {
        return FsStatus::fail(FsError::InvalidArgument, "empty store root");
    }
    if (create && !ensure_directory(host_root)) {
        return FsStatus::from_errno(errno, "create " + host_root);
    }

    char resolved[PATH_MAX];
    if (!realpath(host_root.c_str(), resolved)) {
        return FsStatus::from_errno(errno, host_root);
    }
    struct stat st;
    if (stat(resolved, &st) != 0) {
        return FsStatus::from_errno(errno, resolved);
    }
    if (!S_ISDIR(st.st_mode)) {
        return FsStatus::fail(FsError::NotADirectory, resolved);
    }

    root_ = resolved;
    LOG_DEBUG("[Store] Opened %s", root_.c_str());
    return FsStatus::ok();
}

std::string LocalStore::host_path(const std::string& path) const {
    std::string normalized = normalize_path("/" + path);
    if (normalized == "/") return root_;
    return root_ + normalized;
}

FsStatus LocalStore::make_dir(const std::string& path) {
    std::string host = host_path(path);
    // mkdir(2) is the exclusive-create primitive: exactly one caller wins
    if (mkdir(host.c_str(), 0755) != 0) {
        return FsStatus::from_errno(errno, path);
    }
    return FsStatus::ok();
}

FsStatus LocalStore::mirror_from(const std::string& source_dir, const std::string& dest) {
    struct stat st;
    if (stat(source_dir.c_str(), &st) != 0) {
        return FsStatus::from_errno(errno, source_dir);
    }
    if (!S_ISDIR(st.st_mode)) {
        return FsStatus::fail(FsError::NotADirectory, source_dir);
    }

    std::string dst = host_path(dest);
    FsStatus status = mirror_dir(source_dir, dst, 0);
    if (!status.is_ok()) {
        LOG_ERROR("[Store] Mirror %s -> %s failed: %s",
                  source_dir.c_str(), dst.c_str(), status.to_string().c_str());
    }
    return status;
}

FsStatus LocalStore::mirror_dir(const std::string& src, const std::string& dst, int depth) {
    if (depth > kMaxMirrorDepth) {
        return FsStatus::fail(FsError::IoError, src + ": directory tree too deep");
    }

    DirHandle dir(opendir(src.c_str()));
    if (!dir) {
        return FsStatus::from_errno(errno, src);
    }

    errno = 0;
    struct dirent* ent;
    while ((ent = readdir(dir.get())) != NULL) {
        std::string name = ent->d_name;
        if (name == "." || name == "..") continue;

        std::string src_path = src + "/" + name;
        std::string dst_path = dst + "/" + name;

        struct stat st;
        if (lstat(src_path.c_str(), &st) != 0) {
            return FsStatus::from_errno(errno, src_path);
        }

        struct timespec times[2];
        fill_times(times, st.st_atime, st.st_mtime);

        if (S_ISDIR(st.st_mode)) {
            if (mkdir(dst_path.c_str(), 0700) != 0) {
                return FsStatus::from_errno(errno, dst_path);
            }
            FsStatus status = mirror_dir(src_path, dst_path, depth + 1);
            if (!status.is_ok()) return status;
            // Mode and times last: filling the directory bumps its mtime
            if (chmod(dst_path.c_str(), st.st_mode & 07777) != 0 ||
                utimensat(AT_FDCWD, dst_path.c_str(), times, 0) != 0) {
                return FsStatus::from_errno(errno, dst_path);
            }
        } else if (S_ISREG(st.st_mode)) {
            FsStatus status = copy_file(src_path, dst_path, st);
            if (!status.is_ok()) return status;
        } else if (S_ISLNK(st.st_mode)) {
            std::vector<char> target(static_cast<size_t>(st.st_size > 0 ? st.st_size : PATH_MAX) + 1);
            ssize_t len = readlink(src_path.c_str(), &target[0], target.size() - 1);
            if (len < 0) {
                return FsStatus::from_errno(errno, src_path);
            }
            std::string link_target(&target[0], static_cast<size_t>(len));
            if (symlink(link_target.c_str(), dst_path.c_str()) != 0) {
                return FsStatus::from_errno(errno, dst_path);
            }
            if (utimensat(AT_FDCWD, dst_path.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
                LOG_DEBUG("[Store] Could not set link times on %s: %s",
                          dst_path.c_str(), strerror(errno));
            }
        } else {
            LOG_WARN("[Store] Skipping special file %s (mode %o)",
                     src_path.c_str(), static_cast<unsigned>(st.st_mode));
        }
        errno = 0;
    }
    if (errno != 0) {
        return FsStatus::from_errno(errno, src);
    }
    return FsStatus::ok();
}

FsStatus LocalStore::copy_file(const std::string& src, const std::string& dst, const struct stat& st) {
    ScopedFd in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (in.get() < 0) {
        return FsStatus::from_errno(errno, src);
    }
    ScopedFd out(::open(dst.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600));
    if (out.get() < 0) {
        return FsStatus::from_errno(errno, dst);
    }

    std::vector<char> buffer(kCopyBufferSize);
    for (;;) {
        ssize_t n = ::read(in.get(), &buffer[0], buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return FsStatus::from_errno(errno, src);
        }
        if (n == 0) break;
        if (!write_all(out.get(), &buffer[0], static_cast<size_t>(n))) {
            return FsStatus::from_errno(errno, dst);
        }
    }

    struct timespec times[2];
    fill_times(times, st.st_atime, st.st_mtime);
    if (fchmod(out.get(), st.st_mode & 07777) != 0 || futimens(out.get(), times) != 0) {
        return FsStatus::from_errno(errno, dst);
    }
    if (out.close() != 0) {
        return FsStatus::from_errno(errno, dst);
    }
    return FsStatus::ok();
}

FsStatus LocalStore::get_info(const std::string& path, EntryInfo& out) const {
    struct stat st;
    if (lstat(host_path(path).c_str(), &st) != 0) {
        return FsStatus::from_errno(errno, path);
    }
    out.mode = static_cast<uint32_t>(st.st_mode);
    out.nlink = static_cast<uint64_t>(st.st_nlink);
    out.size = static_cast<int64_t>(st.st_size);
    out.atime = static_cast<int64_t>(st.st_atime);
    out.mtime = static_cast<int64_t>(st.st_mtime);
    return FsStatus::ok();
}

FsStatus LocalStore::read_link(const std::string& path, std::string& target) const {
    std::string host = host_path(path);
    char buf[PATH_MAX];
    ssize_t len = readlink(host.c_str(), buf, sizeof(buf));
    if (len < 0) {
        if (errno == EINVAL) {
            return FsStatus::fail(FsError::NotASymlink, path);
        }
        return FsStatus::from_errno(errno, path);
    }
    target.assign(buf, static_cast<size_t>(len));
    return FsStatus::ok();
}

FsStatus LocalStore::real_path(const std::string& path, std::string& out) const {
    char resolved[PATH_MAX];
    if (!realpath(host_path(path).c_str(), resolved)) {
        if (errno == ENOENT || errno == ENOTDIR || errno == ELOOP) {
            return FsStatus::fail(FsError::NotFound, path);
        }
        return FsStatus::from_errno(errno, path);
    }
    std::string real(resolved);
    if (!path_within(real, root_)) {
        LOG_WARN("[Store] %s resolves outside the store (%s)", path.c_str(), resolved);
        return FsStatus::fail(FsError::NotFound, path);
    }
    out = real.size() == root_.size() ? std::string("/") : real.substr(root_.size());
    return FsStatus::ok();
}

FsStatus LocalStore::list_dir(const std::string& path, std::vector<std::string>& names) const {
    DirHandle dir(opendir(host_path(path).c_str()));
    if (!dir) {
        return FsStatus::from_errno(errno, path);
    }
    names.clear();
    errno = 0;
    struct dirent* ent;
    while ((ent = readdir(dir.get())) != NULL) {
        if (strcmp(ent->d_name, ".") == 0 || strcmp(ent->d_name, "..") == 0) continue;
        names.push_back(ent->d_name);
        errno = 0;
    }
    if (errno != 0) {
        return FsStatus::from_errno(errno, path);
    }
    std::sort(names.begin(), names.end());
    return FsStatus::ok();
}

FsStatus LocalStore::set_times(const std::string& path, int64_t atime, int64_t mtime) {
    struct timespec times[2];
    fill_times(times, atime, mtime);
    if (utimensat(AT_FDCWD, host_path(path).c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
        return FsStatus::from_errno(errno, path);
    }
    return FsStatus::ok();
}

FsStatus LocalStore::set_mode(const std::string& path, uint32_t mode) {
    if (chmod(host_path(path).c_str(), static_cast<mode_t>(mode & 07777)) != 0) {
        return FsStatus::from_errno(errno, path);
    }
    return FsStatus::ok();
}

FsStatus LocalStore::create_exclusive(const std::string& path, int& fd) {
    std::string host = host_path(path);
    int flags = O_WRONLY | O_CREAT | O_EXCL | O_APPEND | O_CLOEXEC | O_NOFOLLOW;
    int opened = ::open(host.c_str(), flags, 0600);
    if (opened < 0) {
        return FsStatus::from_errno(errno, path);
    }
    fd = opened;
    return FsStatus::ok();
}

FsStatus LocalStore::read_file(const std::string& path, std::string& out) const {
    ScopedFd in(::open(host_path(path).c_str(), O_RDONLY | O_CLOEXEC));
    if (in.get() < 0) {
        return FsStatus::from_errno(errno, path);
    }
    out.clear();
    std::vector<char> buffer(kCopyBufferSize);
    for (;;) {
        ssize_t n = ::read(in.get(), &buffer[0], buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return FsStatus::from_errno(errno, path);
        }
        if (n == 0) break;
        out.append(&buffer[0], static_cast<size_t>(n));
    }
    return FsStatus::ok();
}

} // namespace decoyfs
