/*
 * decoyfs - Backing store
 *
 * BackingStore is the storage seam under the jail and the capture store.
 * Paths handed to a store are store-relative ("/ftp/pub/readme.txt"); a
 * store never resolves them above its own root.
 *
 *   LocalStore - a directory on the host filesystem
 */
#ifndef decoyfs_FS_STORE_HPP
#define decoyfs_FS_STORE_HPP

#include <decoyfs/fs/status.hpp>
#include <string>
#include <vector>
#include <cstdint>
#include <sys/stat.h>

namespace decoyfs {

// Metadata of one entry, never following a final symlink
struct EntryInfo {
    uint32_t mode;
    uint64_t nlink;
    int64_t size;
    int64_t atime;
    int64_t mtime;

    EntryInfo() : mode(0), nlink(0), size(0), atime(0), mtime(0) {}

    bool is_dir() const;
    bool is_symlink() const;
    bool is_regular() const;
};

class BackingStore {
public:
    virtual ~BackingStore() {}

    // Create one directory. AlreadyExists if anything is present at path.
    virtual FsStatus make_dir(const std::string& path) = 0;

    // Recursively copy files, directories and symlinks from a host directory
    // into an existing store directory. The source is only read.
    virtual FsStatus mirror_from(const std::string& source_dir, const std::string& dest) = 0;

    virtual FsStatus get_info(const std::string& path, EntryInfo& out) const = 0;
    virtual FsStatus read_link(const std::string& path, std::string& target) const = 0;

    // Canonical store-relative path with every symlink followed. NotFound if
    // the path does not exist or resolves outside the store.
    virtual FsStatus real_path(const std::string& path, std::string& out) const = 0;

    // Entry names except "." and "..", sorted bytewise
    virtual FsStatus list_dir(const std::string& path, std::vector<std::string>& names) const = 0;

    virtual FsStatus set_times(const std::string& path, int64_t atime, int64_t mtime) = 0;
    virtual FsStatus set_mode(const std::string& path, uint32_t mode) = 0;

    // Atomically create a new regular file opened write-only/append.
    // AlreadyExists if the name is taken. The caller owns the descriptor.
    virtual FsStatus create_exclusive(const std::string& path, int& fd) = 0;

    virtual FsStatus read_file(const std::string& path, std::string& out) const = 0;
};

class LocalStore : public BackingStore {
public:
    LocalStore();

    // Root the store at a host directory, creating it first if asked.
    FsStatus open(const std::string& host_root, bool create = false);
    bool is_open() const { return !root_.empty(); }

    // Canonical host directory backing "/"
    const std::string& host_root() const { return root_; }

    // Host path for a store-relative path (".." never climbs above the root)
    std::string host_path(const std::string& path) const;

    FsStatus make_dir(const std::string& path) override;
    FsStatus mirror_from(const std::string& source_dir, const std::string& dest) override;
    FsStatus get_info(const std::string& path, EntryInfo& out) const override;
    FsStatus read_link(const std::string& path, std::string& target) const override;
    FsStatus real_path(const std::string& path, std::string& out) const override;
    FsStatus list_dir(const std::string& path, std::vector<std::string>& names) const override;
    FsStatus set_times(const std::string& path, int64_t atime, int64_t mtime) override;
    FsStatus set_mode(const std::string& path, uint32_t mode) override;
    FsStatus create_exclusive(const std::string& path, int& fd) override;
    FsStatus read_file(const std::string& path, std::string& out) const override;

private:
    FsStatus mirror_dir(const std::string& src, const std::string& dst, int depth);
    FsStatus copy_file(const std::string& src, const std::string& dst, const struct stat& st);

    std::string root_;
};

} // namespace decoyfs

#endif // decoyfs_FS_STORE_HPP
