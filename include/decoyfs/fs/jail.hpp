/*
 * decoyfs - Chroot jail
 *
 * JailRoot is the process-wide "/" shared by every protocol. Each protocol
 * session works through a ProtocolJail whose home is "/<protocol>", mirrored
 * from a template directory at initialize() time. All paths a client sends
 * are canonicalized against the jail's cwd and must stay at or below home:
 *
 *   client sees          store path            host path
 *   /                    /ftp                  <root_dir>/ftp
 *   /pub/readme.txt      /ftp/pub/readme.txt   <root_dir>/ftp/pub/readme.txt
 *
 * A ProtocolJail belongs to one session and is not internally locked.
 */
#ifndef decoyfs_FS_JAIL_HPP
#define decoyfs_FS_JAIL_HPP

#include <decoyfs/fs/status.hpp>
#include <decoyfs/fs/store.hpp>
#include <string>
#include <vector>
#include <set>
#include <mutex>
#include <cstdint>

namespace decoyfs {

class DirListing;

// ============================================================================
// JailRoot - arena of protocol subtrees
// ============================================================================
class JailRoot {
public:
    JailRoot();
    ~JailRoot();

    // Use root_dir as "/", or a fresh private temp dir when root_dir is empty.
    // Unless keep_on_close is set, close() removes the temp dir or, for a
    // caller-supplied root_dir, every subtree claimed through this object.
    bool open(const std::string& root_dir = "", bool keep_on_close = false);
    void close();
    bool is_open() const { return store_.is_open(); }

    const std::string& host_dir() const { return store_.host_root(); }
    BackingStore& store() { return store_; }
    const BackingStore& store() const { return store_; }

    // Exclusively create "/<protocol>". Exactly one concurrent caller per
    // name succeeds; the rest get AlreadyExists.
    FsStatus claim(const std::string& protocol);

    std::vector<std::string> protocols() const;

    const std::string& last_error() const { return last_error_; }

    static bool is_valid_protocol_name(const std::string& name);

private:
    JailRoot(const JailRoot&);
    JailRoot& operator=(const JailRoot&);

    LocalStore store_;
    bool owns_dir_;
    bool keep_on_close_;
    std::string last_error_;

    mutable std::mutex mutex_;
    std::set<std::string> protocols_;
};

// ============================================================================
// StatInfo - what a client is shown for one entry
// ============================================================================
struct StatInfo {
    uint32_t mode;
    uint64_t nlink;
    int64_t size;
    int64_t atime;
    int64_t mtime;
    std::string owner;  // always "owner", host identities are never exposed
    std::string group;  // always "group"

    StatInfo() : mode(0), nlink(0), size(0), atime(0), mtime(0) {}

    bool is_dir() const;
    bool is_symlink() const;
};

// ============================================================================
// ProtocolJail - one session's view of its protocol subtree
// ============================================================================
class ProtocolJail {
public:
    explicit ProtocolJail(JailRoot& root);

    // Claim "/<protocol>" and mirror source_dir into it; home = cwd = "/".
    // InvalidArgument if the new home would lie inside source_dir.
    FsStatus initialize(const std::string& protocol, const std::string& source_dir);
    bool is_initialized() const { return initialized_; }

    const std::string& protocol() const { return protocol_; }
    const std::string& root() const { return root_; }
    const std::string& home() const { return home_; }
    const std::string& cwd() const { return cwd_; }

    // Home-relative cwd, always starting with "/"
    std::string getcwd() const { return cwd_; }

    // NotADirectory for an empty or missing target, a non-directory, or any
    // path that would leave the jail.
    FsStatus chdir(const std::string& path);

    FsStatus stat(const std::string& path, StatInfo& out) const;
    FsStatus readlink(const std::string& path, std::string& target) const;
    FsStatus getmtime(const std::string& path, int64_t& mtime) const;
    FsStatus utime(const std::string& path, int64_t atime, int64_t mtime);
    FsStatus chmod(const std::string& path, uint32_t mode);
    FsStatus get_permissions(const std::string& path, uint32_t& mode) const;
    FsStatus set_permissions(const std::string& path, uint32_t mode);
    FsStatus listdir(const std::string& path, std::vector<std::string>& names) const;

    // Lazy "ls -lA" rendering of names under basedir (see listing.hpp).
    // The jail must outlive the returned listing.
    DirListing format_list(const std::string& basedir, const std::vector<std::string>& names) const;
    DirListing format_list(const std::string& basedir, const std::vector<std::string>& names, int64_t now) const;

    // Canonical home-relative path for path (absolute paths start at home).
    // False if ".." would climb above home.
    bool resolve(const std::string& path, std::string& out) const;

private:
    // Resolve path and check that its parent directory really lies inside
    // home. Failures are reported with the given code.
    FsStatus locate(const std::string& path, FsError failure,
                    std::string& virtual_path, std::string& store_path) const;
    // Follow every symlink in store_path and require the result inside home
    FsStatus contained_real_path(const std::string& store_path, FsError failure,
                                 const std::string& path, std::string& real) const;
    std::string to_store_path(const std::string& virtual_path) const;

    JailRoot& jail_root_;
    bool initialized_;
    std::string protocol_;
    std::string root_;
    std::string home_;
    std::string cwd_;
};

} // namespace decoyfs

#endif // decoyfs_FS_JAIL_HPP
