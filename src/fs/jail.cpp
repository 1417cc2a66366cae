/*
 * decoyfs - Chroot jail implementation
 */
#include <decoyfs/fs/jail.hpp>
#include <decoyfs/core/logger.hpp>
#include <decoyfs/core/utils.hpp>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>

namespace decoyfs {

namespace {

const char* kOwnerPlaceholder = "owner";
const char* kGroupPlaceholder = "group";

std::string temp_base_dir() {
    const char* tmp = getenv("TMPDIR");
    if (tmp && tmp[0] != '\0') return std::string(tmp);
    return "/tmp";
}

} // namespace

// ============================================================================
// JailRoot
// ============================================================================

JailRoot::JailRoot()
    : owns_dir_(false)
    , keep_on_close_(false)
{}

JailRoot::~JailRoot() {
    close();
}

bool JailRoot::is_valid_protocol_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    for (size_t i = 0; i < name.size(); ++i) {
        if (name[i] == '/' || name[i] == '\0') return false;
    }
    return true;
}

bool JailRoot::open(const std::string& root_dir, bool keep_on_close) {
    if (is_open()) {
        close();
    }

    std::string dir = root_dir;
    owns_dir_ = false;
    if (dir.empty()) {
        std::string tmpl = join_path(temp_base_dir(), "decoyfs-XXXXXX");
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!mkdtemp(&buf[0])) {
            last_error_ = std::string("mkdtemp failed: ") + strerror(errno);
            LOG_ERROR("[JailRoot] %s", last_error_.c_str());
            return false;
        }
        dir = &buf[0];
        owns_dir_ = true;
    }

    FsStatus status = store_.open(dir, !owns_dir_);
    if (!status.is_ok()) {
        last_error_ = status.to_string();
        LOG_ERROR("[JailRoot] Cannot open %s: %s", dir.c_str(), last_error_.c_str());
        if (owns_dir_) {
            remove_tree(dir);
            owns_dir_ = false;
        }
        return false;
    }

    keep_on_close_ = keep_on_close;
    LOG_INFO("[JailRoot] Jail root at %s%s", store_.host_root().c_str(),
             owns_dir_ ? " (temporary)" : "");
    return true;
}

void JailRoot::close() {
    if (!is_open()) return;

    std::string dir = store_.host_root();
    std::set<std::string> claimed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        claimed.swap(protocols_);
    }

    if (keep_on_close_) {
        LOG_INFO("[JailRoot] Keeping jail tree at %s", dir.c_str());
    } else if (owns_dir_) {
        if (!remove_tree(dir)) {
            LOG_ERROR("[JailRoot] Failed to remove %s: %s", dir.c_str(), strerror(errno));
        }
    } else {
        for (std::set<std::string>::const_iterator it = claimed.begin(); it != claimed.end(); ++it) {
            std::string subtree = join_path(dir, *it);
            if (!remove_tree(subtree)) {
                LOG_ERROR("[JailRoot] Failed to remove %s: %s", subtree.c_str(), strerror(errno));
            }
        }
    }

    store_ = LocalStore();
    owns_dir_ = false;
}

FsStatus JailRoot::claim(const std::string& protocol) {
    if (!is_open()) {
        return FsStatus::fail(FsError::InvalidArgument, "jail root is not open");
    }
    if (!is_valid_protocol_name(protocol)) {
        return FsStatus::fail(FsError::InvalidArgument, "invalid protocol name '" + protocol + "'");
    }

    FsStatus status = store_.make_dir("/" + protocol);
    if (!status.is_ok()) {
        return status;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    protocols_.insert(protocol);
    return FsStatus::ok();
}

std::vector<std::string> JailRoot::protocols() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(protocols_.begin(), protocols_.end());
}

// ============================================================================
// StatInfo
// ============================================================================

bool StatInfo::is_dir() const { return S_ISDIR(mode); }
bool StatInfo::is_symlink() const { return S_ISLNK(mode); }

// ============================================================================
// ProtocolJail
// ============================================================================

ProtocolJail::ProtocolJail(JailRoot& root)
    : jail_root_(root)
    , initialized_(false)
    , root_("/")
    , cwd_("/")
{}

FsStatus ProtocolJail::initialize(const std::string& protocol, const std::string& source_dir) {
    if (initialized_) {
        return FsStatus::fail(FsError::AlreadyExists, "jail already initialized for " + protocol_);
    }

    // Mirroring a tree into a directory below itself would write into the
    // template and recurse without end
    char resolved[PATH_MAX];
    if (realpath(source_dir.c_str(), resolved) &&
        path_within(join_path(jail_root_.host_dir(), protocol), resolved)) {
        LOG_ERROR("[Jail] %s: jail root %s lies inside template %s",
                  protocol.c_str(), jail_root_.host_dir().c_str(), resolved);
        return FsStatus::fail(FsError::InvalidArgument,
                              "template " + source_dir + " contains the jail root");
    }

    FsStatus status = jail_root_.claim(protocol);
    if (!status.is_ok()) {
        LOG_ERROR("[Jail] Cannot create home for '%s': %s",
                  protocol.c_str(), status.to_string().c_str());
        return status;
    }

    std::string home = root_ + protocol;
    status = jail_root_.store().mirror_from(source_dir, home);
    if (!status.is_ok()) {
        return status;
    }

    protocol_ = protocol;
    home_ = home;
    cwd_ = "/";
    initialized_ = true;
    LOG_INFO("[Jail] %s: mirrored %s into %s", protocol.c_str(), source_dir.c_str(), home_.c_str());
    return FsStatus::ok();
}

bool ProtocolJail::resolve(const std::string& path, std::string& out) const {
    std::string combined = (!path.empty() && path[0] == '/') ? path : cwd_ + "/" + path;

    std::vector<std::string> parts = split(combined, '/');
    std::vector<std::string> stack;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].empty() || parts[i] == ".") continue;
        if (parts[i] == "..") {
            if (stack.empty()) {
                return false;
            }
            stack.pop_back();
            continue;
        }
        stack.push_back(parts[i]);
    }
    out = "/" + join(stack, "/");
    return true;
}

std::string ProtocolJail::to_store_path(const std::string& virtual_path) const {
    if (virtual_path == "/") return home_;
    return home_ + virtual_path;
}

FsStatus ProtocolJail::contained_real_path(const std::string& store_path, FsError failure,
                                           const std::string& path, std::string& real) const {
    FsStatus status = jail_root_.store().real_path(store_path, real);
    if (!status.is_ok()) {
        return status.code == FsError::IoError ? status : FsStatus::fail(failure, path);
    }
    if (!path_within(real, home_)) {
        LOG_WARN("[Jail] %s: '%s' resolves outside the jail", protocol_.c_str(), path.c_str());
        return FsStatus::fail(failure, path);
    }
    return FsStatus::ok();
}

FsStatus ProtocolJail::locate(const std::string& path, FsError failure,
                              std::string& virtual_path, std::string& store_path) const {
    if (!initialized_) {
        return FsStatus::fail(FsError::InvalidArgument, "jail is not initialized");
    }
    if (path.empty()) {
        return FsStatus::fail(failure, "empty path");
    }
    if (!resolve(path, virtual_path)) {
        LOG_WARN("[Jail] %s: escape attempt '%s' from cwd %s",
                 protocol_.c_str(), path.c_str(), cwd_.c_str());
        return FsStatus::fail(failure, path);
    }
    store_path = to_store_path(virtual_path);
    if (virtual_path == "/") {
        return FsStatus::ok();
    }

    // The final component is looked at without following it; everything
    // above it must not lead out of home through a symlink.
    std::string real_parent;
    return contained_real_path(parent_path(store_path), failure, path, real_parent);
}

FsStatus ProtocolJail::chdir(const std::string& path) {
    std::string virtual_path, store_path;
    FsStatus status = locate(path, FsError::NotADirectory, virtual_path, store_path);
    if (!status.is_ok()) return status;

    std::string real;
    status = contained_real_path(store_path, FsError::NotADirectory, path, real);
    if (!status.is_ok()) return status;

    EntryInfo info;
    status = jail_root_.store().get_info(real, info);
    if (!status.is_ok() || !info.is_dir()) {
        return FsStatus::fail(FsError::NotADirectory, path);
    }

    cwd_ = virtual_path;
    LOG_DEBUG("[Jail] %s: cwd -> %s", protocol_.c_str(), cwd_.c_str());
    return FsStatus::ok();
}

FsStatus ProtocolJail::stat(const std::string& path, StatInfo& out) const {
    std::string virtual_path, store_path;
    FsStatus status = locate(path, FsError::NotFound, virtual_path, store_path);
    if (!status.is_ok()) return status;

    EntryInfo info;
    status = jail_root_.store().get_info(store_path, info);
    if (!status.is_ok()) {
        if (status.code == FsError::NotFound || status.code == FsError::NotADirectory) {
            return FsStatus::fail(FsError::NotFound, path);
        }
        return status;
    }

    out.mode = info.mode;
    out.nlink = info.nlink;
    out.size = info.size;
    out.atime = info.atime;
    out.mtime = info.mtime;
    out.owner = kOwnerPlaceholder;
    out.group = kGroupPlaceholder;
    return FsStatus::ok();
}

FsStatus ProtocolJail::readlink(const std::string& path, std::string& target) const {
    std::string virtual_path, store_path;
    FsStatus status = locate(path, FsError::NotFound, virtual_path, store_path);
    if (!status.is_ok()) return status;

    status = jail_root_.store().read_link(store_path, target);
    if (status.code == FsError::NotADirectory) {
        return FsStatus::fail(FsError::NotFound, path);
    }
    return status;
}

FsStatus ProtocolJail::getmtime(const std::string& path, int64_t& mtime) const {
    StatInfo st;
    FsStatus status = stat(path, st);
    if (!status.is_ok()) return status;
    mtime = st.mtime;
    return FsStatus::ok();
}

FsStatus ProtocolJail::utime(const std::string& path, int64_t atime, int64_t mtime) {
    std::string virtual_path, store_path, real;
    FsStatus status = locate(path, FsError::NotFound, virtual_path, store_path);
    if (!status.is_ok()) return status;
    status = contained_real_path(store_path, FsError::NotFound, path, real);
    if (!status.is_ok()) return status;
    return jail_root_.store().set_times(real, atime, mtime);
}

FsStatus ProtocolJail::chmod(const std::string& path, uint32_t mode) {
    std::string virtual_path, store_path, real;
    FsStatus status = locate(path, FsError::NotFound, virtual_path, store_path);
    if (!status.is_ok()) return status;
    status = contained_real_path(store_path, FsError::NotFound, path, real);
    if (!status.is_ok()) return status;
    LOG_DEBUG("[Jail] %s: chmod %o %s", protocol_.c_str(), mode & 07777, virtual_path.c_str());
    return jail_root_.store().set_mode(real, mode);
}

FsStatus ProtocolJail::get_permissions(const std::string& path, uint32_t& mode) const {
    StatInfo st;
    FsStatus status = stat(path, st);
    if (!status.is_ok()) return status;
    mode = st.mode & 07777;
    return FsStatus::ok();
}

FsStatus ProtocolJail::set_permissions(const std::string& path, uint32_t mode) {
    return chmod(path, mode);
}

FsStatus ProtocolJail::listdir(const std::string& path, std::vector<std::string>& names) const {
    std::string virtual_path, store_path, real;
    FsStatus status = locate(path, FsError::NotADirectory, virtual_path, store_path);
    if (!status.is_ok()) return status;
    status = contained_real_path(store_path, FsError::NotADirectory, path, real);
    if (!status.is_ok()) return status;

    EntryInfo info;
    status = jail_root_.store().get_info(real, info);
    if (!status.is_ok() || !info.is_dir()) {
        return FsStatus::fail(FsError::NotADirectory, path);
    }
    return jail_root_.store().list_dir(real, names);
}

} // namespace decoyfs
