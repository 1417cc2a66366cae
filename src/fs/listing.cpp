#include <decoyfs/fs/listing.hpp>
#include <decoyfs/fs/commands.hpp>
#include <decoyfs/core/utils.hpp>

#include <cstdio>
#include <ctime>
#include <sys/stat.h>

namespace decoyfs {

std::string format_mode(uint32_t mode) {
    std::string s(10, '-');

    switch (mode & S_IFMT) {
        case S_IFLNK:  s[0] = 'l'; break;
        case S_IFSOCK: s[0] = 's'; break;
        case S_IFBLK:  s[0] = 'b'; break;
        case S_IFDIR:  s[0] = 'd'; break;
        case S_IFCHR:  s[0] = 'c'; break;
        case S_IFIFO:  s[0] = 'p'; break;
        default: break;
    }

    if (mode & S_IRUSR) s[1] = 'r';
    if (mode & S_IWUSR) s[2] = 'w';
    if (mode & S_ISUID) s[3] = (mode & S_IXUSR) ? 's' : 'S';
    else if (mode & S_IXUSR) s[3] = 'x';

    if (mode & S_IRGRP) s[4] = 'r';
    if (mode & S_IWGRP) s[5] = 'w';
    if (mode & S_ISGID) s[6] = (mode & S_IXGRP) ? 's' : 'S';
    else if (mode & S_IXGRP) s[6] = 'x';

    if (mode & S_IROTH) s[7] = 'r';
    if (mode & S_IWOTH) s[8] = 'w';
    if (mode & S_ISVTX) s[9] = (mode & S_IXOTH) ? 't' : 'T';
    else if (mode & S_IXOTH) s[9] = 'x';

    return s;
}

std::string format_listing_time(int64_t mtime, int64_t now) {
    time_t t = static_cast<time_t>(mtime);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);

    const char* fmt = (now - mtime) > kListingRecentWindow ? "%d  %Y" : "%d %H:%M";
    char buf[32];
    strftime(buf, sizeof(buf), fmt, &tm_buf);

    const char* month = month_abbrev(tm_buf.tm_mon + 1);
    return std::string(month ? month : "???") + " " + buf;
}

std::string format_listing_line(const StatInfo& st, const std::string& display_name, int64_t now) {
    char prefix[128];
    snprintf(prefix, sizeof(prefix), "%s %3llu %-8s %-8s %8lld ",
             format_mode(st.mode).c_str(),
             static_cast<unsigned long long>(st.nlink),
             st.owner.c_str(), st.group.c_str(),
             static_cast<long long>(st.size));

    std::string line(prefix);
    line += format_listing_time(st.mtime, now);
    line += ' ';
    line += display_name;
    line += "\r\n";
    return line;
}

// ============================================================================
// DirListing
// ============================================================================

DirListing::DirListing(const ProtocolJail& jail, const std::string& basedir,
                       const std::vector<std::string>& names, int64_t now)
    : jail_(&jail)
    , basedir_(basedir)
    , names_(names)
    , now_(now)
    , pos_(0)
{}

FsStatus DirListing::next(std::string& line) {
    if (!has_next()) {
        return FsStatus::fail(FsError::NotFound, "listing exhausted");
    }
    const std::string& name = names_[pos_++];
    std::string path = join_path(basedir_, name);

    StatInfo st;
    FsStatus status = jail_->stat(path, st);
    if (!status.is_ok()) return status;

    std::string display = name;
    if (st.is_symlink()) {
        std::string target;
        status = jail_->readlink(path, target);
        if (!status.is_ok()) return status;
        display += " -> " + target;
    }

    line = format_listing_line(st, display, now_);
    return FsStatus::ok();
}

FsStatus DirListing::read_all(std::string& out) {
    while (has_next()) {
        std::string line;
        FsStatus status = next(line);
        if (!status.is_ok()) return status;
        out += line;
    }
    return FsStatus::ok();
}

// Declared in jail.hpp; defined here where DirListing is complete
DirListing ProtocolJail::format_list(const std::string& basedir, const std::vector<std::string>& names) const {
    return DirListing(*this, basedir, names, current_timestamp());
}

DirListing ProtocolJail::format_list(const std::string& basedir, const std::vector<std::string>& names,
                                     int64_t now) const {
    return DirListing(*this, basedir, names, now);
}

} // namespace decoyfs
