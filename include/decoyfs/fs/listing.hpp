/*
 * decoyfs - "ls -lA" directory listing
 *
 * Lines match proftpd / GNU ls long format byte for byte:
 *
 *   -rw-r--r--   1 owner    group     7045120 Sep 02  2022 music.mp3
 *   drwxr-xr-x   2 owner    group        4096 Oct 15 14:05 pub
 *   lrwxrwxrwx   1 owner    group          11 Oct 15 14:05 latest -> pub/v2.tar
 *
 * Entries are rendered in the order given; nothing is sorted or filtered.
 */
#ifndef decoyfs_FS_LISTING_HPP
#define decoyfs_FS_LISTING_HPP

#include <decoyfs/fs/jail.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace decoyfs {

// Entries modified longer ago than this show the year instead of the time
const int64_t kListingRecentWindow = 180 * 24 * 60 * 60;

// Ten character type + rwx string, "drwxr-sr-t" style special bits included
std::string format_mode(uint32_t mode);

// "Sep 02 03:47" when within the recent window of now, else "Sep 02  2022" (UTC)
std::string format_listing_time(int64_t mtime, int64_t now);

// One CRLF-terminated line. display_name already carries any " -> target".
std::string format_listing_line(const StatInfo& st, const std::string& display_name, int64_t now);

class DirListing {
public:
    DirListing(const ProtocolJail& jail, const std::string& basedir,
               const std::vector<std::string>& names, int64_t now);

    bool has_next() const { return pos_ < names_.size(); }
    size_t position() const { return pos_; }
    size_t size() const { return names_.size(); }

    // Stat (and readlink) the next entry and render it. A failing entry is
    // reported and then skipped over, so the caller decides whether to go on.
    FsStatus next(std::string& line);

    // Render the remaining entries, stopping at the first failure
    FsStatus read_all(std::string& out);

private:
    const ProtocolJail* jail_;
    std::string basedir_;
    std::vector<std::string> names_;
    int64_t now_;
    size_t pos_;
};

} // namespace decoyfs

#endif // decoyfs_FS_LISTING_HPP
