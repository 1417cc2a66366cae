#ifndef decoyfs_CORE_UTILS_HPP
#define decoyfs_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace decoyfs {

// ============ Time utilities ============

// Get current Unix timestamp in seconds
int64_t current_timestamp();

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Format timestamp as ISO 8601 string (YYYY-MM-DDTHH:MM:SSZ)
std::string format_timestamp(int64_t timestamp);

// Format timestamp in local time as "YYYY-MM-DD HH:MM:SS"
std::string format_local_timestamp(int64_t timestamp);

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

std::string to_lower(const std::string& s);
std::string to_upper(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Lowercase ASCII token: alphanumeric runs joined by '-', apostrophes dropped,
// no leading/trailing separator. UTF-8 Latin-1 letters fold to ASCII
// ("R\xc3\xa9sum\xc3\xa9" -> "resume"); other non-ASCII text separates.
// "Bob's Music.MP3" -> "bobs-music-mp3"
std::string slugify(const std::string& text);

// Lowercase hex encoding of raw bytes
std::string to_hex(const unsigned char* data, size_t len);

// ============ Path utilities ============

// Normalize path (resolve . and ..)
std::string normalize_path(const std::string& path);

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// "/a/b/c" -> "/a/b", "/a" -> "/"
std::string parent_path(const std::string& path);

// True if path equals base or lies below it ("/ftp" contains "/ftp/x", not "/ftpx")
bool path_within(const std::string& path, const std::string& base);

// Expand a leading "~/" using $HOME
std::string expand_home(const std::string& path);

// Create a directory and its parents (mode 0700 for created components)
bool ensure_directory(const std::string& path);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

// Remove a directory tree without following symlinks
bool remove_tree(const std::string& path);

} // namespace decoyfs

#endif // decoyfs_CORE_UTILS_HPP
