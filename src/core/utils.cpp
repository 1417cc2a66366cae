#include <decoyfs/core/utils.hpp>
#include <algorithm>
#include <numeric>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <ftw.h>
#include <errno.h>

namespace decoyfs {

// ============ Time utilities ============

int64_t current_timestamp() {
    return static_cast<int64_t>(std::time(NULL));
}

int64_t current_timestamp_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

std::string format_timestamp(int64_t timestamp) {
    time_t t = static_cast<time_t>(timestamp);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return std::string(buf);
}

std::string format_local_timestamp(int64_t timestamp) {
    time_t t = static_cast<time_t>(timestamp);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf);
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    return rtrim(ltrim(s));
}

std::string ltrim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return s.substr(start);
}

std::string rtrim(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\n\r");
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && 
           std::equal(prefix.begin(), prefix.end(), s.begin());
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";
    return std::accumulate(
        std::next(parts.begin()), parts.end(), parts[0],
        [&](const std::string& a, const std::string& b) {
            return a + delimiter + b;
        });
}

// ASCII spelling of U+00C0..U+00FF, lowercase; NULL where the character is
// punctuation (multiplication and division signs)
static const char* const latin1_folds[64] = {
    "a", "a", "a", "a", "a", "a", "ae", "c",    // C0-C7
    "e", "e", "e", "e", "i", "i", "i", "i",     // C8-CF
    "d", "n", "o", "o", "o", "o", "o", NULL,    // D0-D7
    "o", "u", "u", "u", "u", "y", "th", "ss",   // D8-DF
    "a", "a", "a", "a", "a", "a", "ae", "c",    // E0-E7
    "e", "e", "e", "e", "i", "i", "i", "i",     // E8-EF
    "d", "n", "o", "o", "o", "o", "o", NULL,    // F0-F7
    "o", "u", "u", "u", "u", "y", "th", "y"     // F8-FF
};

std::string slugify(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pending_sep = false;

    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == '\'') {
            continue;
        }

        const char* word = NULL;
        char ascii[2] = {0, 0};
        if (c < 0x80 && std::isalnum(c)) {
            ascii[0] = static_cast<char>(std::tolower(c));
            word = ascii;
        } else if (c == 0xC3 && i + 1 < text.size()) {
            unsigned char next = static_cast<unsigned char>(text[i + 1]);
            if (next >= 0x80 && next <= 0xBF) {
                word = latin1_folds[next - 0x80];
                ++i;
            }
        }

        if (word) {
            if (pending_sep && !out.empty()) {
                out.push_back('-');
            }
            pending_sep = false;
            out += word;
        } else {
            // Punctuation, whitespace, control and other non-ASCII bytes separate
            pending_sep = true;
        }
    }
    return out;
}

std::string to_hex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

// ============ Path utilities ============

std::string normalize_path(const std::string& path) {
    if (path.empty()) return path;
    
    std::vector<std::string> parts = split(path, '/');
    std::vector<std::string> result;
    
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].empty() || parts[i] == ".") {
            continue;
        }
        if (parts[i] == "..") {
            if (!result.empty() && result.back() != "..") {
                result.pop_back();
            } else if (path[0] != '/') {
                result.push_back("..");
            }
        } else {
            result.push_back(parts[i]);
        }
    }
    
    std::string normalized = join(result, "/");
    if (path[0] == '/') {
        normalized = "/" + normalized;
    }
    
    return normalized.empty() ? "." : normalized;
}

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;
    
    bool a_ends_slash = a.back() == '/';
    bool b_starts_slash = b[0] == '/';
    
    if (a_ends_slash && b_starts_slash) {
        return a + b.substr(1);
    }
    if (!a_ends_slash && !b_starts_slash) {
        return a + "/" + b;
    }
    return a + b;
}

std::string parent_path(const std::string& path) {
    size_t pos = path.rfind('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

bool path_within(const std::string& path, const std::string& base) {
    if (base == "/") return !path.empty() && path[0] == '/';
    if (path.size() < base.size() || path.compare(0, base.size(), base) != 0) {
        return false;
    }
    return path.size() == base.size() || path[base.size()] == '/';
}

std::string expand_home(const std::string& path) {
    if (path != "~" && !starts_with(path, "~/")) return path;
    const char* home = getenv("HOME");
    std::string base = (home && home[0] != '\0') ? std::string(home) : "/tmp";
    return base + path.substr(1);
}

bool ensure_directory(const std::string& path) {
    if (path.empty()) return false;
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    size_t pos = path.rfind('/');
    if (pos != std::string::npos && pos > 0) {
        if (!ensure_directory(path.substr(0, pos))) {
            return false;
        }
    }
    return mkdir(path.c_str(), 0700) == 0 || errno == EEXIST;
}

bool create_parent_directory(const std::string& filepath) {
    size_t pos = filepath.rfind('/');
    if (pos == std::string::npos || pos == 0) return true; // No directory component
    return ensure_directory(filepath.substr(0, pos));
}

static int remove_entry(const char* path, const struct stat* /*st*/, int /*flag*/, struct FTW* /*ftw*/) {
    return ::remove(path);
}

bool remove_tree(const std::string& path) {
    return nftw(path.c_str(), remove_entry, 32, FTW_DEPTH | FTW_PHYS) == 0;
}

} // namespace decoyfs
