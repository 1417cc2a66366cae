#include <decoyfs/core/logger.hpp>
#include <decoyfs/core/utils.hpp>

#include <cstring>
#include <unistd.h>

namespace decoyfs {

static const char* get_color_code(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[34m"; // Blue
        case LogLevel::INFO: return "\033[32m";  // Green
        case LogLevel::WARN: return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m"; // Red
        default: return "\033[0m"; // Reset
    }
}

static const char* get_level_str(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

// "decoyfs::ProtocolJail::chdir(const string&)" -> {"ProtocolJail", "chdir"}
static std::pair<std::string, std::string> extract_class_and_function(const char* pretty_function) {
    std::string pf = pretty_function;
    
    size_t paren_pos = pf.find('(');
    if (paren_pos == std::string::npos) {
        return std::make_pair(std::string(), std::string());
    }
    
    std::string signature = pf.substr(0, paren_pos);
    
    size_t last_colon = signature.rfind("::");
    if (last_colon == std::string::npos) {
        size_t space_pos = signature.rfind(' ');
        std::string func_name = (space_pos != std::string::npos) ? signature.substr(space_pos + 1) : signature;
        return std::make_pair(std::string(), func_name);
    }
    
    std::string func_name = signature.substr(last_colon + 2);
    
    std::string before_last_colon = signature.substr(0, last_colon);
    size_t space_pos = before_last_colon.rfind(' ');
    std::string class_name = (space_pos != std::string::npos)
        ? before_last_colon.substr(space_pos + 1)
        : before_last_colon;
    
    size_t template_pos = class_name.find('<');
    if (template_pos != std::string::npos) {
        class_name = class_name.substr(0, template_pos);
    }
    if (!class_name.empty() && class_name[0] == '*') {
        class_name = class_name.substr(1);
    }
    if (starts_with(class_name, "decoyfs::")) {
        class_name = class_name.substr(9);
    }
    // Free functions in the namespace leave only the namespace behind
    if (class_name == "decoyfs") {
        class_name.clear();
    }
    
    return std::make_pair(class_name, func_name);
}

LogLevel parse_log_level(const std::string& name) {
    std::string lower = to_lower(trim(name));
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) { level_.store(level); }

LogLevel Logger::level() const { return level_.load(); }

void Logger::set_output(FILE* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out ? out : stderr;
}

Logger::Logger() : level_(LogLevel::INFO), out_(stderr) {}

void Logger::write(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...) {
    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);

    std::lock_guard<std::mutex> lock(mutex_);

    bool color = isatty(fileno(out_)) != 0;
    const char* level_color = color ? get_color_code(level) : "";
    const char* func_color = color ? "\033[36m" : "";
    const char* location_color = color ? "\033[33m" : "";
    const char* reset = color ? "\033[0m" : "";
    const char* level_str = get_level_str(level);

    if (level_ == LogLevel::DEBUG) {
        const char* slash = strrchr(file, '/');
        file = slash ? slash + 1 : file;
        std::pair<std::string, std::string> names = extract_class_and_function(func);
        if (!names.first.empty()) {
            fprintf(out_, "[%s] %s[%s]%s %s(%s::%s)%s at %s%s:%d%s ",
                    timestamp, level_color, level_str, reset,
                    func_color, names.first.c_str(), names.second.c_str(), reset,
                    location_color, file, line, reset);
        } else {
            fprintf(out_, "[%s] %s[%s]%s %s(%s)%s at %s%s:%d%s ",
                    timestamp, level_color, level_str, reset,
                    func_color, names.second.c_str(), reset,
                    location_color, file, line, reset);
        }
    } else {
        fprintf(out_, "[%s] %s[%s]%s ", timestamp, level_color, level_str, reset);
    }
    va_list args;
    va_start(args, fmt);
    vfprintf(out_, fmt, args);
    va_end(args);
    fprintf(out_, "\n");
    fflush(out_);
}

} // namespace decoyfs
