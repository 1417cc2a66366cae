/*
 * decoyfs - Configuration
 *
 * JSON configuration with dotted-path lookups ("capture.data_dir").
 */
#ifndef decoyfs_CORE_CONFIG_HPP
#define decoyfs_CORE_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace decoyfs {

typedef nlohmann::json Json;

class Config {
public:
    Config();

    // Load from a JSON file. Returns false if the file is missing or malformed.
    bool load_file(const std::string& path);
    bool load_string(const std::string& text);

    std::string get_string(const std::string& key, const std::string& default_val = "") const;
    int64_t get_int(const std::string& key, int64_t default_val = 0) const;
    bool get_bool(const std::string& key, bool default_val = false) const;
    bool has(const std::string& key) const;

    // Keys of an object node ("protocols" -> {"ftp", "tftp"}); empty if absent
    std::vector<std::string> keys(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);

    const std::string& source_path() const { return source_path_; }
    const std::string& last_error() const { return last_error_; }

private:
    const Json* find(const std::string& key) const;

    Json root_;
    std::string source_path_;
    std::string last_error_;
};

} // namespace decoyfs

#endif // decoyfs_CORE_CONFIG_HPP
