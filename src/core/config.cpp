#include <decoyfs/core/config.hpp>
#include <decoyfs/core/logger.hpp>
#include <decoyfs/core/utils.hpp>

#include <fstream>
#include <sstream>

namespace decoyfs {

Config::Config() : root_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream in(path.c_str());
    if (!in) {
        last_error_ = "cannot open " + path;
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (!load_string(buffer.str())) {
        LOG_ERROR("[Config] %s: %s", path.c_str(), last_error_.c_str());
        return false;
    }
    source_path_ = path;
    LOG_DEBUG("[Config] Loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    try {
        Json parsed = Json::parse(text);
        if (!parsed.is_object()) {
            last_error_ = "top-level JSON value must be an object";
            return false;
        }
        root_ = parsed;
    } catch (const Json::parse_error& e) {
        last_error_ = e.what();
        return false;
    }
    last_error_.clear();
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* node = find(key);
    if (!node || !node->is_string()) return default_val;
    return node->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* node = find(key);
    if (!node || !node->is_number_integer()) return default_val;
    return node->get<int64_t>();
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* node = find(key);
    if (!node || !node->is_boolean()) return default_val;
    return node->get<bool>();
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

std::vector<std::string> Config::keys(const std::string& key) const {
    std::vector<std::string> out;
    const Json* node = find(key);
    if (!node || !node->is_object()) return out;
    for (Json::const_iterator it = node->begin(); it != node->end(); ++it) {
        out.push_back(it.key());
    }
    return out;
}

void Config::set_string(const std::string& key, const std::string& value) {
    std::vector<std::string> parts = split(key, '.');
    if (parts.empty()) return;
    Json* node = &root_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        Json& child = (*node)[parts[i]];
        if (!child.is_object()) child = Json::object();
        node = &child;
    }
    (*node)[parts.back()] = value;
}

} // namespace decoyfs
