#include <docpipe/core/config.hpp>
#include <docpipe/core/logger.hpp>
#include <docpipe/core/utils.hpp>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace docpipe {

Config::Config() : data_(Json::object()) {}

Config::Config(const Json& data) : data_(data.is_object() ? data : Json::object()) {}

bool Config::load_file(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        LOG_INFO("[Config] No config file at '%s', using defaults", path.c_str());
        return true;
    }

    std::ifstream in(path.c_str());
    if (!in) {
        LOG_ERROR("[Config] Cannot open config file '%s'", path.c_str());
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    if (!load_string(ss.str())) {
        LOG_ERROR("[Config] Failed to parse '%s'", path.c_str());
        return false;
    }
    LOG_INFO("[Config] Loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    Json parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        LOG_ERROR("[Config] Configuration must be a JSON object");
        return false;
    }
    data_ = parsed;
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::find_or_create(const std::string& key) {
    Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* v = find(key);
    if (v && v->is_string()) return v->get<std::string>();
    return default_val;
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* v = find(key);
    if (v && v->is_number_integer()) return v->get<int64_t>();
    if (v && v->is_number_float()) return static_cast<int64_t>(v->get<double>());
    return default_val;
}

double Config::get_double(const std::string& key, double default_val) const {
    const Json* v = find(key);
    if (v && v->is_number()) return v->get<double>();
    return default_val;
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* v = find(key);
    if (v && v->is_boolean()) return v->get<bool>();
    return default_val;
}

void Config::set_string(const std::string& key, const std::string& value) {
    find_or_create(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    find_or_create(key) = value;
}

const Json* Config::get_object(const std::string& key) const {
    const Json* v = find(key);
    return (v && v->is_object()) ? v : nullptr;
}

} // namespace docpipe
