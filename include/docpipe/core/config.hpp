/*
 * docpipe C++17 - Configuration
 *
 * JSON configuration file with dotted-key access ("pipeline.max_concurrent_jobs").
 * Getters never throw; a missing or mistyped key yields the default.
 */
#ifndef docpipe_CORE_CONFIG_HPP
#define docpipe_CORE_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace docpipe {

using Json = nlohmann::json;

class Config {
public:
    Config();
    explicit Config(const Json& data);

    // Load from file. A missing file keeps the defaults and returns true;
    // unreadable or malformed JSON returns false.
    bool load_file(const std::string& path);
    bool load_string(const std::string& text);

    std::string get_string(const std::string& key, const std::string& default_val) const;
    int64_t get_int(const std::string& key, int64_t default_val) const;
    double get_double(const std::string& key, double default_val) const;
    bool get_bool(const std::string& key, bool default_val) const;

    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);

    // Sub-object at the dotted key, or null
    const Json* get_object(const std::string& key) const;

    const Json& data() const { return data_; }

private:
    const Json* find(const std::string& key) const;
    Json& find_or_create(const std::string& key);

    Json data_;
};

} // namespace docpipe

#endif // docpipe_CORE_CONFIG_HPP
