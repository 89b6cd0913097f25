// include/kestrel/utils/config.hpp
#pragma once
#include <string>
#include <map>
#include <vector>
#include <sstream>

namespace kestrel {
namespace utils {

// Flat key=value configuration. Lines starting with '#' are comments.
// Instances are plain values: each run loads and owns its own copy.
class Config {
private:
    std::map<std::string, std::string> values_;

    static std::string trim(const std::string& text);

public:
    Config() = default;

    // Load configuration from file, replacing current values
    bool load_from_file(const std::string& filename);

    // Parse configuration text, replacing current values.
    // Returns the number of key=value lines accepted.
    size_t load_from_string(const std::string& text);

    bool has(const std::string& key) const;

    // Get a value with default
    template<typename T>
    T get(const std::string& key, const T& default_value) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        std::istringstream iss(it->second);
        T value;
        if (!(iss >> value)) {
            return default_value;
        }

        return value;
    }

    // Specialized for string to avoid stringstream tokenizing on whitespace
    std::string get(const std::string& key, const std::string& default_value) const;
    std::string get(const std::string& key, const char* default_value) const;

    bool get_bool(const std::string& key, bool default_value) const;

    // Comma separated list, entries trimmed, empty entries dropped
    std::vector<std::string> get_list(const std::string& key) const;

    // All entries whose key starts with prefix, with the prefix stripped
    std::map<std::string, std::string> with_prefix(const std::string& prefix) const;

    template<typename T>
    void set(const std::string& key, const T& value) {
        std::ostringstream oss;
        oss << value;
        values_[key] = oss.str();
    }

    const std::map<std::string, std::string>& values() const { return values_; }
};

} // namespace utils
} // namespace kestrel
