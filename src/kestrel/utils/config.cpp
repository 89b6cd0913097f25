// src/kestrel/utils/config.cpp
#include "kestrel/utils/config.hpp"
#include "kestrel/utils/logger.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>

namespace kestrel {
namespace utils {

std::string Config::trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        Logger::warn() << "Config file not found: " << filename << Logger::endl;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    size_t accepted = load_from_string(buffer.str());

    Logger::info() << "Loaded " << accepted << " config entries from " << filename << Logger::endl;
    return true;
}

size_t Config::load_from_string(const std::string& text) {
    values_.clear();

    std::istringstream input(text);
    std::string line;
    size_t accepted = 0;
    while (std::getline(input, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Parse key=value
        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            Logger::warn() << "Ignoring config line without '=': " << line << Logger::endl;
            continue;
        }

        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));
        if (key.empty()) {
            continue;
        }

        values_[key] = value;
        ++accepted;
    }
    return accepted;
}

bool Config::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

std::string Config::get(const std::string& key, const std::string& default_value) const {
    auto it = values_.find(key);
    return (it != values_.end()) ? it->second : default_value;
}

std::string Config::get(const std::string& key, const char* default_value) const {
    return get(key, std::string(default_value));
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return default_value;
    }

    std::string lowered = it->second;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1") {
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") {
        return false;
    }
    return default_value;
}

std::vector<std::string> Config::get_list(const std::string& key) const {
    std::vector<std::string> items;
    auto it = values_.find(key);
    if (it == values_.end()) {
        return items;
    }

    std::stringstream ss(it->second);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::map<std::string, std::string> Config::with_prefix(const std::string& prefix) const {
    std::map<std::string, std::string> result;
    for (auto it = values_.lower_bound(prefix); it != values_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        result[it->first.substr(prefix.size())] = it->second;
    }
    return result;
}

} // namespace utils
} // namespace kestrel
