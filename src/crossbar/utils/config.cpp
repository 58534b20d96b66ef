// src/crossbar/utils/config.cpp
#include "crossbar/utils/config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace crossbar {
namespace utils {

Config::Config(const Config& other) {
    std::lock_guard<std::mutex> lock(other.mutex_);
    values_ = other.values_;
}

Config& Config::operator=(const Config& other) {
    if (this != &other) {
        std::map<std::string, std::string> copy;
        {
            std::lock_guard<std::mutex> lock(other.mutex_);
            copy = other.values_;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        values_ = std::move(copy);
    }
    return *this;
}

bool Config::parse_value(const std::string& text, bool& out) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
        out = true;
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
        out = false;
        return true;
    }
    return false;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    load_from_stream(file);
    return true;
}

void Config::load_from_stream(std::istream& input) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();

    std::string line;
    while (std::getline(input, line)) {
        // Skip comments and empty lines
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }

        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);

        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t\r") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r") + 1);

        if (!key.empty()) {
            values_[key] = value;
        }
    }
}

std::optional<std::string> Config::raw(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.count(key) > 0;
}

std::vector<std::string> Config::keys_with_prefix(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (auto it = values_.lower_bound(prefix); it != values_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        keys.push_back(it->first);
    }
    return keys;
}

size_t Config::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
}

} // namespace utils
} // namespace crossbar
