// include/crossbar/utils/config.hpp
#pragma once
#include <crossbar/core/errors.hpp>
#include <istream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

namespace crossbar {
namespace utils {

/**
 * @brief Flat key=value configuration store.
 *
 * Lines starting with '#' are comments. Keys are dotted paths such as
 * "indicators.rsi.period". Lists are comma separated.
 */
class Config {
private:
    std::map<std::string, std::string> values_;
    mutable std::mutex mutex_;

    static bool parse_value(const std::string& text, std::string& out) {
        out = text;
        return true;
    }

    static bool parse_value(const std::string& text, bool& out);

    template<typename T>
    static bool parse_value(const std::string& text, T& out) {
        // Streams wrap "-1" into a huge unsigned value
        if (std::is_unsigned<T>::value && text.find('-') != std::string::npos) {
            return false;
        }
        std::istringstream iss(text);
        T value;
        if (!(iss >> value)) {
            return false;
        }
        iss >> std::ws;
        if (!iss.eof()) {
            return false;
        }
        out = value;
        return true;
    }

    std::optional<std::string> raw(const std::string& key) const;

public:
    Config() = default;
    Config(const Config& other);
    Config& operator=(const Config& other);

    // Load configuration from file
    bool load_from_file(const std::string& filename);
    void load_from_stream(std::istream& input);

    bool has(const std::string& key) const;

    // Get a value with default; malformed values fall back to the default
    template<typename T>
    T get(const std::string& key, const T& default_value) const {
        auto text = raw(key);
        if (!text) {
            return default_value;
        }
        T value;
        if (!parse_value(*text, value)) {
            return default_value;
        }
        return value;
    }

    std::string get(const std::string& key, const char* default_value) const {
        return get<std::string>(key, default_value);
    }

    // Default only when the key is absent; a present but malformed value throws
    template<typename T>
    T get_checked(const std::string& key, const T& default_value) const {
        if (!has(key)) {
            return default_value;
        }
        return require<T>(key);
    }

    // Get a value that must be present and well formed
    template<typename T>
    T require(const std::string& key) const {
        auto text = raw(key);
        if (!text) {
            throw core::ConfigurationError("missing required key '" + key + "'");
        }
        T value;
        if (!parse_value(*text, value)) {
            throw core::ConfigurationError("invalid value '" + *text + "' for key '" + key + "'");
        }
        return value;
    }

    // Comma separated list; an absent key yields the default
    template<typename T>
    std::vector<T> get_list(const std::string& key, const std::vector<T>& default_value) const {
        auto text = raw(key);
        if (!text) {
            return default_value;
        }
        std::vector<T> result;
        std::stringstream ss(*text);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item.erase(0, item.find_first_not_of(" \t"));
            item.erase(item.find_last_not_of(" \t") + 1);
            if (item.empty()) {
                continue;
            }
            T value;
            if (!parse_value(item, value)) {
                throw core::ConfigurationError("invalid list element '" + item + "' for key '" + key + "'");
            }
            result.push_back(value);
        }
        return result;
    }

    // Keys beginning with prefix, in sorted order
    std::vector<std::string> keys_with_prefix(const std::string& prefix) const;

    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << value;
        values_[key] = oss.str();
    }

    size_t size() const;
};

} // namespace utils
} // namespace crossbar
