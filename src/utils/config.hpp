#pragma once

#include <string>
#include <optional>
#include <type_traits>
#include <nlohmann/json.hpp>

namespace trustpath::utils {

using json = nlohmann::json;

/**
 * Flat key/value configuration backed by a JSON object
 *
 * Typed reads are strict: a negative number never reads as an unsigned
 * field and a fraction never reads as an integer.
 */
class Config {
public:
    Config() = default;

    /**
     * Load configuration from a JSON file
     * @throws ConfigException if the file is unreadable or not a JSON object
     */
    static Config load_from_file(const std::string& path);

    /**
     * Load configuration from a JSON string
     * @throws ConfigException if the text is not a JSON object
     */
    static Config load_from_json(const std::string& json_str);

    // Absent keys and type mismatches yield nullopt
    template<typename T>
    std::optional<T> get(const std::string& key) const {
        if (!has(key)) {
            return std::nullopt;
        }
        const json& value = data_.at(key);
        if (!holds<T>(value)) {
            return std::nullopt;
        }
        return value.get<T>();
    }

    template<typename T>
    T get_or(const std::string& key, const T& default_value) const {
        return get<T>(key).value_or(default_value);
    }

    template<typename T>
    void set(const std::string& key, const T& value) {
        data_[key] = value;
    }

    bool has(const std::string& key) const {
        return data_.is_object() && data_.contains(key);
    }

    const json& data() const { return data_; }

private:
    template<typename T>
    static bool holds(const json& value) {
        if constexpr (std::is_same_v<T, bool>) {
            return value.is_boolean();
        } else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
            return value.is_number_unsigned();
        } else if constexpr (std::is_integral_v<T>) {
            return value.is_number_integer();
        } else if constexpr (std::is_floating_point_v<T>) {
            return value.is_number();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return value.is_string();
        } else {
            return !value.is_null();
        }
    }

    json data_ = json::object();
};

} // namespace trustpath::utils
