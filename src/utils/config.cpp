#include "config.hpp"
#include "trustpath/error.hpp"
#include <fstream>

namespace trustpath::utils {

namespace {
    Config checked(json data, const std::string& source) {
        if (!data.is_object()) {
            throw ConfigException(ErrorCode::ConfigInvalid, "Config root must be an object: " + source);
        }
        Config config;
        for (auto it = data.begin(); it != data.end(); ++it) {
            config.set(it.key(), it.value());
        }
        return config;
    }
}

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigException(ErrorCode::ConfigInvalid, "Failed to open config file: " + path);
    }
    json data = json::parse(file, nullptr, false);
    if (data.is_discarded()) {
        throw ConfigException(ErrorCode::ConfigInvalid, "Failed to parse config file: " + path);
    }
    return checked(std::move(data), path);
}

Config Config::load_from_json(const std::string& json_str) {
    json data = json::parse(json_str, nullptr, false);
    if (data.is_discarded()) {
        throw ConfigException(ErrorCode::ConfigInvalid, "Failed to parse config JSON");
    }
    return checked(std::move(data), "<string>");
}

} // namespace trustpath::utils
