#include "provmark/config.hpp"

#include <fstream>
#include <limits>

#include "provmark/errors.hpp"

namespace ProvMark {

namespace {

int64_t read_integer(const nlohmann::json& j, const char* key, int64_t fallback, int64_t min, int64_t max) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        throw MalformedInput(std::string("Config value must be an integer: ") + key);
    }
    const int64_t value = it->get<int64_t>();
    if (value < min || value > max) {
        throw MalformedInput(std::string("Config value out of range: ") + key);
    }
    return value;
}

} // namespace

ServerConfig ServerConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw MalformedInput("Config must be a JSON object.");
    }

    ServerConfig config;
    config.port = static_cast<uint16_t>(read_integer(j, "port", config.port, 1, 65535));
    config.similarity_threshold =
        static_cast<int>(read_integer(j, "similarity_threshold", config.similarity_threshold, 0, 64));
    config.action_window_ms = read_integer(j, "action_window_ms", config.action_window_ms, 1000,
                                           std::numeric_limits<int64_t>::max());
    config.list_limit = static_cast<size_t>(read_integer(j, "list_limit", static_cast<int64_t>(config.list_limit), 1,
                                                         std::numeric_limits<int32_t>::max()));

    auto path = j.find("store_path");
    if (path != j.end() && !path->is_null()) {
        if (!path->is_string()) {
            throw MalformedInput("Config value must be a string: store_path");
        }
        config.store_path = path->get<std::string>();
    }
    return config;
}

ServerConfig ServerConfig::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw RuntimeError("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedInput("Config file " + path + " is not valid JSON: " + e.what());
    }
    return from_json(j);
}

ServiceOptions ServerConfig::service_options() const {
    ServiceOptions options;
    options.similarity_threshold = similarity_threshold;
    options.action_window_millis = action_window_ms;
    options.list_limit = list_limit;
    return options;
}

} // namespace ProvMark
