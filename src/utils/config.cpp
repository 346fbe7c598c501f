#include "config.hpp"
#include "powgate/common.hpp"
#include <fstream>
#include <stdexcept>

namespace powgate::utils {

Config Config::defaults() {
    Config config;
    config.set("server_url", std::string(constants::DEFAULT_SERVER_URL));
    config.set("login_path", std::string(constants::DEFAULT_LOGIN_PATH));
    config.set("profile_path", std::string(constants::DEFAULT_PROFILE_PATH));
    config.set("request_timeout_ms", constants::DEFAULT_REQUEST_TIMEOUT_MS);
    config.set("data_dir", std::string("./data"));
    config.set("log_level", std::string("info"));
    config.set("log_to_file", false);
    config.set("log_file", std::string("powgate.log"));
    return config;
}

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    
    json parsed;
    try {
        file >> parsed;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file: " + std::string(e.what()));
    }
    
    Config config = defaults();
    config.merge(parsed);
    return config;
}

Config Config::load_from_json(const std::string& json_str) {
    json parsed;
    try {
        parsed = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse JSON: " + std::string(e.what()));
    }
    
    Config config = defaults();
    config.merge(parsed);
    return config;
}

void Config::merge(const json& overrides) {
    if (!overrides.is_object()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }
    for (auto it = overrides.begin(); it != overrides.end(); ++it) {
        data_[it.key()] = it.value();
    }
}

ClientSettings ClientSettings::from_config(const Config& config) {
    ClientSettings settings;
    settings.server_url = config.get_or<std::string>("server_url", constants::DEFAULT_SERVER_URL);
    settings.login_path = config.get_or<std::string>("login_path", constants::DEFAULT_LOGIN_PATH);
    settings.profile_path = config.get_or<std::string>("profile_path", constants::DEFAULT_PROFILE_PATH);
    settings.request_timeout_ms = config.get_or<uint32_t>("request_timeout_ms",
                                                          constants::DEFAULT_REQUEST_TIMEOUT_MS);
    settings.data_dir = config.get_or<std::string>("data_dir", "./data");
    settings.log.level = config.get_or<std::string>("log_level", "info");
    settings.log.log_to_file = config.get_or<bool>("log_to_file", false);
    settings.log.file_path = config.get_or<std::string>("log_file", "powgate.log");
    return settings;
}

} // namespace powgate::utils
