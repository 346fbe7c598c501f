#pragma once

#include "utils/logger.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace powgate::utils {

using json = nlohmann::json;

/**
 * Client configuration: a flat JSON object
 *
 * Files are merged over defaults(), so a file only needs the keys it
 * changes. Load failures throw std::runtime_error.
 */
class Config {
public:
    Config() = default;
    
    static Config defaults();
    static Config load_from_file(const std::string& path);
    static Config load_from_json(const std::string& json_str);
    
    // nullopt when the key is missing or holds another type
    template<typename T>
    std::optional<T> get(const std::string& key) const {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return std::nullopt;
        }
        try {
            return it->template get<T>();
        } catch (const json::type_error&) {
            return std::nullopt;
        }
    }
    
    template<typename T>
    T get_or(const std::string& key, const T& fallback) const {
        return get<T>(key).value_or(fallback);
    }
    
    template<typename T>
    void set(const std::string& key, const T& value) {
        data_[key] = value;
    }
    
    bool has(const std::string& key) const { return data_.contains(key); }
    const json& data() const { return data_; }
    
private:
    void merge(const json& overrides);
    
    json data_ = json::object();
};

/**
 * Settings read by the client, with defaults applied
 */
struct ClientSettings {
    std::string server_url;
    std::string login_path;
    std::string profile_path;
    uint32_t request_timeout_ms;
    std::string data_dir;       // token store lives under <data_dir>/session
    LogOptions log;
    
    static ClientSettings from_config(const Config& config);
};

} // namespace powgate::utils
