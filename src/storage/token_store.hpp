#pragma once

#include "powgate/common.hpp"
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace powgate::storage {

/**
 * Key-value capability for small persisted secrets such as the session
 * token. The session manager is the only writer.
 */
class TokenStore {
public:
    virtual ~TokenStore() = default;
    
    /**
     * Read a value
     * @return Value or nullopt if absent or unreadable
     */
    virtual std::optional<std::string> get(const std::string& key) const = 0;
    
    /**
     * Store a value, replacing any previous one
     * @return True if successful
     */
    virtual bool set(const std::string& key, const std::string& value) = 0;
    
    /**
     * Remove a value. Removing an absent key succeeds.
     * @return True if the key is absent afterwards
     */
    virtual bool clear(const std::string& key) = 0;
};

/**
 * File-backed store, one file per key under a data directory.
 * Survives process restarts.
 */
class FileTokenStore : public TokenStore {
public:
    /**
     * @param data_dir Directory for token files (creates if doesn't exist)
     */
    explicit FileTokenStore(const std::filesystem::path& data_dir);
    
    std::optional<std::string> get(const std::string& key) const override;
    bool set(const std::string& key, const std::string& value) override;
    bool clear(const std::string& key) override;
    
    const std::filesystem::path& directory() const { return data_dir_; }
    
private:
    std::filesystem::path path_for(const std::string& key) const;
    
    std::filesystem::path data_dir_;
};

/**
 * In-process store, lost on exit
 */
class MemoryTokenStore : public TokenStore {
public:
    std::optional<std::string> get(const std::string& key) const override;
    bool set(const std::string& key, const std::string& value) override;
    bool clear(const std::string& key) override;
    
private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

} // namespace powgate::storage
