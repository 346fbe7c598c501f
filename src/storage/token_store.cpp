#include "storage/token_store.hpp"
#include "powgate/error.hpp"
#include "utils/logger.hpp"
#include <fstream>
#include <iterator>
#include <system_error>

namespace powgate::storage {

// FileTokenStore implementation

FileTokenStore::FileTokenStore(const std::filesystem::path& data_dir)
    : data_dir_(data_dir) {
    std::error_code ec;
    std::filesystem::create_directories(data_dir_, ec);
    if (ec) {
        throw StorageException(ErrorCode::StorageWriteFailed,
                               "cannot create " + data_dir_.string() + ": " + ec.message());
    }
    
    POWGATE_LOG_DEBUG("Token store initialized at: {}", data_dir_.string());
}

std::filesystem::path FileTokenStore::path_for(const std::string& key) const {
    // Simple key to filename (escape special chars)
    std::string safe_key = key;
    for (char& c : safe_key) {
        if (c == '/' || c == '\\' || c == ':' || c == '.') {
            c = '_';
        }
    }
    return data_dir_ / (safe_key + ".token");
}

std::optional<std::string> FileTokenStore::get(const std::string& key) const {
    auto path = path_for(key);
    
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        POWGATE_LOG_ERROR("Failed to open token file: {}", path.string());
        return std::nullopt;
    }
    
    std::string value((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        POWGATE_LOG_ERROR("Failed to read token file: {}", path.string());
        return std::nullopt;
    }
    
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

bool FileTokenStore::set(const std::string& key, const std::string& value) {
    auto path = path_for(key);
    auto tmp_path = path;
    tmp_path += ".tmp";
    
    std::error_code ec;
    
    // Owner-only before the token is written
    {
        std::ofstream create(tmp_path, std::ios::binary | std::ios::trunc);
        if (!create) {
            POWGATE_LOG_ERROR("Failed to create token file: {}", tmp_path.string());
            return false;
        }
    }
    std::filesystem::permissions(tmp_path,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        POWGATE_LOG_ERROR("Could not restrict permissions on {}: {}", tmp_path.string(), ec.message());
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            POWGATE_LOG_ERROR("Failed to open token file: {}", tmp_path.string());
            std::filesystem::remove(tmp_path, ec);
            return false;
        }
        
        file.write(value.data(), static_cast<std::streamsize>(value.size()));
        if (!file) {
            POWGATE_LOG_ERROR("Failed to write token file: {}", tmp_path.string());
            std::filesystem::remove(tmp_path, ec);
            return false;
        }
    }
    
    // Rename so a reader never sees a partial token
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        POWGATE_LOG_ERROR("Failed to replace token file {}: {}", path.string(), ec.message());
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    
    return true;
}

bool FileTokenStore::clear(const std::string& key) {
    auto path = path_for(key);
    
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        POWGATE_LOG_ERROR("Failed to delete token file: {} ({})", path.string(), ec.message());
        return false;
    }
    
    return true;
}

// MemoryTokenStore implementation

std::optional<std::string> MemoryTokenStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryTokenStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
    return true;
}

bool MemoryTokenStore::clear(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.erase(key);
    return true;
}

} // namespace powgate::storage
