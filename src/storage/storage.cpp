// ==============================================================================
// storage.cpp - MemoryStorage и FileStorage
// ==============================================================================

#include "duet/storage.hpp"

#include "duet/platform.hpp"

#include <system_error>

namespace duet {

// ----------------------------------------------------------------------------
// MemoryStorage
// ----------------------------------------------------------------------------

bool MemoryStorage::save(const std::string& key, std::string_view text) {
    values_[key] = std::string(text);
    ++save_count_;
    return true;
}

std::optional<std::string> MemoryStorage::load(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryStorage::remove(const std::string& key) {
    values_.erase(key);
}

// ----------------------------------------------------------------------------
// FileStorage
// ----------------------------------------------------------------------------

FileStorage::FileStorage(std::filesystem::path directory) : directory_(std::move(directory)) {}

std::filesystem::path FileStorage::path_for(const std::string& key) const {
    return directory_ / platform::path_from_utf8(key + ".json");
}

bool FileStorage::save(const std::string& key, std::string_view text) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return false;
    }
    return platform::write_file_atomic(path_for(key), text);
}

std::optional<std::string> FileStorage::load(const std::string& key) const {
    return platform::read_file(path_for(key));
}

void FileStorage::remove(const std::string& key) {
    std::error_code ec;
    std::filesystem::remove(path_for(key), ec);
}

}  // namespace duet
