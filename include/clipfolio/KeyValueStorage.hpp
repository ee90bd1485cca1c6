#pragma once
// Single Responsibility: JSON documents persisted one file per key

#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace clipfolio {

class KeyValueStorage {
public:
    // Creates the directory; throws StorageError if that fails
    explicit KeyValueStorage(std::filesystem::path directory);

    // nullopt when the key was never saved or its file is unreadable
    std::optional<nlohmann::json> load(const std::string& key) const;

    // Atomic replace (write temp file, rename); throws StorageError
    void save(const std::string& key, const nlohmann::json& value);

    std::filesystem::path pathFor(const std::string& key) const;
    const std::filesystem::path& directory() const { return m_directory; }

private:
    std::filesystem::path m_directory;
};

} // namespace clipfolio
