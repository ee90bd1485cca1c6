#pragma once
// Single Responsibility: PNG files captured from the clipboard (<data>/images)

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace clipfolio {

class ImageStore {
public:
    // Creates the directory; throws StorageError if that fails
    explicit ImageStore(std::filesystem::path directory);

    // Writes the bytes as img_<ms>_<uuid>.png and returns the file name
    std::string save(std::string_view pngBytes);

    std::optional<std::string> load(const std::string& fileName) const;
    bool exists(const std::string& fileName) const;

    // Throws StorageError for names containing path separators
    std::filesystem::path pathFor(const std::string& fileName) const;
    const std::filesystem::path& directory() const { return m_directory; }

private:
    std::filesystem::path m_directory;
};

} // namespace clipfolio
