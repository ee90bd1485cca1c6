#include "clipfolio/ImageStore.hpp"
#include "clipfolio/Errors.hpp"
#include "clipfolio/Ids.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace clipfolio {

ImageStore::ImageStore(fs::path directory)
    : m_directory(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(m_directory, ec);
    if (ec) {
        throw StorageError("cannot create image directory " + m_directory.string() +
                           ": " + ec.message());
    }
}

fs::path ImageStore::pathFor(const std::string& fileName) const {
    if (fileName.empty() || fileName.find('/') != std::string::npos ||
        fileName.find('\\') != std::string::npos || fileName == "." || fileName == "..") {
        throw StorageError("invalid image name '" + fileName + "'");
    }
    return m_directory / fileName;
}

std::string ImageStore::save(std::string_view pngBytes) {
    if (pngBytes.empty()) throw StorageError("refusing to save an empty image");

    std::string fileName = "img_" + nextId() + "_" + generateUUID() + ".png";
    fs::path path = pathFor(fileName);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) throw StorageError("cannot open " + path.string() + " for writing");
    file.write(pngBytes.data(), static_cast<std::streamsize>(pngBytes.size()));
    if (!file.good()) throw StorageError("write failed for " + path.string());

    spdlog::debug("[Images] Saved {} ({} bytes)", fileName, pngBytes.size());
    return fileName;
}

std::optional<std::string> ImageStore::load(const std::string& fileName) const {
    std::ifstream file(pathFor(fileName), std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

bool ImageStore::exists(const std::string& fileName) const {
    std::error_code ec;
    return fs::is_regular_file(pathFor(fileName), ec);
}

} // namespace clipfolio
