#include "clipfolio/KeyValueStorage.hpp"
#include "clipfolio/Errors.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace clipfolio {

KeyValueStorage::KeyValueStorage(fs::path directory)
    : m_directory(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(m_directory, ec);
    if (ec) {
        throw StorageError("cannot create storage directory " + m_directory.string() +
                           ": " + ec.message());
    }
}

fs::path KeyValueStorage::pathFor(const std::string& key) const {
    if (key.empty() || key.find('/') != std::string::npos || key.find("..") != std::string::npos) {
        throw StorageError("invalid storage key '" + key + "'");
    }
    return m_directory / (key + ".json");
}

std::optional<nlohmann::json> KeyValueStorage::load(const std::string& key) const {
    fs::path path = pathFor(key);
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;

    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::error("[Storage] Corrupt document {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

void KeyValueStorage::save(const std::string& key, const nlohmann::json& value) {
    fs::path path = pathFor(key);
    fs::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            throw StorageError("cannot open " + tmp.string() + " for writing");
        }
        file << value.dump();
        file.flush();
        if (!file.good()) {
            throw StorageError("write failed for " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw StorageError("cannot replace " + path.string());
    }
    spdlog::debug("[Storage] Saved {}", key);
}

} // namespace clipfolio
