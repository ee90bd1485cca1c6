#include "clipfolio/FsPlugin.hpp"
#include "clipfolio/AppContext.hpp"
#include "clipfolio/Base64.hpp"
#include "clipfolio/CommandRouter.hpp"
#include "clipfolio/Errors.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace clipfolio {

// Containment is checked on the canonical form so that symlinks inside the
// data directory cannot point the request somewhere else
fs::path resolveScoped(const fs::path& root, const std::string& relative) {
    if (relative.empty()) throw ScopeError("empty path not allowed");

    fs::path requested(relative);
    if (requested.is_absolute() || requested.has_root_name()) {
        throw ScopeError("absolute path not allowed: " + relative);
    }

    fs::path base = root.lexically_normal();
    fs::path resolved = (base / requested).lexically_normal();

    std::error_code ec;
    fs::path canonicalBase = fs::weakly_canonical(base, ec);
    if (ec) throw ScopeError("cannot resolve data directory: " + ec.message());
    fs::path canonicalResolved = fs::weakly_canonical(resolved, ec);
    if (ec) throw ScopeError("cannot resolve " + relative + ": " + ec.message());

    fs::path rel = canonicalResolved.lexically_relative(canonicalBase);
    if (rel.empty() || *rel.begin() == "..") {
        throw ScopeError("path escapes the data directory: " + relative);
    }
    if (rel == ".") throw ScopeError("path names the data directory itself: " + relative);
    return resolved;
}

static std::string readWhole(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) throw CommandError("cannot read " + path.string());
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

static void writeWhole(const fs::path& path, const std::string& contents) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) throw CommandError("cannot write " + path.string());
    file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!file.good()) throw CommandError("write failed for " + path.string());
}

void FsPlugin::setup(PluginHost& host) {
    fs::path root = host.context.dataDir;
    constexpr Capability cap = Capability::Filesystem;

    host.router.registerCommand("fs:exists", [root](const json& args) -> json {
        std::error_code ec;
        return fs::exists(resolveScoped(root, requireString(args, "path")), ec);
    }, cap);

    host.router.registerCommand("fs:mkdir", [root](const json& args) -> json {
        fs::path path = resolveScoped(root, requireString(args, "path"));
        std::error_code ec;
        fs::create_directories(path, ec);
        if (ec) throw CommandError("cannot create " + path.string() + ": " + ec.message());
        return true;
    }, cap);

    host.router.registerCommand("fs:read_text_file", [root](const json& args) -> json {
        return readWhole(resolveScoped(root, requireString(args, "path")));
    }, cap);

    host.router.registerCommand("fs:write_text_file", [root](const json& args) -> json {
        writeWhole(resolveScoped(root, requireString(args, "path")),
                   requireString(args, "contents"));
        return true;
    }, cap);

    // Binary contents travel as base64
    host.router.registerCommand("fs:read_file", [root](const json& args) -> json {
        return base64Encode(readWhole(resolveScoped(root, requireString(args, "path"))));
    }, cap);

    host.router.registerCommand("fs:write_file", [root](const json& args) -> json {
        fs::path path = resolveScoped(root, requireString(args, "path"));
        auto bytes = base64Decode(requireString(args, "data"));
        if (!bytes) throw CommandError("data is not valid base64");
        writeWhole(path, *bytes);
        return true;
    }, cap);

    // {path, recursive?}
    host.router.registerCommand("fs:remove", [root](const json& args) -> json {
        fs::path path = resolveScoped(root, requireString(args, "path"));
        bool recursive = args.value("recursive", false);
        std::error_code ec;
        bool removed = recursive ? fs::remove_all(path, ec) > 0 : fs::remove(path, ec);
        if (ec) throw CommandError("cannot remove " + path.string() + ": " + ec.message());
        return removed;
    }, cap);

    spdlog::debug("[Fs] Scoped to {}", root.string());
}

} // namespace clipfolio
