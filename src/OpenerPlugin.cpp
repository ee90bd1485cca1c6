#include "clipfolio/OpenerPlugin.hpp"
#include "clipfolio/CommandRouter.hpp"
#include "clipfolio/ContentDetector.hpp"
#include "clipfolio/Errors.hpp"
#include "clipfolio/Process.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>

using json = nlohmann::json;

namespace clipfolio {

bool XdgOpenLauncher::open(const std::string& target) {
    spdlog::debug("[Opener] xdg-open {}", target);
    return spawnDetached({"xdg-open", target});
}

OpenerPlugin::OpenerPlugin(std::shared_ptr<UrlLauncher> launcher)
    : m_launcher(std::move(launcher)) {
}

void OpenerPlugin::setup(PluginHost& host) {
    if (!m_launcher) throw StartupError("opener plugin has no launcher");
    auto launcher = m_launcher;

    host.router.registerCommand("opener:open_url", [launcher](const json& args) -> json {
        std::string url = trimCopy(requireString(args, "url"));
        if (!isSafeUrl(url)) throw CommandError("refusing to open '" + url + "': not an http(s) URL");
        if (!launcher->open(url)) throw CommandError("could not open " + url);
        return true;
    }, Capability::Opener);

    host.router.registerCommand("opener:open_path", [launcher](const json& args) -> json {
        std::string path = requireString(args, "path");
        std::error_code ec;
        if (path.empty() || !std::filesystem::exists(path, ec)) {
            throw CommandError("no such file or directory: " + path);
        }
        if (!launcher->open(path)) throw CommandError("could not open " + path);
        return true;
    }, Capability::Opener);
}

} // namespace clipfolio
