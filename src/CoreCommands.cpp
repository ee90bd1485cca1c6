#include "clipfolio/CoreCommands.hpp"
#include "clipfolio/AppStore.hpp"
#include "clipfolio/Backup.hpp"
#include "clipfolio/CommandRouter.hpp"
#include "clipfolio/Errors.hpp"
#include "clipfolio/ModelJson.hpp"
#include "clipfolio/Queries.hpp"

namespace fs = std::filesystem;

namespace clipfolio {

void registerCoreCommands(CommandRouter& router, AppStore& store, const fs::path& dataDir) {
    // history:list {search?, collection?: favorites|images|links|code}
    router.registerCommand("history:list", [&store](const json& args) -> json {
        std::string search = optionalString(args, "search").value_or("");
        auto collection = optionalString(args, "collection");
        auto history = store.history();

        if (!collection) return filterHistory(history, search);

        auto smart = smartCollections(history, search);
        if (*collection == "favorites") return smart.favorites;
        if (*collection == "images") return smart.images;
        if (*collection == "links") return smart.links;
        if (*collection == "code") return smart.code;
        throw CommandError("unknown collection '" + *collection + "'");
    });

    router.registerCommand("history:clear", [&store](const json&) -> json {
        store.clearHistory();
        return true;
    });

    router.registerCommand("history:delete", [&store](const json& args) -> json {
        return store.deleteHistoryItem(requireString(args, "id"));
    });

    router.registerCommand("history:favorite", [&store](const json& args) -> json {
        return store.toggleHistoryFavorite(requireString(args, "id"));
    });

    router.registerCommand("projects:list", [&store](const json&) -> json {
        return store.projects();
    });

    // backup:export {path?}; defaults to <data>/backup-YYYY-MM-DD.json
    router.registerCommand("backup:export", [&store, dataDir](const json& args) -> json {
        auto path = optionalString(args, "path");
        fs::path target = path ? fs::path(*path) : dataDir / defaultBackupFileName();
        writeBackupFile(store, target);
        return json{{"path", target.string()}};
    });

    router.registerCommand("backup:import", [&store](const json& args) -> json {
        readBackupFile(store, requireString(args, "path"));
        return json{
            {"history", store.history().size()},
            {"projects", store.projects().size()},
        };
    });
}

} // namespace clipfolio
