/**
 * @file test_command_router.cpp
 * @brief Tests for command dispatch, permissions, the line protocol and the
 *        history/projects/backup commands.
 */

#include <gtest/gtest.h>

#include "Fakes.hpp"
#include "clipfolio/CoreCommands.hpp"
#include "clipfolio/Errors.hpp"

using namespace clipfolio;
using clipfolio::test::TempDir;
using nlohmann::json;

// --------------------------- Dispatch --------------------------------------

TEST(CommandRouter, Invoke_And_Unknown) {
    CommandRouter router({});
    router.registerCommand("echo", [](const json& args) -> json { return args; });

    EXPECT_TRUE(router.hasCommand("echo"));
    EXPECT_EQ(router.invoke("echo", json{{"a", 1}}), (json{{"a", 1}}));
    // Null arguments become an empty object
    EXPECT_EQ(router.invoke("echo", nullptr), json::object());
    EXPECT_THROW(router.invoke("nope"), CommandError);

    EXPECT_TRUE(router.removeCommand("echo"));
    EXPECT_FALSE(router.removeCommand("echo"));
    EXPECT_FALSE(router.hasCommand("echo"));
}

TEST(CommandRouter, Capability_Gate) {
    CommandRouter router({Capability::Clipboard});
    router.registerCommand("clip", [](const json&) -> json { return 1; }, Capability::Clipboard);
    router.registerCommand("fs", [](const json&) -> json { return 2; }, Capability::Filesystem);

    EXPECT_TRUE(router.isPermitted(Capability::Clipboard));
    EXPECT_FALSE(router.isPermitted(Capability::Filesystem));
    EXPECT_EQ(router.invoke("clip"), 1);
    EXPECT_THROW(router.invoke("fs"), CommandError);
}

TEST(CommandRouter, Json_Errors_Become_CommandError) {
    CommandRouter router({});
    router.registerCommand("typed", [](const json& args) -> json {
        return args.at("n").get<int>() + 1;
    });
    EXPECT_EQ(router.invoke("typed", json{{"n", 1}}), 2);
    EXPECT_THROW(router.invoke("typed", json{{"n", "x"}}), CommandError);
    EXPECT_THROW(router.invoke("typed"), CommandError);
}

TEST(CommandRouter, Argument_Helpers) {
    json args = {{"s", "v"}, {"n", 3}, {"z", nullptr}};
    EXPECT_EQ(requireString(args, "s"), "v");
    EXPECT_THROW(requireString(args, "n"), CommandError);
    EXPECT_THROW(requireString(args, "missing"), CommandError);
    EXPECT_EQ(optionalString(args, "s"), "v");
    EXPECT_FALSE(optionalString(args, "z"));
    EXPECT_FALSE(optionalString(args, "missing"));
    EXPECT_THROW(optionalString(args, "n"), CommandError);
}

// --------------------------- Line protocol ---------------------------------

TEST(CommandRouter, HandleLine_Replies) {
    CommandRouter router({});
    router.registerCommand("add", [](const json& args) -> json {
        return args.value("a", 0) + args.value("b", 0);
    });
    router.registerCommand("boom", [](const json&) -> json {
        throw std::runtime_error("kaput");
    });

    json ok = json::parse(router.handleLine("add {\"a\":2,\"b\":3}"));
    EXPECT_EQ(ok["status"], "ok");
    EXPECT_EQ(ok["data"], 5);

    json noArgs = json::parse(router.handleLine("add"));
    EXPECT_EQ(noArgs["data"], 0);

    json badJson = json::parse(router.handleLine("add {oops"));
    EXPECT_EQ(badJson["status"], "error");

    json unknown = json::parse(router.handleLine("missing {}"));
    EXPECT_EQ(unknown["status"], "error");
    EXPECT_NE(unknown["message"].get<std::string>().find("unknown command"), std::string::npos);

    json raised = json::parse(router.handleLine("boom"));
    EXPECT_EQ(raised["status"], "error");
    EXPECT_EQ(raised["message"], "kaput");
}

// --------------------------- Core commands ---------------------------------

TEST(CoreCommands, History_Commands) {
    AppStore store(nullptr);
    CommandRouter router({});
    registerCoreCommands(router, store, "/tmp");

    store.processClipboardContent(ClipboardContent::text("hello"));
    store.processClipboardContent(ClipboardContent::text("https://example.com"));

    json all = router.invoke("history:list");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(router.invoke("history:list", json{{"search", "HELLO"}}).size(), 1u);
    EXPECT_EQ(router.invoke("history:list", json{{"collection", "links"}}).size(), 1u);
    EXPECT_THROW(router.invoke("history:list", json{{"collection", "music"}}), CommandError);

    std::string id = all[0]["id"].get<std::string>();
    EXPECT_EQ(router.invoke("history:favorite", json{{"id", id}}), true);
    EXPECT_EQ(router.invoke("history:list", json{{"collection", "favorites"}}).size(), 1u);
    EXPECT_EQ(router.invoke("history:delete", json{{"id", id}}), true);
    EXPECT_EQ(router.invoke("history:delete", json{{"id", id}}), false);
    EXPECT_THROW(router.invoke("history:delete"), CommandError);

    router.invoke("history:clear");
    EXPECT_TRUE(store.history().empty());
    EXPECT_EQ(router.invoke("projects:list")[0]["id"], "p1");
}

TEST(CoreCommands, Backup_Export_Import) {
    TempDir dir;
    AppStore store(nullptr);
    CommandRouter router({});
    registerCoreCommands(router, store, dir.path());

    store.processClipboardContent(ClipboardContent::text("saved"));
    json exported = router.invoke("backup:export");
    std::string path = exported["path"].get<std::string>();
    EXPECT_EQ(std::filesystem::path(path).parent_path(), dir.path());
    EXPECT_TRUE(std::filesystem::exists(path));

    store.clearHistory();
    json imported = router.invoke("backup:import", json{{"path", path}});
    EXPECT_EQ(imported["history"], 1);
    EXPECT_EQ(imported["projects"], 1);
    EXPECT_EQ(store.history()[0].text, "saved");

    EXPECT_THROW(router.invoke("backup:import", json{{"path", (dir / "none.json").string()}}),
                 ImportError);
}
