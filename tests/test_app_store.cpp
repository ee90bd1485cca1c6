/**
 * @file test_app_store.cpp
 * @brief Tests for the project tree, clipboard history and persistence.
 */

#include <gtest/gtest.h>
#include <chrono>

#include "TestSupport.hpp"
#include "clipfolio/AppStore.hpp"
#include "clipfolio/KeyValueStorage.hpp"
#include "clipfolio/ModelJson.hpp"

using namespace std::chrono_literals;
using clipfolio::AppStore;
using clipfolio::ClipboardContent;
using clipfolio::ContentType;
using clipfolio::KeyValueStorage;
using clipfolio::StoreOptions;
using clipfolio::test::TempDir;

// --------------------------- Defaults --------------------------------------

TEST(AppStore, Starts_With_Default_Project) {
    AppStore store(nullptr);
    store.load();

    auto projects = store.projects();
    ASSERT_EQ(projects.size(), 1u);
    EXPECT_EQ(projects[0].id, "p1");
    EXPECT_EQ(projects[0].name, "Personal");
    ASSERT_EQ(projects[0].folders.size(), 1u);
    EXPECT_EQ(projects[0].folders[0].id, "f1");
    EXPECT_TRUE(store.history().empty());
}

// --------------------------- History ---------------------------------------

TEST(AppStore, History_Newest_First_And_Classified) {
    AppStore store(nullptr);
    ASSERT_TRUE(store.processClipboardContent(ClipboardContent::text("hello")));
    ASSERT_TRUE(store.processClipboardContent(ClipboardContent::text("https://example.com")));

    auto history = store.history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].text, "https://example.com");
    EXPECT_EQ(history[0].contentType, ContentType::Url);
    EXPECT_EQ(history[1].contentType, ContentType::Text);
    EXPECT_NE(history[0].id, history[1].id);
}

TEST(AppStore, History_Ignores_Repeat_Of_Newest_Only) {
    AppStore store(nullptr);
    store.processClipboardContent(ClipboardContent::text("a"));
    EXPECT_FALSE(store.processClipboardContent(ClipboardContent::text("a")));
    store.processClipboardContent(ClipboardContent::text("b"));
    EXPECT_TRUE(store.processClipboardContent(ClipboardContent::text("a")));
    EXPECT_EQ(store.history().size(), 3u);
}

TEST(AppStore, History_Image_Entries) {
    AppStore store(nullptr);
    ASSERT_TRUE(store.processClipboardContent(ClipboardContent::image("img_1.png")));
    EXPECT_FALSE(store.processClipboardContent(ClipboardContent::image("img_1.png")));

    auto history = store.history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].contentType, ContentType::Image);
    EXPECT_EQ(history[0].text, "Image");
    EXPECT_EQ(history[0].imageData, "img_1.png");
}

TEST(AppStore, History_Is_Capped) {
    AppStore store(nullptr, StoreOptions{.maxHistoryItems = 3});
    for (int i = 0; i < 5; i++) {
        store.processClipboardContent(ClipboardContent::text("item " + std::to_string(i)));
    }
    auto history = store.history();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history.front().text, "item 4");
    EXPECT_EQ(history.back().text, "item 2");
}

TEST(AppStore, History_Delete_Favorite_Clear) {
    AppStore store(nullptr);
    store.processClipboardContent(ClipboardContent::text("one"));
    store.processClipboardContent(ClipboardContent::text("two"));
    store.processClipboardContent(ClipboardContent::text("three"));
    auto history = store.history();

    EXPECT_TRUE(store.toggleHistoryFavorite(history[0].id));
    EXPECT_TRUE(store.history()[0].isFavorite);
    EXPECT_FALSE(store.toggleHistoryFavorite("missing"));

    EXPECT_TRUE(store.deleteHistoryItem(history[1].id));
    EXPECT_FALSE(store.deleteHistoryItem(history[1].id));
    EXPECT_EQ(store.history().size(), 2u);

    EXPECT_EQ(store.deleteHistoryItems({history[0].id, history[2].id, "missing"}), 2u);
    EXPECT_TRUE(store.history().empty());

    store.processClipboardContent(ClipboardContent::text("four"));
    store.clearHistory();
    EXPECT_TRUE(store.history().empty());
}

// --------------------------- Project tree ----------------------------------

TEST(AppStore, Projects_Folders_Notes) {
    AppStore store(nullptr);
    std::string projectId = store.addProject("Work");
    auto folderId = store.addFolder(projectId, "Snippets");
    ASSERT_TRUE(folderId);

    auto noteId = store.addNote(projectId, *folderId, "const a = 1;", {"js"});
    ASSERT_TRUE(noteId);

    auto project = store.findProject(projectId);
    ASSERT_TRUE(project);
    ASSERT_EQ(project->folders.size(), 1u);
    ASSERT_EQ(project->folders[0].notes.size(), 1u);
    EXPECT_EQ(project->folders[0].notes[0].contentType, ContentType::Code);
    EXPECT_EQ(project->folders[0].notes[0].tags, std::vector<std::string>{"js"});

    EXPECT_TRUE(store.editNote(projectId, *folderId, *noteId, "plain words"));
    project = store.findProject(projectId);
    EXPECT_EQ(project->folders[0].notes[0].text, "plain words");
    EXPECT_EQ(project->folders[0].notes[0].contentType, ContentType::Text);
    // Tags survive when not given
    EXPECT_EQ(project->folders[0].notes[0].tags, std::vector<std::string>{"js"});

    EXPECT_TRUE(store.renameFolder(projectId, *folderId, "Code"));
    EXPECT_TRUE(store.renameProject(projectId, "Job"));
    project = store.findProject(projectId);
    EXPECT_EQ(project->name, "Job");
    EXPECT_EQ(project->folders[0].name, "Code");

    EXPECT_TRUE(store.deleteNote(projectId, *folderId, *noteId));
    EXPECT_FALSE(store.deleteNote(projectId, *folderId, *noteId));
    EXPECT_TRUE(store.deleteFolder(projectId, *folderId));
    EXPECT_TRUE(store.deleteProject(projectId));
    EXPECT_FALSE(store.findProject(projectId));
}

TEST(AppStore, Missing_Targets_Are_Rejected) {
    AppStore store(nullptr);
    EXPECT_FALSE(store.addFolder("nope", "x"));
    EXPECT_FALSE(store.addNote("p1", "nope", "x"));
    EXPECT_FALSE(store.editNote("p1", "f1", "nope", "x"));
    EXPECT_FALSE(store.renameProject("nope", "x"));
    EXPECT_FALSE(store.deleteFolder("p1", "nope"));
    EXPECT_FALSE(store.deleteProject("nope"));
}

TEST(AppStore, Copy_To_Project_Uses_General_Folder) {
    AppStore store(nullptr);
    store.processClipboardContent(ClipboardContent::text("keep me"));
    std::string itemId = store.history()[0].id;

    auto first = store.copyItemToProject(itemId, "p1");
    auto second = store.copyItemToProject(itemId, "p1");
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);

    auto project = store.findProject("p1");
    ASSERT_EQ(project->folders.size(), 2u);
    EXPECT_EQ(project->folders[1].name, "General");
    ASSERT_EQ(project->folders[1].notes.size(), 2u);
    EXPECT_EQ(project->folders[1].notes[0].text, "keep me");

    EXPECT_TRUE(store.copyItemToProject(itemId, "p1", std::string("f1")));
    EXPECT_EQ(store.findProject("p1")->folders[0].notes.size(), 1u);

    EXPECT_FALSE(store.copyItemToProject("missing", "p1"));
    EXPECT_FALSE(store.copyItemToProject(itemId, "missing"));
    EXPECT_FALSE(store.copyItemToProject(itemId, "p1", std::string("missing")));
}

TEST(AppStore, Global_Tags_Are_Unique) {
    AppStore store(nullptr);
    EXPECT_TRUE(store.addGlobalTag("work"));
    EXPECT_FALSE(store.addGlobalTag("work"));
    EXPECT_TRUE(store.addGlobalTag("home"));
    EXPECT_EQ(store.globalTags(), (std::vector<std::string>{"work", "home"}));
    EXPECT_TRUE(store.deleteGlobalTag("work"));
    EXPECT_FALSE(store.deleteGlobalTag("work"));
}

TEST(AppStore, OnChange_Fires_After_Mutation) {
    AppStore store(nullptr);
    int calls = 0;
    store.setOnChange([&] { calls++; });
    store.addProject("x");
    store.processClipboardContent(ClipboardContent::text("y"));
    EXPECT_FALSE(store.processClipboardContent(ClipboardContent::text("y")));
    EXPECT_EQ(calls, 2);
}

// --------------------------- Persistence -----------------------------------

TEST(AppStore, Persists_Through_Storage) {
    TempDir dir;
    {
        KeyValueStorage storage(dir.path());
        AppStore store(&storage, StoreOptions{.saveDebounce = 10ms});
        store.load();
        store.processClipboardContent(ClipboardContent::text("persist me"));
        store.addProject("Saved");
        store.addGlobalTag("t");
        store.flush();
    }

    KeyValueStorage storage(dir.path());
    AppStore reloaded(&storage);
    reloaded.load();
    ASSERT_EQ(reloaded.history().size(), 1u);
    EXPECT_EQ(reloaded.history()[0].text, "persist me");
    EXPECT_EQ(reloaded.projects().size(), 2u);
    EXPECT_EQ(reloaded.globalTags(), std::vector<std::string>{"t"});
}

TEST(AppStore, Malformed_Key_Falls_Back_To_Default) {
    TempDir dir;
    KeyValueStorage storage(dir.path());
    storage.save("projects", nlohmann::json{{"not", "an array"}});
    nlohmann::json history = nlohmann::json::array();
    history.push_back(nlohmann::json{{"id", "1"}, {"text", "ok"}});
    storage.save("history", history);

    AppStore store(&storage);
    store.load();
    ASSERT_EQ(store.projects().size(), 1u);
    EXPECT_EQ(store.projects()[0].id, "p1");
    ASSERT_EQ(store.history().size(), 1u);
    EXPECT_EQ(store.history()[0].text, "ok");
}
