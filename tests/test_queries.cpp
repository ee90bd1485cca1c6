/**
 * @file test_queries.cpp
 * @brief Tests for search, smart collections and folder export.
 */

#include <gtest/gtest.h>

#include "clipfolio/Queries.hpp"

using namespace clipfolio;

static HistoryItem item(std::string id, std::string text, ContentType type,
                        bool favorite = false) {
    HistoryItem h;
    h.id = std::move(id);
    h.text = std::move(text);
    h.contentType = type;
    h.isFavorite = favorite;
    return h;
}

static NoteItem note(std::string id, std::string text, std::vector<std::string> tags = {}) {
    NoteItem n;
    n.id = std::move(id);
    n.text = std::move(text);
    n.tags = std::move(tags);
    return n;
}

// --------------------------- Search ----------------------------------------

TEST(Queries, Search_Is_Case_Insensitive) {
    EXPECT_TRUE(matchesSearch("Hello World", "world"));
    EXPECT_TRUE(matchesSearch("Hello World", "LO W"));
    EXPECT_TRUE(matchesSearch("anything", ""));
    EXPECT_FALSE(matchesSearch("Hello", "bye"));
}

TEST(Queries, FilterHistory_Keeps_Order) {
    std::vector<HistoryItem> history = {
        item("3", "Alpha beta", ContentType::Text),
        item("2", "gamma", ContentType::Text),
        item("1", "BETA release", ContentType::Text),
    };
    auto hits = filterHistory(history, "beta");
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].id, "3");
    EXPECT_EQ(hits[1].id, "1");
    EXPECT_EQ(filterHistory(history, "").size(), 3u);
}

TEST(Queries, SmartCollections_Group_By_Type) {
    std::vector<HistoryItem> history = {
        item("1", "https://a.example", ContentType::Url, true),
        item("2", "Image", ContentType::Image),
        item("3", "let x = 2", ContentType::Code),
        item("4", "note", ContentType::Text, true),
    };
    auto c = smartCollections(history);
    ASSERT_EQ(c.favorites.size(), 2u);
    EXPECT_EQ(c.favorites[0].id, "1");
    EXPECT_EQ(c.favorites[1].id, "4");
    ASSERT_EQ(c.images.size(), 1u);
    ASSERT_EQ(c.links.size(), 1u);
    ASSERT_EQ(c.code.size(), 1u);

    auto filtered = smartCollections(history, "example");
    EXPECT_EQ(filtered.favorites.size(), 1u);
    EXPECT_TRUE(filtered.code.empty());
}

// --------------------------- Folders ---------------------------------------

TEST(Queries, FilterFolders_By_Note_Text_Tag_And_Name) {
    Project project{"p", "P", {
        Folder{"a", "Recipes", {note("n1", "Pancakes"), note("n2", "Soup", {"dinner"})}},
        Folder{"b", "Dinner ideas", {note("n3", "Tacos")}},
        Folder{"c", "Misc", {note("n4", "nothing")}},
    }};

    auto byTag = filterFolders(project, "DINNER");
    ASSERT_EQ(byTag.size(), 2u);
    EXPECT_EQ(byTag[0].id, "a");
    ASSERT_EQ(byTag[0].notes.size(), 1u);
    EXPECT_EQ(byTag[0].notes[0].id, "n2");
    // Name match keeps the folder but only matching notes
    EXPECT_EQ(byTag[1].id, "b");
    EXPECT_TRUE(byTag[1].notes.empty());

    EXPECT_EQ(filterFolders(project, "").size(), 3u);
    EXPECT_TRUE(filterFolders(project, "zzz").empty());

    auto expand = foldersToExpand(project, "dinner");
    EXPECT_EQ(expand, (std::set<std::string>{"a", "b"}));
    EXPECT_TRUE(foldersToExpand(project, "").empty());
}

TEST(Queries, FolderClipboardText_Flattens_Lines) {
    NoteItem image = note("i", "Image");
    image.contentType = ContentType::Image;
    Folder folder{"f", "F", {note("1", "  first\r\nline  "), image, note("2", "a\nb\rc")}};

    auto text = folderClipboardText(folder);
    ASSERT_TRUE(text);
    EXPECT_EQ(*text, "first line\r\n[Image]\r\na b c");

    EXPECT_FALSE(folderClipboardText(Folder{"e", "Empty", {}}));
}
