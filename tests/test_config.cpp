/**
 * @file test_config.cpp
 * @brief Tests for the TOML-style config file and the derived app context.
 */

#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <iterator>

#include "TestSupport.hpp"
#include "clipfolio/AppContext.hpp"
#include "clipfolio/ConfigParser.hpp"
#include "clipfolio/Errors.hpp"

using namespace clipfolio;
using clipfolio::test::TempDir;

namespace {

// Points XDG_DATA_HOME at a temp dir for the lifetime of the fixture
class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* old = std::getenv("XDG_DATA_HOME");
        if (old) m_oldDataHome = old;
        ::setenv("XDG_DATA_HOME", m_dir.path().c_str(), 1);
    }

    void TearDown() override {
        if (m_oldDataHome.empty()) ::unsetenv("XDG_DATA_HOME");
        else ::setenv("XDG_DATA_HOME", m_oldDataHome.c_str(), 1);
    }

    TempDir m_dir;
    std::string m_oldDataHome;
};

} // namespace

TEST_F(ConfigTest, Missing_File_Gives_Defaults) {
    Config config = loadConfig((m_dir / "none.toml").string());
    EXPECT_EQ(config.maxHistoryItems, 50);
    EXPECT_EQ(config.toggleShortcut, "Super+V");
    EXPECT_TRUE(config.monitorClipboard);
    EXPECT_EQ(config.dataDir, (m_dir / "clipfolio").string());
    EXPECT_TRUE(std::filesystem::is_directory(config.dataDir));
}

TEST_F(ConfigTest, Parses_Keys_And_Skips_Junk) {
    std::ofstream(m_dir / "c.toml")
        << "# comment\n"
        << "[general]\n"
        << "max_history_items = 20\n"
        << "clipboard_poll_ms = abc\n"
        << "monitor_clipboard = false\n"
        << "toggle_shortcut = \"Ctrl+Shift+V\"\n"
        << "capabilities = \"clipboard,fs\"\n"
        << "unknown_key = 1\n"
        << "not a pair\n";

    Config config = loadConfig((m_dir / "c.toml").string());
    EXPECT_EQ(config.maxHistoryItems, 20);
    EXPECT_EQ(config.clipboardPollMs, 1000);
    EXPECT_FALSE(config.monitorClipboard);
    EXPECT_EQ(config.toggleShortcut, "Ctrl+Shift+V");
    EXPECT_EQ(config.capabilities, "clipboard,fs");
}

TEST_F(ConfigTest, Save_Then_Load) {
    Config config;
    config.configPath = (m_dir / "sub" / "clipfolio.toml").string();
    config.windowWidth = 500;
    config.alwaysOnTop = true;
    config.compositorPlugin = true;
    ASSERT_TRUE(saveConfig(config));

    Config loaded = loadConfig(config.configPath);
    EXPECT_EQ(loaded.windowWidth, 500);
    EXPECT_TRUE(loaded.alwaysOnTop);
    EXPECT_TRUE(loaded.compositorPlugin);
}

TEST_F(ConfigTest, Relocated_Data_Dir_Survives_Save) {
    Config config = loadConfig((m_dir / "none.toml").string());
    config.configPath = (m_dir / "clipfolio.toml").string();
    config.dataDir = (m_dir / "elsewhere").string();
    ASSERT_TRUE(saveConfig(config));

    Config loaded = loadConfig(config.configPath);
    EXPECT_EQ(loaded.dataDir, (m_dir / "elsewhere").string());
    EXPECT_TRUE(std::filesystem::is_directory(loaded.dataDir));
}

TEST_F(ConfigTest, Default_Data_Dir_Is_Not_Written) {
    Config config = loadConfig((m_dir / "none.toml").string());
    config.configPath = (m_dir / "clipfolio.toml").string();
    ASSERT_TRUE(saveConfig(config));

    std::ifstream file(config.configPath);
    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(contents.find("data_dir"), std::string::npos);
    EXPECT_EQ(loadConfig(config.configPath).dataDir, (m_dir / "clipfolio").string());
}

TEST_F(ConfigTest, Capability_List_Tolerates_Non_Ascii) {
    Config config = loadConfig((m_dir / "none.toml").string());
    config.capabilities = " clipboard ,\xc3\xa9t\xc3\xa9, fs\t";
    AppContext context = generateContext(config);
    EXPECT_EQ(context.permissions, (std::set<Capability>{Capability::Clipboard, Capability::Filesystem}));
}

// --------------------------- AppContext ------------------------------------

TEST_F(ConfigTest, Context_From_Config) {
    Config config = loadConfig((m_dir / "none.toml").string());
    config.capabilities = "clipboard,opener";
    config.clipboardPollMs = 5;

    AppContext context = generateContext(config);
    EXPECT_EQ(context.identifier, "io.clipfolio.app");
    EXPECT_EQ(context.version, CLIPFOLIO_VERSION);
    EXPECT_EQ(context.permissions, (std::set<Capability>{Capability::Clipboard, Capability::Opener}));
    EXPECT_GE(context.clipboardPollMs, 100);
    EXPECT_EQ(context.dataDir, std::filesystem::path(config.dataDir));
    EXPECT_NO_THROW(validateContext(context));
}

TEST_F(ConfigTest, Context_Validation) {
    AppContext context = generateContext(loadConfig((m_dir / "none.toml").string()));

    AppContext noId = context;
    noId.identifier.clear();
    EXPECT_THROW(validateContext(noId), StartupError);

    AppContext noDir = context;
    noDir.dataDir.clear();
    EXPECT_THROW(validateContext(noDir), StartupError);

    AppContext badWindow = context;
    badWindow.window.width = 0;
    EXPECT_THROW(validateContext(badWindow), StartupError);
}
