/**
 * @file test_app_builder.cpp
 * @brief Tests for plugin assembly per target platform and the startup /
 *        shutdown sequence of AppBuilder::run.
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <fstream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_sinks.h>

#include "Fakes.hpp"
#include "clipfolio/AppBuilder.hpp"
#include "clipfolio/Errors.hpp"

using namespace clipfolio;
using clipfolio::test::FakeBinder;
using clipfolio::test::FakeClipboard;
using clipfolio::test::FakeLauncher;
using clipfolio::test::FakeRuntime;
using clipfolio::test::TempDir;
using nlohmann::json;

namespace {

PlatformServices fakeServices(std::shared_ptr<FakeBinder> binder = std::make_shared<FakeBinder>()) {
    return PlatformServices{
        .clipboard = std::make_shared<FakeClipboard>(),
        .launcher = std::make_shared<FakeLauncher>(),
        .shortcuts = std::move(binder),
    };
}

AppContext testContext(const TempDir& dir) {
    AppContext context;
    context.dataDir = dir.path();
    context.permissions = allCapabilities();
    context.monitorClipboard = false;
    context.saveDebounceMs = 10;
    return context;
}

// Appends its lifecycle events to a log owned by the test
class RecordingPlugin : public Plugin {
public:
    RecordingPlugin(Capability cap, bool failSetup, std::vector<std::string>& log)
        : m_cap(cap), m_failSetup(failSetup), m_log(log) {}

    std::string name() const override { return std::string("recording-") + capabilityName(m_cap); }
    Capability capability() const override { return m_cap; }

    void setup(PluginHost&) override {
        if (m_failSetup) throw std::runtime_error("setup refused");
        m_log.push_back("setup " + name());
    }
    void shutdown() override { m_log.push_back("shutdown " + name()); }

private:
    Capability m_cap;
    bool m_failSetup;
    std::vector<std::string>& m_log;
};

} // namespace

// --------------------------- Assembly --------------------------------------

TEST(AppBuilder, Desktop_Targets_Get_Global_Shortcuts) {
    EXPECT_EQ(makeBuilder<TargetPlatform::Linux>(fakeServices()).capabilities(), allCapabilities());
    EXPECT_EQ(makeBuilder<TargetPlatform::Windows>(fakeServices()).capabilities(), allCapabilities());
    EXPECT_EQ(makeBuilder<TargetPlatform::MacOS>(fakeServices()).capabilities(), allCapabilities());
}

TEST(AppBuilder, Mobile_Targets_Skip_Global_Shortcuts) {
    auto android = makeBuilder<TargetPlatform::Android>(fakeServices());
    auto ios = makeBuilder<TargetPlatform::IOS>(fakeServices());

    std::set<Capability> expected{Capability::Clipboard, Capability::Opener, Capability::Filesystem};
    EXPECT_EQ(android.capabilities(), expected);
    EXPECT_EQ(ios.capabilities(), expected);
    EXPECT_FALSE(android.hasCapability(Capability::GlobalShortcut));
    EXPECT_EQ(android.pluginNames(), (std::vector<std::string>{"clipboard", "opener", "fs"}));
}

TEST(AppBuilder, Duplicate_Capability_Is_Ignored) {
    std::vector<std::string> log;
    AppBuilder builder;
    builder.plugin(std::make_unique<RecordingPlugin>(Capability::Clipboard, false, log))
        .plugin(std::make_unique<ClipboardPlugin>(std::make_shared<FakeClipboard>()))
        .plugin(nullptr);
    EXPECT_EQ(builder.pluginNames(), std::vector<std::string>{"recording-clipboard"});
}

// --------------------------- Run -------------------------------------------

TEST(AppBuilder, Run_Sets_Up_Plugins_Then_Shuts_Down) {
    TempDir dir;
    AppContext context = testContext(dir);
    context.toggleShortcut = "Super+V";

    auto binder = std::make_shared<FakeBinder>();
    auto builder = makeBuilder<TargetPlatform::Linux>(fakeServices(binder));

    FakeRuntime runtime;
    runtime.onStart = [](PluginHost& host) {
        host.store.processClipboardContent(ClipboardContent::text("during run"));
        EXPECT_EQ(host.router.invoke("global_shortcut:is_registered",
                                     json{{"shortcut", "Super+V"}}), true);
    };
    builder.run(context, runtime);

    EXPECT_TRUE(runtime.started);
    EXPECT_TRUE(runtime.ran);
    for (const char* command : {"history:list", "backup:export", "clipboard:read_text",
                                "opener:open_url", "fs:read_text_file",
                                "global_shortcut:register"}) {
        EXPECT_NE(std::find(runtime.commandsAtStart.begin(), runtime.commandsAtStart.end(),
                            command), runtime.commandsAtStart.end()) << command;
    }

    // Shortcut released on shutdown, store flushed to disk
    EXPECT_EQ(binder->unbound, std::vector<std::string>{"Super+V"});
    EXPECT_TRUE(std::filesystem::exists(dir / "history.json"));
    EXPECT_TRUE(std::filesystem::is_directory(dir / "images"));
}

TEST(AppBuilder, Plugin_Failure_Unwinds_Ready_Plugins) {
    TempDir dir;
    std::vector<std::string> log;
    AppBuilder builder;
    builder.plugin(std::make_unique<RecordingPlugin>(Capability::Clipboard, false, log))
        .plugin(std::make_unique<RecordingPlugin>(Capability::Opener, false, log))
        .plugin(std::make_unique<RecordingPlugin>(Capability::Filesystem, true, log));

    FakeRuntime runtime;
    EXPECT_THROW(builder.run(testContext(dir), runtime), StartupError);
    EXPECT_FALSE(runtime.started);
    EXPECT_EQ(log, (std::vector<std::string>{
        "setup recording-clipboard", "setup recording-opener",
        "shutdown recording-opener", "shutdown recording-clipboard"}));
}

TEST(AppBuilder, Runtime_Failure_Is_A_Startup_Error) {
    TempDir dir;
    std::vector<std::string> log;
    AppBuilder builder;
    builder.plugin(std::make_unique<RecordingPlugin>(Capability::Clipboard, false, log));

    FakeRuntime runtime;
    runtime.failStart = true;
    EXPECT_THROW(builder.run(testContext(dir), runtime), StartupError);
    EXPECT_EQ(log.back(), "shutdown recording-clipboard");
    EXPECT_FALSE(runtime.ran);
}

TEST(AppBuilder, Invalid_Context_Is_A_Startup_Error) {
    TempDir dir;
    AppContext context = testContext(dir);
    context.dataDir.clear();
    FakeRuntime runtime;
    AppBuilder builder = makeBuilder<TargetPlatform::Linux>(fakeServices());
    EXPECT_THROW(builder.run(context, runtime), StartupError);

    AppContext unwritable = testContext(dir);
    std::ofstream(dir / "file") << "x";
    unwritable.dataDir = dir / "file" / "data";
    EXPECT_THROW(builder.run(unwritable, runtime), StartupError);
}

// --------------------------- runOrExit -------------------------------------

TEST(AppBuilder, RunOrExit_Returns_After_Clean_Run) {
    TempDir dir;
    FakeRuntime runtime;
    AppBuilder builder = makeBuilder<TargetPlatform::Linux>(fakeServices());
    runOrExit(builder, testContext(dir), runtime);
    EXPECT_TRUE(runtime.ran);
}

TEST(AppBuilderDeathTest, RunOrExit_Exits_With_Status_One) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    TempDir dir;

    EXPECT_EXIT({
        spdlog::set_default_logger(spdlog::stderr_logger_mt("death"));
        FakeRuntime runtime;
        runtime.failStart = true;
        AppBuilder builder = makeBuilder<TargetPlatform::Linux>(fakeServices());
        runOrExit(builder, testContext(dir), runtime);
    }, ::testing::ExitedWithCode(1), "error while running application: cannot create window");

    EXPECT_EXIT({
        spdlog::set_default_logger(spdlog::stderr_logger_mt("death"));
        FakeRuntime runtime;
        AppContext context = testContext(dir);
        context.identifier.clear();
        AppBuilder builder = makeBuilder<TargetPlatform::Linux>(fakeServices());
        runOrExit(builder, context, runtime);
    }, ::testing::ExitedWithCode(1), "error while running application");
}
