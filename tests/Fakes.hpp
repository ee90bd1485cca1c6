#pragma once
// In-memory stand-ins for the native services and the event loop

#include "TestSupport.hpp"
#include "clipfolio/AppContext.hpp"
#include "clipfolio/AppStore.hpp"
#include "clipfolio/ClipboardBackend.hpp"
#include "clipfolio/CommandRouter.hpp"
#include "clipfolio/ImageStore.hpp"
#include "clipfolio/KeyValueStorage.hpp"
#include "clipfolio/OpenerPlugin.hpp"
#include "clipfolio/Plugin.hpp"
#include "clipfolio/Runtime.hpp"
#include "clipfolio/Shortcut.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace clipfolio::test {

class FakeClipboard : public ClipboardBackend {
public:
    std::optional<std::string> readText() override {
        std::lock_guard<std::mutex> lock(mutex);
        return text;
    }
    bool writeText(std::string_view value) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (failWrites) return false;
        text = std::string(value);
        return true;
    }
    std::optional<std::string> readImage() override {
        std::lock_guard<std::mutex> lock(mutex);
        return image;
    }
    bool writeImage(std::string_view bytes) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (failWrites) return false;
        image = std::string(bytes);
        return true;
    }

    void setText(std::optional<std::string> value) {
        std::lock_guard<std::mutex> lock(mutex);
        text = std::move(value);
    }
    void setImage(std::optional<std::string> value) {
        std::lock_guard<std::mutex> lock(mutex);
        image = std::move(value);
    }

    std::mutex mutex;
    std::optional<std::string> text;
    std::optional<std::string> image;
    bool failWrites = false;
};

class FakeLauncher : public UrlLauncher {
public:
    bool open(const std::string& target) override {
        opened.push_back(target);
        return succeed;
    }

    std::vector<std::string> opened;
    bool succeed = true;
};

class FakeBinder : public ShortcutBinder {
public:
    bool bind(const Accelerator& accelerator) override {
        if (refuse) return false;
        bound.push_back(accelerator.toString());
        return true;
    }
    bool unbind(const Accelerator& accelerator) override {
        unbound.push_back(accelerator.toString());
        return true;
    }

    std::vector<std::string> bound;
    std::vector<std::string> unbound;
    bool refuse = false;
};

// Runs posted tasks inline; run() returns immediately unless a hook is set
class FakeRuntime : public Runtime {
public:
    void start(PluginHost& host) override {
        if (failStart) throw std::runtime_error("no display");
        started = true;
        commandsAtStart = host.router.commandNames();
        if (onStart) onStart(host);
    }
    void run() override {
        ran = true;
        if (onRun) onRun();
    }
    void quit() override { quitCalled = true; }
    void post(std::function<void()> task) override {
        std::lock_guard<std::mutex> lock(mutex);
        posted++;
        task();
    }

    std::function<void(PluginHost&)> onStart;
    std::function<void()> onRun;
    std::vector<std::string> commandsAtStart;
    bool failStart = false;
    bool started = false;
    bool ran = false;
    bool quitCalled = false;
    int posted = 0;
    std::mutex mutex;
};

// Everything a plugin's setup() needs, backed by a temp data directory
struct HostFixture {
    explicit HostFixture(std::set<Capability> permissions = allCapabilities())
        : storage(dir.path())
        , images(dir / "images")
        , store(&storage)
        , router(permissions) {
        context.dataDir = dir.path();
        context.permissions = std::move(permissions);
        context.monitorClipboard = false;
        context.clipboardPollMs = 20;
    }

    PluginHost host() {
        return PluginHost{router, storage, store, images, context, runtime};
    }

    TempDir dir;
    KeyValueStorage storage;
    ImageStore images;
    AppStore store;
    CommandRouter router;
    AppContext context;
    FakeRuntime runtime;
};

} // namespace clipfolio::test
