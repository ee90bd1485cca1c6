#pragma once
// Event loop abstraction (native window + main loop)

#include "Forward.hpp"
#include <functional>

namespace clipfolio {

class Runtime {
public:
    virtual ~Runtime() = default;

    // Creates the native window and registers the app:* commands.
    // Throws StartupError when the windowing system is unavailable.
    virtual void start(PluginHost& host) = 0;

    // Blocks until quit()
    virtual void run() = 0;
    virtual void quit() = 0;

    // Runs task on the event loop thread; callable from any thread
    virtual void post(std::function<void()> task) = 0;
};

} // namespace clipfolio
