#pragma once
// Single Responsibility: GTK/GLib event loop, control socket and window lifetime

#include "Runtime.hpp"
#include <glib.h>
#include <memory>

namespace clipfolio {

class ControlServer;
class MainWindow;

class GtkRuntime : public Runtime {
public:
    explicit GtkRuntime(bool showOnStart = false);
    ~GtkRuntime() override;

    void start(PluginHost& host) override;
    void run() override;
    void quit() override;
    void post(std::function<void()> task) override;

private:
    void teardown();

    static gboolean onControlReadable(GIOChannel* channel, GIOCondition condition, gpointer data);
    static gboolean onQuitSignal(gpointer data);

    bool m_showOnStart;
    bool m_quitRequested = false;
    GMainLoop* m_loop = nullptr;
    PluginHost* m_host = nullptr;
    std::unique_ptr<MainWindow> m_window;
    std::unique_ptr<ControlServer> m_control;
    guint m_controlWatch = 0;
    guint m_sigint = 0;
    guint m_sigterm = 0;
};

} // namespace clipfolio
