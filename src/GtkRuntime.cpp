// Standalone GTK4 process: one window, a Unix control socket and the GLib loop

#include "clipfolio/GtkRuntime.hpp"
#include "clipfolio/AppContext.hpp"
#include "clipfolio/CommandRouter.hpp"
#include "clipfolio/ControlSocket.hpp"
#include "clipfolio/Errors.hpp"
#include "clipfolio/MainWindow.hpp"
#include "clipfolio/Plugin.hpp"
#include <gtk/gtk.h>
#include <glib-unix.h>
#include <spdlog/spdlog.h>
#include <csignal>

using json = nlohmann::json;

namespace clipfolio {

GtkRuntime::GtkRuntime(bool showOnStart)
    : m_showOnStart(showOnStart) {
}

GtkRuntime::~GtkRuntime() {
    teardown();
    if (m_loop) g_main_loop_unref(m_loop);
}

// ============================================================================
// Startup
// ============================================================================

void GtkRuntime::start(PluginHost& host) {
    if (!gtk_init_check()) {
        throw StartupError("cannot open display (is a Wayland session running?)");
    }
    m_host = &host;
    m_loop = g_main_loop_new(nullptr, FALSE);

    // Window (CSS, widgets; hidden until asked)
    m_window = std::make_unique<MainWindow>(host);
    m_window->initialize();

    CommandRouter& router = host.router;
    router.registerCommand("app:show", [this](const json&) -> json {
        m_window->show();
        return "shown";
    });
    router.registerCommand("app:hide", [this](const json&) -> json {
        m_window->hide();
        return "hidden";
    });
    router.registerCommand("app:toggle", [this](const json&) -> json {
        m_window->toggle();
        return m_window->isVisible() ? "shown" : "hidden";
    });
    router.registerCommand("app:quit", [this](const json&) -> json {
        quit();
        return "quitting";
    });

    // Commands from other instances, shortcut bindings and the compositor plugin
    m_control = std::make_unique<ControlServer>(host.context.socketPath);
    if (m_control->listen()) {
        GIOChannel* channel = g_io_channel_unix_new(m_control->fd());
        m_controlWatch = g_io_add_watch(channel, G_IO_IN, onControlReadable, this);
        g_io_channel_unref(channel);
    } else {
        spdlog::warn("[Runtime] Control socket unavailable; --toggle from other processes will not reach this instance");
    }

    // Clean shutdown
    m_sigint = g_unix_signal_add(SIGINT, onQuitSignal, this);
    m_sigterm = g_unix_signal_add(SIGTERM, onQuitSignal, this);

    if (m_showOnStart) m_window->show();
}

gboolean GtkRuntime::onControlReadable(GIOChannel*, GIOCondition, gpointer data) {
    auto* self = static_cast<GtkRuntime*>(data);
    CommandRouter& router = self->m_host->router;
    self->m_control->acceptOne([&router](const std::string& line) {
        return router.handleLine(line);
    });
    return TRUE;
}

gboolean GtkRuntime::onQuitSignal(gpointer data) {
    spdlog::info("[Runtime] Signal received, quitting");
    static_cast<GtkRuntime*>(data)->quit();
    return G_SOURCE_CONTINUE;
}

// ============================================================================
// Loop
// ============================================================================

void GtkRuntime::run() {
    if (!m_loop) throw StartupError("runtime was not started");

    if (!m_quitRequested) {
        spdlog::info("[Runtime] Entering main loop");
        g_main_loop_run(m_loop);
    }
    teardown();
}

void GtkRuntime::quit() {
    m_quitRequested = true;
    if (m_loop) g_main_loop_quit(m_loop);
}

void GtkRuntime::post(std::function<void()> task) {
    auto* boxed = new std::function<void()>(std::move(task));
    g_idle_add_full(
        G_PRIORITY_DEFAULT_IDLE,
        +[](gpointer d) -> gboolean {
            (*static_cast<std::function<void()>*>(d))();
            return G_SOURCE_REMOVE;
        },
        boxed,
        +[](gpointer d) { delete static_cast<std::function<void()>*>(d); });
}

// Window and socket must be gone before the store they reference
void GtkRuntime::teardown() {
    if (m_controlWatch) { g_source_remove(m_controlWatch); m_controlWatch = 0; }
    if (m_sigint) { g_source_remove(m_sigint); m_sigint = 0; }
    if (m_sigterm) { g_source_remove(m_sigterm); m_sigterm = 0; }
    m_control.reset();

    if (m_host) {
        for (const char* name : {"app:show", "app:hide", "app:toggle", "app:quit"}) {
            m_host->router.removeCommand(name);
        }
        m_host = nullptr;
    }
    m_window.reset();
}

} // namespace clipfolio
