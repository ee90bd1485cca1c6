#pragma once
// GTK4 Layer-Shell window: sidebar (views + projects), search, item list,
// hint bar and an inline prompt for create/rename

#include "Forward.hpp"
#include "SessionState.hpp"
#include <gtk/gtk.h>
#include <gtk4-layer-shell.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clipfolio {

class MainWindow {
public:
    explicit MainWindow(PluginHost& host);
    ~MainWindow();

    MainWindow(const MainWindow&) = delete;
    MainWindow& operator=(const MainWindow&) = delete;

    void initialize();  // Create window + UI (call AFTER gtk_init)
    void show();
    void hide();
    void toggle();
    bool isVisible() const { return m_visible; }

    void refresh();

private:
    PluginHost& m_host;

    // GTK widgets
    GtkWidget* m_window = nullptr;
    GtkWidget* m_sidebar = nullptr;
    GtkWidget* m_projectBox = nullptr;
    GtkWidget* m_viewButtons[5] = {};
    GtkWidget* m_countLabel = nullptr;
    GtkWidget* m_searchEntry = nullptr;
    GtkWidget* m_scrolled = nullptr;
    GtkWidget* m_listBox = nullptr;
    GtkWidget* m_statusLabel = nullptr;
    GtkWidget* m_promptBar = nullptr;
    GtkWidget* m_promptTitle = nullptr;
    GtkWidget* m_promptEntry = nullptr;
    GtkWidget* m_promptTags = nullptr;

    // State
    SessionState m_session;
    std::vector<ListRow> m_rows;
    int m_selectedIndex = 0;
    std::optional<PromptRequest> m_prompt;
    bool m_visible = false;

    // Guards callbacks posted to the event loop after destruction
    std::shared_ptr<int> m_lifetime = std::make_shared<int>(0);

    // UI building
    void buildUI();
    GtkWidget* createSidebar();
    GtkWidget* createSearchBar();
    GtkWidget* createPromptBar();
    GtkWidget* createHintBar();
    GtkWidget* createRow(const ListRow& row, int index);

    // List management
    void updateList();
    void updateProjects();
    void updateViewButtons();
    void updateSelection(int newIndex);
    void scrollToIndex(int index);
    void setView(ViewKind view, std::optional<std::string> projectId = std::nullopt);
    const ListRow* selectedRow() const;
    std::string projectIdForRow() const;

    // Actions
    void activateRow(int index);
    void copyRow(const ListRow& row);
    void copyFolder(const ListRow& row);
    void deleteRow(const ListRow& row);
    void toggleFavorite(const ListRow& row);
    void openUrl(const ListRow& row);
    void copyToProject(int projectNumber);
    void deleteBatch();
    void togglePinned();
    void toggleFocusMode();
    void exportBackup();

    // Prompt
    void openPrompt(PromptRequest request);
    void promptCreate(bool secondary);
    void promptRename();
    void confirmPrompt();
    void closePrompt();

    void setStatus(const std::string& message);
    void saveSession();
    bool invoke(const std::string& command, const nlohmann::json& args);
    bool focusWithin(GtkWidget* widget) const;

    static gboolean onKeyPress(GtkEventControllerKey* controller,
                               guint keyval, guint keycode,
                               GdkModifierType state, gpointer data);

    void removeAllChildren(GtkWidget* box);

    static constexpr int THUMB_WIDTH = 72;
    static constexpr int THUMB_HEIGHT = 44;
};

} // namespace clipfolio
