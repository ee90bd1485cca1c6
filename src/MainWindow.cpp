// Clipfolio UI: layer-shell window with a sidebar of views and projects
// GTK4 Layer-Shell window, standalone Wayland client

#include "clipfolio/MainWindow.hpp"
#include "clipfolio/AppContext.hpp"
#include "clipfolio/AppStore.hpp"
#include "clipfolio/CommandRouter.hpp"
#include "clipfolio/Errors.hpp"
#include "clipfolio/ImageStore.hpp"
#include "clipfolio/KeyValueStorage.hpp"
#include "clipfolio/Plugin.hpp"
#include "clipfolio/Queries.hpp"
#include "clipfolio/Runtime.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

using json = nlohmann::json;

namespace clipfolio {

// ── View definitions (sidebar order) ────────────────────────────────────────
static const ViewKind SIDEBAR_VIEWS[] = {
    ViewKind::History, ViewKind::Favorites, ViewKind::Images, ViewKind::Links, ViewKind::Code
};
static const char* VIEW_ICONS[] = {
    "\xe2\x8a\x9b",          // ⊛
    "\xe2\x98\x86",          // ☆
    "\xf0\x9f\x96\xbc",      // 🖼
    "\xe2\x86\x97",          // ↗
    "</>"
};

// ── CSS: dark compact layout ────────────────────────────────────────────────
static const char* CLIPFOLIO_CSS = R"CSS(
.Clipfolio { background: transparent; }

.cf-root {
  background: #0a0a0a;
  border: 1px solid #2a2a2a;
}

/* ── Sidebar ── */
.cf-sidebar {
  background: #0e0e0e;
  border-right: 1px solid #1a1a1a;
  padding: 2px;
  min-width: 36px;
}

.cf-sidebar-icon {
  min-width: 32px;
  min-height: 28px;
  padding: 2px;
  border-radius: 0;
  border: 1px solid transparent;
  background: transparent;
  color: #4a5a5a;
  font-size: 13px;
}
.cf-sidebar-icon:hover {
  background: #1a1a1a;
  border-color: #2a3a2a;
  color: #7a9a7a;
}
.cf-sidebar-icon.active {
  background: #1a2a1a;
  border-color: #3a6a3a;
  color: #8aba8a;
}

.cf-project {
  font-size: 10px;
  font-family: "Fira Code", monospace;
}

.cf-sidebar-sep {
  background: #1a1a1a;
  min-height: 1px;
  margin: 3px 4px;
}

.cf-count {
  font-size: 9px;
  font-family: "Fira Code", monospace;
  color: #3a4a4a;
  padding: 2px;
}

/* ── Search ── */
.cf-search {
  background: #111111;
  border-bottom: 1px solid #1a1a1a;
  padding: 4px 8px;
}
.cf-search label {
  color: #3a4a3a;
  font-size: 12px;
}
.cf-search-input {
  background: transparent;
  border: none;
  color: #8a9a9a;
  font-family: "Fira Code", monospace;
  font-size: 11px;
  caret-color: #3a6a3a;
}
.cf-search-input:focus { outline: none; }

/* ── Item list ── */
.cf-scroll { min-height: 120px; }
.cf-list { padding: 2px 4px; }

.cf-item {
  padding: 3px 8px;
  border-radius: 0;
  border: 1px solid transparent;
  background: transparent;
}
.cf-item:hover {
  background: #161616;
  border-color: #1a2a1a;
}
.cf-item.selected {
  background: rgba(42, 90, 42, 0.25);
  border-color: #3a6a3a;
}
.cf-item.batch {
  border-left: 2px solid #f9e2af;
}
.cf-item.note { padding-left: 22px; }

.cf-triangle {
  font-size: 9px;
  color: #2a3a3a;
  min-width: 10px;
}
.cf-item.selected .cf-triangle { color: #5a9a5a; }

.cf-preview {
  font-family: "Fira Code", monospace;
  font-size: 11px;
  color: #7a8a8a;
}
.cf-item.selected .cf-preview { color: #9aaa9a; }
.cf-item.folder .cf-preview { color: #8aba8a; }
.cf-item.missing .cf-preview { color: #aa6a6a; }

.cf-detail {
  font-size: 9px;
  font-family: "Fira Code", monospace;
  color: #3a4a4a;
}

.cf-type {
  font-size: 9px;
  color: #3a5a5a;
  margin-right: 4px;
}
.cf-item.url .cf-type { color: #5a7aaa; }
.cf-item.color .cf-type { color: #aa8a5a; }
.cf-item.code .cf-type { color: #8a6aaa; }

.cf-star { font-size: 10px; color: #2a3a3a; }
.cf-star.starred { color: #f9e2af; }

/* ── Prompt ── */
.cf-prompt {
  background: #111a11;
  border-top: 1px solid #2a3a2a;
  padding: 4px 8px;
}
.cf-prompt label {
  color: #7a9a7a;
  font-size: 10px;
}
.cf-prompt entry {
  font-family: "Fira Code", monospace;
  font-size: 11px;
}

/* ── Hint bar ── */
.cf-hints {
  background: #0a0a0a;
  border-top: 1px solid #1a1a1a;
  padding: 2px 8px;
}
.cf-hint {
  font-size: 9px;
  font-family: "Fira Code", monospace;
  color: #2a3a3a;
}
.cf-status {
  font-size: 9px;
  font-family: "Fira Code", monospace;
  color: #6a8a6a;
}
)CSS";

// ── Ctor / Dtor ─────────────────────────────────────────────────────────────

MainWindow::MainWindow(PluginHost& host)
    : m_host(host) {}

MainWindow::~MainWindow() {
    m_host.store.setOnChange(nullptr);
    if (m_window) { gtk_window_destroy(GTK_WINDOW(m_window)); m_window = nullptr; }
}

// ── Initialize ──────────────────────────────────────────────────────────────

void MainWindow::initialize() {
    if (auto saved = m_host.storage.load(KEY_UI_STATE)) {
        m_session.restore(*saved);
    }

    GtkCssProvider* css = gtk_css_provider_new();
    gtk_css_provider_load_from_string(css, CLIPFOLIO_CSS);
    gtk_style_context_add_provider_for_display(
        gdk_display_get_default(), GTK_STYLE_PROVIDER(css),
        GTK_STYLE_PROVIDER_PRIORITY_APPLICATION);
    g_object_unref(css);

    const AppContext& ctx = m_host.context;
    m_window = gtk_window_new();
    gtk_window_set_title(GTK_WINDOW(m_window), ctx.window.title.c_str());
    gtk_window_set_default_size(GTK_WINDOW(m_window), ctx.window.width, ctx.window.height);

    gtk_layer_init_for_window(GTK_WINDOW(m_window));
    gtk_layer_set_layer(GTK_WINDOW(m_window),
                        (m_session.pinned || ctx.window.alwaysOnTop)
                            ? GTK_LAYER_SHELL_LAYER_OVERLAY : GTK_LAYER_SHELL_LAYER_TOP);
    gtk_layer_set_keyboard_mode(GTK_WINDOW(m_window), GTK_LAYER_SHELL_KEYBOARD_MODE_ON_DEMAND);
    gtk_layer_set_namespace(GTK_WINDOW(m_window), "clipfolio");
    gtk_widget_add_css_class(m_window, "Clipfolio");

    buildUI();

    g_signal_connect(m_window, "close-request",
        G_CALLBACK(+[](GtkWindow*, gpointer d) -> gboolean {
            static_cast<MainWindow*>(d)->hide();
            return TRUE;
        }), this);

    g_signal_connect(m_window, "show",
        G_CALLBACK(+[](GtkWidget*, gpointer d) {
            auto* s = static_cast<MainWindow*>(d);
            s->m_selectedIndex = 0;
            s->closePrompt();
            if (s->m_scrolled) {
                auto* vadj = gtk_scrolled_window_get_vadjustment(GTK_SCROLLED_WINDOW(s->m_scrolled));
                if (vadj) gtk_adjustment_set_value(vadj, 0);
            }
            s->refresh();
        }), this);

    // Store changes may come from any thread; redraw on the loop thread
    std::weak_ptr<int> alive = m_lifetime;
    Runtime& runtime = m_host.runtime;
    m_host.store.setOnChange([this, alive, &runtime] {
        runtime.post([this, alive] {
            if (alive.lock() && m_visible) refresh();
        });
    });

    spdlog::debug("[Window] Initialized ({}x{})", ctx.window.width, ctx.window.height);
}

// ── UI Assembly ─────────────────────────────────────────────────────────────
//
//  ╭────┬────────────────────────────────────────────────╮
//  │ ⊛  │ ◎ search…                                      │
//  │ ☆  ├────────────────────────────────────────────────┤
//  │ 🖼  │ ▸ item text preview...              12:04   ★  │
//  │ ↗  │ ▾ Inbox                                  3     │
//  │ </>│     note text...                               │
//  │────│                                                │
//  │ Pe │                                                │
//  │ +  ├────────────────────────────────────────────────┤
//  │ 7  │ [prompt]                                       │
//  ╰────┴────────────────────────────────────────────────╯
//   hints · status

void MainWindow::buildUI() {
    GtkWidget* root = gtk_box_new(GTK_ORIENTATION_VERTICAL, 0);
    gtk_widget_add_css_class(root, "cf-root");

    GtkWidget* bodyRow = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 0);
    gtk_widget_set_vexpand(bodyRow, TRUE);

    m_sidebar = createSidebar();
    gtk_box_append(GTK_BOX(bodyRow), m_sidebar);
    gtk_widget_set_visible(m_sidebar, !m_session.focusMode);

    GtkWidget* main = gtk_box_new(GTK_ORIENTATION_VERTICAL, 0);
    gtk_widget_set_hexpand(main, TRUE);
    gtk_box_append(GTK_BOX(main), createSearchBar());

    m_scrolled = gtk_scrolled_window_new();
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(m_scrolled),
                                   GTK_POLICY_NEVER, GTK_POLICY_AUTOMATIC);
    gtk_widget_set_vexpand(m_scrolled, TRUE);
    gtk_widget_add_css_class(m_scrolled, "cf-scroll");

    m_listBox = gtk_box_new(GTK_ORIENTATION_VERTICAL, 1);
    gtk_widget_add_css_class(m_listBox, "cf-list");
    gtk_scrolled_window_set_child(GTK_SCROLLED_WINDOW(m_scrolled), m_listBox);
    gtk_box_append(GTK_BOX(main), m_scrolled);

    gtk_box_append(GTK_BOX(main), createPromptBar());
    gtk_box_append(GTK_BOX(bodyRow), main);

    gtk_box_append(GTK_BOX(root), bodyRow);
    gtk_box_append(GTK_BOX(root), createHintBar());

    gtk_window_set_child(GTK_WINDOW(m_window), root);

    // Capture phase: shortcuts win over the focused entry
    GtkEventController* kc = gtk_event_controller_key_new();
    gtk_event_controller_set_propagation_phase(kc, GTK_PHASE_CAPTURE);
    g_signal_connect(kc, "key-pressed", G_CALLBACK(onKeyPress), this);
    gtk_widget_add_controller(m_window, kc);
}

// ── Sidebar (views, projects, count) ────────────────────────────────────────

GtkWidget* MainWindow::createSidebar() {
    GtkWidget* bar = gtk_box_new(GTK_ORIENTATION_VERTICAL, 2);
    gtk_widget_add_css_class(bar, "cf-sidebar");

    for (int i = 0; i < 5; i++) {
        GtkWidget* btn = gtk_button_new_with_label(VIEW_ICONS[i]);
        gtk_widget_set_can_focus(btn, FALSE);
        gtk_widget_add_css_class(btn, "cf-sidebar-icon");
        gtk_widget_set_tooltip_text(btn, viewName(SIDEBAR_VIEWS[i]));
        g_object_set_data(G_OBJECT(btn), "view-index", GINT_TO_POINTER(i));
        g_signal_connect(btn, "clicked",
            G_CALLBACK(+[](GtkButton* b, gpointer d) {
                int idx = GPOINTER_TO_INT(g_object_get_data(G_OBJECT(b), "view-index"));
                static_cast<MainWindow*>(d)->setView(SIDEBAR_VIEWS[idx]);
            }), this);
        m_viewButtons[i] = btn;
        gtk_box_append(GTK_BOX(bar), btn);
    }

    GtkWidget* sep = gtk_separator_new(GTK_ORIENTATION_HORIZONTAL);
    gtk_widget_add_css_class(sep, "cf-sidebar-sep");
    gtk_box_append(GTK_BOX(bar), sep);

    m_projectBox = gtk_box_new(GTK_ORIENTATION_VERTICAL, 2);
    gtk_box_append(GTK_BOX(bar), m_projectBox);

    GtkWidget* addBtn = gtk_button_new_with_label("+");
    gtk_widget_set_can_focus(addBtn, FALSE);
    gtk_widget_add_css_class(addBtn, "cf-sidebar-icon");
    gtk_widget_set_tooltip_text(addBtn, "new project");
    g_signal_connect(addBtn, "clicked",
        G_CALLBACK(+[](GtkButton*, gpointer d) {
            static_cast<MainWindow*>(d)->openPrompt(
                PromptRequest{.kind = PromptRequest::Kind::CreateProject, .title = "New project"});
        }), this);
    gtk_box_append(GTK_BOX(bar), addBtn);

    GtkWidget* spacer = gtk_box_new(GTK_ORIENTATION_VERTICAL, 0);
    gtk_widget_set_vexpand(spacer, TRUE);
    gtk_box_append(GTK_BOX(bar), spacer);

    m_countLabel = gtk_label_new("0");
    gtk_widget_add_css_class(m_countLabel, "cf-count");
    gtk_box_append(GTK_BOX(bar), m_countLabel);

    return bar;
}

void MainWindow::updateProjects() {
    if (!m_projectBox) return;
    removeAllChildren(m_projectBox);

    for (const auto& project : m_host.store.projects()) {
        // Two-letter badge, full name as tooltip
        std::string badge = project.name.substr(0, std::min<size_t>(2, project.name.size()));
        GtkWidget* btn = gtk_button_new_with_label(badge.c_str());
        gtk_widget_set_can_focus(btn, FALSE);
        gtk_widget_add_css_class(btn, "cf-sidebar-icon");
        gtk_widget_add_css_class(btn, "cf-project");
        gtk_widget_set_tooltip_text(btn, project.name.c_str());
        if (m_session.view == ViewKind::Project && m_session.selectedProjectId == project.id)
            gtk_widget_add_css_class(btn, "active");

        g_object_set_data_full(G_OBJECT(btn), "project-id", g_strdup(project.id.c_str()), g_free);
        g_signal_connect(btn, "clicked",
            G_CALLBACK(+[](GtkButton* b, gpointer d) {
                auto* id = static_cast<const char*>(g_object_get_data(G_OBJECT(b), "project-id"));
                static_cast<MainWindow*>(d)->setView(ViewKind::Project, std::string(id));
            }), this);
        gtk_box_append(GTK_BOX(m_projectBox), btn);
    }
}

void MainWindow::updateViewButtons() {
    for (int i = 0; i < 5; i++) {
        if (SIDEBAR_VIEWS[i] == m_session.view) gtk_widget_add_css_class(m_viewButtons[i], "active");
        else                                     gtk_widget_remove_css_class(m_viewButtons[i], "active");
    }
}

// ── Search bar ──────────────────────────────────────────────────────────────

GtkWidget* MainWindow::createSearchBar() {
    GtkWidget* box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 6);
    gtk_widget_add_css_class(box, "cf-search");

    GtkWidget* icon = gtk_label_new("\xe2\x97\x8e");
    gtk_box_append(GTK_BOX(box), icon);

    m_searchEntry = gtk_entry_new();
    gtk_entry_set_placeholder_text(GTK_ENTRY(m_searchEntry), "search...  (ctrl+k)");
    gtk_widget_set_hexpand(m_searchEntry, TRUE);
    gtk_widget_add_css_class(m_searchEntry, "cf-search-input");

    g_signal_connect(m_searchEntry, "changed",
        G_CALLBACK(+[](GtkEditable* e, gpointer d) {
            auto* s = static_cast<MainWindow*>(d);
            const char* t = gtk_editable_get_text(e);
            s->m_session.search = t ? t : "";
            s->m_selectedIndex = 0;
            s->updateList();
        }), this);

    gtk_box_append(GTK_BOX(box), m_searchEntry);
    return box;
}

// ── Prompt bar (create / rename / edit) ─────────────────────────────────────

GtkWidget* MainWindow::createPromptBar() {
    m_promptBar = gtk_box_new(GTK_ORIENTATION_VERTICAL, 2);
    gtk_widget_add_css_class(m_promptBar, "cf-prompt");

    m_promptTitle = gtk_label_new("");
    gtk_label_set_xalign(GTK_LABEL(m_promptTitle), 0);
    gtk_box_append(GTK_BOX(m_promptBar), m_promptTitle);

    m_promptEntry = gtk_entry_new();
    gtk_box_append(GTK_BOX(m_promptBar), m_promptEntry);

    m_promptTags = gtk_entry_new();
    gtk_entry_set_placeholder_text(GTK_ENTRY(m_promptTags), "tags, comma separated");
    gtk_box_append(GTK_BOX(m_promptBar), m_promptTags);

    gtk_widget_set_visible(m_promptBar, FALSE);
    return m_promptBar;
}

// ── Hint bar (keyboard shortcuts + status) ──────────────────────────────────

GtkWidget* MainWindow::createHintBar() {
    GtkWidget* box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    gtk_widget_add_css_class(box, "cf-hints");

    const char* hints =
        "\xe2\x86\x91\xe2\x86\x93 nav  \xc2\xb7  "   // ↑↓ nav  ·
        "\xe2\x8f\x8e copy  \xc2\xb7  "                // ⏎ copy  ·
        "\xe2\x8c\xa6 del  \xc2\xb7  "                 // ⌦ del  ·
        "\xe2\x87\xa5 view  \xc2\xb7  "                // ⇥ view  ·
        "^N new  \xc2\xb7  F2 rename  \xc2\xb7  "
        "\xe2\x8e\x8b close";                          // ⎋ close

    GtkWidget* label = gtk_label_new(hints);
    gtk_widget_add_css_class(label, "cf-hint");
    gtk_label_set_xalign(GTK_LABEL(label), 0);
    gtk_box_append(GTK_BOX(box), label);

    m_statusLabel = gtk_label_new("");
    gtk_widget_add_css_class(m_statusLabel, "cf-status");
    gtk_widget_set_hexpand(m_statusLabel, TRUE);
    gtk_label_set_xalign(GTK_LABEL(m_statusLabel), 1);
    gtk_label_set_ellipsize(GTK_LABEL(m_statusLabel), PANGO_ELLIPSIZE_START);
    gtk_box_append(GTK_BOX(box), m_statusLabel);
    return box;
}

// ── List management ─────────────────────────────────────────────────────────

void MainWindow::removeAllChildren(GtkWidget* box) {
    GtkWidget* child = gtk_widget_get_first_child(box);
    while (child) {
        GtkWidget* next = gtk_widget_get_next_sibling(child);
        gtk_box_remove(GTK_BOX(box), child);
        child = next;
    }
}

void MainWindow::refresh() {
    updateProjects();
    updateViewButtons();
    updateList();
}

GtkWidget* MainWindow::createRow(const ListRow& row, int index) {
    GtkWidget* btn = gtk_button_new();
    gtk_widget_set_can_focus(btn, FALSE);
    gtk_widget_add_css_class(btn, "cf-item");
    gtk_widget_add_css_class(btn, contentTypeName(row.contentType));
    if (index == m_selectedIndex) gtk_widget_add_css_class(btn, "selected");
    if (row.kind == ListRow::Kind::History && m_session.selectedItems.count(row.id))
        gtk_widget_add_css_class(btn, "batch");
    if (row.kind == ListRow::Kind::Folder) gtk_widget_add_css_class(btn, "folder");
    if (row.kind == ListRow::Kind::Note) gtk_widget_add_css_class(btn, "note");

    GtkWidget* hbox = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 4);

    // Selection triangle
    GtkWidget* triangle = gtk_label_new(index == m_selectedIndex ? "\xe2\x96\xb8" : " ");
    gtk_widget_add_css_class(triangle, "cf-triangle");
    gtk_box_append(GTK_BOX(hbox), triangle);

    std::string text = row.label;
    if (row.kind == ListRow::Kind::Folder) {
        GtkWidget* arrow = gtk_label_new(row.expanded ? "\xe2\x96\xbe" : "\xe2\x96\xb9");
        gtk_widget_add_css_class(arrow, "cf-type");
        gtk_box_append(GTK_BOX(hbox), arrow);
    } else if (row.contentType == ContentType::Image && row.imageData) {
        if (m_host.images.exists(*row.imageData)) {
            std::string path = m_host.images.pathFor(*row.imageData).string();
            GtkWidget* pic = gtk_picture_new_for_filename(path.c_str());
            gtk_picture_set_content_fit(GTK_PICTURE(pic), GTK_CONTENT_FIT_COVER);
            gtk_widget_set_size_request(pic, THUMB_WIDTH, THUMB_HEIGHT);
            gtk_box_append(GTK_BOX(hbox), pic);
        } else {
            text = "[Image Missing: " + *row.imageData + "]";
            gtk_widget_add_css_class(btn, "missing");
        }
    } else if (row.contentType != ContentType::Text) {
        GtkWidget* type = gtk_label_new(contentTypeName(row.contentType));
        gtk_widget_add_css_class(type, "cf-type");
        gtk_box_append(GTK_BOX(hbox), type);
    }

    // Single-line preview
    std::replace(text.begin(), text.end(), '\n', ' ');
    GtkWidget* preview = gtk_label_new(text.empty() ? "[Empty]" : text.c_str());
    gtk_widget_set_hexpand(preview, TRUE);
    gtk_label_set_xalign(GTK_LABEL(preview), 0);
    gtk_label_set_max_width_chars(GTK_LABEL(preview), 60);
    gtk_label_set_ellipsize(GTK_LABEL(preview), PANGO_ELLIPSIZE_END);
    gtk_widget_add_css_class(preview, "cf-preview");
    gtk_box_append(GTK_BOX(hbox), preview);

    GtkWidget* detail = gtk_label_new(row.detail.c_str());
    gtk_widget_add_css_class(detail, "cf-detail");
    gtk_box_append(GTK_BOX(hbox), detail);

    if (row.kind == ListRow::Kind::History) {
        GtkWidget* star = gtk_label_new(row.favorite ? "\xe2\x98\x85" : "\xe2\x98\x86");
        gtk_widget_add_css_class(star, "cf-star");
        if (row.favorite) gtk_widget_add_css_class(star, "starred");
        gtk_box_append(GTK_BOX(hbox), star);
    }

    gtk_button_set_child(GTK_BUTTON(btn), hbox);

    // Click → select + activate
    g_object_set_data(G_OBJECT(btn), "row-index", GINT_TO_POINTER(index));
    g_signal_connect(btn, "clicked",
        G_CALLBACK(+[](GtkButton* b, gpointer d) {
            auto* s = static_cast<MainWindow*>(d);
            int idx = GPOINTER_TO_INT(g_object_get_data(G_OBJECT(b), "row-index"));
            s->updateSelection(idx);
            s->activateRow(idx);
        }), this);
    return btn;
}

void MainWindow::updateList() {
    if (!m_listBox) return;

    size_t expandedBefore = m_session.expandedFolders.size();
    m_rows = buildRows(m_host.store, m_session);
    if (m_session.expandedFolders.size() != expandedBefore) saveSession();

    removeAllChildren(m_listBox);
    int count = static_cast<int>(m_rows.size());
    if (m_selectedIndex >= count) m_selectedIndex = std::max(0, count - 1);

    for (int i = 0; i < count; i++) {
        gtk_box_append(GTK_BOX(m_listBox), createRow(m_rows[static_cast<size_t>(i)], i));
    }

    if (m_countLabel) {
        gtk_label_set_text(GTK_LABEL(m_countLabel), std::to_string(m_rows.size()).c_str());
    }
}

void MainWindow::updateSelection(int newIndex) {
    if (newIndex < 0 || newIndex == m_selectedIndex || !m_listBox) return;

    int idx = 0;
    GtkWidget* btn = gtk_widget_get_first_child(m_listBox);
    while (btn) {
        if (idx == m_selectedIndex || idx == newIndex) {
            if (idx == m_selectedIndex) gtk_widget_remove_css_class(btn, "selected");
            if (idx == newIndex)        gtk_widget_add_css_class(btn, "selected");
            GtkWidget* hbox = gtk_button_get_child(GTK_BUTTON(btn));
            if (hbox) {
                GtkWidget* tri = gtk_widget_get_first_child(hbox);
                if (tri && GTK_IS_LABEL(tri))
                    gtk_label_set_text(GTK_LABEL(tri), idx == newIndex ? "\xe2\x96\xb8" : " ");
            }
        }
        btn = gtk_widget_get_next_sibling(btn);
        idx++;
    }
    m_selectedIndex = newIndex;
    scrollToIndex(newIndex);
}

void MainWindow::scrollToIndex(int index) {
    if (!m_scrolled) return;
    GtkAdjustment* vadj = gtk_scrolled_window_get_vadjustment(GTK_SCROLLED_WINDOW(m_scrolled));
    if (!vadj) return;

    GtkWidget* row = gtk_widget_get_first_child(m_listBox);
    for (int i = 0; row && i < index; i++) row = gtk_widget_get_next_sibling(row);
    if (!row) return;

    graphene_rect_t bounds;
    if (!gtk_widget_compute_bounds(row, m_listBox, &bounds)) return;

    double page = gtk_adjustment_get_page_size(vadj);
    double top = bounds.origin.y;
    double bot = top + bounds.size.height;
    double cur = gtk_adjustment_get_value(vadj);
    if (bot > cur + page) gtk_adjustment_set_value(vadj, bot - page);
    else if (top < cur)   gtk_adjustment_set_value(vadj, top);
}

void MainWindow::setView(ViewKind view, std::optional<std::string> projectId) {
    m_session.view = view;
    if (projectId) m_session.selectedProjectId = std::move(projectId);
    if (view == ViewKind::Project && !m_session.selectedProjectId) {
        m_session.view = ViewKind::History;
    }
    m_session.clearSelection();
    m_selectedIndex = 0;
    refresh();
}

const ListRow* MainWindow::selectedRow() const {
    if (m_selectedIndex < 0 || m_selectedIndex >= static_cast<int>(m_rows.size())) return nullptr;
    return &m_rows[static_cast<size_t>(m_selectedIndex)];
}

std::string MainWindow::projectIdForRow() const {
    if (m_session.view != ViewKind::Project || !m_session.selectedProjectId) return "";
    return *m_session.selectedProjectId;
}

// ── Actions ─────────────────────────────────────────────────────────────────

bool MainWindow::invoke(const std::string& command, const json& args) {
    try {
        m_host.router.invoke(command, args);
        return true;
    } catch (const Error& e) {
        spdlog::warn("[Window] {} failed: {}", command, e.what());
        setStatus(e.what());
        return false;
    }
}

void MainWindow::activateRow(int index) {
    if (index < 0 || index >= static_cast<int>(m_rows.size())) return;
    ListRow row = m_rows[static_cast<size_t>(index)];

    if (row.kind == ListRow::Kind::Folder) {
        m_session.toggleFolder(row.id);
        saveSession();
        updateList();
        return;
    }
    copyRow(row);
}

void MainWindow::copyRow(const ListRow& row) {
    bool ok;
    if (row.contentType == ContentType::Image && row.imageData) {
        ok = m_host.images.exists(*row.imageData)
            ? invoke("clipboard:write_image_file", {{"name", *row.imageData}})
            : invoke("clipboard:write_text", {{"text", "[Image Missing: " + *row.imageData + "]"}});
    } else {
        ok = invoke("clipboard:write_text", {{"text", row.label}});
    }
    if (!ok) return;

    setStatus("copied");
    if (!m_session.pinned) hide();
}

void MainWindow::copyFolder(const ListRow& row) {
    auto project = m_host.store.findProject(projectIdForRow());
    if (!project) return;

    for (const auto& folder : project->folders) {
        if (folder.id != row.id) continue;
        auto text = folderClipboardText(folder);
        if (!text) {
            setStatus("folder is empty");
            return;
        }
        if (invoke("clipboard:write_text", {{"text", *text}})) {
            setStatus("copied " + std::to_string(folder.notes.size()) + " notes");
        }
        return;
    }
}

void MainWindow::deleteRow(const ListRow& row) {
    std::string projectId = projectIdForRow();
    switch (row.kind) {
        case ListRow::Kind::History:
            m_host.store.deleteHistoryItem(row.id);
            m_session.selectedItems.erase(row.id);
            break;
        case ListRow::Kind::Folder:
            deleteFolderFromSession(m_host.store, m_session, projectId, row.id);
            saveSession();
            break;
        case ListRow::Kind::Note:
            m_host.store.deleteNote(projectId, row.folderId, row.id);
            break;
    }
    updateList();
}

void MainWindow::toggleFavorite(const ListRow& row) {
    if (row.kind != ListRow::Kind::History) return;
    m_host.store.toggleHistoryFavorite(row.id);
    updateList();
}

void MainWindow::openUrl(const ListRow& row) {
    if (row.contentType != ContentType::Url) return;
    if (invoke("opener:open_url", {{"url", row.label}})) setStatus("opened");
}

void MainWindow::copyToProject(int projectNumber) {
    const ListRow* row = selectedRow();
    if (!row || row->kind == ListRow::Kind::Folder) return;

    auto projects = m_host.store.projects();
    if (projectNumber < 1 || projectNumber > static_cast<int>(projects.size())) return;
    const Project& target = projects[static_cast<size_t>(projectNumber - 1)];

    if (m_host.store.copyItemToProject(row->id, target.id)) {
        setStatus("copied to " + target.name);
    }
}

void MainWindow::deleteBatch() {
    size_t removed = deleteSelectedItems(m_host.store, m_session);
    if (removed) setStatus("deleted " + std::to_string(removed) + " items");
    updateList();
}

void MainWindow::togglePinned() {
    m_session.pinned = !m_session.pinned;
    gtk_layer_set_layer(GTK_WINDOW(m_window),
                        (m_session.pinned || m_host.context.window.alwaysOnTop)
                            ? GTK_LAYER_SHELL_LAYER_OVERLAY : GTK_LAYER_SHELL_LAYER_TOP);
    setStatus(m_session.pinned ? "pinned" : "unpinned");
    saveSession();
}

void MainWindow::toggleFocusMode() {
    m_session.focusMode = !m_session.focusMode;
    gtk_widget_set_visible(m_sidebar, !m_session.focusMode);
}

void MainWindow::exportBackup() {
    try {
        json result = m_host.router.invoke("backup:export", json::object());
        setStatus("exported " + result.value("path", std::string()));
    } catch (const Error& e) {
        spdlog::error("[Window] Export failed: {}", e.what());
        setStatus(e.what());
    }
}

// ── Prompt ──────────────────────────────────────────────────────────────────

void MainWindow::openPrompt(PromptRequest request) {
    bool isNote = request.kind == PromptRequest::Kind::CreateNote ||
                  request.kind == PromptRequest::Kind::EditNote;

    gtk_label_set_text(GTK_LABEL(m_promptTitle), request.title.c_str());
    gtk_editable_set_text(GTK_EDITABLE(m_promptEntry), request.initialValue.c_str());

    std::string tags;
    for (const auto& t : request.initialTags) {
        if (!tags.empty()) tags += ", ";
        tags += t;
    }
    gtk_editable_set_text(GTK_EDITABLE(m_promptTags), tags.c_str());
    gtk_widget_set_visible(m_promptTags, isNote);

    m_prompt = std::move(request);
    gtk_widget_set_visible(m_promptBar, TRUE);
    gtk_widget_grab_focus(m_promptEntry);
}

// Ctrl+N: note (project view) or project. Ctrl+Shift+N: folder or project.
void MainWindow::promptCreate(bool secondary) {
    std::string projectId = projectIdForRow();
    if (projectId.empty()) {
        openPrompt({.kind = PromptRequest::Kind::CreateProject, .title = "New project"});
        return;
    }

    const ListRow* row = selectedRow();
    if (!secondary && row) {
        std::string folderId = row->kind == ListRow::Kind::Folder ? row->id : row->folderId;
        openPrompt({.kind = PromptRequest::Kind::CreateNote, .title = "New note",
                    .projectId = projectId, .folderId = folderId});
        return;
    }
    openPrompt({.kind = PromptRequest::Kind::CreateFolder, .title = "New folder",
                .projectId = projectId});
}

void MainWindow::promptRename() {
    std::string projectId = projectIdForRow();
    if (projectId.empty()) return;

    const ListRow* row = selectedRow();
    if (row && row->kind == ListRow::Kind::Folder) {
        openPrompt({.kind = PromptRequest::Kind::RenameFolder, .title = "Rename folder",
                    .initialValue = row->label, .projectId = projectId, .folderId = row->id});
        return;
    }
    if (row && row->kind == ListRow::Kind::Note) {
        std::vector<std::string> tags;
        if (auto project = m_host.store.findProject(projectId)) {
            for (const auto& folder : project->folders) {
                for (const auto& note : folder.notes) {
                    if (note.id == row->id) tags = note.tags;
                }
            }
        }
        openPrompt({.kind = PromptRequest::Kind::EditNote, .title = "Edit note",
                    .initialValue = row->label, .initialTags = tags,
                    .projectId = projectId, .folderId = row->folderId, .noteId = row->id});
        return;
    }

    auto project = m_host.store.findProject(projectId);
    if (!project) return;
    openPrompt({.kind = PromptRequest::Kind::RenameProject, .title = "Rename project",
                .initialValue = project->name, .projectId = projectId});
}

void MainWindow::confirmPrompt() {
    if (!m_prompt) return;

    const char* value = gtk_editable_get_text(GTK_EDITABLE(m_promptEntry));
    const char* tags = gtk_editable_get_text(GTK_EDITABLE(m_promptTags));
    PromptRequest request = *m_prompt;
    closePrompt();

    if (applyPrompt(m_host.store, m_session, request, value ? value : "",
                    parseTagList(tags ? tags : ""))) {
        if (request.kind == PromptRequest::Kind::CreateFolder) saveSession();
        refresh();
    }
}

void MainWindow::closePrompt() {
    m_prompt.reset();
    if (m_promptBar) gtk_widget_set_visible(m_promptBar, FALSE);
}

// ── Helpers ─────────────────────────────────────────────────────────────────

void MainWindow::setStatus(const std::string& message) {
    if (m_statusLabel) gtk_label_set_text(GTK_LABEL(m_statusLabel), message.c_str());
}

void MainWindow::saveSession() {
    try {
        m_host.storage.save(KEY_UI_STATE, m_session.persisted());
    } catch (const StorageError& e) {
        spdlog::error("[Window] Cannot save ui state: {}", e.what());
    }
}

bool MainWindow::focusWithin(GtkWidget* widget) const {
    GtkWidget* focus = gtk_root_get_focus(GTK_ROOT(m_window));
    return focus && (focus == widget || gtk_widget_is_ancestor(focus, widget));
}

// ── Keyboard handler ────────────────────────────────────────────────────────

gboolean MainWindow::onKeyPress(GtkEventControllerKey*,
                                guint keyval, guint,
                                GdkModifierType state, gpointer data) {
    auto* self = static_cast<MainWindow*>(data);
    int count = static_cast<int>(self->m_rows.size());
    bool ctrl = state & GDK_CONTROL_MASK;
    bool shift = state & GDK_SHIFT_MASK;
    bool alt = state & GDK_ALT_MASK;

    // Prompt owns the keyboard except for confirm / cancel
    if (self->m_prompt) {
        if (keyval == GDK_KEY_Return || keyval == GDK_KEY_KP_Enter) {
            self->confirmPrompt();
            return TRUE;
        }
        if (keyval == GDK_KEY_Escape) {
            self->closePrompt();
            return TRUE;
        }
        return FALSE;
    }

    if (keyval == GDK_KEY_Escape) {
        if (!self->m_session.search.empty()) {
            gtk_editable_set_text(GTK_EDITABLE(self->m_searchEntry), "");
        } else {
            self->hide();
        }
        return TRUE;
    }

    if (ctrl && (keyval == GDK_KEY_k || keyval == GDK_KEY_K)) {
        gtk_widget_grab_focus(self->m_searchEntry);
        return TRUE;
    }
    if (ctrl && (keyval == GDK_KEY_f || keyval == GDK_KEY_F)) {
        self->toggleFocusMode();
        return TRUE;
    }
    if (ctrl && (keyval == GDK_KEY_p || keyval == GDK_KEY_P)) {
        self->togglePinned();
        return TRUE;
    }
    if (ctrl && (keyval == GDK_KEY_e || keyval == GDK_KEY_E)) {
        self->exportBackup();
        return TRUE;
    }
    if (ctrl && (keyval == GDK_KEY_n || keyval == GDK_KEY_N)) {
        self->promptCreate(shift);
        return TRUE;
    }
    if (keyval == GDK_KEY_F2) {
        self->promptRename();
        return TRUE;
    }
    if (keyval == GDK_KEY_Tab) {
        self->m_session.cycleView(1, self->m_session.selectedProjectId.has_value());
        self->setView(self->m_session.view);
        return TRUE;
    }
    if (keyval == GDK_KEY_ISO_Left_Tab) {
        self->m_session.cycleView(-1, self->m_session.selectedProjectId.has_value());
        self->setView(self->m_session.view);
        return TRUE;
    }
    if (alt && keyval >= GDK_KEY_1 && keyval <= GDK_KEY_9) {
        self->copyToProject(static_cast<int>(keyval - GDK_KEY_0));
        return TRUE;
    }
    if (ctrl && keyval == GDK_KEY_Delete) {
        self->deleteBatch();
        return TRUE;
    }

    if (keyval == GDK_KEY_Down) {
        self->updateSelection(std::min(self->m_selectedIndex + 1, count - 1));
        return TRUE;
    }
    if (keyval == GDK_KEY_Up) {
        self->updateSelection(std::max(self->m_selectedIndex - 1, 0));
        return TRUE;
    }
    if (keyval == GDK_KEY_Return || keyval == GDK_KEY_KP_Enter) {
        self->activateRow(self->m_selectedIndex);
        return TRUE;
    }

    // Remaining keys edit the search text while it has focus
    if (self->focusWithin(self->m_searchEntry)) return FALSE;

    const ListRow* row = self->selectedRow();
    if (keyval == GDK_KEY_Home) {
        self->updateSelection(0);
        return TRUE;
    }
    if (keyval == GDK_KEY_End) {
        self->updateSelection(std::max(0, count - 1));
        return TRUE;
    }
    if (keyval == GDK_KEY_Delete) {
        if (row) self->deleteRow(*row);
        return TRUE;
    }
    if (ctrl && (keyval == GDK_KEY_d || keyval == GDK_KEY_D)) {
        if (row) self->toggleFavorite(*row);
        return TRUE;
    }
    if (ctrl && (keyval == GDK_KEY_o || keyval == GDK_KEY_O)) {
        if (row) self->openUrl(*row);
        return TRUE;
    }
    if (ctrl && (keyval == GDK_KEY_c || keyval == GDK_KEY_C)) {
        if (row && row->kind == ListRow::Kind::Folder) self->copyFolder(*row);
        else if (row) self->copyRow(*row);
        return TRUE;
    }
    if (keyval == GDK_KEY_space) {
        if (row && row->kind == ListRow::Kind::History) {
            self->m_session.toggleSelectItem(row->id);
            self->updateList();
        }
        return TRUE;
    }
    if (keyval == GDK_KEY_BackSpace) {
        std::string cur = self->m_session.search;
        if (!cur.empty()) {
            cur.pop_back();
            gtk_editable_set_text(GTK_EDITABLE(self->m_searchEntry), cur.c_str());
        }
        return TRUE;
    }

    // Typing anywhere goes to the search
    guint32 ch = gdk_keyval_to_unicode(keyval);
    if (!ctrl && !alt && ch > 32 && ch < 127) {
        std::string cur = self->m_session.search + static_cast<char>(ch);
        gtk_editable_set_text(GTK_EDITABLE(self->m_searchEntry), cur.c_str());
        return TRUE;
    }
    return FALSE;
}

// ── Public API ──────────────────────────────────────────────────────────────

void MainWindow::show() {
    if (m_window && !m_visible) {
        gtk_window_present(GTK_WINDOW(m_window));
        m_visible = true;
    }
}

void MainWindow::hide() {
    if (m_window && m_visible) {
        closePrompt();
        gtk_widget_set_visible(m_window, FALSE);
        m_visible = false;
    }
}

void MainWindow::toggle() {
    if (!m_window) return;
    if (m_visible) hide(); else show();
}

} // namespace clipfolio
