#pragma once
// Forward declarations for loose coupling

namespace clipfolio {

// Data structures
struct Config;
struct AppContext;
struct HistoryItem;
struct NoteItem;
struct Folder;
struct Project;
struct ClipboardContent;
struct SessionState;

// Storage
class KeyValueStorage;
class DebouncedSaver;
class AppStore;
class ImageStore;

// Plugins and runtime
class Plugin;
struct PluginHost;
class CommandRouter;
class Runtime;
class AppBuilder;
class ClipboardBackend;
class ClipboardMonitor;
class ShortcutBinder;
class UrlLauncher;

} // namespace clipfolio
