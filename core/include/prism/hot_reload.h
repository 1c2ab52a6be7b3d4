#pragma once

// Polling watcher that reloads a plugin when any of its files change.
// Reloads go through PluginLoader::reload_plugin, which serializes them;
// the watcher never holds that lock while sleeping.

#include "prism/plugin_loader.h"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace prism {

struct FileFingerprint {
    int64_t mtime_ns{0};
    uintmax_t size{0};
    std::string sha256;      // empty unless hashing is enabled

    bool operator==(const FileFingerprint& o) const {
        return mtime_ns == o.mtime_ns && size == o.size && sha256 == o.sha256;
    }
    bool operator!=(const FileFingerprint& o) const { return !(*this == o); }
};

// Relative path -> fingerprint, for every watched file under a plugin dir.
using PluginFingerprint = std::map<std::string, FileFingerprint>;

struct ReloadEvent {
    std::string plugin;
    bool success{false};
    std::string reason;
    int64_t ts_ms{0};
};

struct WatcherStatus {
    bool enabled{false};
    int interval_ms{0};
    size_t watched_plugins{0};
    size_t total_files{0};
};

class HotReloadManager {
public:
    HotReloadManager(PluginLoader& loader, int interval_ms, bool use_hash, size_t history_limit = 100);
    ~HotReloadManager();
    HotReloadManager(const HotReloadManager&) = delete;
    HotReloadManager& operator=(const HotReloadManager&) = delete;

    // Takes a baseline of every loaded plugin and starts the polling thread.
    void start();
    void stop();
    bool running() const;

    // One polling pass. Plugins seen for the first time only get a baseline.
    // A plugin whose reload failed stays watched and is retried on its next edit.
    // Returns the plugins that were reloaded.
    std::vector<std::string> check_once();

    bool force_reload(const std::string& plugin);
    std::map<std::string, bool> reload_all();

    void on_before_reload(std::function<void(const std::string&)> fn);
    void on_after_reload(std::function<void(const std::string&, bool)> fn);

    // Oldest first. Empty plugin: every plugin.
    std::vector<ReloadEvent> history(const std::string& plugin = "") const;
    WatcherStatus status() const;

    // Watched files under dir (.so .json .yml .yaml .sig .manifest), skipping
    // .git, __pycache__ and data directories.
    PluginFingerprint scan(const std::filesystem::path& dir) const;

private:
    bool reload(const std::string& plugin);
    void loop();

    PluginLoader& loader_;
    const int interval_ms_;
    const bool use_hash_;
    const size_t history_limit_;

    mutable std::mutex mu_;
    std::map<std::string, PluginFingerprint> states_;
    std::set<std::string> failed_;    // unloaded by a failed reload, still watched
    std::deque<ReloadEvent> history_;
    std::vector<std::function<void(const std::string&)>> before_;
    std::vector<std::function<void(const std::string&, bool)>> after_;

    std::mutex stop_mu_;
    std::condition_variable stop_cv_;
    bool stop_{false};
    std::unique_ptr<std::thread> thread_;
};

} // namespace prism
