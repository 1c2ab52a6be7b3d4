#include "prism/hot_reload.h"
#include "prism/crypto.h"

#include <chrono>
#include <iostream>
#include <set>

namespace prism {

namespace fs = std::filesystem;

namespace {

const std::set<std::string> kWatchedSuffixes = {".so", ".json", ".yml", ".yaml", ".sig", ".manifest"};
const std::set<std::string> kIgnoredDirs = {".git", "__pycache__", "data"};

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

HotReloadManager::HotReloadManager(PluginLoader& loader, int interval_ms, bool use_hash, size_t history_limit)
    : loader_(loader),
      interval_ms_(interval_ms < 50 ? 50 : interval_ms),
      use_hash_(use_hash),
      history_limit_(history_limit == 0 ? 1 : history_limit) {}

HotReloadManager::~HotReloadManager() {
    stop();
}

PluginFingerprint HotReloadManager::scan(const fs::path& dir) const {
    PluginFingerprint out;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) return out;
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const fs::path& p = it->path();
        if (it->is_directory(ec)) {
            if (kIgnoredDirs.count(p.filename().string())) it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file(ec)) continue;
        if (!kWatchedSuffixes.count(p.extension().string())) continue;

        FileFingerprint fp;
        auto t = it->last_write_time(ec);
        if (ec) continue;
        fp.mtime_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
        fp.size = it->file_size(ec);
        if (ec) continue;
        if (use_hash_) fp.sha256 = sha256_hex_file(p);
        out[p.lexically_relative(dir).generic_string()] = std::move(fp);
    }
    return out;
}

std::vector<std::string> HotReloadManager::check_once() {
    std::vector<std::string> changed;
    const auto loaded = loader_.loaded_names();
    std::set<std::string> watched(loaded.begin(), loaded.end());
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = failed_.begin(); it != failed_.end();) {
            std::error_code ec;
            if (!fs::is_directory(loader_.plugin_dir(*it), ec)) it = failed_.erase(it);
            else watched.insert(*it++);
        }
        // forget plugins that were unloaded elsewhere
        for (auto it = states_.begin(); it != states_.end();) {
            if (!watched.count(it->first)) it = states_.erase(it);
            else ++it;
        }
    }
    for (const auto& name : watched) {
        PluginFingerprint now = scan(loader_.plugin_dir(name));
        std::lock_guard<std::mutex> lk(mu_);
        auto it = states_.find(name);
        if (it == states_.end()) {
            states_.emplace(name, std::move(now));
        } else if (it->second != now) {
            changed.push_back(name);
        }
    }

    std::vector<std::string> reloaded;
    for (const auto& name : changed) {
        std::cerr << "[hot_reload] change detected in " << name << "\n";
        if (reload(name)) reloaded.push_back(name);
    }
    return reloaded;
}

bool HotReloadManager::reload(const std::string& plugin) {
    std::vector<std::function<void(const std::string&)>> before;
    std::vector<std::function<void(const std::string&, bool)>> after;
    {
        std::lock_guard<std::mutex> lk(mu_);
        before = before_;
        after = after_;
    }
    for (auto& fn : before) fn(plugin);

    std::string reason;
    bool ok = loader_.reload_plugin(plugin, &reason);
    if (!ok) std::cerr << "[warn] hot_reload: reload of " << plugin << " failed: " << reason << "\n";

    PluginFingerprint fresh = scan(loader_.plugin_dir(plugin));
    {
        std::lock_guard<std::mutex> lk(mu_);
        // the new baseline stops the same edit from being retried every tick;
        // the next edit triggers another attempt
        states_[plugin] = std::move(fresh);
        if (ok) failed_.erase(plugin);
        else failed_.insert(plugin);
        history_.push_back(ReloadEvent{plugin, ok, ok ? "" : reason, now_ms()});
        while (history_.size() > history_limit_) history_.pop_front();
    }
    for (auto& fn : after) fn(plugin, ok);
    return ok;
}

bool HotReloadManager::force_reload(const std::string& plugin) {
    return reload(plugin);
}

std::map<std::string, bool> HotReloadManager::reload_all() {
    std::map<std::string, bool> out;
    for (const auto& name : loader_.loaded_names()) out[name] = reload(name);
    return out;
}

void HotReloadManager::on_before_reload(std::function<void(const std::string&)> fn) {
    std::lock_guard<std::mutex> lk(mu_);
    before_.push_back(std::move(fn));
}

void HotReloadManager::on_after_reload(std::function<void(const std::string&, bool)> fn) {
    std::lock_guard<std::mutex> lk(mu_);
    after_.push_back(std::move(fn));
}

std::vector<ReloadEvent> HotReloadManager::history(const std::string& plugin) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<ReloadEvent> out;
    for (const auto& e : history_) {
        if (plugin.empty() || e.plugin == plugin) out.push_back(e);
    }
    return out;
}

WatcherStatus HotReloadManager::status() const {
    WatcherStatus s;
    s.enabled = running();
    s.interval_ms = interval_ms_;
    std::lock_guard<std::mutex> lk(mu_);
    s.watched_plugins = states_.size();
    for (const auto& kv : states_) s.total_files += kv.second.size();
    return s;
}

void HotReloadManager::start() {
    if (thread_) return;
    {
        std::lock_guard<std::mutex> lk(stop_mu_);
        stop_ = false;
    }
    for (const auto& name : loader_.loaded_names()) {
        PluginFingerprint fp = scan(loader_.plugin_dir(name));
        std::lock_guard<std::mutex> lk(mu_);
        states_[name] = std::move(fp);
    }
    thread_.reset(new std::thread([this]() { loop(); }));
    std::cerr << "[hot_reload] watching " << status().watched_plugins << " plugins every "
              << interval_ms_ << "ms\n";
}

void HotReloadManager::stop() {
    {
        std::lock_guard<std::mutex> lk(stop_mu_);
        stop_ = true;
    }
    stop_cv_.notify_all();
    if (thread_ && thread_->joinable()) thread_->join();
    thread_.reset();
}

bool HotReloadManager::running() const {
    return thread_ != nullptr;
}

void HotReloadManager::loop() {
    for (;;) {
        {
            std::unique_lock<std::mutex> lk(stop_mu_);
            if (stop_cv_.wait_for(lk, std::chrono::milliseconds(interval_ms_), [this] { return stop_; })) return;
        }
        try {
            check_once();
        } catch (const std::exception& e) {
            std::cerr << "[error] hot_reload: " << e.what() << "\n";
        }
    }
}

} // namespace prism
