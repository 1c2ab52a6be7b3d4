#pragma once

// Dependency-aware plugin loader.
//
// Per-plugin gate, in order: installed (registry) -> signature (optional) ->
// dependencies loaded and version-compatible -> lock file present ->
// ledger grants -> root registered with the interception engine ->
// instantiate + initialize under the plugin's PluginScope.
// Any failure skips only that plugin; a dependency cycle aborts the batch.

#include "prism/capability_ledger.h"
#include "prism/interception.h"
#include "prism/manifest.h"
#include "prism/plugin_api.h"
#include "prism/signature.h"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace prism {

struct Settings;
class JsonlAuditLog;

struct LoaderOptions {
    std::filesystem::path plugins_dir;
    std::filesystem::path registry_file;
    std::vector<std::string> enabled_plugins;   // empty: every installed plugin (if auto_load)
    bool auto_load{true};
    bool verify_signatures{false};
    std::filesystem::path trusted_keys_dir;
    bool strict_version_constraints{false};

    static LoaderOptions from_settings(const Settings& s);
};

struct LoadReport {
    std::vector<std::string> loaded;
    std::vector<std::pair<std::string, std::string>> skipped;   // name, reason
    std::string fatal_error;                                      // batch aborted (cycle)

    bool ok() const { return fatal_error.empty(); }
    bool was_skipped(const std::string& name) const;
};

struct PluginRecord {
    std::string name;
    PluginManifest manifest;
    std::filesystem::path root;
    std::shared_ptr<Plugin> instance;
    std::vector<std::string> warnings;    // manifest/lock security warnings
};

struct SecurityReport {
    std::string plugin;
    bool loaded{false};
    std::vector<std::string> granted;
    std::vector<std::string> violations;
    std::vector<std::string> warnings;
};

// Read-only view of loaded plugins; the chain runner depends only on this.
class IPluginDirectory {
public:
    virtual ~IPluginDirectory() = default;
    virtual std::shared_ptr<Plugin> find(const std::string& name) const = 0;
    virtual std::optional<std::string> plugin_type(const std::string& name) const = 0;
};

class PluginLoader : public IPluginDirectory {
public:
    PluginLoader(LoaderOptions opts, const PermissionEngine& perms,
                 CapabilityLedger& ledger, InterceptionEngine& interception);
    ~PluginLoader() override;
    PluginLoader(const PluginLoader&) = delete;
    PluginLoader& operator=(const PluginLoader&) = delete;

    LoadReport load_all();

    // Full gate for plugins_dir/<name>. Already-loaded plugins return true.
    bool load_plugin(const std::string& name, std::string* reason);

    // Shuts down, releases grants/root and re-runs the gate.
    bool reload_plugin(const std::string& name, std::string* reason);
    bool unload_plugin(const std::string& name);
    void shutdown_all();

    std::shared_ptr<Plugin> find(const std::string& name) const override;
    std::optional<std::string> plugin_type(const std::string& name) const override;
    std::shared_ptr<const PluginRecord> record(const std::string& name) const;
    std::vector<std::string> loaded_names() const;
    bool is_loaded(const std::string& name) const;

    std::vector<std::string> violations(const std::string& name) const;
    SecurityReport security_report(const std::string& name) const;

    // Called after every change to the loaded set. Returns an id for removal.
    int add_change_listener(std::function<void()> fn);
    void remove_change_listener(int id);

    void set_audit_log(std::shared_ptr<JsonlAuditLog> log) { audit_ = std::move(log); }
    const LoaderOptions& options() const { return opts_; }
    std::filesystem::path plugin_dir(const std::string& name) const { return opts_.plugins_dir / name; }

private:
    bool load_locked(const std::string& name, const PluginManifest* scanned, std::string* reason);
    bool unload_locked(const std::string& name);
    void check_dependencies(const PluginManifest& m) const;
    // Declared permissions that are unknown, privileged or not granted by the
    // lock. A group's sub-plugins run under its grants, so theirs are checked too.
    std::vector<std::string> security_warnings(const PluginManifest& m, const LockFile* lock,
                                               const GroupManifest* group = nullptr) const;
    std::shared_ptr<Plugin> instantiate(const std::filesystem::path& dir, const PluginManifest& m) const;
    void load_group(const std::string& name, const std::filesystem::path& dir, const GroupManifest& group,
                    MetaPlugin& meta);
    void release_group(const std::string& name, MetaPlugin& meta);
    void audit(const std::string& event, const std::string& plugin, const std::string& detail) const;
    void notify();

    LoaderOptions opts_;
    const PermissionEngine& perms_;
    CapabilityLedger& ledger_;
    InterceptionEngine& interception_;
    InstallRegistry registry_;
    PluginSignatureVerifier verifier_;

    std::mutex reload_mu_;          // one load/reload/unload in flight
    mutable std::mutex mu_;         // guards plugins_ and listeners_
    std::map<std::string, std::shared_ptr<const PluginRecord>> plugins_;
    std::map<int, std::function<void()>> listeners_;
    int next_listener_{1};
    std::shared_ptr<JsonlAuditLog> audit_;
};

} // namespace prism
