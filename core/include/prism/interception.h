#pragma once

// Enforcement point for governed operations.
//
// One InterceptionEngine at a time is active for the whole process; the SDK
// (prism/sdk.h) calls enforce() before every sensitive primitive. The acting
// plugin is taken from the calling thread's PluginScope stack, so concurrent
// chain runs on different threads never see each other's identity.
//
// Decision order: fixed jail (secure dir, lock files) -> directory jail
// (plugin root or temp dir, unless a "system." capability is held) ->
// capability check (OR over the capabilities the event maps to).

#include "prism/capability_ledger.h"
#include "prism/permission_engine.h"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace prism {

// RAII guard: marks `plugin` as the code running on this thread until
// destruction, then restores the previous identity (also on unwind).
class PluginScope {
public:
    explicit PluginScope(std::string plugin);
    ~PluginScope();
    PluginScope(const PluginScope&) = delete;
    PluginScope& operator=(const PluginScope&) = delete;

    // nullptr outside any scope.
    static const std::string* current();

private:
    std::string name_;
    const std::string* prev_;
};

// Snapshot of the caller's identity for handing work to another thread.
std::optional<std::string> capture_scope();

// Wraps `fn` so it runs under the identity active at wrap time.
template <typename Fn>
auto bind_to_current_scope(Fn fn) {
    return [id = capture_scope(), fn = std::move(fn)](auto&&... args) mutable {
        if (!id) return fn(std::forward<decltype(args)>(args)...);
        PluginScope scope(*id);
        return fn(std::forward<decltype(args)>(args)...);
    };
}

struct JailPaths {
    std::filesystem::path secure_dir;   // reserved storage, never accessible to plugins
    std::filesystem::path temp_root;    // per-plugin temp dirs live at temp_root/<plugin>
};

class InterceptionEngine {
public:
    InterceptionEngine(const PermissionEngine& perms, CapabilityLedger& ledger, JailPaths paths);
    ~InterceptionEngine();
    InterceptionEngine(const InterceptionEngine&) = delete;
    InterceptionEngine& operator=(const InterceptionEngine&) = delete;

    // Installs this engine as the process-wide hook.
    // Throws std::runtime_error if another engine is already installed.
    void activate();
    void deactivate();
    static InterceptionEngine* active();

    // Also creates the plugin's temp dir.
    void register_plugin_root(const std::string& plugin, const std::filesystem::path& root);
    void release_plugin_root(const std::string& plugin);
    std::optional<std::filesystem::path> plugin_root(const std::string& plugin) const;
    std::filesystem::path temp_dir_for(const std::string& plugin) const;

    // Checks the operation for the current PluginScope. No-op outside any
    // scope. On denial records a violation and throws AuthorizationDenied.
    void check(const std::string& event, const OperationArgs& args);

    // Pure decision for an explicit plugin: nullopt if allowed, otherwise the
    // violation message.
    std::optional<std::string> evaluate(const std::string& plugin, const std::string& event,
                                        const OperationArgs& args) const;

    const CapabilityLedger& ledger() const { return ledger_; }

private:
    std::optional<std::string> check_path(const std::string& plugin, const std::string& event,
                                          const OperationArgs& args, const std::filesystem::path& p) const;

    const PermissionEngine& perms_;
    CapabilityLedger& ledger_;
    std::filesystem::path secure_dir_;
    std::filesystem::path temp_root_;

    mutable std::mutex mu_;
    std::map<std::string, std::filesystem::path> roots_;
};

// Called by every governed operation before it takes effect.
// Outside plugin scope: no-op. Inside a scope with no active engine: denied.
void enforce(const std::string& event, const OperationArgs& args);

} // namespace prism
