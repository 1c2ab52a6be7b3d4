#include "prism/interception.h"
#include "prism/errors.h"
#include "prism/manifest.h"

#include <atomic>
#include <iostream>
#include <sstream>

namespace prism {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// PluginScope
// ---------------------------------------------------------------------------

static thread_local const std::string* t_current_plugin = nullptr;

PluginScope::PluginScope(std::string plugin) : name_(std::move(plugin)), prev_(t_current_plugin) {
    t_current_plugin = &name_;
}

PluginScope::~PluginScope() {
    t_current_plugin = prev_;
}

const std::string* PluginScope::current() {
    return t_current_plugin;
}

std::optional<std::string> capture_scope() {
    if (!t_current_plugin) return std::nullopt;
    return *t_current_plugin;
}

// ---------------------------------------------------------------------------
// Path helpers
// ---------------------------------------------------------------------------

static bool resolve_path(const fs::path& p, fs::path* out) {
    std::error_code ec;
    auto abs = fs::absolute(p, ec);
    if (ec) return false;
    auto rp = fs::weakly_canonical(abs, ec);
    if (ec) return false;
    *out = rp;
    return true;
}

static bool is_path_under(const fs::path& p, const fs::path& root) {
    auto ps = p.generic_string();
    auto rs = root.generic_string();
    if (rs.empty()) return false;
    if (ps == rs) return true;
    if (rs.back() != '/') rs.push_back('/');
    return ps.rfind(rs, 0) == 0;
}

static bool is_write_event(const std::string& event, const OperationArgs& args) {
    if (event == events::kRename || event == events::kRemove) return true;
    return args.mode.find_first_of("wax+") != std::string::npos;
}

static std::string join(const std::vector<std::string>& v) {
    std::string s = "[";
    for (size_t i = 0; i < v.size(); i++) {
        if (i) s += ", ";
        s += v[i];
    }
    return s + "]";
}

static std::string blocked(const std::string& plugin, const std::string& why,
                           const std::string& event, const std::string& resource) {
    std::ostringstream m;
    m << "Plugin '" << plugin << "' blocked: " << why << ". Event: " << event << ", Resource: " << resource;
    return m.str();
}

// ---------------------------------------------------------------------------
// InterceptionEngine
// ---------------------------------------------------------------------------

static std::atomic<InterceptionEngine*> g_active_engine{nullptr};

InterceptionEngine::InterceptionEngine(const PermissionEngine& perms, CapabilityLedger& ledger, JailPaths paths)
    : perms_(perms), ledger_(ledger) {
    if (!resolve_path(paths.secure_dir, &secure_dir_)) secure_dir_ = paths.secure_dir;
    if (!resolve_path(paths.temp_root, &temp_root_)) temp_root_ = paths.temp_root;
}

InterceptionEngine::~InterceptionEngine() {
    deactivate();
}

void InterceptionEngine::activate() {
    InterceptionEngine* expected = nullptr;
    if (g_active_engine.load() == this) return;
    if (!g_active_engine.compare_exchange_strong(expected, this)) {
        throw std::runtime_error("interception hook already installed by another engine");
    }
    std::cerr << "[interception] hook installed; secure_dir=" << secure_dir_.string() << "\n";
}

void InterceptionEngine::deactivate() {
    InterceptionEngine* expected = this;
    g_active_engine.compare_exchange_strong(expected, nullptr);
}

InterceptionEngine* InterceptionEngine::active() {
    return g_active_engine.load();
}

void InterceptionEngine::register_plugin_root(const std::string& plugin, const fs::path& root) {
    fs::path resolved;
    if (!resolve_path(root, &resolved)) resolved = root;
    {
        std::lock_guard<std::mutex> lk(mu_);
        roots_[plugin] = resolved;
    }
    std::error_code ec;
    fs::create_directories(temp_dir_for(plugin), ec);
    if (ec) {
        std::cerr << "[warn] interception: cannot create temp dir for " << plugin << ": " << ec.message() << "\n";
    }
}

void InterceptionEngine::release_plugin_root(const std::string& plugin) {
    std::lock_guard<std::mutex> lk(mu_);
    roots_.erase(plugin);
}

std::optional<fs::path> InterceptionEngine::plugin_root(const std::string& plugin) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = roots_.find(plugin);
    if (it == roots_.end()) return std::nullopt;
    return it->second;
}

fs::path InterceptionEngine::temp_dir_for(const std::string& plugin) const {
    return temp_root_ / plugin;
}

std::optional<std::string> InterceptionEngine::check_path(const std::string& plugin, const std::string& event,
                                                          const OperationArgs& args, const fs::path& p) const {
    fs::path rp;
    if (!resolve_path(p, &rp)) {
        return blocked(plugin, "path cannot be resolved", event, p.string());
    }

    // 1. Fixed jail.
    if (is_path_under(rp, secure_dir_)) {
        return blocked(plugin, "access to secure storage is forbidden", event, rp.string());
    }
    auto root = plugin_root(plugin);
    if (rp.filename() == kLockFileName) {
        if (root && rp == *root / kLockFileName) {
            return blocked(plugin, "access to its own lock file is forbidden", event, rp.string());
        }
        if (is_write_event(event, args)) {
            return blocked(plugin, "modifying a lock file is forbidden", event, rp.string());
        }
    }

    // 2. Directory jail.
    if (!root) {
        return blocked(plugin, "no registered plugin root", event, rp.string());
    }
    if (is_path_under(rp, *root) || is_path_under(rp, temp_dir_for(plugin))) return std::nullopt;
    if (ledger_.has_prefix(plugin, "system.")) return std::nullopt;
    return blocked(plugin, "path outside plugin directory", event, rp.string());
}

std::optional<std::string> InterceptionEngine::evaluate(const std::string& plugin, const std::string& event,
                                                        const OperationArgs& args) const {
    const bool path_event = event == events::kOpen || event == events::kRename || event == events::kRemove;
    if (path_event) {
        if (auto denied = check_path(plugin, event, args, args.path)) return denied;
        if (!args.path2.empty()) {
            if (auto denied = check_path(plugin, event, args, args.path2)) return denied;
        }
    }

    // 3. Capability check.
    const auto required = perms_.map_event_to_permissions(event, args);
    if (required.empty() && !perms_.governs(event)) return std::nullopt;
    if (!required.empty() && ledger_.holds_any(plugin, required, event, args)) return std::nullopt;

    std::ostringstream m;
    m << "Plugin '" << plugin << "' blocked from performing unauthorized action. Event: " << event
      << ", Required one of Permissions: " << join(required) << ", Resource: " << args.describe_resource();
    return m.str();
}

void InterceptionEngine::check(const std::string& event, const OperationArgs& args) {
    const std::string* plugin = PluginScope::current();
    if (!plugin) return;
    if (auto denied = evaluate(*plugin, event, args)) {
        ledger_.log_violation(*plugin, *denied);
        throw AuthorizationDenied(*plugin, event, *denied);
    }
}

void enforce(const std::string& event, const OperationArgs& args) {
    const std::string* plugin = PluginScope::current();
    if (!plugin) return;
    InterceptionEngine* engine = InterceptionEngine::active();
    if (!engine) {
        throw AuthorizationDenied(*plugin, event,
            "Plugin '" + *plugin + "' blocked: no interception engine installed. Event: " + event);
    }
    engine->check(event, args);
}

} // namespace prism
