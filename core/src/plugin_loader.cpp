#include "prism/plugin_loader.h"
#include "prism/config.h"
#include "prism/dependency_resolver.h"
#include "prism/errors.h"
#include "prism/log.h"
#include "prism/version.h"

#include <dlfcn.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <set>

namespace prism {

namespace fs = std::filesystem;

namespace {

constexpr const char* kBuiltinPrefix = "builtin:";
constexpr const char* kDefaultLibrary = "plugin.so";

// Keeps a dlopen handle alive for as long as any instance created from it.
struct LibraryHandle {
    void* handle{nullptr};
    explicit LibraryHandle(void* h) : handle(h) {}
    ~LibraryHandle() {
        if (handle) dlclose(handle);
    }
    LibraryHandle(const LibraryHandle&) = delete;
    LibraryHandle& operator=(const LibraryHandle&) = delete;
};

std::shared_ptr<Plugin> load_shared_library(const fs::path& path) {
    void* h = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!h) {
        const char* dl_err = dlerror();  // dlerror() clears on read
        throw MissingArtifact(std::string("dlopen failed: ") + (dl_err ? dl_err : "(unknown)"));
    }
    auto lib = std::make_shared<LibraryHandle>(h);

    // ABI version check, enforced unless PRISM_PLUGIN_ABI_LAX=1
    dlerror();
    auto abi_fn = reinterpret_cast<prism_plugin_abi_version_fn>(dlsym(h, "prism_plugin_abi_version"));
    dlerror();
    if (abi_fn) {
        int plugin_abi = abi_fn();
        if (plugin_abi != PRISM_ABI_VERSION) {
            throw ConfigurationError("ABI version mismatch: host=" + std::to_string(PRISM_ABI_VERSION) +
                                     " plugin=" + std::to_string(plugin_abi) + " for " + path.string());
        }
    } else {
        const char* lax = std::getenv("PRISM_PLUGIN_ABI_LAX");
        if (!lax || std::string(lax) != "1") {
            throw ConfigurationError("plugin missing prism_plugin_abi_version() export: " + path.string() +
                                     " (set PRISM_PLUGIN_ABI_LAX=1 to allow)");
        }
    }

    dlerror();
    auto create = reinterpret_cast<prism_plugin_create_fn>(dlsym(h, "prism_plugin_create"));
    auto destroy = reinterpret_cast<prism_plugin_destroy_fn>(dlsym(h, "prism_plugin_destroy"));
    const char* sym_err = dlerror();
    if (sym_err || !create || !destroy) {
        throw MissingArtifact(std::string("missing prism_plugin_create/prism_plugin_destroy: ") +
                              (sym_err ? sym_err : path.string()));
    }

    Plugin* raw = create();
    if (!raw) throw std::runtime_error("prism_plugin_create() returned null: " + path.string());
    return std::shared_ptr<Plugin>(raw, [lib, destroy](Plugin* p) { destroy(p); });
}

bool entry_escapes(const std::string& entry) {
    fs::path p(entry);
    if (p.is_absolute()) return true;
    for (const auto& part : p) {
        if (part == "..") return true;
    }
    return false;
}

std::string join_names(const std::set<std::string>& names) {
    std::string s;
    for (const auto& n : names) s += (s.empty() ? "" : ",") + n;
    return s;
}

} // namespace

LoaderOptions LoaderOptions::from_settings(const Settings& s) {
    LoaderOptions o;
    o.plugins_dir = s.plugins_dir;
    o.registry_file = s.registry_file();
    o.enabled_plugins = s.enabled_plugins;
    o.auto_load = s.auto_load;
    o.verify_signatures = s.verify_signatures;
    o.trusted_keys_dir = s.trusted_keys_dir;
    o.strict_version_constraints = s.strict_version_constraints;
    return o;
}

bool LoadReport::was_skipped(const std::string& name) const {
    return std::any_of(skipped.begin(), skipped.end(),
                       [&](const std::pair<std::string, std::string>& s) { return s.first == name; });
}

PluginLoader::PluginLoader(LoaderOptions opts, const PermissionEngine& perms,
                           CapabilityLedger& ledger, InterceptionEngine& interception)
    : opts_(std::move(opts)),
      perms_(perms),
      ledger_(ledger),
      interception_(interception),
      registry_(opts_.registry_file),
      verifier_(opts_.trusted_keys_dir) {}

PluginLoader::~PluginLoader() {
    shutdown_all();
}

// ---------------------------------------------------------------------------
// Batch load
// ---------------------------------------------------------------------------

LoadReport PluginLoader::load_all() {
    std::lock_guard<std::mutex> guard(reload_mu_);
    LoadReport report;

    std::error_code ec;
    if (!fs::is_directory(opts_.plugins_dir, ec)) {
        std::cerr << "[warn] loader: plugin directory not found: " << opts_.plugins_dir.string() << "\n";
        return report;
    }
    if (opts_.enabled_plugins.empty() && !opts_.auto_load) {
        std::cerr << "[loader] auto-load disabled and no plugins enabled\n";
        return report;
    }

    std::vector<std::string> candidates;
    for (const auto& ent : fs::directory_iterator(opts_.plugins_dir, ec)) {
        if (!ent.is_directory()) continue;
        std::string name = ent.path().filename().string();
        if (name.empty() || name[0] == '_' || name[0] == '.') continue;
        candidates.push_back(name);
    }
    std::sort(candidates.begin(), candidates.end());

    const std::set<std::string> enabled(opts_.enabled_plugins.begin(), opts_.enabled_plugins.end());
    std::map<std::string, PluginManifest> scanned;
    DependencyResolver resolver;

    for (const auto& name : candidates) {
        if (!enabled.empty() && !enabled.count(name)) continue;
        if (!registry_.is_installed(name)) {
            report.skipped.emplace_back(name, "not installed");
            continue;
        }
        try {
            PluginManifest m = read_plugin_manifest(plugin_dir(name));
            std::vector<std::string> deps;
            for (const auto& d : m.dependencies) deps.push_back(d.name);
            resolver.add_plugin(name, deps);
            scanned.emplace(name, std::move(m));
        } catch (const std::exception& e) {
            std::cerr << "[warn] loader: skipping " << name << ": " << e.what() << "\n";
            report.skipped.emplace_back(name, e.what());
        }
    }
    for (const auto& name : enabled) {
        if (!std::binary_search(candidates.begin(), candidates.end(), name)) {
            report.skipped.emplace_back(name, "plugin directory not found");
        }
    }

    std::vector<std::string> order;
    try {
        order = resolver.resolve();
    } catch (const DependencyCycleError& e) {
        std::cerr << "[error] loader: " << e.what() << "; aborting load batch\n";
        report.fatal_error = e.what();
        audit("batch_aborted", "", e.what());
        return report;
    }

    for (const auto& name : order) {
        std::string reason;
        if (load_locked(name, &scanned.at(name), &reason)) {
            report.loaded.push_back(name);
        } else {
            report.skipped.emplace_back(name, reason);
        }
    }
    std::cerr << "[loader] batch complete: loaded=" << report.loaded.size()
              << " skipped=" << report.skipped.size() << "\n";
    notify();
    return report;
}

bool PluginLoader::load_plugin(const std::string& name, std::string* reason) {
    bool ok;
    {
        std::lock_guard<std::mutex> guard(reload_mu_);
        ok = load_locked(name, nullptr, reason);
    }
    notify();
    return ok;
}

bool PluginLoader::reload_plugin(const std::string& name, std::string* reason) {
    bool ok;
    {
        std::lock_guard<std::mutex> guard(reload_mu_);
        std::cerr << "[loader] reloading " << name << "\n";
        unload_locked(name);
        ok = load_locked(name, nullptr, reason);
        audit("reload", name, ok ? "ok" : (reason ? *reason : "failed"));
    }
    notify();
    return ok;
}

bool PluginLoader::unload_plugin(const std::string& name) {
    bool ok;
    {
        std::lock_guard<std::mutex> guard(reload_mu_);
        ok = unload_locked(name);
    }
    if (ok) notify();
    return ok;
}

void PluginLoader::shutdown_all() {
    std::lock_guard<std::mutex> guard(reload_mu_);
    for (const auto& name : loaded_names()) unload_locked(name);
}

// ---------------------------------------------------------------------------
// Per-plugin gate
// ---------------------------------------------------------------------------

void PluginLoader::check_dependencies(const PluginManifest& m) const {
    for (const auto& dep : m.dependencies) {
        auto rec = record(dep.name);
        if (!rec) {
            throw UnmetDependency("requires '" + dep.name + "', which is not loaded");
        }
        switch (check_version_constraint(rec->manifest.version, dep.constraint)) {
        case ConstraintCheck::Satisfied:
            break;
        case ConstraintCheck::Unsatisfied:
            throw UnmetDependency("requires " + dep.to_string() + ", found " + rec->manifest.version);
        case ConstraintCheck::Unparseable:
            if (opts_.strict_version_constraints) {
                throw UnmetDependency("unparseable version constraint " + dep.to_string() +
                                      " (strict mode)");
            }
            std::cerr << "[warn] loader: " << m.name << ": cannot evaluate constraint " << dep.to_string()
                      << " against " << rec->manifest.version << "; allowing\n";
            break;
        }
    }
}

std::vector<std::string> PluginLoader::security_warnings(const PluginManifest& m, const LockFile* lock,
                                                        const GroupManifest* group) const {
    std::vector<std::string> out;
    std::set<std::string> locked;
    if (lock) {
        for (const auto& p : lock->permissions) {
            if (!p.name.empty()) locked.insert(p.name);
            else if (const auto* def = perms_.find_definition_for_declaration(p.type, p.resource)) locked.insert(def->name);
        }
    }
    for (const auto& p : m.permissions) {
        std::string cap = p.name;
        if (cap.empty()) {
            const auto* def = perms_.find_definition_for_declaration(p.type, p.resource);
            if (!def) {
                out.push_back("declared permission " + p.type + ":" + p.resource + " matches no known capability");
                continue;
            }
            cap = def->name;
        } else if (!perms_.definition(cap)) {
            out.push_back("declared permission '" + cap + "' is not a registered capability");
            continue;
        }
        if (cap.compare(0, 7, "system.") == 0) {
            out.push_back("requests privileged capability " + cap);
        }
        if (lock && !locked.count(cap)) {
            out.push_back("declared permission " + cap + " is not granted by the lock file");
        }
    }
    if (group) {
        for (const auto& kv : group->subplugins) {
            if (!kv.second.enabled || kv.second.permissions.empty()) continue;
            PluginManifest sub;
            sub.permissions = kv.second.permissions;
            for (const auto& w : security_warnings(sub, lock)) out.push_back("sub-plugin " + kv.first + ": " + w);
        }
    }
    return out;
}

std::shared_ptr<Plugin> PluginLoader::instantiate(const fs::path& dir, const PluginManifest& m) const {
    const std::string& entry = m.entry;
    if (entry.compare(0, std::char_traits<char>::length(kBuiltinPrefix), kBuiltinPrefix) == 0) {
        const std::string id = entry.substr(std::char_traits<char>::length(kBuiltinPrefix));
        std::unique_ptr<Plugin> p = PluginFactoryRegistry::instance().create(id);
        if (!p) throw MissingArtifact("no registered plugin factory '" + id + "'");
        return std::shared_ptr<Plugin>(std::move(p));
    }

    std::error_code ec;
    if (!entry.empty()) {
        if (entry_escapes(entry)) throw ConfigurationError("entry point escapes plugin directory: " + entry);
        if (!fs::is_regular_file(dir / entry, ec)) throw MissingArtifact("entry point not found: " + entry);
        return load_shared_library(dir / entry);
    }
    if (fs::is_regular_file(dir / kDefaultLibrary, ec)) return load_shared_library(dir / kDefaultLibrary);
    if (is_group_dir(dir)) return std::make_shared<MetaPlugin>();
    throw MissingArtifact("no entry point (manifest 'entry' or " + std::string(kDefaultLibrary) + ")");
}

bool PluginLoader::load_locked(const std::string& name, const PluginManifest* scanned, std::string* reason) {
    auto fail = [&](const std::string& why) {
        std::cerr << "[warn] loader: skipping " << name << ": " << why << "\n";
        audit("plugin_skipped", name, why);
        if (reason) *reason = why;
        return false;
    };

    if (is_loaded(name)) return true;

    const fs::path dir = plugin_dir(name);
    std::error_code ec;
    if (name.empty() || entry_escapes(name) || !fs::is_directory(dir, ec)) {
        return fail("plugin directory not found");
    }

    // 1. install registry
    if (!registry_.is_installed(name)) return fail("not installed");

    // 2. signature
    if (opts_.verify_signatures) {
        std::string serr;
        if (!verifier_.verify_plugin(dir, &serr)) return fail("signature verification failed: " + serr);
    }

    PluginManifest manifest;
    LockFile lock;
    std::optional<GroupManifest> group;
    try {
        manifest = scanned ? *scanned : read_plugin_manifest(dir);
        // 3. dependencies
        check_dependencies(manifest);
        // 4. lock file
        lock = read_lock_file(lock_file_path(dir));
        if (lock.plugin_name != name) {
            throw ConfigurationError("lock file belongs to '" + lock.plugin_name + "'");
        }
        if (is_group_dir(dir)) group = read_group_manifest(dir);
    } catch (const std::exception& e) {
        return fail(e.what());
    }

    auto warnings = security_warnings(manifest, &lock, group ? &*group : nullptr);
    for (const auto& w : warnings) std::cerr << "[warn] security: " << name << ": " << w << "\n";

    // 5. grants, 6. root
    ledger_.grant_from_lock(name, lock.permissions);
    interception_.register_plugin_root(name, dir);

    // 7. instantiate and initialize under the plugin's scope
    std::shared_ptr<Plugin> instance;
    std::string error;
    try {
        PluginScope scope(name);
        instance = instantiate(dir, manifest);
        instance->initialize();
        if (group) {
            auto* meta = dynamic_cast<MetaPlugin*>(instance.get());
            if (!meta) throw ConfigurationError("group plugin does not derive from MetaPlugin");
            load_group(name, dir, *group, *meta);
        }
    } catch (const std::exception& e) {
        error = e.what();
    } catch (...) {
        error = "non-standard exception during initialization";
    }
    if (!error.empty()) {
        if (instance) {
            if (auto* meta = dynamic_cast<MetaPlugin*>(instance.get())) release_group(name, *meta);
        }
        instance.reset();
        ledger_.revoke(name);
        interception_.release_plugin_root(name);
        return fail("initialization failed: " + error);
    }

    auto rec = std::make_shared<PluginRecord>();
    rec->name = name;
    rec->manifest = std::move(manifest);
    rec->root = dir;
    rec->instance = std::move(instance);
    rec->warnings = std::move(warnings);
    {
        std::lock_guard<std::mutex> lk(mu_);
        plugins_[name] = rec;
    }
    std::cerr << "[loader] loaded " << name << " " << rec->manifest.version
              << " grants=[" << join_names(ledger_.granted(name)) << "]\n";
    audit("plugin_loaded", name, rec->manifest.version);
    return true;
}

bool PluginLoader::unload_locked(const std::string& name) {
    std::shared_ptr<const PluginRecord> rec;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = plugins_.find(name);
        if (it == plugins_.end()) return false;
        rec = it->second;
        plugins_.erase(it);
    }

    if (auto* meta = dynamic_cast<MetaPlugin*>(rec->instance.get())) release_group(name, *meta);
    try {
        PluginScope scope(name);
        rec->instance->shutdown();
    } catch (const std::exception& e) {
        std::cerr << "[warn] loader: shutdown of " << name << " failed: " << e.what() << "\n";
    }
    ledger_.revoke(name);
    interception_.release_plugin_root(name);
    std::cerr << "[loader] unloaded " << name << "\n";
    audit("plugin_unloaded", name, "");
    return true;
}

// ---------------------------------------------------------------------------
// Meta-plugin groups
// ---------------------------------------------------------------------------

void PluginLoader::load_group(const std::string& name, const fs::path& dir, const GroupManifest& group,
                              MetaPlugin& meta) {
    const fs::path subs_dir = dir / "subplugins";

    std::map<std::string, PluginManifest> manifests;
    std::map<std::string, std::vector<DependencySpec>> deps;
    std::error_code ec;
    if (fs::is_directory(subs_dir, ec)) {
        for (const auto& ent : fs::directory_iterator(subs_dir, ec)) {
            if (!ent.is_directory()) continue;
            const std::string sub = ent.path().filename().string();
            auto cfg = group.subplugins.find(sub);
            if (cfg != group.subplugins.end() && !cfg->second.enabled) continue;

            PluginManifest m;
            try {
                m = read_plugin_manifest(ent.path());
            } catch (const MissingArtifact&) {
                m.name = sub;
            }
            std::vector<DependencySpec> d = m.dependencies;
            if (cfg != group.subplugins.end()) {
                d.insert(d.end(), cfg->second.dependencies.begin(), cfg->second.dependencies.end());
            }
            deps[sub] = std::move(d);
            manifests[sub] = std::move(m);
        }
    } else if (!group.subplugins.empty()) {
        std::cerr << "[warn] loader: " << name << ": subplugins directory not found\n";
    }

    DependencyResolver resolver;
    for (const auto& kv : deps) {
        std::vector<std::string> names;
        for (const auto& d : kv.second) names.push_back(d.name);
        resolver.add_plugin(kv.first, names);
    }
    const std::vector<std::string> order = resolver.resolve();   // cycle fails the whole group

    std::set<std::string> attached;
    for (const auto& sub : order) {
        const std::string full = name + "." + sub;
        bool unmet = false;
        for (const auto& d : deps[sub]) {
            if (!attached.count(d.name)) {
                std::cerr << "[warn] loader: " << full << " requires sub-plugin " << d.name
                          << ", which is not loaded; skipped\n";
                unmet = true;
                break;
            }
            auto check = check_version_constraint(manifests[d.name].version, d.constraint);
            if (check == ConstraintCheck::Unsatisfied ||
                (check == ConstraintCheck::Unparseable && opts_.strict_version_constraints)) {
                std::cerr << "[warn] loader: " << full << " requires " << d.to_string() << ", found "
                          << manifests[d.name].version << "; skipped\n";
                unmet = true;
                break;
            }
        }
        if (unmet) continue;

        ledger_.inherit(full, name);
        interception_.register_plugin_root(full, dir);
        try {
            PluginScope scope(full);
            auto inst = instantiate(subs_dir / sub, manifests[sub]);
            inst->initialize();
            meta.attach_subplugin(sub, std::move(inst));
            attached.insert(sub);
            std::cerr << "[loader] loaded sub-plugin " << full << "\n";
        } catch (const std::exception& e) {
            std::cerr << "[warn] loader: sub-plugin " << full << " failed: " << e.what() << "\n";
            ledger_.revoke(full);
            interception_.release_plugin_root(full);
        }
    }

    meta.set_chains(read_preset_chains(dir, name, attached, group.chains.root));
}

void PluginLoader::release_group(const std::string& name, MetaPlugin& meta) {
    for (auto& kv : meta.detach_subplugins()) {
        const std::string full = name + "." + kv.first;
        try {
            PluginScope scope(full);
            kv.second->shutdown();
        } catch (const std::exception& e) {
            std::cerr << "[warn] loader: shutdown of " << full << " failed: " << e.what() << "\n";
        }
        ledger_.revoke(full);
        interception_.release_plugin_root(full);
    }
    meta.set_chains({});
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::shared_ptr<const PluginRecord> PluginLoader::record(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = plugins_.find(name);
    return it == plugins_.end() ? nullptr : it->second;
}

std::shared_ptr<Plugin> PluginLoader::find(const std::string& name) const {
    auto rec = record(name);
    return rec ? rec->instance : nullptr;
}

std::optional<std::string> PluginLoader::plugin_type(const std::string& name) const {
    auto rec = record(name);
    if (!rec) return std::nullopt;
    return rec->manifest.type;
}

std::vector<std::string> PluginLoader::loaded_names() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    for (const auto& kv : plugins_) out.push_back(kv.first);
    return out;
}

bool PluginLoader::is_loaded(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    return plugins_.count(name) != 0;
}

std::vector<std::string> PluginLoader::violations(const std::string& name) const {
    return ledger_.violations(name);
}

SecurityReport PluginLoader::security_report(const std::string& name) const {
    SecurityReport r;
    r.plugin = name;
    auto rec = record(name);
    r.loaded = rec != nullptr;
    auto granted = ledger_.granted(name);
    r.granted.assign(granted.begin(), granted.end());
    r.violations = ledger_.violations(name);
    if (rec) {
        r.warnings = rec->warnings;
        return r;
    }
    try {
        const fs::path dir = plugin_dir(name);
        PluginManifest m = read_plugin_manifest(dir);
        std::optional<LockFile> lock;
        std::optional<GroupManifest> group;
        std::error_code ec;
        if (fs::is_regular_file(lock_file_path(dir), ec)) lock = read_lock_file(lock_file_path(dir));
        if (is_group_dir(dir)) group = read_group_manifest(dir);
        r.warnings = security_warnings(m, lock ? &*lock : nullptr, group ? &*group : nullptr);
        if (!lock) r.warnings.push_back("no lock file; plugin cannot load");
    } catch (const std::exception& e) {
        r.warnings.push_back(e.what());
    }
    return r;
}

int PluginLoader::add_change_listener(std::function<void()> fn) {
    std::lock_guard<std::mutex> lk(mu_);
    int id = next_listener_++;
    listeners_[id] = std::move(fn);
    return id;
}

void PluginLoader::remove_change_listener(int id) {
    std::lock_guard<std::mutex> lk(mu_);
    listeners_.erase(id);
}

void PluginLoader::notify() {
    std::vector<std::function<void()>> fns;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& kv : listeners_) fns.push_back(kv.second);
    }
    for (auto& fn : fns) fn();
}

void PluginLoader::audit(const std::string& event, const std::string& plugin, const std::string& detail) const {
    if (audit_) audit_->event(event, audit_payload({{"plugin", plugin}, {"detail", detail}}));
}

} // namespace prism
