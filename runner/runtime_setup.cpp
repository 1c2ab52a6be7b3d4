#include "runtime_setup.h"
#include "builtin_plugins.h"
#include "runner_utils.h"

#include "prism/errors.h"
#include "prism/permission_engine.h"

#include <iostream>

namespace prism {

Runtime::~Runtime() {
    if (hot_reload) hot_reload->stop();
    if (loader && loader_listener) loader->remove_change_listener(loader_listener);
    runner.reset();
    if (loader) loader->shutdown_all();
    loader.reset();
    if (interception) interception->deactivate();
}

std::unique_ptr<Runtime> setup_runtime(const char* argv0, const SetupOptions& opts) {
    const auto root = resolve_root(argv0);
    set_env_if_missing("PRISM_ROOT", root.string());

    // SAFETY: profile defaults use setenv(); must run before any thread starts.
    Profile profile = detect_profile();
    apply_profile_defaults(profile);

    auto rt = std::make_unique<Runtime>();
    rt->settings = Settings::from_env();
    const Settings& s = rt->settings;
    std::cerr << "[setup] profile=" << profile_name(profile) << " root=" << s.root.string()
              << " plugins=" << s.plugins_dir.string() << "\n";

    register_builtin_plugins();

    if (!s.audit_log.empty()) {
        rt->audit = std::make_shared<JsonlAuditLog>(s.audit_log);
        if (!rt->audit->ok()) {
            std::cerr << "[warn] audit log disabled: cannot open " << s.audit_log << "\n";
            rt->audit.reset();
        }
    }

    const PermissionEngine& perms = default_permission_engine();
    rt->ledger = std::make_unique<CapabilityLedger>(perms);
    rt->ledger->set_audit_log(rt->audit);

    rt->interception = std::make_unique<InterceptionEngine>(perms, *rt->ledger,
                                                            JailPaths{s.secure_dir(), s.temp_root()});
    rt->interception->activate();

    rt->loader = std::make_unique<PluginLoader>(LoaderOptions::from_settings(s), perms,
                                                *rt->ledger, *rt->interception);
    rt->loader->set_audit_log(rt->audit);

    rt->runner = std::make_unique<ChainRunner>(*rt->loader, rt->routes);
    rt->runner->set_default_plugin(s.default_plugin);
    ChainRunner* runner = rt->runner.get();
    rt->loader_listener = rt->loader->add_change_listener([runner]() { runner->clear_cache(); });

    if (opts.load_routes) {
        try {
            rt->routes.load_file(s.routes_file);
        } catch (const MissingArtifact&) {
            std::cerr << "[warn] route file not found: " << s.routes_file.string() << "\n";
        }
    }

    if (opts.load_plugins) {
        rt->report = rt->loader->load_all();
        if (!rt->report.ok()) std::cerr << "[error] plugin batch aborted: " << rt->report.fatal_error << "\n";
    }

    if (opts.start_hot_reload && s.hot_reload) {
        rt->hot_reload = std::make_unique<HotReloadManager>(*rt->loader, s.hot_reload_interval_ms,
                                                            s.hot_reload_hash);
        rt->hot_reload->start();
    }
    return rt;
}

} // namespace prism
