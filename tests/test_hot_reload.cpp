#include "test_common.h"
#include "test_fixtures.h"

#include "prism/capability_ledger.h"
#include "prism/hot_reload.h"
#include "prism/interception.h"
#include "prism/plugin_loader.h"
#include "prism/request_context.h"

#include <atomic>
#include <chrono>
#include <thread>

using namespace prism;

namespace {

std::atomic<int> g_init{0};

class CountingPlugin : public Plugin {
public:
    void initialize() override { g_init++; }
    StepResult handle(RequestContext&) override { return StepResult::Continue; }
};

PluginRegistration<CountingPlugin> reg_counting("hr_counting");

} // namespace

int main() {
    TempDir tmp("prism_test_hot_reload");
    const PermissionEngine& perms = default_permission_engine();
    CapabilityLedger ledger(perms);
    InterceptionEngine engine(perms, ledger, JailPaths{tmp.path / "system_secure", tmp.path / "data" / "temp"});
    engine.activate();

    fs::path plugins = tmp.path / "plugins";
    fs::path registry = tmp.path / "plugin_data" / "plugin_registry.json";
    write_builtin_plugin(plugins / "alpha", "hr_counting");
    write_lock(plugins / "alpha", "alpha");
    write_builtin_plugin(plugins / "beta", "hr_counting");
    write_lock(plugins / "beta", "beta");
    write_text(plugins / "alpha" / "data" / "cache.json", "{}");
    write_text(plugins / "alpha" / "notes.txt", "not watched");
    write_registry(registry, {"alpha", "beta"});

    LoaderOptions opts;
    opts.plugins_dir = plugins;
    opts.registry_file = registry;
    PluginLoader loader(opts, perms, ledger, engine);
    LoadReport r = loader.load_all();
    expect_true(r.loaded.size() == 2, "both plugins loaded");

    // scan: watched suffixes only, data/ skipped
    {
        HotReloadManager hr(loader, 100, true);
        PluginFingerprint fp = hr.scan(plugins / "alpha");
        expect_true(fp.count("plugin.yml") == 1, "manifest watched");
        expect_true(fp.count("permissions.lock.json") == 1, "lock file watched");
        expect_true(fp.count("notes.txt") == 0, "unwatched suffix ignored");
        expect_true(fp.count("data/cache.json") == 0, "data directory ignored");
        expect_true(!fp.at("plugin.yml").sha256.empty(), "hash recorded when enabled");

        HotReloadManager no_hash(loader, 100, false);
        expect_true(no_hash.scan(plugins / "alpha").at("plugin.yml").sha256.empty(), "no hash by default");
    }

    // check_once: baseline, then change detection
    {
        HotReloadManager hr(loader, 10, false, 2);
        std::vector<std::string> before;
        std::vector<std::pair<std::string, bool>> after;
        hr.on_before_reload([&before](const std::string& p) { before.push_back(p); });
        hr.on_after_reload([&after](const std::string& p, bool ok) { after.emplace_back(p, ok); });

        expect_true(hr.check_once().empty(), "first pass only records a baseline");
        WatcherStatus st = hr.status();
        expect_true(!st.enabled, "not running without start");
        expect_eq_ll(st.interval_ms, 50, "interval clamped to minimum");
        expect_eq_ll((long long)st.watched_plugins, 2, "both plugins watched");
        expect_true(hr.check_once().empty(), "unchanged files trigger nothing");

        g_init = 0;
        write_builtin_plugin(plugins / "alpha", "hr_counting", "1.1.0", "description: grown\n");
        auto reloaded = hr.check_once();
        expect_true(reloaded.size() == 1 && reloaded[0] == "alpha", "changed plugin reloaded");
        expect_eq_ll(g_init.load(), 1, "fresh instance initialized");
        expect_true(loader.record("alpha")->manifest.version == "1.1.0", "new manifest in effect");
        expect_true(before.size() == 1 && before[0] == "alpha", "before callback");
        expect_true(after.size() == 1 && after[0].second, "after callback reports success");
        expect_true(hr.check_once().empty(), "new baseline after reload");

        // a failing reload is recorded once and not retried for the same edit
        fs::remove(plugins / "beta" / "permissions.lock.json");
        write_text(plugins / "beta" / "plugin.yml", "name: beta\nversion: \"2.0.0\"\nentry: builtin:hr_counting\n");
        reloaded = hr.check_once();
        expect_true(reloaded.empty(), "failed reload is not reported as reloaded");
        auto events = hr.history("beta");
        expect_true(events.size() == 1 && !events[0].success && !events[0].reason.empty(), "failure in history");
        expect_true(hr.check_once().empty(), "failed edit not retried");
        expect_true(!loader.is_loaded("beta"), "failed plugin stays unloaded");
        expect_eq_ll((long long)hr.status().watched_plugins, 2, "failed plugin still watched");

        // fixing the plugin on disk brings it back
        write_lock(plugins / "beta", "beta");
        reloaded = hr.check_once();
        expect_true(reloaded.size() == 1 && reloaded[0] == "beta", "fixed plugin reloaded");
        expect_true(loader.is_loaded("beta"), "fixed plugin loaded again");
        expect_true(loader.record("beta")->manifest.version == "2.0.0", "fixed manifest in effect");
        events = hr.history("beta");
        expect_true(events.size() == 2 && events[1].success, "recovery in history");
        expect_true(hr.check_once().empty(), "recovered plugin has a fresh baseline");

        // forgotten once unloaded; history bounded
        expect_true(loader.unload_plugin("beta"), "unload beta");
        expect_true(hr.check_once().empty(), "pass after unload");
        expect_eq_ll((long long)hr.status().watched_plugins, 1, "unloaded plugin forgotten");
        expect_true(hr.force_reload("alpha"), "forced reload");
        expect_true(hr.force_reload("alpha"), "forced reload again");
        expect_eq_ll((long long)hr.history().size(), 2, "history bounded by limit");
        expect_true(hr.history().back().ts_ms > 0, "timestamped");
        auto all = hr.reload_all();
        expect_true(all.size() == 1 && all["alpha"], "reload_all covers loaded plugins");
    }

    // background thread
    {
        HotReloadManager hr(loader, 50, true);
        std::atomic<int> fired{0};
        hr.on_after_reload([&fired](const std::string&, bool ok) {
            if (ok) fired++;
        });
        hr.start();
        expect_true(hr.running() && hr.status().enabled, "watcher running");
        write_builtin_plugin(plugins / "alpha", "hr_counting", "1.2.0", "description: again\n");
        for (int i = 0; i < 100 && fired.load() == 0; i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        hr.stop();
        expect_true(!hr.running(), "watcher stopped");
        expect_true(fired.load() >= 1, "watcher reloaded changed plugin");
        expect_true(loader.record("alpha")->manifest.version == "1.2.0", "background reload applied");
    }

    loader.shutdown_all();
    std::cerr << "test_hot_reload: ALL PASSED" << std::endl;
    return 0;
}
