#pragma once

#include "prism/capability_ledger.h"
#include "prism/chain_runner.h"
#include "prism/config.h"
#include "prism/hot_reload.h"
#include "prism/interception.h"
#include "prism/log.h"
#include "prism/plugin_loader.h"

#include <memory>

namespace prism {

// Everything a CLI command needs, wired in dependency order and torn down
// in reverse (watcher, runner, loaded plugins, interception hook).
struct Runtime {
    Settings settings;
    std::shared_ptr<JsonlAuditLog> audit;
    std::unique_ptr<CapabilityLedger> ledger;
    std::unique_ptr<InterceptionEngine> interception;
    std::unique_ptr<PluginLoader> loader;
    RouteTable routes;
    std::unique_ptr<ChainRunner> runner;
    std::unique_ptr<HotReloadManager> hot_reload;
    LoadReport report;
    int loader_listener{0};

    Runtime() = default;
    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;
    ~Runtime();
};

struct SetupOptions {
    bool load_plugins{true};
    bool load_routes{true};
    bool start_hot_reload{false};   // still requires PRISM_HOT_RELOAD=1
};

// Throws std::runtime_error (hook already installed, malformed route file).
std::unique_ptr<Runtime> setup_runtime(const char* argv0, const SetupOptions& opts);

} // namespace prism
