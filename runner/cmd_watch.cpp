#include "commands.h"
#include "runner_utils.h"
#include "runtime_setup.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

using namespace prism;

static std::atomic<bool> g_watch_running{true};

// Usage: prism_cli watch [--interval_ms N] [--hash]
// Loads plugins and reloads them on file changes until SIGINT/SIGTERM.
int cmd_watch(int argc, char** argv) {
    g_watch_running.store(true);
    std::signal(SIGTERM, [](int) { g_watch_running.store(false); });
    std::signal(SIGINT,  [](int) { g_watch_running.store(false); });

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--interval_ms" && i + 1 < argc) { setenv("PRISM_HOT_RELOAD_INTERVAL_MS", argv[++i], 1); continue; }
        if (a == "--hash") { setenv("PRISM_HOT_RELOAD_HASH", "1", 1); continue; }
        std::cerr << "usage: prism_cli watch [--interval_ms N] [--hash]\n";
        return 2;
    }
    setenv("PRISM_HOT_RELOAD", "1", 1);

    auto rt = setup_runtime(argv[0], SetupOptions{true, true, true});
    if (!rt->hot_reload) {
        std::cerr << "[error] hot reload did not start\n";
        return 1;
    }
    rt->hot_reload->on_after_reload([](const std::string& plugin, bool ok) {
        std::cout << "reload " << plugin << " " << (ok ? "ok" : "failed") << std::endl;
    });

    while (g_watch_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    WatcherStatus st = rt->hot_reload->status();
    std::cerr << "[watch] stopping: plugins=" << st.watched_plugins << " files=" << st.total_files
              << " reloads=" << rt->hot_reload->history().size() << "\n";
    return 0;
}
