#include "test_common.h"
#include "test_fixtures.h"

#include "prism/capability_ledger.h"
#include "prism/errors.h"
#include "prism/interception.h"
#include "prism/proc.h"
#include "prism/sdk.h"

using namespace prism;

template <typename Fn>
static bool denied(Fn fn) {
    try {
        fn();
    } catch (const AuthorizationDenied&) {
        return true;
    }
    return false;
}

int main() {
    // Test 1: plain process capture (host code)
    {
        ProcResult r;
        expect_true(proc_run_capture({"/bin/echo", "hi"}, "", ProcLimits{}, &r), "echo started");
        expect_eq_ll(r.exit_code, 0, "echo exit code");
        expect_true(r.output == "hi\n", "echo output captured");
    }

    // Test 2: timeout
    {
        ProcLimits lim;
        lim.timeout_ms = 200;
        ProcResult r;
        expect_true(proc_run_capture({"/bin/sleep", "5"}, "", lim, &r), "sleep started");
        expect_true(r.timed_out, "sleep timed out");
    }

    // Test 3: output cap
    {
        ProcLimits lim;
        lim.stdout_max_bytes = 16;
        ProcResult r;
        proc_run_capture({"/bin/sh", "-c", "head -c 4096 /dev/zero"}, "", lim, &r);
        expect_true(r.output_truncated && r.output.size() <= 16, "output truncated at cap");
    }

    TempDir tmp("prism_test_sdk");
    const fs::path plugins = tmp.path / "plugins";
    write_text(plugins / "runner" / "in.txt", "data");
    write_text(plugins / "writer" / "in.txt", "data");
    write_text(plugins / "reader" / "in.txt", "data");

    const PermissionEngine& perms = default_permission_engine();
    CapabilityLedger ledger(perms);
    InterceptionEngine engine(perms, ledger, JailPaths{tmp.path / "system_secure", tmp.path / "data" / "temp"});
    engine.activate();

    ledger.grant_from_lock("runner", {{"system", "subprocess", "", ""}});
    ledger.grant_from_lock("writer", {{"file", "write", "", ""}});
    ledger.grant_from_lock("reader", {{"file", "read", "", ""}});
    engine.register_plugin_root("runner", plugins / "runner");
    engine.register_plugin_root("reader", plugins / "reader");
    engine.register_plugin_root("writer", plugins / "writer");

    // Test 4: governed subprocess
    {
        PluginScope scope("runner");
        ProcResult r = sdk::run_process({"/bin/echo", "governed"});
        expect_true(r.exit_code == 0 && r.output == "governed\n", "granted plugin spawns");
    }
    {
        PluginScope scope("reader");
        expect_true(denied([] { sdk::run_process({"/bin/echo", "nope"}); }), "spawn without grant denied");
    }
    expect_true(!ledger.violations("reader").empty(), "spawn violation logged");

    // Test 5: rename and remove stay inside the plugin directory
    {
        PluginScope scope("writer");
        sdk::rename_file(plugins / "writer" / "in.txt", plugins / "writer" / "moved.txt");
        expect_true(fs::exists(plugins / "writer" / "moved.txt"), "rename inside root");
        expect_true(denied([&] { sdk::rename_file(plugins / "writer" / "moved.txt", tmp.path / "stolen.txt"); }),
                    "rename out of root denied");
        expect_true(fs::exists(plugins / "writer" / "moved.txt"), "denied rename left source");
        sdk::write_file(engine.temp_dir_for("writer") / "scratch.txt", "tmp");
        sdk::remove_file(engine.temp_dir_for("writer") / "scratch.txt");
        expect_true(!fs::exists(engine.temp_dir_for("writer") / "scratch.txt"), "remove in temp dir");
    }
    {
        PluginScope scope("reader");
        expect_true(sdk::read_file(plugins / "reader" / "in.txt") == "data", "reader reads own file");
        expect_true(denied([&] { sdk::remove_file(plugins / "reader" / "in.txt"); }), "remove without write denied");
        expect_true(denied([&] { sdk::write_file(plugins / "reader" / "in.txt", "x", true); }),
                    "append without write denied");
        expect_true(fs::exists(plugins / "reader" / "in.txt"), "denied remove left file");
        expect_true(denied([] { sdk::connect_tcp("127.0.0.1", 443); }), "connect without network grant denied");
    }

    // Test 6: bad open mode is rejected before any check
    {
        PluginScope scope("reader");
        bool threw = false;
        try {
            sdk::open_file(plugins / "reader" / "in.txt", "rw");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect_true(threw, "invalid mode rejected");
    }

    std::cerr << "test_sdk: ALL PASSED" << std::endl;
    return 0;
}
