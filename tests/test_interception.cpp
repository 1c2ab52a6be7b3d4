#include "test_common.h"
#include "test_fixtures.h"

#include "prism/capability_ledger.h"
#include "prism/errors.h"
#include "prism/interception.h"
#include "prism/sdk.h"

#include <thread>

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
    TempDir tmp("prism_test_interception");
    const fs::path root = tmp.path;
    const fs::path secure = root / "system_secure";
    const fs::path plugins = root / "plugins";
    write_text(secure / "master.key", "secret");
    write_text(plugins / "p" / "data.txt", "hello");
    write_text(root / "outside.txt", "outside");
    write_lock(plugins / "p", "p");
    write_lock(plugins / "q", "q");

    const PermissionEngine& perms = default_permission_engine();
    CapabilityLedger ledger(perms);
    InterceptionEngine engine(perms, ledger, JailPaths{secure, root / "data" / "temp"});
    engine.activate();
    expect_true(InterceptionEngine::active() == &engine, "engine is active");

    // Only one hook per process
    {
        InterceptionEngine second(perms, ledger, JailPaths{secure, root / "data" / "temp"});
        bool threw = false;
        try {
            second.activate();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        expect_true(threw, "second activation must throw");
    }
    expect_true(InterceptionEngine::active() == &engine, "first engine still active");

    ledger.grant_from_lock("p", {{"file", "read", "", ""}});
    engine.register_plugin_root("p", plugins / "p");
    expect_true(fs::is_directory(engine.temp_dir_for("p")), "temp dir created on registration");

    // Outside any scope enforcement is a no-op
    expect_true(sdk::read_file(secure / "master.key") == "secret", "host code reads secure storage");
    expect_true(PluginScope::current() == nullptr, "no scope at start");

    {
        PluginScope scope("p");
        expect_true(sdk::read_file(plugins / "p" / "data.txt") == "hello", "read inside own root");

        // Fixed jail precedes the capability check
        expect_true(denied([&] { sdk::read_file(secure / "master.key"); }), "secure storage denied");
        auto v = ledger.violations("p");
        expect_true(!v.empty() && v.back().find("secure storage") != std::string::npos,
                    "violation mentions secure storage");

        expect_true(denied([&] { sdk::read_file(plugins / "p" / "permissions.lock.json"); }),
                    "own lock file denied even for reading");
        expect_true(denied([&] { sdk::read_file(root / "outside.txt"); }), "outside root denied");
        expect_true(ledger.violations("p").back().find("path outside plugin directory") != std::string::npos,
                    "directory jail message");
        expect_true(denied([&] { sdk::write_file(plugins / "p" / "new.txt", "x"); }),
                    "write without file.write denied");
        expect_true(!fs::exists(plugins / "p" / "new.txt"), "denied write has no effect");
        expect_true(ledger.violations("p").back().find("Required one of Permissions: [file.write.plugin]") !=
                        std::string::npos,
                    "capability violation lists required permissions");
    }

    // Pure decisions
    ledger.grant_from_lock("p", {{"file", "read", "", ""}, {"file", "write", "", ""}});
    OperationArgs w;
    w.path = plugins / "p" / "new.txt";
    w.mode = "w";
    expect_true(!engine.evaluate("p", events::kOpen, w), "write allowed with grant");
    w.path = engine.temp_dir_for("p") / "scratch.txt";
    expect_true(!engine.evaluate("p", events::kOpen, w), "temp dir allowed");
    w.path = plugins / "q" / "permissions.lock.json";
    auto why = engine.evaluate("p", events::kOpen, w);
    expect_true(why && why->find("modifying a lock file") != std::string::npos, "foreign lock write denied");

    OperationArgs net;
    net.host = "example.com";
    net.port = 443;
    why = engine.evaluate("p", events::kConnect, net);
    expect_true(why && why->find("network.https") != std::string::npos, "https without grant denied");
    net.port = 8080;
    expect_true(engine.evaluate("p", events::kConnect, net).has_value(), "unmatched port denied");
    expect_true(!engine.evaluate("p", "time.sleep", OperationArgs{}), "ungoverned event allowed");

    OperationArgs spawn;
    spawn.argv = {"/bin/true"};
    expect_true(engine.evaluate("p", events::kSpawn, spawn).has_value(), "spawn without grant denied");

    // Unregistered roots are denied for path events
    OperationArgs r;
    r.path = plugins / "q" / "x.txt";
    r.mode = "r";
    why = engine.evaluate("q", events::kOpen, r);
    expect_true(why && why->find("no registered plugin root") != std::string::npos, "no root denied");

    // A system.* holder may leave its directory, but never reach secure storage
    ledger.grant_from_lock("s", {{"file", "read", "", ""}, {"system", "subprocess", "", ""}});
    engine.register_plugin_root("s", plugins / "s");
    r.path = root / "outside.txt";
    expect_true(!engine.evaluate("s", events::kOpen, r), "system holder reads outside root");
    r.path = secure / "master.key";
    expect_true(engine.evaluate("s", events::kOpen, r).has_value(), "system holder still jailed from secure");

    // Nested scopes restore the previous identity, also on unwind
    {
        PluginScope a("a");
        {
            PluginScope b("b");
            expect_true(*PluginScope::current() == "b", "inner scope");
        }
        expect_true(*PluginScope::current() == "a", "outer scope restored");
        try {
            PluginScope c("c");
            throw std::runtime_error("boom");
        } catch (const std::runtime_error&) {
        }
        expect_true(*PluginScope::current() == "a", "scope restored after exception");
    }
    expect_true(PluginScope::current() == nullptr, "no scope after all guards");

    // Identity is per thread; bind_to_current_scope carries it explicitly
    {
        PluginScope scope("p");
        bool other_thread_scoped = true;
        std::thread t([&] { other_thread_scoped = PluginScope::current() != nullptr; });
        t.join();
        expect_true(!other_thread_scoped, "scope does not leak into other threads");

        std::string seen;
        auto task = bind_to_current_scope([&seen]() {
            const std::string* cur = PluginScope::current();
            seen = cur ? *cur : "";
        });
        std::thread t2(task);
        t2.join();
        expect_true(seen == "p", "bound task runs under captured identity");
    }

    // Revoked plugin loses access immediately
    engine.release_plugin_root("p");
    ledger.revoke("p");
    {
        PluginScope scope("p");
        expect_true(denied([&] { sdk::read_file(plugins / "p" / "data.txt"); }), "released plugin denied");
    }

    // Inside a scope with no hook installed, governed operations fail closed
    engine.deactivate();
    {
        PluginScope scope("p");
        expect_true(denied([&] { enforce(events::kOpen, r); }), "no active engine denies");
    }
    expect_true(sdk::read_file(plugins / "p" / "data.txt") == "hello", "host unaffected without engine");

    std::cerr << "test_interception: ALL PASSED" << std::endl;
    return 0;
}
