#include "test_common.h"
#include "prism/capability_ledger.h"
#include "prism/errors.h"
#include "prism/permission_engine.h"

#include <algorithm>

using namespace prism;

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

static OperationArgs open_args(const std::string& path, const std::string& mode) {
    OperationArgs a;
    a.path = path;
    a.mode = mode;
    return a;
}

int main() {
    const PermissionEngine& perms = default_permission_engine();

    // Catalogue
    for (const char* n : {"file.read.plugin", "file.write.plugin", "network.https", "network.http",
                          "api.create_route", "system.subprocess"}) {
        expect_true(perms.definition(n) != nullptr, std::string("default capability missing: ") + n);
    }
    expect_true(perms.frozen(), "default catalogue should be frozen");

    // Event mapping with discriminators
    auto r = perms.map_event_to_permissions(events::kOpen, open_args("/x", "r"));
    expect_true(r.size() == 1 && r[0] == "file.read.plugin", "open r -> file.read.plugin");
    r = perms.map_event_to_permissions(events::kOpen, open_args("/x", "w"));
    expect_true(r.size() == 1 && r[0] == "file.write.plugin", "open w -> file.write.plugin");
    r = perms.map_event_to_permissions(events::kOpen, open_args("/x", "r+"));
    expect_true(contains(r, "file.read.plugin") && contains(r, "file.write.plugin"), "r+ maps to both");
    r = perms.map_event_to_permissions(events::kOpen, open_args("/x", "w+"));
    expect_true(r.size() == 1 && r[0] == "file.write.plugin", "w+ is governed as a write");
    r = perms.map_event_to_permissions(events::kOpen, open_args("/x", "a+"));
    expect_true(r.size() == 1 && r[0] == "file.write.plugin", "a+ is governed as a write");
    r = perms.map_event_to_permissions(events::kRemove, open_args("/x", ""));
    expect_true(r.size() == 1 && r[0] == "file.write.plugin", "remove counts as write");

    OperationArgs net;
    net.host = "example.com";
    net.port = 443;
    r = perms.map_event_to_permissions(events::kConnect, net);
    expect_true(r.size() == 1 && r[0] == "network.https", "port 443 -> https");
    net.port = 80;
    r = perms.map_event_to_permissions(events::kConnect, net);
    expect_true(r.size() == 1 && r[0] == "network.http", "port 80 -> http");
    net.port = 8080;
    expect_true(perms.map_event_to_permissions(events::kConnect, net).empty(), "port 8080 matches nothing");
    expect_true(perms.governs(events::kConnect), "connect is governed");

    r = perms.map_event_to_permissions("subprocess.spawn", OperationArgs{});
    expect_true(r.size() == 1 && r[0] == "system.subprocess", "subprocess.* prefix mapping");
    r = perms.map_event_to_permissions(events::kSystem, OperationArgs{});
    expect_true(r.size() == 1 && r[0] == "system.subprocess", "os.system mapping");
    expect_true(perms.map_event_to_permissions("time.sleep", OperationArgs{}).empty(), "ungoverned event");
    expect_true(!perms.governs("time.sleep"), "time.sleep is not governed");

    // Declaration lookup
    const auto* d = perms.find_definition_for_declaration("file", "read");
    expect_true(d && d->name == "file.read.plugin", "file:read declaration");
    d = perms.find_definition_for_declaration("network", "outbound:https");
    expect_true(d && d->name == "network.https", "network:outbound:https declaration");
    expect_true(perms.find_definition_for_declaration("file", "execute") == nullptr, "unknown resource");
    expect_true(perms.find_definition_for_declaration("gpu", "any") == nullptr, "unknown type");

    // Registration rules
    PermissionEngine custom;
    custom.register_capability({"db.read", "", "database", {"db.query"}, std::nullopt, nullptr});
    d = custom.find_definition_for_declaration("database", "anything at all");
    expect_true(d && d->name == "db.read", "null pattern matches any resource");
    bool threw = false;
    try {
        custom.register_capability({"db.read", "", "database", {}, std::nullopt, nullptr});
    } catch (const ConfigurationError&) {
        threw = true;
    }
    expect_true(threw, "duplicate capability should throw");
    custom.freeze();
    threw = false;
    try {
        custom.register_capability({"db.write", "", "database", {}, std::nullopt, nullptr});
    } catch (const ConfigurationError&) {
        threw = true;
    }
    expect_true(threw, "registration after freeze should throw");

    // Ledger ingestion: unmappable entries are dropped
    CapabilityLedger ledger(perms);
    std::vector<PermissionDeclaration> lock = {
        {"file", "read", "", ""},
        {"file", "execute", "", ""},
        {"", "", "", "network.https"},
        {"", "", "", "no.such.capability"},
    };
    auto dropped = ledger.grant_from_lock("p", lock);
    expect_eq_ll((long long)dropped.size(), 2, "two unmappable entries dropped");
    auto g = ledger.granted("p");
    expect_eq_ll((long long)g.size(), 2, "two grants");
    expect_true(g.count("file.read.plugin") && g.count("network.https"), "granted set contents");

    expect_true(ledger.check_permission("p", "file.read.plugin"), "exact grant");
    expect_true(!ledger.check_permission("p", "file.write.plugin"), "write not granted");
    expect_true(!ledger.check_permission("q", "file.read.plugin"), "unknown plugin holds nothing");

    // OR semantics
    expect_true(ledger.holds_any("p", {"file.write.plugin", "file.read.plugin"}, events::kOpen,
                                 open_args("/x", "r+")), "any one capability suffices");

    // Glob grants also need the resource matcher to accept the operation
    ledger.grant_from_lock("g", {{"", "", "", "network.*"}});
    net.port = 443;
    expect_true(ledger.check_permission("g", "network.https", events::kConnect, net), "glob grant https:443");
    net.port = 80;
    expect_true(!ledger.check_permission("g", "network.https", events::kConnect, net),
                "glob grant rejected when matcher fails");
    expect_true(ledger.check_permission("g", "network.http", events::kConnect, net), "glob grant http:80");

    // Re-grant replaces wholesale
    ledger.grant_from_lock("p", {{"system", "subprocess", "", ""}});
    g = ledger.granted("p");
    expect_true(g.size() == 1 && g.count("system.subprocess"), "grants replaced");
    expect_true(ledger.has_prefix("p", "system."), "has system. prefix");

    // Inherit and revoke
    ledger.inherit("p.sub", "p");
    expect_true(ledger.check_permission("p.sub", "system.subprocess"), "sub-plugin inherits grants");
    ledger.revoke("p");
    expect_true(!ledger.has_grants("p"), "revoked");
    expect_true(ledger.has_grants("p.sub"), "inherited copy survives owner revoke");

    // Violations are ordered per plugin
    ledger.log_violation("p", "first");
    ledger.log_violation("p", "second");
    auto v = ledger.violations("p");
    expect_true(v.size() == 2 && v[0] == "first" && v[1] == "second", "violation order");
    expect_true(ledger.violations("other").empty(), "no violations for other plugin");

    std::cerr << "test_permission_engine: ALL PASSED" << std::endl;
    return 0;
}
