#include "test_common.h"
#include "test_fixtures.h"

#include "prism/crypto.h"
#include "prism/json_mini.h"
#include "prism/log.h"

#include <sstream>

using namespace prism;

namespace {

std::vector<std::string> lines_of(const fs::path& p) {
    std::vector<std::string> out;
    std::istringstream in(read_text(p));
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) out.push_back(line);
    }
    return out;
}

// Recomputes every chain_hash; returns the number of verified lines.
size_t verify_chain(const std::vector<std::string>& lines) {
    std::string prev(64, '0');
    size_t n = 0;
    for (const auto& l : lines) {
        json_mini::Doc d = json_mini::parse(l);
        if (!d) die("unparseable audit line: " + l);
        auto hash = json_mini::string_at(d.root, "chain_hash");
        auto chain_prev = json_mini::string_at(d.root, "chain_prev");
        if (!hash || !chain_prev || *chain_prev != prev) return n;
        json_object_object_del(d.root, "chain_hash");
        json_object_object_del(d.root, "chain_prev");
        if (sha256_hex(prev + json_mini::canonical_json(d.root)) != *hash) return n;
        prev = *hash;
        n++;
    }
    return n;
}

} // namespace

int main() {
    TempDir tmp("prism_test_audit_log");
    const fs::path log_path = tmp.path / "audit.jsonl";

    {
        JsonlAuditLog log(log_path.string());
        expect_true(log.ok(), "log opened");
        log.event("plugin_loaded", audit_payload({{"plugin", "auth_plugin"}, {"version", "1.0.0"}}));
        log.event("violation", "not json {");
    }
    auto lines = lines_of(log_path);
    expect_eq_ll((long long)lines.size(), 2, "two records");
    expect_eq_ll((long long)verify_chain(lines), 2, "chain verifies");

    json_mini::Doc second = json_mini::parse(lines[1]);
    expect_true(json_mini::string_at(second.root, "payload").value_or("") == "not json {",
                "invalid payload stored as string");
    json_mini::Doc first = json_mini::parse(lines[0]);
    expect_true(json_mini::string_at(json_mini::member(first.root, "payload"), "plugin").value_or("") ==
                    "auth_plugin",
                "structured payload");

    // reopening continues sequence and chain
    {
        JsonlAuditLog log(log_path.string());
        log.event("plugin_unloaded", audit_payload({{"plugin", "auth_plugin"}}));
    }
    lines = lines_of(log_path);
    expect_eq_ll((long long)lines.size(), 3, "appended");
    expect_eq_ll((long long)verify_chain(lines), 3, "chain continues across reopen");
    json_mini::Doc third = json_mini::parse(lines[2]);
    expect_eq_ll(json_mini::int_at(third.root, "seq").value_or(0), 3, "seq continues");

    // tampering breaks verification at the edited record
    std::string edited = lines[1];
    edited.replace(edited.find("violation"), 9, "violatiox");
    lines[1] = edited;
    expect_eq_ll((long long)verify_chain(lines), 1, "tampered record detected");

    expect_true(audit_payload({{"b", "2"}, {"a", "1"}}) == R"({"a":"1","b":"2"})", "payload is canonical");

    std::cerr << "test_audit_log: ALL PASSED" << std::endl;
    return 0;
}
