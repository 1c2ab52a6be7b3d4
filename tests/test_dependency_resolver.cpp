#include "test_common.h"
#include "prism/dependency_resolver.h"
#include "prism/errors.h"

#include <algorithm>
#include <map>

using namespace prism;

static size_t pos(const std::vector<std::string>& order, const std::string& name) {
    auto it = std::find(order.begin(), order.end(), name);
    if (it == order.end()) die("missing from order: " + name);
    return (size_t)(it - order.begin());
}

static void expect_cycle(DependencyResolver& r, const std::string& msg) {
    try {
        r.resolve();
    } catch (const DependencyCycleError& e) {
        expect_true(std::string(e.what()).find("circular dependency detected") != std::string::npos,
                    msg + ": message");
        return;
    }
    die(msg + ": expected DependencyCycleError");
}

int main() {
    // Topological order is independent of insertion order
    const std::map<std::string, std::vector<std::string>> graph = {
        {"app", {"auth", "provider"}},
        {"auth", {"crypto"}},
        {"provider", {"crypto", "http"}},
        {"crypto", {}},
        {"http", {}},
    };
    std::vector<std::string> names;
    for (const auto& kv : graph) names.push_back(kv.first);
    std::vector<std::string> first;
    do {
        DependencyResolver r;
        for (const auto& n : names) r.add_plugin(n, graph.at(n));
        auto order = r.resolve();
        expect_eq_ll((long long)order.size(), 5, "all nodes ordered");
        for (const auto& kv : graph) {
            for (const auto& dep : kv.second) {
                expect_true(pos(order, dep) < pos(order, kv.first), dep + " before " + kv.first);
            }
        }
        if (first.empty()) first = order;
        expect_true(order == first, "order is deterministic");
    } while (std::next_permutation(names.begin(), names.end()));

    // Unknown dependencies are skipped, not fatal
    {
        DependencyResolver r;
        r.add_plugin("a", {"ghost"});
        auto order = r.resolve();
        expect_true(order.size() == 1 && order[0] == "a", "unknown edge skipped");
        auto missing = r.missing_dependencies();
        expect_true(missing.size() == 1 && missing[0] == "ghost", "missing dependency reported");
    }

    // Cycles
    {
        DependencyResolver r;
        r.add_plugin("self", {"self"});
        expect_cycle(r, "self cycle");
    }
    {
        DependencyResolver r;
        r.add_plugin("a", {"b"});
        r.add_plugin("b", {"a"});
        expect_cycle(r, "two-node cycle");
    }
    {
        DependencyResolver r;
        r.add_plugin("a", {"b"});
        r.add_plugin("b", {"c"});
        r.add_plugin("c", {"a"});
        r.add_plugin("d", {});
        try {
            r.resolve();
            die("A->B->C->A should throw");
        } catch (const DependencyCycleError& e) {
            expect_true(e.cycle() == "a -> b -> c -> a", "cycle path: " + e.cycle());
        }
    }

    // Deep chains do not recurse
    {
        DependencyResolver r;
        const int n = 20000;
        for (int i = 0; i < n; i++) {
            std::vector<std::string> deps;
            if (i + 1 < n) deps.push_back("n" + std::to_string(i + 1));
            r.add_plugin("n" + std::to_string(i), deps);
        }
        auto order = r.resolve();
        expect_eq_ll((long long)order.size(), n, "deep chain fully ordered");
        expect_true(order.front() == "n" + std::to_string(n - 1), "deepest dependency first");
    }

    std::cerr << "test_dependency_resolver: ALL PASSED" << std::endl;
    return 0;
}
