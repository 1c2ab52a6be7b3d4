#include "prism/dependency_resolver.h"
#include "prism/errors.h"

#include <algorithm>
#include <iostream>
#include <set>

namespace prism {

void DependencyResolver::add_plugin(const std::string& name, const std::vector<std::string>& depends_on) {
    graph_[name] = depends_on;
}

std::vector<std::string> DependencyResolver::missing_dependencies() const {
    std::set<std::string> out;
    for (const auto& kv : graph_) {
        for (const auto& d : kv.second) {
            if (!graph_.count(d)) out.insert(d);
        }
    }
    return {out.begin(), out.end()};
}

std::vector<std::string> DependencyResolver::resolve() const {
    enum class Mark { None, Temp, Done };
    std::map<std::string, Mark> marks;
    std::vector<std::string> order;
    std::vector<std::string> path;    // current DFS stack, for cycle reporting

    // Iterative DFS; frame = (node, index of next edge).
    for (const auto& start : graph_) {
        if (marks[start.first] == Mark::Done) continue;

        std::vector<std::pair<std::string, size_t>> stack;
        stack.emplace_back(start.first, 0);
        marks[start.first] = Mark::Temp;
        path.push_back(start.first);

        while (!stack.empty()) {
            auto& frame = stack.back();
            const auto& deps = graph_.at(frame.first);

            if (frame.second >= deps.size()) {
                marks[frame.first] = Mark::Done;
                order.push_back(frame.first);
                path.pop_back();
                stack.pop_back();
                continue;
            }

            const std::string dep = deps[frame.second++];
            if (!graph_.count(dep)) {
                std::cerr << "[warn] resolver: " << frame.first << " depends on unknown plugin " << dep << "\n";
                continue;
            }
            Mark m = marks[dep];
            if (m == Mark::Done) continue;
            if (m == Mark::Temp) {
                auto it = std::find(path.begin(), path.end(), dep);
                std::string cycle;
                for (; it != path.end(); ++it) cycle += *it + " -> ";
                throw DependencyCycleError(cycle + dep);
            }
            marks[dep] = Mark::Temp;
            path.push_back(dep);
            stack.emplace_back(dep, 0);
        }
    }
    return order;
}

} // namespace prism
