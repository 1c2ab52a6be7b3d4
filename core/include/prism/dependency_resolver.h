#pragma once

#include <map>
#include <string>
#include <vector>

namespace prism {

// Transient "depends on" graph for one load batch.
class DependencyResolver {
public:
    // Re-adding a name replaces its edges.
    void add_plugin(const std::string& name, const std::vector<std::string>& depends_on);

    // Dependencies-first order (depth-first, nodes visited in name order so
    // the result does not depend on insertion order). Edges to names that
    // are not in the graph are skipped with a warning.
    // Throws DependencyCycleError on any cycle, including self-edges.
    std::vector<std::string> resolve() const;

    // Names referenced as dependencies but never added.
    std::vector<std::string> missing_dependencies() const;

    bool contains(const std::string& name) const { return graph_.count(name) != 0; }
    size_t size() const { return graph_.size(); }

private:
    std::map<std::string, std::vector<std::string>> graph_;
};

} // namespace prism
