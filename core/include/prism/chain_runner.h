#pragma once

// Route -> chain resolution and chain execution.
//
// A chain entry is one of three reference kinds:
//   "plugin"         plain plugin
//   "meta.sub"       sub-plugin of a loaded meta-plugin (resolved at run time)
//   "meta:chain"     preset chain of a meta-plugin (spliced in at resolution)
// Resolved chains are cached per route until clear_cache(); RouteTable
// changes clear the cache automatically.

#include "prism/plugin_api.h"
#include "prism/plugin_loader.h"
#include "prism/request_context.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace prism {

struct PlainRef {
    std::string name;
};

struct SubPluginRef {
    std::string meta;
    std::string sub;
};

struct PresetRef {
    std::string meta;
    std::string chain;
};

using ChainRef = std::variant<PlainRef, SubPluginRef, PresetRef>;

// ':' takes precedence over '.'; both split on the first occurrence.
ChainRef parse_chain_ref(const std::string& ref);
std::string to_string(const ChainRef& ref);

// Route configuration. Thread-safe; every mutation notifies listeners.
class RouteTable {
public:
    void set_route(const std::string& route, std::vector<std::string> chain);
    bool remove_route(const std::string& route);
    void clear();

    // Replaces the table with {"routes": {"<route>": {"chain": [...]}}} from a
    // JSON or YAML file. A chain entry is a string or {"plugin": "<ref>"}.
    // Throws MissingArtifact / ConfigurationError; the table is unchanged on error.
    void load_file(const std::filesystem::path& path);

    std::optional<std::vector<std::string>> chain_for(const std::string& route) const;
    std::map<std::string, std::vector<std::string>> routes() const;

    int add_change_listener(std::function<void()> fn);
    void remove_change_listener(int id);

private:
    void notify();

    mutable std::mutex mu_;
    std::map<std::string, std::vector<std::string>> routes_;
    std::map<int, std::function<void()>> listeners_;
    int next_listener_{1};
};

struct ChainValidation {
    std::string route;
    std::vector<std::string> chain;
    bool valid{true};
    std::vector<std::string> issues;
};

class ChainRunner {
public:
    ChainRunner(const IPluginDirectory& plugins, RouteTable& routes);
    ~ChainRunner();
    ChainRunner(const ChainRunner&) = delete;
    ChainRunner& operator=(const ChainRunner&) = delete;

    // Single-item fallback chain for unconfigured routes; empty disables it.
    void set_default_plugin(std::string name);

    // Configured chain with presets expanded. Empty if the route has none.
    // A resolution that overlaps clear_cache() is returned but not cached.
    std::vector<std::string> get_chain_for_route(const std::string& route, RequestContext* ctx = nullptr);
    void clear_cache();

    // Never throws for plugin failures; errors end up in response_data.
    // request["_trace"] truthy enables tracing; the log is attached as
    // response_data["_trace"].
    RequestContext run(const std::string& route, json_mini::Doc request);

    ChainValidation validate_chain(const std::string& route);

    // Plugin instance for a reference. Throws std::out_of_range with a
    // human-readable reason when it does not resolve.
    std::shared_ptr<Plugin> resolve(const std::string& ref, RequestContext* ctx = nullptr) const;

private:
    std::vector<std::string> default_chain() const;

    const IPluginDirectory& plugins_;
    RouteTable& routes_;
    int routes_listener_{0};

    mutable std::mutex mu_;
    std::map<std::string, std::vector<std::string>> cache_;
    uint64_t cache_generation_{0};    // bumped by clear_cache()
    std::string default_plugin_;
};

} // namespace prism
