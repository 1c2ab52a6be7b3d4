#include "prism/permission_engine.h"
#include "prism/errors.h"

#include <fnmatch.h>

#include <algorithm>
#include <sstream>

namespace prism {

bool glob_match(const std::string& pattern, const std::string& text) {
    return fnmatch(pattern.c_str(), text.c_str(), 0) == 0;
}

std::string OperationArgs::describe_resource() const {
    if (!argv.empty()) {
        std::string s;
        for (size_t i = 0; i < argv.size(); i++) {
            if (i) s += " ";
            s += argv[i];
        }
        return s;
    }
    if (!host.empty() || port) return host + ":" + std::to_string(port);
    if (!path2.empty()) return path.string() + " -> " + path2.string();
    return path.string();
}

// Rename and remove are write operations on the affected path.
static OperationArgs discriminator_for(const std::string& event, const OperationArgs& args) {
    if (event == events::kRename || event == events::kRemove) {
        OperationArgs a = args;
        a.mode = "w";
        return a;
    }
    return args;
}

// Only an explicit 'r' counts as a read; "w+" and "a+" are governed as writes.
static bool mode_reads(const OperationArgs& a) {
    return a.mode.find('r') != std::string::npos;
}

static bool mode_writes(const OperationArgs& a) {
    return a.mode.find_first_of("wax+") != std::string::npos;
}

PermissionEngine PermissionEngine::with_defaults() {
    PermissionEngine e;
    e.register_capability({"file.read.plugin", "Read files within the plugin directory", "file",
                           {events::kOpen}, std::string("read"), mode_reads});
    e.register_capability({"file.write.plugin", "Write files within the plugin directory", "file",
                           {events::kOpen, events::kRename, events::kRemove}, std::string("write"), mode_writes});
    e.register_capability({"network.https", "Outbound HTTPS connections", "network",
                           {events::kConnect}, std::string("outbound:https"),
                           [](const OperationArgs& a) { return a.port == 443; }});
    e.register_capability({"network.http", "Outbound HTTP connections", "network",
                           {events::kConnect}, std::string("outbound:http"),
                           [](const OperationArgs& a) { return a.port == 80; }});
    e.register_capability({"api.create_route", "Register API routes", "api",
                           {}, std::string("create_route"), nullptr});
    e.register_capability({"system.subprocess", "Spawn subprocesses", "system",
                           {"subprocess.", events::kSystem}, std::string("subprocess"), nullptr});
    return e;
}

void PermissionEngine::register_capability(CapabilityDefinition def) {
    if (frozen_) {
        throw ConfigurationError("capability catalogue is frozen; cannot register " + def.name);
    }
    if (def.name.empty()) throw ConfigurationError("capability name is empty");
    if (defs_.count(def.name)) {
        throw ConfigurationError("capability already registered: " + def.name);
    }
    for (const auto& ev : def.events) event_map_[ev].push_back(def.name);
    std::string name = def.name;
    defs_.emplace(std::move(name), std::move(def));
}

std::vector<std::string> PermissionEngine::candidates_for(const std::string& event) const {
    auto it = event_map_.find(event);
    if (it != event_map_.end()) return it->second;
    // Dynamically named categories (e.g. "subprocess.spawn") match a registered prefix.
    std::vector<std::string> candidates;
    for (const auto& kv : event_map_) {
        const std::string& key = kv.first;
        if (!key.empty() && key.back() == '.' && event.compare(0, key.size(), key) == 0) {
            candidates.insert(candidates.end(), kv.second.begin(), kv.second.end());
        }
    }
    return candidates;
}

bool PermissionEngine::governs(const std::string& event) const {
    return !candidates_for(event).empty();
}

std::vector<std::string> PermissionEngine::map_event_to_permissions(const std::string& event,
                                                                    const OperationArgs& args) const {
    const std::vector<std::string> candidates = candidates_for(event);
    const OperationArgs disc = discriminator_for(event, args);
    std::vector<std::string> out;
    for (const auto& name : candidates) {
        const auto& def = defs_.at(name);
        if (def.resource_matcher && !def.resource_matcher(disc)) continue;
        if (std::find(out.begin(), out.end(), name) == out.end()) out.push_back(name);
    }
    return out;
}

const CapabilityDefinition* PermissionEngine::find_definition_for_declaration(const std::string& type,
                                                                              const std::string& resource) const {
    for (const auto& kv : defs_) {
        const auto& def = kv.second;
        if (def.type != type) continue;
        if (!def.resource_pattern || glob_match(*def.resource_pattern, resource)) return &def;
    }
    return nullptr;
}

const CapabilityDefinition* PermissionEngine::definition(const std::string& name) const {
    auto it = defs_.find(name);
    return it == defs_.end() ? nullptr : &it->second;
}

std::vector<std::string> PermissionEngine::names() const {
    std::vector<std::string> out;
    out.reserve(defs_.size());
    for (const auto& kv : defs_) out.push_back(kv.first);
    return out;
}

bool PermissionEngine::resource_matches(const std::string& name, const std::string& event,
                                        const OperationArgs& args) const {
    const auto* def = definition(name);
    if (!def) return false;
    if (!def->resource_matcher) return true;
    return def->resource_matcher(discriminator_for(event, args));
}

const PermissionEngine& default_permission_engine() {
    static const PermissionEngine engine = [] {
        PermissionEngine e = PermissionEngine::with_defaults();
        e.freeze();
        return e;
    }();
    return engine;
}

} // namespace prism
