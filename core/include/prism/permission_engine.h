#pragma once

// Capability catalogue: which named capabilities exist, which intercepted
// operations they govern, and how manifest/lock-file declarations map onto them.

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace prism {

// Names of governed operation categories.
namespace events {
constexpr const char* kOpen    = "open";
constexpr const char* kRename  = "os.rename";
constexpr const char* kRemove  = "os.remove";
constexpr const char* kConnect = "socket.connect";
constexpr const char* kSpawn   = "subprocess.spawn";
constexpr const char* kSystem  = "os.system";
} // namespace events

// Arguments of an intercepted operation. Only the fields relevant to the
// event are filled in.
struct OperationArgs {
    std::filesystem::path path;    // open / rename source / remove
    std::filesystem::path path2;   // rename target
    std::string mode;              // fopen-style: r, w, a, r+, ...
    std::string host;
    int port{0};
    std::vector<std::string> argv;

    // Human-readable resource for violation messages.
    std::string describe_resource() const;
};

struct CapabilityDefinition {
    std::string name;
    std::string description;
    std::string type;                              // declaration type: file, network, api, system
    std::vector<std::string> events;               // an entry ending in '.' matches by prefix
    std::optional<std::string> resource_pattern;   // glob over declared resources; nullopt matches any
    std::function<bool(const OperationArgs&)> resource_matcher;  // empty: always matches
};

// One permission entry from a manifest or lock file.
struct PermissionDeclaration {
    std::string type;
    std::string resource;
    std::string description;
    std::string name;              // optional explicit capability name or glob
};

class PermissionEngine {
public:
    PermissionEngine() = default;

    // Catalogue with file.read.plugin, file.write.plugin, network.https,
    // network.http, api.create_route and system.subprocess.
    static PermissionEngine with_defaults();

    // Throws ConfigurationError on duplicate name or after freeze().
    void register_capability(CapabilityDefinition def);
    void freeze() { frozen_ = true; }
    bool frozen() const { return frozen_; }

    // Every capability that governs `event` and whose resource matcher accepts
    // the discriminator in `args`. Empty for ungoverned events.
    std::vector<std::string> map_event_to_permissions(const std::string& event,
                                                      const OperationArgs& args) const;

    // Reverse lookup: type equality plus glob match of the declared resource.
    const CapabilityDefinition* find_definition_for_declaration(const std::string& type,
                                                                const std::string& resource) const;

    // True if any capability lists `event` (exactly or by prefix). A governed
    // event with no matching capability is denied.
    bool governs(const std::string& event) const;

    const CapabilityDefinition* definition(const std::string& name) const;
    std::vector<std::string> names() const;

    // True if the discriminator in `args` satisfies `name`'s matcher for `event`.
    bool resource_matches(const std::string& name, const std::string& event, const OperationArgs& args) const;

private:
    std::vector<std::string> candidates_for(const std::string& event) const;

    std::map<std::string, CapabilityDefinition> defs_;
    std::map<std::string, std::vector<std::string>> event_map_;
    bool frozen_{false};
};

// Frozen process-wide catalogue built from with_defaults().
const PermissionEngine& default_permission_engine();

// fnmatch(3) without flags.
bool glob_match(const std::string& pattern, const std::string& text);

} // namespace prism
