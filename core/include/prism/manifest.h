#pragma once

// On-disk artifacts consumed by the loader: plugin manifests (plugin.yml,
// plugin.yaml, plugin.json), group.yml / chains.yml for meta-plugins, the
// installer-issued permissions.lock.json and the install registry.
// Nothing here executes plugin code.

#include "prism/json_mini.h"
#include "prism/permission_engine.h"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace prism {

constexpr const char* kLockFileName = "permissions.lock.json";
constexpr const char* kGroupFileName = "group.yml";
constexpr const char* kChainsFileName = "chains.yml";
constexpr const char* kNextPlaceholder = "__NEXT__";

// "name" or "name@constraint" (split on the first '@').
struct DependencySpec {
    std::string name;
    std::string constraint;

    static DependencySpec parse(const std::string& spec);
    std::string to_string() const { return constraint.empty() ? name : name + "@" + constraint; }
};

struct PluginManifest {
    std::string name;
    std::string version{"0.0.0"};
    std::string description;
    std::string type;                               // free-form role, e.g. "auth", "provider"
    std::vector<DependencySpec> dependencies;
    std::vector<PermissionDeclaration> permissions;
    std::string entry;                              // "builtin:<id>", a library path, or empty (plugin.so)
    std::filesystem::path source;                   // manifest file it was read from
};

struct LockFile {
    std::string plugin_name;
    std::vector<PermissionDeclaration> permissions;
    std::string created_at;
    std::string version;
};

struct SubPluginConfig {
    std::string name;
    bool enabled{true};
    std::vector<PermissionDeclaration> permissions;
    std::vector<DependencySpec> dependencies;
};

struct GroupManifest {
    std::map<std::string, SubPluginConfig> subplugins;   // configured entries from group.yml
    json_mini::Doc chains;                               // raw "chains" section, may be empty
};

struct PresetChain {
    std::string pattern;
    std::string description;
    std::vector<std::string> plugins;                    // may contain kNextPlaceholder
};

// Parses .json with json-c and .yml/.yaml with yaml-cpp into a json-c tree.
// Throws ConfigurationError on malformed content, MissingArtifact if absent.
json_mini::Doc load_structured_file(const std::filesystem::path& path);

// First of plugin.yml, plugin.yaml, plugin.json in dir.
std::optional<std::filesystem::path> find_manifest_file(const std::filesystem::path& dir);

// Metadata-only scan. The plugin is identified by its directory name;
// a differing "name" field is reported and ignored. For groups without a
// plugin manifest the metadata comes from group.yml.
// Throws MissingArtifact (no manifest) or ConfigurationError (malformed).
PluginManifest read_plugin_manifest(const std::filesystem::path& dir);

PluginManifest manifest_from_json(json_object* root, const std::string& name);

std::filesystem::path lock_file_path(const std::filesystem::path& dir);

// Throws MissingArtifact if absent, ConfigurationError if malformed.
LockFile read_lock_file(const std::filesystem::path& path);

bool is_group_dir(const std::filesystem::path& dir);
GroupManifest read_group_manifest(const std::filesystem::path& dir);

// chains.yml "chains" (falling back to group.yml "chains"), map or list form.
// Keys of the result are "<meta>:<chain>". Sub-plugin names become
// "<meta>.<sub>" and "{next}" becomes kNextPlaceholder.
std::map<std::string, PresetChain> read_preset_chains(const std::filesystem::path& dir,
                                                      const std::string& meta,
                                                      const std::set<std::string>& subplugins,
                                                      json_object* group_chains);

// Installer-maintained {"<name>": {"version": ..., ...}} map. Re-read on
// every query so installs made while running are picked up.
class InstallRegistry {
public:
    explicit InstallRegistry(std::filesystem::path file) : file_(std::move(file)) {}

    bool is_installed(const std::string& name) const;
    const std::filesystem::path& file() const { return file_; }

private:
    std::filesystem::path file_;
};

} // namespace prism
