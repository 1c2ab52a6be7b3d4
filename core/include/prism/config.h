#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace prism {

enum class Profile { DEV, PROD };

// Detect profile from PRISM_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (no signature check, permissive version constraints)
// PROD: strict (signatures required, unparseable constraints fail the gate)
void apply_profile_defaults(Profile p);

// Runtime settings resolved from PRISM_* environment variables.
struct Settings {
    std::filesystem::path root;           // project root (secure dir, temp dir, registry)
    std::filesystem::path plugins_dir;
    std::vector<std::string> enabled_plugins;
    bool auto_load{true};

    bool verify_signatures{false};
    std::filesystem::path trusted_keys_dir;
    bool strict_version_constraints{false};

    bool hot_reload{false};
    int hot_reload_interval_ms{2000};
    bool hot_reload_hash{false};

    std::string default_plugin{"auth_plugin"};
    std::filesystem::path routes_file;
    std::string audit_log;                // empty: disabled

    std::filesystem::path registry_file() const { return root / "plugin_data" / "plugin_registry.json"; }
    std::filesystem::path secure_dir() const { return root / "system_secure"; }
    std::filesystem::path temp_root() const { return root / "data" / "temp"; }

    // Relative paths in the environment are resolved against root.
    static Settings from_env();
};

// Reads an integer/boolean env var with a default. Booleans accept 1/true/yes/on.
int getenv_int(const char* key, int defv);
bool getenv_bool(const char* key, bool defv);

} // namespace prism
