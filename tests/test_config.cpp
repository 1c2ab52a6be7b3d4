#include "test_common.h"
#include "prism/config.h"
#include "prism/plugin_loader.h"
#include <cstdlib>

int main() {
    const char* vars[] = {"PRISM_PROFILE", "PRISM_ROOT", "PRISM_PLUGINS_DIR", "PRISM_ENABLED_PLUGINS",
                          "PRISM_AUTO_LOAD", "PRISM_VERIFY_SIGNATURES", "PRISM_STRICT_VERSION_CONSTRAINTS",
                          "PRISM_HOT_RELOAD", "PRISM_HOT_RELOAD_INTERVAL_MS", "PRISM_HOT_RELOAD_HASH",
                          "PRISM_PLUGIN_ABI_LAX", "PRISM_DEFAULT_PLUGIN", "PRISM_ROUTES_FILE",
                          "PRISM_TRUSTED_KEYS_DIR", "PRISM_AUDIT_LOG"};
    for (const char* v : vars) unsetenv(v);

    // Test 1: Default profile is DEV
    auto p = prism::detect_profile();
    expect_true(p == prism::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("PRISM_PROFILE", "prod", 1);
    expect_true(prism::detect_profile() == prism::Profile::PROD, "should detect PROD");
    setenv("PRISM_PROFILE", "PRODUCTION", 1);
    expect_true(prism::detect_profile() == prism::Profile::PROD, "should detect PRODUCTION case-insensitive");
    setenv("PRISM_PROFILE", "staging", 1);
    expect_true(prism::detect_profile() == prism::Profile::DEV, "unknown profile falls back to DEV");

    // Test 3: Apply defaults (won't override existing)
    setenv("PRISM_VERIFY_SIGNATURES", "0", 1);
    prism::apply_profile_defaults(prism::Profile::PROD);
    std::string val = std::getenv("PRISM_VERIFY_SIGNATURES") ? std::getenv("PRISM_VERIFY_SIGNATURES") : "";
    expect_true(val == "0", "should NOT override pre-existing env var");

    // Test 4: Apply sets missing vars
    val = std::getenv("PRISM_STRICT_VERSION_CONSTRAINTS") ? std::getenv("PRISM_STRICT_VERSION_CONSTRAINTS") : "";
    expect_true(val == "1", "PROD should set STRICT_VERSION_CONSTRAINTS=1");

    // Test 5: Profile name
    expect_true(std::string(prism::profile_name(prism::Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(prism::profile_name(prism::Profile::PROD)) == "prod", "prod name");

    // Test 6: getenv helpers
    setenv("PRISM_HOT_RELOAD_INTERVAL_MS", "junk", 1);
    expect_eq_ll(prism::getenv_int("PRISM_HOT_RELOAD_INTERVAL_MS", 7), 7, "bad int falls back");
    setenv("PRISM_HOT_RELOAD", "Yes", 1);
    expect_true(prism::getenv_bool("PRISM_HOT_RELOAD", false), "yes is true");
    setenv("PRISM_HOT_RELOAD", "maybe", 1);
    expect_true(!prism::getenv_bool("PRISM_HOT_RELOAD", false), "unknown bool falls back");

    // Test 7: Settings from env
    for (const char* v : vars) unsetenv(v);
    setenv("PRISM_ROOT", "/srv/prism/../prism", 1);
    setenv("PRISM_ENABLED_PLUGINS", " auth_plugin, ,llm_provider ", 1);
    setenv("PRISM_HOT_RELOAD_INTERVAL_MS", "10", 1);
    setenv("PRISM_STRICT_VERSION_CONSTRAINTS", "true", 1);
    setenv("PRISM_ROUTES_FILE", "/etc/prism/routes.yml", 1);
    prism::Settings s = prism::Settings::from_env();
    expect_true(s.root == "/srv/prism", "root normalized");
    expect_true(s.plugins_dir == "/srv/prism/plugins", "plugins dir under root");
    expect_true(s.registry_file() == "/srv/prism/plugin_data/plugin_registry.json", "registry under root");
    expect_true(s.secure_dir() == "/srv/prism/system_secure", "secure dir under root");
    expect_true(s.enabled_plugins.size() == 2 && s.enabled_plugins[1] == "llm_provider", "enabled list trimmed");
    expect_eq_ll(s.hot_reload_interval_ms, 50, "interval clamped");
    expect_true(s.strict_version_constraints && !s.verify_signatures, "bool settings");
    expect_true(s.routes_file == "/etc/prism/routes.yml", "absolute routes file kept");
    expect_true(s.default_plugin == "auth_plugin" && s.auto_load, "defaults");

    prism::LoaderOptions o = prism::LoaderOptions::from_settings(s);
    expect_true(o.plugins_dir == s.plugins_dir && o.registry_file == s.registry_file(), "loader paths");
    expect_true(o.strict_version_constraints && o.enabled_plugins == s.enabled_plugins, "loader flags");

    for (const char* v : vars) unsetenv(v);
    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
