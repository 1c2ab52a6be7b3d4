#include "prism/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace prism {

Profile detect_profile() {
    const char* env = std::getenv("PRISM_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before the hot-reload watcher starts.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("PRISM_VERIFY_SIGNATURES",          "0", NO_OVERWRITE);
            setenv("PRISM_STRICT_VERSION_CONSTRAINTS", "0", NO_OVERWRITE);
            setenv("PRISM_HOT_RELOAD",                 "0", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("PRISM_VERIFY_SIGNATURES",          "1", NO_OVERWRITE);
            setenv("PRISM_STRICT_VERSION_CONSTRAINTS", "1", NO_OVERWRITE);
            setenv("PRISM_HOT_RELOAD",                 "0", NO_OVERWRITE);
            setenv("PRISM_PLUGIN_ABI_LAX",             "0", NO_OVERWRITE);
            break;
    }
}

int getenv_int(const char* key, int defv) {
    const char* v = std::getenv(key);
    if (!v || !*v) return defv;
    try {
        return std::stoi(v);
    } catch (const std::exception&) {
        return defv;
    }
}

bool getenv_bool(const char* key, bool defv) {
    const char* v = std::getenv(key);
    if (!v || !*v) return defv;
    std::string s = v;
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

static std::string getenv_str(const char* key, const std::string& defv) {
    const char* v = std::getenv(key);
    return (v && *v) ? std::string(v) : defv;
}

static std::filesystem::path under_root(const std::filesystem::path& root, const std::string& p) {
    std::filesystem::path path(p);
    return path.is_absolute() ? path : root / path;
}

Settings Settings::from_env() {
    Settings s;
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    s.root = std::filesystem::absolute(getenv_str("PRISM_ROOT", cwd.string()), ec).lexically_normal();

    s.plugins_dir = under_root(s.root, getenv_str("PRISM_PLUGINS_DIR", "plugins"));
    s.auto_load = getenv_bool("PRISM_AUTO_LOAD", true);

    std::stringstream enabled(getenv_str("PRISM_ENABLED_PLUGINS", ""));
    std::string item;
    while (std::getline(enabled, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) s.enabled_plugins.push_back(item);
    }

    s.verify_signatures = getenv_bool("PRISM_VERIFY_SIGNATURES", false);
    s.trusted_keys_dir = under_root(s.root, getenv_str("PRISM_TRUSTED_KEYS_DIR", "trusted_keys"));
    s.strict_version_constraints = getenv_bool("PRISM_STRICT_VERSION_CONSTRAINTS", false);

    s.hot_reload = getenv_bool("PRISM_HOT_RELOAD", false);
    s.hot_reload_interval_ms = std::max(50, getenv_int("PRISM_HOT_RELOAD_INTERVAL_MS", 2000));
    s.hot_reload_hash = getenv_bool("PRISM_HOT_RELOAD_HASH", false);

    s.default_plugin = getenv_str("PRISM_DEFAULT_PLUGIN", "auth_plugin");
    s.routes_file = under_root(s.root, getenv_str("PRISM_ROUTES_FILE", "config/routes.json"));
    s.audit_log = getenv_str("PRISM_AUDIT_LOG", "");
    return s;
}

} // namespace prism
