#include "runner_utils.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace prism {

static void warn_sensitive_root(const std::filesystem::path& root) {
    static const std::vector<std::string> sensitive = {"/", "/etc", "/usr", "/var", "/home", "/root", "/tmp"};
    std::error_code ec;
    auto canon = std::filesystem::weakly_canonical(root, ec);
    if (ec) return;
    for (const auto& s : sensitive) {
        if (canon == std::filesystem::path(s)) {
            std::cerr << "[warn] PRISM_ROOT points to sensitive directory: " << canon << "\n";
            break;
        }
    }
}

std::filesystem::path resolve_root(const char* argv0) {
    std::error_code ec;
    if (const char* e = std::getenv("PRISM_ROOT")) {
        std::filesystem::path p = e;
        if (std::filesystem::exists(p, ec)) {
            auto result = std::filesystem::canonical(p, ec);
            if (!ec) {
                warn_sensitive_root(result);
                return result;
            }
        }
    }
    std::filesystem::path exe = argv0 ? std::filesystem::path(argv0) : std::filesystem::path();
    if (!exe.empty() && !exe.is_absolute()) exe = std::filesystem::absolute(exe, ec);
    if (!exe.empty() && std::filesystem::exists(exe, ec)) {
        auto canon = std::filesystem::canonical(exe, ec);
        if (!ec) exe = canon;
    }
    std::filesystem::path dir = exe.empty() ? std::filesystem::current_path(ec) : exe.parent_path();
    // walk up looking for a project root (plugins directory)
    for (int i = 0; i < 8; i++) {
        if (std::filesystem::is_directory(dir / "plugins", ec)) {
            warn_sensitive_root(dir);
            return dir;
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) break;
        dir = dir.parent_path();
    }
    auto result = std::filesystem::current_path(ec);
    warn_sensitive_root(result);
    return result;
}

void set_env_if_missing(const char* key, const std::string& value) {
    if (std::getenv(key) != nullptr) return;
    setenv(key, value.c_str(), 0);
}

std::string slurp(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("cannot open: " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void print_json(json_object* obj) {
    std::cout << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_NOSLASHESCAPE)
              << "\n";
}

json_object* strings_to_json(const std::vector<std::string>& items) {
    json_object* arr = json_object_new_array();
    for (const auto& s : items) json_object_array_add(arr, json_object_new_string(s.c_str()));
    return arr;
}

json_object* validation_to_json(const ChainValidation& v) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "route", json_object_new_string(v.route.c_str()));
    json_object_object_add(o, "chain", strings_to_json(v.chain));
    json_object_object_add(o, "valid", json_object_new_boolean(v.valid ? 1 : 0));
    json_object_object_add(o, "issues", strings_to_json(v.issues));
    return o;
}

} // namespace prism
