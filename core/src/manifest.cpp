#include "prism/manifest.h"
#include "prism/errors.h"

#include <yaml-cpp/yaml.h>

#include <iostream>
#include <set>

namespace prism {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// YAML -> json-c
// ---------------------------------------------------------------------------

// Plain scalars stay strings (so "version: 1.0" keeps its spelling) except
// YAML 1.1 booleans and nulls.
static json_object* yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Map: {
        json_object* obj = json_object_new_object();
        for (const auto& kv : node) {
            json_object_object_add(obj, kv.first.Scalar().c_str(), yaml_to_json(kv.second));
        }
        return obj;
    }
    case YAML::NodeType::Sequence: {
        json_object* arr = json_object_new_array();
        for (const auto& el : node) json_object_array_add(arr, yaml_to_json(el));
        return arr;
    }
    case YAML::NodeType::Scalar: {
        const std::string& s = node.Scalar();
        if (node.Tag() != "!") {
            // YAML 1.1 booleans, as PyYAML-written manifests use them
            static const std::set<std::string> kTrue = {"true", "True", "TRUE", "yes", "Yes", "YES", "on", "On", "ON"};
            static const std::set<std::string> kFalse = {"false", "False", "FALSE", "no", "No", "NO", "off", "Off", "OFF"};
            if (kTrue.count(s)) return json_object_new_boolean(1);
            if (kFalse.count(s)) return json_object_new_boolean(0);
            if (s == "~" || s == "null" || s == "Null" || s == "NULL") return nullptr;
        }
        return json_object_new_string_len(s.c_str(), static_cast<int>(s.size()));
    }
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
        break;
    }
    return nullptr;
}

json_mini::Doc load_structured_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) throw MissingArtifact("file not found: " + path.string());

    const auto ext = path.extension().string();
    if (ext == ".yml" || ext == ".yaml") {
        try {
            YAML::Node node = YAML::LoadFile(path.string());
            if (node.IsNull()) return json_mini::Doc::object();
            return json_mini::Doc{yaml_to_json(node)};
        } catch (const YAML::Exception& e) {
            throw ConfigurationError("invalid YAML in " + path.string() + ": " + e.what());
        }
    }

    std::string err;
    json_mini::Doc d = json_mini::parse_file(path, &err);
    if (!d) throw ConfigurationError(err);
    return d;
}

// ---------------------------------------------------------------------------
// Manifest
// ---------------------------------------------------------------------------

DependencySpec DependencySpec::parse(const std::string& spec) {
    DependencySpec d;
    auto at = spec.find('@');
    if (at == std::string::npos) {
        d.name = spec;
    } else {
        d.name = spec.substr(0, at);
        d.constraint = spec.substr(at + 1);
    }
    auto trim = [](std::string& s) {
        s.erase(0, s.find_first_not_of(" \t"));
        s.erase(s.find_last_not_of(" \t") + 1);
    };
    trim(d.name);
    trim(d.constraint);
    return d;
}

static std::string scalar_text(json_object* v) {
    if (!v || json_object_is_type(v, json_type_null)) return "";
    if (json_object_is_type(v, json_type_string)) return json_object_get_string(v);
    return json_object_to_json_string_ext(v, JSON_C_TO_STRING_PLAIN);
}

static std::vector<DependencySpec> parse_dependencies(json_object* deps, const std::string& owner) {
    std::vector<DependencySpec> out;
    if (!deps || json_object_is_type(deps, json_type_null)) return out;
    if (!json_object_is_type(deps, json_type_array)) {
        throw ConfigurationError(owner + ": 'dependencies' must be a list");
    }
    const size_t n = json_object_array_length(deps);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(deps, i);
        DependencySpec d;
        if (json_object_is_type(el, json_type_string)) {
            d = DependencySpec::parse(json_object_get_string(el));
        } else if (json_object_is_type(el, json_type_object)) {
            d.name = json_mini::string_at(el, "name").value_or("");
            d.constraint = scalar_text(json_mini::member(el, "version"));
        }
        if (d.name.empty()) throw ConfigurationError(owner + ": dependency entry without a name");
        out.push_back(std::move(d));
    }
    return out;
}

static std::vector<PermissionDeclaration> parse_permissions(json_object* perms, const std::string& owner) {
    std::vector<PermissionDeclaration> out;
    if (!perms || json_object_is_type(perms, json_type_null)) return out;
    if (!json_object_is_type(perms, json_type_array)) {
        throw ConfigurationError(owner + ": 'permissions' must be a list");
    }
    const size_t n = json_object_array_length(perms);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(perms, i);
        PermissionDeclaration p;
        if (json_object_is_type(el, json_type_string)) {
            p.name = json_object_get_string(el);
        } else if (json_object_is_type(el, json_type_object)) {
            p.type = scalar_text(json_mini::member(el, "type"));
            p.resource = scalar_text(json_mini::member(el, "resource"));
            p.description = scalar_text(json_mini::member(el, "description"));
            p.name = scalar_text(json_mini::member(el, "name"));
        } else {
            throw ConfigurationError(owner + ": malformed permission entry");
        }
        if (p.type.empty() && p.name.empty()) {
            throw ConfigurationError(owner + ": permission entry needs 'type' or 'name'");
        }
        out.push_back(std::move(p));
    }
    return out;
}

PluginManifest manifest_from_json(json_object* root, const std::string& name) {
    if (!root || !json_object_is_type(root, json_type_object)) {
        throw ConfigurationError(name + ": manifest must be a mapping");
    }
    PluginManifest m;
    m.name = name;
    auto declared = scalar_text(json_mini::member(root, "name"));
    if (!declared.empty() && declared != name) {
        std::cerr << "[warn] manifest: " << name << " declares name '" << declared
                  << "'; using directory name\n";
    }
    auto version = scalar_text(json_mini::member(root, "version"));
    if (!version.empty()) m.version = version;
    m.description = scalar_text(json_mini::member(root, "description"));
    m.type = scalar_text(json_mini::member(root, "type"));
    m.entry = scalar_text(json_mini::member(root, "entry"));
    m.dependencies = parse_dependencies(json_mini::member(root, "dependencies"), name);
    m.permissions = parse_permissions(json_mini::member(root, "permissions"), name);
    return m;
}

std::optional<fs::path> find_manifest_file(const fs::path& dir) {
    std::error_code ec;
    for (const char* f : {"plugin.yml", "plugin.yaml", "plugin.json"}) {
        if (fs::is_regular_file(dir / f, ec)) return dir / f;
    }
    return std::nullopt;
}

PluginManifest read_plugin_manifest(const fs::path& dir) {
    const std::string name = dir.filename().string();
    auto file = find_manifest_file(dir);

    if (!file) {
        if (!is_group_dir(dir)) throw MissingArtifact(name + ": no plugin.yml/plugin.json manifest");
        // group.yml doubles as the meta-plugin manifest; its "dependencies"
        // map describes sub-plugins, not the group itself.
        json_mini::Doc d = load_structured_file(dir / kGroupFileName);
        json_mini::Doc copy = json_mini::Doc::object();
        for (const char* key : {"name", "version", "description", "type", "entry", "permissions"}) {
            json_object* v = json_mini::member(d.root, key);
            if (v) json_object_object_add(copy.root, key, json_object_get(v));
        }
        json_object* deps = json_mini::member(d.root, "dependencies");
        if (deps && json_object_is_type(deps, json_type_array)) {
            json_object_object_add(copy.root, "dependencies", json_object_get(deps));
        }
        PluginManifest m = manifest_from_json(copy.root, name);
        m.source = dir / kGroupFileName;
        return m;
    }

    json_mini::Doc d = load_structured_file(*file);
    PluginManifest m = manifest_from_json(d.root, name);
    m.source = *file;
    return m;
}

// ---------------------------------------------------------------------------
// Lock file
// ---------------------------------------------------------------------------

fs::path lock_file_path(const fs::path& dir) {
    return dir / kLockFileName;
}

LockFile read_lock_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) throw MissingArtifact("lock file not found: " + path.string());

    std::string err;
    json_mini::Doc d = json_mini::parse_file(path, &err);
    if (!d || !json_object_is_type(d.root, json_type_object)) {
        throw ConfigurationError("malformed lock file " + path.string() + (err.empty() ? "" : ": " + err));
    }
    LockFile lf;
    lf.plugin_name = json_mini::string_at(d.root, "plugin_name").value_or("");
    if (lf.plugin_name.empty()) throw ConfigurationError("lock file without plugin_name: " + path.string());
    lf.permissions = parse_permissions(json_mini::member(d.root, "permissions"), lf.plugin_name);
    lf.created_at = scalar_text(json_mini::member(d.root, "created_at"));
    lf.version = scalar_text(json_mini::member(d.root, "version"));
    return lf;
}

// ---------------------------------------------------------------------------
// Groups and preset chains
// ---------------------------------------------------------------------------

bool is_group_dir(const fs::path& dir) {
    std::error_code ec;
    return fs::is_regular_file(dir / kGroupFileName, ec);
}

GroupManifest read_group_manifest(const fs::path& dir) {
    json_mini::Doc d = load_structured_file(dir / kGroupFileName);
    const std::string owner = dir.filename().string() + "/" + kGroupFileName;
    GroupManifest g;

    json_object* subs = json_mini::member(d.root, "subplugins");
    if (subs && json_object_is_type(subs, json_type_object)) {
        json_object_object_foreach(subs, k, v) {
            SubPluginConfig sc;
            sc.name = k;
            if (v && json_object_is_type(v, json_type_object)) {
                sc.enabled = json_mini::bool_at(v, "enabled").value_or(true);
                sc.permissions = parse_permissions(json_mini::member(v, "permissions"), owner);
            }
            g.subplugins[sc.name] = std::move(sc);
        }
    } else if (subs && !json_object_is_type(subs, json_type_null)) {
        throw ConfigurationError(owner + ": 'subplugins' must be a mapping");
    }

    json_object* deps = json_mini::member(d.root, "dependencies");
    if (deps && json_object_is_type(deps, json_type_object)) {
        json_object_object_foreach(deps, k, v) {
            auto& sc = g.subplugins[k];
            sc.name = k;
            if (v && json_object_is_type(v, json_type_string)) {
                sc.dependencies.push_back(DependencySpec::parse(json_object_get_string(v)));
            } else {
                sc.dependencies = parse_dependencies(v, owner);
            }
        }
    }

    json_object* chains = json_mini::member(d.root, "chains");
    if (chains) g.chains = json_mini::Doc{json_object_get(chains)};
    return g;
}

static PresetChain parse_chain(json_object* cfg, const std::string& meta, const std::set<std::string>& subs) {
    PresetChain c;
    c.pattern = scalar_text(json_mini::member(cfg, "pattern"));
    c.description = scalar_text(json_mini::member(cfg, "description"));

    json_object* list = json_mini::member(cfg, "plugins");
    if (!list) list = json_mini::member(cfg, "steps");
    if (!list || !json_object_is_type(list, json_type_array)) return c;

    const size_t n = json_object_array_length(list);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(list, i);
        std::string ref;
        if (json_object_is_type(el, json_type_string)) ref = json_object_get_string(el);
        else if (json_object_is_type(el, json_type_object)) ref = json_mini::string_at(el, "plugin").value_or("");
        if (ref.empty()) continue;

        if (ref == "{next}") c.plugins.push_back(kNextPlaceholder);
        else if (subs.count(ref)) c.plugins.push_back(meta + "." + ref);
        else c.plugins.push_back(ref);
    }
    return c;
}

std::map<std::string, PresetChain> read_preset_chains(const fs::path& dir, const std::string& meta,
                                                      const std::set<std::string>& subplugins,
                                                      json_object* group_chains) {
    std::map<std::string, PresetChain> out;

    json_mini::Doc file;
    json_object* raw = nullptr;
    std::error_code ec;
    if (fs::is_regular_file(dir / kChainsFileName, ec)) {
        try {
            file = load_structured_file(dir / kChainsFileName);
            raw = json_mini::member(file.root, "chains");
        } catch (const ConfigurationError& e) {
            std::cerr << "[warn] chains: " << e.what() << "\n";
        }
    }
    if (!json_mini::truthy(raw)) raw = group_chains;
    if (!raw) return out;

    if (json_object_is_type(raw, json_type_object)) {
        json_object_object_foreach(raw, k, v) {
            if (!v || !json_object_is_type(v, json_type_object)) {
                std::cerr << "[warn] chains: " << meta << ":" << k << " is not a mapping, skipped\n";
                continue;
            }
            out[meta + ":" + k] = parse_chain(v, meta, subplugins);
        }
    } else if (json_object_is_type(raw, json_type_array)) {
        const size_t n = json_object_array_length(raw);
        for (size_t i = 0; i < n; i++) {
            json_object* item = json_object_array_get_idx(raw, i);
            auto name = json_mini::string_at(item, "name");
            if (!name || name->empty()) {
                std::cerr << "[warn] chains: entry without a valid 'name' in " << meta << ", skipped\n";
                continue;
            }
            out[meta + ":" + *name] = parse_chain(item, meta, subplugins);
        }
    } else {
        std::cerr << "[warn] chains: invalid chains section in " << meta << "; expected mapping or list\n";
    }
    return out;
}

// ---------------------------------------------------------------------------
// Install registry
// ---------------------------------------------------------------------------

bool InstallRegistry::is_installed(const std::string& name) const {
    std::string err;
    json_mini::Doc d = json_mini::parse_file(file_, &err);
    return json_mini::member(d.root, name.c_str()) != nullptr;
}

} // namespace prism
