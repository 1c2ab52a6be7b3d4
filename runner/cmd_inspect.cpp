#include "commands.h"
#include "runner_utils.h"
#include "runtime_setup.h"

#include <iostream>

using namespace prism;

// Usage: prism_cli inspect <plugin>
// Manifest, grants, violations and security warnings of one plugin.
int cmd_inspect(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: prism_cli inspect <plugin>\n";
        return 2;
    }
    const std::string name = argv[2];
    auto rt = setup_runtime(argv[0], SetupOptions{true, false, false});

    SecurityReport sec = rt->loader->security_report(name);
    json_mini::Doc out = json_mini::Doc::object();
    json_mini::put_string(out.root, "plugin", name);
    json_object_object_add(out.root, "loaded", json_object_new_boolean(sec.loaded ? 1 : 0));
    if (rt->report.was_skipped(name)) {
        for (const auto& s : rt->report.skipped) {
            if (s.first == name) json_mini::put_string(out.root, "skip_reason", s.second);
        }
    }

    if (auto rec = rt->loader->record(name)) {
        const PluginManifest& m = rec->manifest;
        json_mini::put_string(out.root, "version", m.version);
        json_mini::put_string(out.root, "type", m.type);
        json_mini::put_string(out.root, "root", rec->root.string());
        std::vector<std::string> deps;
        for (const auto& d : m.dependencies) deps.push_back(d.to_string());
        json_object_object_add(out.root, "dependencies", strings_to_json(deps));
        if (auto* meta = dynamic_cast<MetaPlugin*>(rec->instance.get())) {
            json_object_object_add(out.root, "subplugins", strings_to_json(meta->subplugin_names()));
            json_object_object_add(out.root, "chains", strings_to_json(meta->chain_names()));
        }
    }
    json_object_object_add(out.root, "granted", strings_to_json(sec.granted));
    json_object_object_add(out.root, "violations", strings_to_json(sec.violations));
    json_object_object_add(out.root, "warnings", strings_to_json(sec.warnings));
    print_json(out.root);
    return sec.loaded ? 0 : 1;
}
