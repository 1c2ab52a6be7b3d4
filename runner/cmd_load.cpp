#include "commands.h"
#include "runner_utils.h"
#include "runtime_setup.h"

#include <iostream>

using namespace prism;

// Usage: prism_cli load
// Runs the full load batch and prints what loaded and why the rest did not.
int cmd_load(int argc, char** argv) {
    (void)argc;
    auto rt = setup_runtime(argv[0], SetupOptions{true, false, false});
    const LoadReport& r = rt->report;

    json_mini::Doc out = json_mini::Doc::object();
    json_object_object_add(out.root, "loaded", strings_to_json(r.loaded));
    json_object* skipped = json_object_new_array();
    for (const auto& s : r.skipped) {
        json_object* e = json_object_new_object();
        json_mini::put_string(e, "plugin", s.first);
        json_mini::put_string(e, "reason", s.second);
        json_object_array_add(skipped, e);
    }
    json_object_object_add(out.root, "skipped", skipped);
    if (!r.ok()) json_mini::put_string(out.root, "fatal_error", r.fatal_error);
    print_json(out.root);
    return r.ok() ? 0 : 1;
}
