#include "commands.h"
#include "runner_utils.h"
#include "runtime_setup.h"

#include <iostream>
#include <iterator>

using namespace prism;

// Usage: prism_cli run <route> [request.json|-]
// Prints the final response_data. Plugin failures are part of the response,
// so the exit code only reflects usage and input errors.
int cmd_run(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: prism_cli run <route> [request.json|-]\n";
        return 2;
    }
    const std::string route = argv[2];

    json_mini::Doc request = json_mini::Doc::object();
    if (argc >= 4) {
        const std::string src = argv[3];
        std::string text;
        if (src == "-") {
            text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        } else {
            try {
                text = slurp(src);
            } catch (const std::exception& e) {
                std::cerr << "[error] " << e.what() << "\n";
                return 2;
            }
        }
        request = json_mini::parse(text);
        if (!request || !json_object_is_type(request.root, json_type_object)) {
            std::cerr << "[error] request must be a JSON object\n";
            return 2;
        }
    }

    auto rt = setup_runtime(argv[0], SetupOptions{});
    RequestContext ctx = rt->runner->run(route, std::move(request));
    print_json(ctx.response_data());
    return 0;
}

// Usage: prism_cli validate <route>
int cmd_validate(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: prism_cli validate <route>\n";
        return 2;
    }
    auto rt = setup_runtime(argv[0], SetupOptions{});
    ChainValidation v = rt->runner->validate_chain(argv[2]);
    json_mini::Doc out{validation_to_json(v)};
    print_json(out.root);
    return v.valid ? 0 : 1;
}
