#include "commands.h"

#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "prism_cli <load|run|validate|inspect|watch> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    try {
        if (cmd == "load") return cmd_load(argc, argv);
        if (cmd == "run") return cmd_run(argc, argv);
        if (cmd == "validate") return cmd_validate(argc, argv);
        if (cmd == "inspect") return cmd_inspect(argc, argv);
        if (cmd == "watch") return cmd_watch(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
