#include "commands.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "warden_cli <sanitize|gate> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "sanitize") return cmd_sanitize(argc, argv);
    if (cmd == "gate") return cmd_gate(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
