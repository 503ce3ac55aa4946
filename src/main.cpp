#include "../include/abelian.hpp"
#include "../include/fpspace.hpp"
#include "../include/input.hpp"
#include "../include/multgrp.hpp"

#include <iostream>
#include <string>

const std::string truthies[] = { "true", "1", "yes" };

bool truthy(std::string s) {
    // To lowercase
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] >= 'A' && s[i] <= 'Z') s[i] += 'a' - 'A';
    }

    for (const std::string &t : truthies) {
        if (s == t) return true;
    }
    return false;
}

// Coefficients: finitely generated abelian groups, vector spaces over F_p or units mod p
enum class ModuleKind { z, fp, mult };

Input::Config parse_arg(int argc, char** argv, ModuleKind &kind) {
    Input::Config config;
    kind = ModuleKind::z;

    // Support only --key=value arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = std::string(argv[i]);

        if (arg.substr(0, 2) != "--") {
            throw std::invalid_argument("Invalid argument: " + arg);
        }
        size_t split = arg.find_first_of('=');
        if (split == std::string::npos) throw std::invalid_argument("Expected --key=value, got " + arg);
        std::string key = arg.substr(2, split - 2);
        std::string val = arg.substr(split + 1);

        if (key == "module") {
            if (val == "z") kind = ModuleKind::z;
            else if (val == "fp") kind = ModuleKind::fp;
            else if (val == "mult") kind = ModuleKind::mult;
            else throw std::invalid_argument("Unknown module kind '" + val + "', expected z, fp or mult");
        } else if (key == "pretty") {
            config.pretty = truthy(val);
        } else if (key == "force_rws" || key == "rws") {
            config.force_rws = truthy(val);
        } else if (key == "verbose") {
            config.verbose = std::stoi(val);
        } else if (key == "assert") {
            config.assert_level = std::stoi(val);
        } else {
            std::cerr << "Warning: Unknown argument '" << key << "'" << std::endl;
        }
    }

    return config;
}

int main(int argc, char** argv) {
    ModuleKind kind;
    Input::Config config = parse_arg(argc, argv, kind);

    if (kind == ModuleKind::fp) {
        Input::InputHandler<fpspace::FpSpace> handler(std::cin, std::cout, std::cerr, config);
        handler.handle_input();
    } else if (kind == ModuleKind::mult) {
        Input::InputHandler<multgrp::MultGrp> handler(std::cin, std::cout, std::cerr, config);
        handler.handle_input();
    } else {
        Input::InputHandler<abelian::AbGroup> handler(std::cin, std::cout, std::cerr, config);
        handler.handle_input();
    }
}
