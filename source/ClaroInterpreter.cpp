// ClaroInterpreter.cpp
#include "Claro.hpp"
#include "Config.hpp"
#include "Error.hpp"
#include "TextIO.hpp"
#include <string>

namespace {
    void print_usage() {
        TextIO::print(
            "Usage: claro [options] [file]\n"
            "  <file>             Run a Claro program\n"
            "  -e <file>          Run a Claro program\n"
            "  -i                 Start interactive mode\n"
            "  --config <file>    Load settings from a JSON file\n"
            "  --debug            Trace every executed line\n"
            "  -h, --help         Show this help\n"
            "  --version          Show the version\n");
    }
}

int main(int argc, char* argv[]) {
    // Create an instance of our interpreter
    ClaroInterpreter interpreter;
    InterpreterConfig config;

    bool interactive = false;
    bool debug_flag = false;
    std::string filename_arg;
    std::string config_arg;

    if (argc < 2) {
        print_usage();
        return 0;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        }
        else if (arg == "--version") {
            TextIO::print("Claro Interpreter Version 1.0\n");
            return 0;
        }
        else if (arg == "-i") {
            interactive = true;
        }
        else if (arg == "--debug") {
            debug_flag = true;
        }
        else if (arg == "-e" || arg == "--config") {
            if (i + 1 >= argc) {
                TextIO::print("Error: " + arg + " needs a file name\n");
                print_usage();
                return 1;
            }
            (arg == "-e" ? filename_arg : config_arg) = argv[++i];
        }
        else if (!arg.empty() && arg[0] == '-') {
            TextIO::print("Error: unknown option '" + arg + "'\n");
            print_usage();
            return 1;
        }
        else if (filename_arg.empty()) {
            // Capture the first non-flag argument as the program file
            filename_arg = arg;
        }
    }

    if (!config_arg.empty()) {
        if (!Config::load_file(config_arg, config)) {
            Error::print();
            return 1;
        }
    }
    if (debug_flag) config.debug = true;
    interpreter.apply_config(config);

    if (!filename_arg.empty()) {
        bool ok = interpreter.run_file(filename_arg);
        if (!interactive) return ok ? 0 : 1;
    }
    if (interactive) {
        interpreter.start();
        return 0;
    }

    // Only options, no program and no -i.
    print_usage();
    return 1;
}
