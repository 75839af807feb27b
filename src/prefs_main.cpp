/**
 * gridsync-prefs
 *
 * Reads and writes the Gridsync preference file from the command line.
 *
 *   gridsync-prefs get features invites
 *   gridsync-prefs set features multiple_grids false
 *   gridsync-prefs features
 */

#include "logger.hpp"
#include "preferences.hpp"
#include "status.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace gridsync;

static void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS] COMMAND\n\n"
              << "Commands:\n"
              << "  get SECTION OPTION        Print a preference value\n"
              << "  set SECTION OPTION VALUE  Store a preference value\n"
              << "  features                  Print the resolved feature flags\n\n"
              << "Options:\n"
              << "  --file PATH  Preference file (default: " << PreferenceStore::default_path() << ")\n"
              << "  --debug      Enable debug logging\n"
              << "  --help       Show this help message\n";
}

int main(int argc, char* argv[]) {
    bool debug_mode = false;
    std::string file_path;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg(argv[i]);
        if (arg == "--debug") {
            debug_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--file") {
            if (i + 1 >= argc) {
                std::cerr << "--file requires a path\n";
                return 2;
            }
            file_path = argv[++i];
        } else {
            args.push_back(arg);
        }
    }

    // Keep stdout for values; only warnings and errors unless --debug
    Logger::init(debug_mode ? LogLevel::DEBUG : LogLevel::WARN, Logger::default_log_path());

    if (args.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    PreferenceStore store(file_path.empty() ? PreferenceStore::default_path() : file_path);
    Logger::debug("[Prefs] Using " + store.path());

    const std::string& command = args[0];
    if (command == "get" && args.size() == 3) {
        std::string value;
        Status status = store.get(args[1], args[2], &value);
        if (status != Status::Ok) {
            std::cerr << args[1] << "." << args[2] << ": " << status_name(status) << "\n";
            return 1;
        }
        std::cout << value << "\n";
        return 0;
    }

    if (command == "set" && args.size() == 4) {
        Status status = store.set(args[1], args[2], args[3]);
        if (status != Status::Ok) {
            std::cerr << "Could not save " << args[1] << "." << args[2] << ": "
                      << status_name(status) << "\n";
            return 1;
        }
        return 0;
    }

    if (command == "features" && args.size() == 1) {
        FeatureFlags flags = load_feature_flags(store);
        std::cout << "grid_invites=" << (flags.grid_invites ? "true" : "false") << "\n"
                  << "invites=" << (flags.invites ? "true" : "false") << "\n"
                  << "multiple_grids=" << (flags.multiple_grids ? "true" : "false") << "\n";
        return 0;
    }

    print_usage(argv[0]);
    return 2;
}
