#include "config.hpp"
#include "dispatcher.hpp"
#include "platform/platform_paths.hpp"
#include "storage/session_store.hpp"

#include <cstdio>
#include <exception>
#include <iostream>
#include <print>
#include <string>

// PostToolUse hook. Whatever happens, the host sees a successful exit.
int main(int argc, char* argv[]) {
    bool verbose = platform::verbose_requested();
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: build-tracker-hook [options] < event.json");
            std::println("Options:");
            std::println("  -v, --verbose       Log decisions to stderr");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -h, --help          Show this help");
            return 0;
        }
    }

    try {
        auto config = Config::from_environment(config_path);
        SessionStore store(config.cache_root());
        Dispatcher dispatcher(std::move(config), store, verbose);
        return dispatcher.run(std::cin);
    } catch (const std::exception& e) {
        if (verbose) std::fprintf(stderr, "[build-tracker] startup error: %s\n", e.what());
    } catch (...) {
        if (verbose) std::fputs("[build-tracker] startup error: unknown exception\n", stderr);
    }
    return 0;
}
