#pragma once

#include <string>
#include <vector>

struct Config {
    // Absolute project root. Only ever supplied by the environment.
    std::string project_root;

    // Session caches live under <project_root>/<cache_dir>/<session_id>.
    std::string cache_dir = ".claude/tsc-cache";
    std::string default_session = "default";

    std::vector<std::string> tools = {"Edit", "MultiEdit", "Write"};
    std::vector<std::string> excluded_suffixes = {".md", ".markdown"};

    struct Repos {
        std::vector<std::string> frontend = {"frontend", "client", "web", "app", "ui"};
        std::vector<std::string> backend = {"backend", "server", "api", "src", "services"};
        std::vector<std::string> database = {"database", "prisma", "migrations"};
        std::vector<std::string> groups = {"packages", "examples"};
    } repos;

    bool tracking_enabled() const { return !project_root.empty(); }
    std::string cache_root() const;

    static Config load(const std::string& path);
    static Config load_default();

    // load()/load_default() plus the project root from the environment.
    static Config from_environment(const std::string& path = {});
};
