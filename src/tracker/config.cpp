#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Config::cache_root() const {
    if (project_root.empty()) return {};
    return (fs::path(project_root) / cache_dir).string();
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("cache_dir")) cfg.cache_dir = j["cache_dir"].get<std::string>();
        if (j.contains("default_session")) cfg.default_session = j["default_session"].get<std::string>();
        if (j.contains("tools")) cfg.tools = j["tools"].get<std::vector<std::string>>();
        if (j.contains("excluded_suffixes")) {
            cfg.excluded_suffixes = j["excluded_suffixes"].get<std::vector<std::string>>();
        }

        if (j.contains("repos")) {
            auto& r = j["repos"];
            if (r.contains("frontend")) cfg.repos.frontend = r["frontend"].get<std::vector<std::string>>();
            if (r.contains("backend")) cfg.repos.backend = r["backend"].get<std::vector<std::string>>();
            if (r.contains("database")) cfg.repos.database = r["database"].get<std::vector<std::string>>();
            if (r.contains("groups")) cfg.repos.groups = r["groups"].get<std::vector<std::string>>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        return load(config_path.string());
    }
    return Config{};
}

Config Config::from_environment(const std::string& path) {
    Config cfg = path.empty() ? load_default() : load(path);
    cfg.project_root = platform::project_root();
    return cfg;
}
