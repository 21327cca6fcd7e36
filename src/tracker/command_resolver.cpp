#include "command_resolver.hpp"

#include "path_classifier.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string_view to_string(CommandKind kind) {
    switch (kind) {
        case CommandKind::Build: return "build";
        case CommandKind::Typecheck: return "tsc";
    }
    return "build";
}

std::optional<CommandKind> parse_command_kind(std::string_view tag) {
    if (tag == "build") return CommandKind::Build;
    if (tag == "tsc") return CommandKind::Typecheck;
    return std::nullopt;
}

std::string ValidationCommand::to_line() const {
    return std::format("{}:{}:{}", repo_id, to_string(kind), command_line);
}

std::optional<ValidationCommand> ValidationCommand::from_line(std::string_view line) {
    auto first = line.find(':');
    if (first == std::string_view::npos || first == 0) return std::nullopt;
    auto second = line.find(':', first + 1);
    if (second == std::string_view::npos) return std::nullopt;

    auto kind = parse_command_kind(line.substr(first + 1, second - first - 1));
    if (!kind) return std::nullopt;

    auto command_line = line.substr(second + 1);
    if (command_line.empty()) return std::nullopt;

    return ValidationCommand{
        .repo_id = std::string(line.substr(0, first)),
        .kind = *kind,
        .command_line = std::string(command_line),
    };
}

std::vector<ValidationCommand> ResolvedCommands::commands(const std::string& repo_id) const {
    std::vector<ValidationCommand> out;
    if (build) out.push_back({repo_id, CommandKind::Build, *build});
    if (typecheck) out.push_back({repo_id, CommandKind::Typecheck, *typecheck});
    return out;
}

CommandResolver::CommandResolver(std::string project_root)
    : project_root_(std::move(project_root)) {}

ResolvedCommands CommandResolver::resolve(const std::string& repo_id) const {
    return ResolvedCommands{
        .build = resolve_build(repo_id),
        .typecheck = resolve_typecheck(repo_id),
    };
}

std::expected<std::string, std::string>
CommandResolver::resolve_build(const std::string& repo_id) const {
    auto repo_dir = repo::directory(repo_id, project_root_);
    auto manifest = repo_dir + "/package.json";

    std::string reason;
    if (exists(manifest)) {
        auto declared = declares_build_script(manifest);
        if (declared && *declared) {
            auto pm = detect_package_manager(repo_dir);
            return std::format("cd {} && {}", repo_dir, build_invocation(pm));
        }
        reason = declared ? "no build script in " + manifest : declared.error();
    } else {
        reason = "no manifest at " + manifest;
    }

    if (is_database_repo(repo_id) &&
        (exists(repo_dir + "/schema.prisma") || exists(repo_dir + "/prisma/schema.prisma"))) {
        return std::format("cd {} && npx prisma generate", repo_dir);
    }

    return std::unexpected(std::move(reason));
}

std::expected<std::string, std::string>
CommandResolver::resolve_typecheck(const std::string& repo_id) const {
    auto repo_dir = repo::directory(repo_id, project_root_);

    if (!exists(repo_dir + "/tsconfig.json")) {
        return std::unexpected("no tsconfig.json in " + repo_dir);
    }

    if (exists(repo_dir + "/tsconfig.app.json")) {
        return std::format("cd {} && npx tsc --project tsconfig.app.json --noEmit", repo_dir);
    }
    return std::format("cd {} && npx tsc --noEmit", repo_dir);
}

PackageManager CommandResolver::detect_package_manager(const std::string& repo_dir) {
    if (exists(repo_dir + "/pnpm-lock.yaml")) return PackageManager::Pnpm;
    if (exists(repo_dir + "/package-lock.json")) return PackageManager::Npm;
    if (exists(repo_dir + "/yarn.lock")) return PackageManager::Yarn;
    return PackageManager::Npm;
}

std::string_view CommandResolver::build_invocation(PackageManager pm) {
    switch (pm) {
        case PackageManager::Pnpm: return "pnpm build";
        case PackageManager::Npm: return "npm run build";
        case PackageManager::Yarn: return "yarn build";
    }
    return "npm run build";
}

std::expected<bool, std::string>
CommandResolver::declares_build_script(const std::string& manifest_path) {
    std::ifstream f(manifest_path);
    if (!f.is_open()) {
        return std::unexpected("could not open " + manifest_path);
    }

    try {
        auto j = json::parse(f);
        if (!j.is_object()) return false;
        auto scripts = j.find("scripts");
        if (scripts == j.end() || !scripts->is_object()) return false;
        auto build = scripts->find("build");
        return build != scripts->end() && build->is_string();
    } catch (const json::exception& e) {
        return std::unexpected(std::format("{}: {}", manifest_path, e.what()));
    }
}

bool CommandResolver::is_database_repo(const std::string& repo_id) {
    return repo_id == "database" || repo_id.find("prisma") != std::string::npos;
}

bool CommandResolver::exists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}
