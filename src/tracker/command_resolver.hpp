#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class CommandKind { Build, Typecheck };

// Persisted kind tag: "build" or "tsc".
std::string_view to_string(CommandKind kind);
std::optional<CommandKind> parse_command_kind(std::string_view tag);

struct ValidationCommand {
    std::string repo_id;
    CommandKind kind = CommandKind::Build;
    std::string command_line;

    // "<repo_id>:<kind>:<command_line>"
    std::string to_line() const;
    static std::optional<ValidationCommand> from_line(std::string_view line);

    bool operator==(const ValidationCommand&) const = default;
};

enum class PackageManager { Pnpm, Npm, Yarn };

struct ResolvedCommands {
    std::expected<std::string, std::string> build;
    std::expected<std::string, std::string> typecheck;

    // The commands that resolved, build first.
    std::vector<ValidationCommand> commands(const std::string& repo_id) const;
};

// Derives build/typecheck commands from a repo directory's manifest state.
// Unresolved commands carry the reason; nothing here throws.
class CommandResolver {
public:
    explicit CommandResolver(std::string project_root);

    ResolvedCommands resolve(const std::string& repo_id) const;

    std::expected<std::string, std::string> resolve_build(const std::string& repo_id) const;
    std::expected<std::string, std::string> resolve_typecheck(const std::string& repo_id) const;

    // Lockfile probe in priority order pnpm > npm > yarn, npm when none is found.
    static PackageManager detect_package_manager(const std::string& repo_dir);
    static std::string_view build_invocation(PackageManager pm);

private:
    static std::expected<bool, std::string> declares_build_script(const std::string& manifest_path);
    static bool is_database_repo(const std::string& repo_id);
    static bool exists(const std::string& path);

    std::string project_root_;
};
