#include <catch2/catch_test_macros.hpp>

#include "command_resolver.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// RAII temp project root that auto-deletes.
struct TmpProject {
    fs::path root;

    TmpProject() {
        root = fs::temp_directory_path() / ("bt_test_resolver_" + std::to_string(getpid()));
        fs::remove_all(root);
        fs::create_directories(root);
    }

    ~TmpProject() { fs::remove_all(root); }

    void write(const std::string& rel, const std::string& content = "") const {
        auto p = root / rel;
        fs::create_directories(p.parent_path());
        std::ofstream(p) << content;
    }

    std::string dir(const std::string& rel) const { return (root / rel).string(); }
};

constexpr const char* manifest_with_build =
    R"({"name": "backend", "scripts": {"build": "tsc -p .", "test": "jest"}})";

} // namespace

TEST_CASE("CommandResolver build", "[resolver]") {
    TmpProject project;
    CommandResolver resolver(project.root.string());

    SECTION("PnpmLockfileWins") {
        project.write("backend/package.json", manifest_with_build);
        project.write("backend/pnpm-lock.yaml");
        project.write("backend/package-lock.json");
        project.write("backend/yarn.lock");

        auto cmd = resolver.resolve_build("backend");
        REQUIRE(cmd);
        REQUIRE(*cmd == "cd " + project.dir("backend") + " && pnpm build");
    }

    SECTION("NpmLockfile") {
        project.write("backend/package.json", manifest_with_build);
        project.write("backend/package-lock.json");
        project.write("backend/yarn.lock");

        auto cmd = resolver.resolve_build("backend");
        REQUIRE(cmd);
        REQUIRE(*cmd == "cd " + project.dir("backend") + " && npm run build");
    }

    SECTION("YarnLockfileOnly") {
        project.write("backend/package.json", manifest_with_build);
        project.write("backend/yarn.lock");

        auto cmd = resolver.resolve_build("backend");
        REQUIRE(cmd);
        REQUIRE(*cmd == "cd " + project.dir("backend") + " && yarn build");
    }

    SECTION("NoLockfileFallsBackToNpm") {
        project.write("backend/package.json", manifest_with_build);

        auto cmd = resolver.resolve_build("backend");
        REQUIRE(cmd);
        REQUIRE(*cmd == "cd " + project.dir("backend") + " && npm run build");
    }

    SECTION("NoBuildScript") {
        project.write("frontend/package.json", R"({"scripts": {"dev": "vite"}})");
        project.write("frontend/pnpm-lock.yaml");
        REQUIRE_FALSE(resolver.resolve_build("frontend"));
    }

    SECTION("BuildMentionedOutsideScripts") {
        project.write("frontend/package.json", R"({"description": "build tools", "build": 1})");
        REQUIRE_FALSE(resolver.resolve_build("frontend"));
    }

    SECTION("MissingManifest") {
        fs::create_directories(project.root / "api");
        auto cmd = resolver.resolve_build("api");
        REQUIRE_FALSE(cmd);
        REQUIRE_FALSE(cmd.error().empty());
    }

    SECTION("MalformedManifest") {
        project.write("api/package.json", "{ \"scripts\": { \"build\": ");
        REQUIRE_FALSE(resolver.resolve_build("api"));
    }

    SECTION("RootRepoUsesProjectRoot") {
        project.write("package.json", manifest_with_build);
        project.write("yarn.lock");

        auto cmd = resolver.resolve_build("root");
        REQUIRE(cmd);
        REQUIRE(*cmd == "cd " + project.root.string() + " && yarn build");
    }

    SECTION("PackageGroupRepo") {
        project.write("packages/foo/package.json", manifest_with_build);
        project.write("packages/foo/pnpm-lock.yaml");

        auto cmd = resolver.resolve_build("packages/foo");
        REQUIRE(cmd);
        REQUIRE(*cmd == "cd " + project.dir("packages/foo") + " && pnpm build");
    }
}

TEST_CASE("CommandResolver database schema", "[resolver]") {
    TmpProject project;
    CommandResolver resolver(project.root.string());

    SECTION("SchemaAtRepoRoot") {
        project.write("database/schema.prisma", "datasource db {}");

        auto cmd = resolver.resolve_build("database");
        REQUIRE(cmd);
        REQUIRE(*cmd == "cd " + project.dir("database") + " && npx prisma generate");
    }

    SECTION("SchemaInPrismaSubdir") {
        project.write("prisma/prisma/schema.prisma", "datasource db {}");

        auto cmd = resolver.resolve_build("prisma");
        REQUIRE(cmd);
        REQUIRE(*cmd == "cd " + project.dir("prisma") + " && npx prisma generate");
    }

    SECTION("PrismaSubstringInGroupRepo") {
        project.write("packages/prisma-client/schema.prisma", "datasource db {}");

        auto cmd = resolver.resolve_build("packages/prisma-client");
        REQUIRE(cmd);
        REQUIRE(*cmd == "cd " + project.dir("packages/prisma-client") + " && npx prisma generate");
    }

    SECTION("BuildScriptTakesPrecedence") {
        project.write("database/package.json", manifest_with_build);
        project.write("database/schema.prisma", "datasource db {}");

        auto cmd = resolver.resolve_build("database");
        REQUIRE(cmd);
        REQUIRE(*cmd == "cd " + project.dir("database") + " && npm run build");
    }

    SECTION("NonDatabaseRepoIgnoresSchema") {
        project.write("backend/schema.prisma", "datasource db {}");
        REQUIRE_FALSE(resolver.resolve_build("backend"));
    }

    SECTION("DatabaseWithoutSchema") {
        fs::create_directories(project.root / "database");
        REQUIRE_FALSE(resolver.resolve_build("database"));
    }
}

TEST_CASE("CommandResolver typecheck", "[resolver]") {
    TmpProject project;
    CommandResolver resolver(project.root.string());

    SECTION("NoTsconfig") {
        project.write("frontend/package.json", manifest_with_build);
        REQUIRE_FALSE(resolver.resolve_typecheck("frontend"));
    }

    SECTION("GenericTsconfig") {
        project.write("frontend/tsconfig.json", "{}");

        auto cmd = resolver.resolve_typecheck("frontend");
        REQUIRE(cmd);
        REQUIRE(*cmd == "cd " + project.dir("frontend") + " && npx tsc --noEmit");
    }

    SECTION("AppTsconfigPreferred") {
        project.write("frontend/tsconfig.json", "{}");
        project.write("frontend/tsconfig.app.json", "{}");

        auto cmd = resolver.resolve_typecheck("frontend");
        REQUIRE(cmd);
        REQUIRE(*cmd == "cd " + project.dir("frontend") +
                           " && npx tsc --project tsconfig.app.json --noEmit");
    }

    SECTION("AppTsconfigAloneIsNotEnough") {
        project.write("frontend/tsconfig.app.json", "{}");
        REQUIRE_FALSE(resolver.resolve_typecheck("frontend"));
    }
}

TEST_CASE("CommandResolver resolve", "[resolver]") {
    TmpProject project;
    CommandResolver resolver(project.root.string());

    SECTION("BothIndependent") {
        project.write("web/package.json", manifest_with_build);
        project.write("web/tsconfig.json", "{}");

        auto cmds = resolver.resolve("web").commands("web");
        REQUIRE(cmds.size() == 2);
        REQUIRE(cmds[0].kind == CommandKind::Build);
        REQUIRE(cmds[1].kind == CommandKind::Typecheck);
        REQUIRE(cmds[0].repo_id == "web");
    }

    SECTION("BrokenManifestKeepsTypecheck") {
        project.write("web/package.json", "nope");
        project.write("web/tsconfig.json", "{}");

        auto resolved = resolver.resolve("web");
        REQUIRE_FALSE(resolved.build);
        REQUIRE(resolved.typecheck);
        REQUIRE(resolved.commands("web").size() == 1);
    }

    SECTION("NothingResolves") {
        REQUIRE(resolver.resolve("ui").commands("ui").empty());
    }
}

TEST_CASE("ValidationCommand lines", "[resolver]") {

    SECTION("Format") {
        ValidationCommand cmd{"backend", CommandKind::Typecheck, "cd /p/backend && npx tsc --noEmit"};
        REQUIRE(cmd.to_line() == "backend:tsc:cd /p/backend && npx tsc --noEmit");
    }

    SECTION("ParseKeepsColonsInCommand") {
        auto cmd = ValidationCommand::from_line("packages/a:build:cd /p && FOO=a:b npm run build");
        REQUIRE(cmd);
        REQUIRE(cmd->repo_id == "packages/a");
        REQUIRE(cmd->kind == CommandKind::Build);
        REQUIRE(cmd->command_line == "cd /p && FOO=a:b npm run build");
    }

    SECTION("RejectsUnknownKind") {
        REQUIRE_FALSE(ValidationCommand::from_line("backend:lint:eslint ."));
        REQUIRE_FALSE(ValidationCommand::from_line("backend"));
        REQUIRE_FALSE(ValidationCommand::from_line(":build:x"));
        REQUIRE_FALSE(ValidationCommand::from_line("backend:build:"));
    }
}
