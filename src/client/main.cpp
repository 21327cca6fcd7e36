#include "config.hpp"
#include "session_view.hpp"
#include "storage/session_store.hpp"

#include <optional>
#include <print>
#include <string>
#include <vector>

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  sessions                     List sessions with a cache");
    std::println(stderr, "  repos                        Show affected repos");
    std::println(stderr, "  commands [--kind build|tsc]  Show pending validation commands");
    std::println(stderr, "  edits                        Show the edit log");
    std::println(stderr, "Options:");
    std::println(stderr, "  --session ID                 Session to read (default from config)");
    std::println(stderr, "  --config PATH                Config file path");
    std::println(stderr, "  --json                       Print JSON");
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string session_id;
    std::string config_path;
    std::string kind_filter;
    bool as_json = false;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--session" && i + 1 < argc) {
            session_id = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--kind" && i + 1 < argc) {
            kind_filter = argv[++i];
        } else if (arg == "--json") {
            as_json = true;
        }
    }

    auto config = Config::from_environment(config_path);
    if (!config.tracking_enabled()) {
        std::println(stderr, "CLAUDE_PROJECT_DIR is not set");
        return 1;
    }
    if (session_id.empty()) session_id = config.default_session;

    SessionStore store(config.cache_root());

    if (command == "sessions") {
        auto ids = store.sessions();
        if (!ids) {
            std::println(stderr, "Error: {}", ids.error());
            return 1;
        }
        if (as_json) {
            std::println("{}", view::dump(view::sessions(*ids)));
        } else {
            for (const auto& id : *ids) std::println("{}", id);
        }
    } else if (command == "repos") {
        auto repos = store.affected_repos(session_id);
        if (!repos) {
            std::println(stderr, "Error: {}", repos.error());
            return 1;
        }
        if (as_json) {
            std::println("{}", view::dump(view::repos(session_id, *repos)));
        } else {
            for (const auto& r : *repos) std::println("{}", r);
        }
    } else if (command == "commands") {
        std::optional<CommandKind> kind;
        if (!kind_filter.empty()) {
            kind = parse_command_kind(kind_filter);
            if (!kind) {
                std::println(stderr, "Unknown kind: {}", kind_filter);
                return 1;
            }
        }

        auto cmds = store.commands(session_id);
        if (!cmds) {
            std::println(stderr, "Error: {}", cmds.error());
            return 1;
        }

        if (as_json) {
            std::println("{}", view::dump(view::commands(session_id, *cmds, kind)));
        } else {
            for (const auto& c : *cmds) {
                if (kind && c.kind != *kind) continue;
                std::println("[{}] {:<5} {}", c.repo_id, to_string(c.kind), c.command_line);
            }
        }
    } else if (command == "edits") {
        auto records = store.edits(session_id);
        if (!records) {
            std::println(stderr, "Error: {}", records.error());
            return 1;
        }

        if (as_json) {
            std::println("{}", view::dump(view::edits(session_id, *records)));
        } else {
            for (const auto& e : *records) {
                std::println("[{}] {} {}", e.timestamp, e.repo_id, e.file_path);
            }
        }
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    return 0;
}
