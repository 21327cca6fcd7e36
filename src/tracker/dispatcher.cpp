#include "dispatcher.hpp"

#include "path_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <exception>
#include <format>
#include <istream>
#include <iterator>
#include <print>

std::string_view to_string(SkipReason reason) {
    switch (reason) {
        case SkipReason::None: return "none";
        case SkipReason::MalformedPayload: return "malformed payload";
        case SkipReason::NotMutatingTool: return "not a mutating tool";
        case SkipReason::NoFilePath: return "no file path";
        case SkipReason::Documentation: return "documentation file";
        case SkipReason::NoProjectRoot: return "no project root";
        case SkipReason::UnknownRepo: return "unknown repo";
    }
    return "unknown";
}

Dispatcher::Dispatcher(Config config, SessionStore& store, bool verbose)
    : config_(std::move(config)), store_(store),
      resolver_(config_.project_root), verbose_(verbose) {}

Outcome Dispatcher::handle(const HookEvent& event) {
    auto now = std::chrono::system_clock::now();
    auto ts = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    return handle(event, static_cast<int64_t>(ts));
}

Outcome Dispatcher::handle(const HookEvent& event, int64_t timestamp) {
    Outcome outcome;

    outcome.skipped = filter(event, outcome.repo_id);
    if (outcome.skipped != SkipReason::None) {
        log(std::format("skip {} ({})", event.file_path, to_string(outcome.skipped)));
        return outcome;
    }

    outcome.session_id = event.session_id.empty() ? config_.default_session : event.session_id;
    if (!SessionStore::valid_session_id(outcome.session_id)) {
        outcome.skipped = SkipReason::MalformedPayload;
        log(std::format("skip {} (invalid session id '{}')", event.file_path, outcome.session_id));
        return outcome;
    }

    outcome.tracked = true;
    const auto& sid = outcome.session_id;
    const auto& repo_id = outcome.repo_id;

    if (auto dir = store_.ensure(sid); !dir) {
        outcome.errors.push_back(dir.error());
    }

    EditRecord record{.timestamp = timestamp, .file_path = event.file_path, .repo_id = repo_id};
    if (auto r = store_.record_edit(sid, record); !r) {
        outcome.errors.push_back(r.error());
    }

    if (auto r = store_.mark_affected(sid, repo_id); !r) {
        outcome.errors.push_back(r.error());
    }

    auto resolved = resolver_.resolve(repo_id);
    if (!resolved.build) log(std::format("{}: no build command: {}", repo_id, resolved.build.error()));
    if (!resolved.typecheck) log(std::format("{}: no tsc command: {}", repo_id, resolved.typecheck.error()));
    outcome.commands = resolved.commands(repo_id);

    if (auto r = store_.record_commands(sid, outcome.commands); !r) {
        outcome.errors.push_back(r.error());
    }

    for (const auto& err : outcome.errors) log("store: " + err);
    log(std::format("tracked {} -> {} ({} command(s), session {})", event.file_path, repo_id,
                    outcome.commands.size(), sid));
    return outcome;
}

Outcome Dispatcher::handle_payload(std::string_view payload) {
    auto event = HookEvent::parse(payload);
    if (!event) {
        log("ignoring payload: " + event.error());
        return Outcome{.skipped = SkipReason::MalformedPayload};
    }
    return handle(*event);
}

int Dispatcher::run(std::istream& in) {
    try {
        std::string payload{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        handle_payload(payload);
    } catch (const std::exception& e) {
        // stdio directly: std::println throws when stderr itself is the failure.
        if (verbose_) std::fprintf(stderr, "[build-tracker] error: %s\n", e.what());
    } catch (...) {
        if (verbose_) std::fputs("[build-tracker] error: unknown exception\n", stderr);
    }
    return 0;
}

bool Dispatcher::is_documentation(std::string_view file_path,
                                  const std::vector<std::string>& suffixes) {
    auto lower = [](unsigned char c) { return static_cast<char>(std::tolower(c)); };
    return std::ranges::any_of(suffixes, [&](const std::string& suffix) {
        if (suffix.empty() || file_path.size() < suffix.size()) return false;
        auto tail = file_path.substr(file_path.size() - suffix.size());
        return std::ranges::equal(tail, suffix, {}, lower, lower);
    });
}

bool Dispatcher::has_control_char(std::string_view file_path) {
    return std::ranges::any_of(file_path, [](unsigned char c) { return c < 0x20 || c == 0x7f; });
}

SkipReason Dispatcher::filter(const HookEvent& event, std::string& repo_id) const {
    if (std::ranges::find(config_.tools, event.tool_name) == config_.tools.end()) {
        return SkipReason::NotMutatingTool;
    }
    if (event.file_path.empty()) return SkipReason::NoFilePath;
    if (has_control_char(event.file_path)) return SkipReason::MalformedPayload;
    if (is_documentation(event.file_path, config_.excluded_suffixes)) return SkipReason::Documentation;
    if (!config_.tracking_enabled()) return SkipReason::NoProjectRoot;

    repo_id = repo::classify(event.file_path, config_.project_root, config_.repos);
    if (repo_id == repo::unknown) return SkipReason::UnknownRepo;
    return SkipReason::None;
}

void Dispatcher::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[build-tracker] {}", msg);
    }
}
