#pragma once

#include "command_resolver.hpp"
#include "config.hpp"
#include "hook_event.hpp"
#include "storage/session_store.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

enum class SkipReason {
    None,
    MalformedPayload,
    NotMutatingTool,
    NoFilePath,
    Documentation,
    NoProjectRoot,
    UnknownRepo,
};

std::string_view to_string(SkipReason reason);

struct Outcome {
    bool tracked = false;
    SkipReason skipped = SkipReason::None;
    std::string session_id;
    std::string repo_id;
    std::vector<ValidationCommand> commands;
    // Steps that failed after the filters passed. Later steps still ran.
    std::vector<std::string> errors;

    bool ok() const { return errors.empty(); }
};

// Filters one hook event and feeds qualifying edits into the session store.
class Dispatcher {
public:
    Dispatcher(Config config, SessionStore& store, bool verbose = false);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    Outcome handle(const HookEvent& event);
    Outcome handle(const HookEvent& event, int64_t timestamp);

    // Parses the payload and handles it.
    Outcome handle_payload(std::string_view payload);

    // Hook entry point: reads stdin-style input to EOF. Every failure is logged
    // and folded into the same result, so the return value is always 0.
    int run(std::istream& in);

    static bool is_documentation(std::string_view file_path,
                                 const std::vector<std::string>& suffixes);

    // Session files are line-oriented; such paths cannot be recorded.
    static bool has_control_char(std::string_view file_path);

private:
    SkipReason filter(const HookEvent& event, std::string& repo_id) const;

    void log(const std::string& msg) const;

    Config config_;
    SessionStore& store_;
    CommandResolver resolver_;
    bool verbose_;
};
