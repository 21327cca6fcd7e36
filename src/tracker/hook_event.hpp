#pragma once

#include <expected>
#include <string>
#include <string_view>

// One tool invocation as reported by the agent on the hook's stdin.
struct HookEvent {
    std::string tool_name;
    std::string file_path;
    std::string session_id; // empty when the payload carried none

    // Accepts {"tool_name", "tool_input": {"file_path"}, "session_id"}; other
    // fields are ignored. Missing fields stay empty, mistyped ones are errors.
    static std::expected<HookEvent, std::string> parse(std::string_view payload);
};
