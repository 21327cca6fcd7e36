#include "hook_event.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::expected<std::string, std::string> string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::string{};
    if (!it->is_string()) return std::unexpected(std::string(key) + " is not a string");
    return it->get<std::string>();
}

} // namespace

std::expected<HookEvent, std::string> HookEvent::parse(std::string_view payload) {
    json j;
    try {
        j = json::parse(payload);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
    if (!j.is_object()) return std::unexpected("payload is not a JSON object");

    HookEvent event;

    auto tool_name = string_field(j, "tool_name");
    if (!tool_name) return std::unexpected(tool_name.error());
    event.tool_name = std::move(*tool_name);

    auto session_id = string_field(j, "session_id");
    if (!session_id) return std::unexpected(session_id.error());
    event.session_id = std::move(*session_id);

    auto input = j.find("tool_input");
    if (input != j.end() && input->is_object()) {
        auto file_path = string_field(*input, "file_path");
        if (!file_path) return std::unexpected("tool_input." + file_path.error());
        event.file_path = std::move(*file_path);
    }

    return event;
}
