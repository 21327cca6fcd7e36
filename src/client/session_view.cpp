#include "session_view.hpp"

using json = nlohmann::json;

namespace view {

json sessions(const std::vector<std::string>& ids) {
    return json(ids);
}

json repos(const std::string& session_id, const std::vector<std::string>& repos) {
    return {{"session", session_id}, {"repos", repos}};
}

json commands(const std::string& session_id, const std::vector<ValidationCommand>& cmds,
              std::optional<CommandKind> kind) {
    json entries = json::array();
    for (const auto& c : cmds) {
        if (kind && c.kind != *kind) continue;
        entries.push_back({
            {"repo", c.repo_id},
            {"kind", std::string(to_string(c.kind))},
            {"command", c.command_line},
        });
    }
    return {{"session", session_id}, {"commands", entries}};
}

json edits(const std::string& session_id, const std::vector<EditRecord>& records) {
    json entries = json::array();
    for (const auto& e : records) {
        entries.push_back({
            {"timestamp", e.timestamp},
            {"repo", e.repo_id},
            {"file", e.file_path},
        });
    }
    return {{"session", session_id}, {"edits", entries}};
}

std::string dump(const json& j) {
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}

} // namespace view
