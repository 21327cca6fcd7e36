#pragma once

#include "command_resolver.hpp"
#include "storage/session_store.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// JSON shapes printed by `build-tracker --json`.
namespace view {

nlohmann::json sessions(const std::vector<std::string>& ids);
nlohmann::json repos(const std::string& session_id, const std::vector<std::string>& repos);
nlohmann::json commands(const std::string& session_id, const std::vector<ValidationCommand>& cmds,
                        std::optional<CommandKind> kind = std::nullopt);
nlohmann::json edits(const std::string& session_id, const std::vector<EditRecord>& records);

// Session files may hold bytes that are not UTF-8; those are replaced, not thrown on.
std::string dump(const nlohmann::json& j);

} // namespace view
