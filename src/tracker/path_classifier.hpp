#pragma once

#include "config.hpp"

#include <string>
#include <string_view>

// Maps an edited file to the logical repo it belongs to.
namespace repo {

inline constexpr std::string_view root = "root";
inline constexpr std::string_view unknown = "unknown";

// Deterministic, no I/O. Returns "unknown" for paths that should not be tracked.
std::string classify(std::string_view file_path, std::string_view project_root,
                     const Config::Repos& names = {});

// Directory a repo id refers to; "root" is the project root itself.
std::string directory(std::string_view repo_id, std::string_view project_root);

} // namespace repo
