#pragma once

#include <string>

namespace platform {

// Directory holding config.json, empty when no home directory is known.
std::string config_dir();

// Absolute project root handed to hooks by the agent, empty when unset.
std::string project_root();

// True when verbose diagnostics were requested through the environment.
bool verbose_requested();

} // namespace platform
