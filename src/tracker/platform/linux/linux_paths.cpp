#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <string_view>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/build-tracker";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/build-tracker";
}

std::string project_root() {
    const char* dir = std::getenv("CLAUDE_PROJECT_DIR");
    if (!dir) return {};
    return dir;
}

bool verbose_requested() {
    const char* v = std::getenv("BUILD_TRACKER_VERBOSE");
    if (!v) return false;
    std::string_view sv(v);
    return !sv.empty() && sv != "0";
}

} // namespace platform
