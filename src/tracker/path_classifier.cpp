#include "path_classifier.hpp"

#include <algorithm>
#include <format>
#include <vector>

namespace repo {

namespace {

std::string_view strip_root(std::string_view path, std::string_view project_root) {
    while (project_root.size() > 1 && project_root.back() == '/') {
        project_root.remove_suffix(1);
    }
    if (project_root.empty()) return path;
    if (path.starts_with(project_root) && path.size() > project_root.size() &&
        path[project_root.size()] == '/') {
        path.remove_prefix(project_root.size() + 1);
    }
    return path;
}

std::vector<std::string_view> split(std::string_view path) {
    std::vector<std::string_view> segments;
    size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string_view::npos) end = path.size();
        segments.push_back(path.substr(start, end - start));
        start = end + 1;
    }
    return segments;
}

bool listed(const std::vector<std::string>& names, std::string_view segment) {
    return std::ranges::any_of(names, [&](const auto& n) { return n == segment; });
}

} // namespace

std::string classify(std::string_view file_path, std::string_view project_root,
                     const Config::Repos& names) {
    auto relative = strip_root(file_path, project_root);
    if (relative.empty()) return std::string(unknown);

    auto segments = split(relative);
    const auto first = segments.front();

    if (!first.empty() && (listed(names.frontend, first) || listed(names.backend, first) ||
                           listed(names.database, first))) {
        return std::string(first);
    }

    if (!first.empty() && listed(names.groups, first)) {
        if (segments.size() > 1 && !segments[1].empty()) {
            return std::format("{}/{}", first, segments[1]);
        }
        return std::string(first);
    }

    if (segments.size() == 1) return std::string(root);
    return std::string(unknown);
}

std::string directory(std::string_view repo_id, std::string_view project_root) {
    std::string dir(project_root);
    while (dir.size() > 1 && dir.back() == '/') dir.pop_back();
    if (repo_id == root) return dir;
    return dir + "/" + std::string(repo_id);
}

} // namespace repo
