#include "session_store.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <set>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

bool single_line(std::string_view text) {
    return text.find_first_of("\r\n") == std::string_view::npos;
}

std::string errno_message(std::string_view what, const std::string& path) {
    return std::format("{} {}: {}", what, path, std::strerror(errno));
}

std::expected<void, std::string> write_all(int fd, std::string_view data, const std::string& path) {
    while (!data.empty()) {
        ssize_t n = ::write(fd, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_message("write", path));
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return {};
}

// One write(2) on an O_APPEND descriptor, so the text lands contiguously
// even when other processes append to the same file.
std::expected<void, std::string> append_text(const std::string& path, const std::string& text) {
    int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) return std::unexpected(errno_message("open", path));

    ssize_t n;
    do {
        n = ::write(fd, text.data(), text.size());
    } while (n < 0 && errno == EINTR);

    std::expected<void, std::string> result;
    if (n < 0) {
        result = std::unexpected(errno_message("append", path));
    } else if (static_cast<size_t>(n) != text.size()) {
        result = std::unexpected(std::format("append {}: short write", path));
    }
    ::close(fd);
    return result;
}

// Missing file reads as empty. Blank lines are dropped.
std::expected<std::vector<std::string>, std::string> read_lines(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) return std::unexpected(std::format("stat {}: {}", path, ec.message()));
        return std::vector<std::string>{};
    }

    std::ifstream f(path);
    if (!f.is_open()) return std::unexpected("could not open " + path);

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) lines.push_back(std::move(line));
    }
    if (f.bad()) return std::unexpected("read error on " + path);
    return lines;
}

// Write to a process-unique name in the same directory, then rename over path.
std::expected<void, std::string> replace_file(const std::string& path, const std::string& content) {
    auto tmp = std::format("{}.{}.new", path, ::getpid());

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) return std::unexpected(errno_message("open", tmp));

    auto written = write_all(fd, content, tmp);
    if (::close(fd) < 0 && written) {
        written = std::unexpected(errno_message("close", tmp));
    }
    if (!written) {
        ::unlink(tmp.c_str());
        return written;
    }

    if (::rename(tmp.c_str(), path.c_str()) < 0) {
        auto err = errno_message("rename", tmp);
        ::unlink(tmp.c_str());
        return std::unexpected(std::move(err));
    }
    return {};
}

} // namespace

std::string EditRecord::to_line() const {
    return std::format("{}:{}:{}", timestamp, file_path, repo_id);
}

std::optional<EditRecord> EditRecord::from_line(std::string_view line) {
    auto first = line.find(':');
    auto last = line.rfind(':');
    if (first == std::string_view::npos || first == last) return std::nullopt;

    int64_t ts = 0;
    auto ts_str = line.substr(0, first);
    auto [ptr, ec] = std::from_chars(ts_str.data(), ts_str.data() + ts_str.size(), ts);
    if (ec != std::errc{} || ptr != ts_str.data() + ts_str.size()) return std::nullopt;

    auto repo_id = line.substr(last + 1);
    if (repo_id.empty()) return std::nullopt;

    return EditRecord{
        .timestamp = ts,
        .file_path = std::string(line.substr(first + 1, last - first - 1)),
        .repo_id = std::string(repo_id),
    };
}

SessionStore::SessionStore(std::string cache_root)
    : cache_root_(std::move(cache_root)) {}

bool SessionStore::valid_session_id(std::string_view session_id) {
    if (session_id.empty() || session_id == "." || session_id == "..") return false;
    return session_id.find_first_of(std::string_view("/\0", 2)) == std::string_view::npos;
}

std::string SessionStore::session_dir(const std::string& session_id) const {
    return (fs::path(cache_root_) / session_id).string();
}

std::string SessionStore::file_path(const std::string& session_id, std::string_view name) const {
    return (fs::path(cache_root_) / session_id / name).string();
}

std::expected<std::string, std::string> SessionStore::ensure(const std::string& session_id) const {
    if (!valid_session_id(session_id)) {
        return std::unexpected(std::format("invalid session id '{}'", session_id));
    }

    auto dir = session_dir(session_id);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return std::unexpected(std::format("mkdir {}: {}", dir, ec.message()));
    return dir;
}

std::expected<void, std::string> SessionStore::record_edit(const std::string& session_id,
                                                           const EditRecord& record) const {
    if (!valid_session_id(session_id)) {
        return std::unexpected(std::format("invalid session id '{}'", session_id));
    }
    if (!single_line(record.file_path) || !single_line(record.repo_id)) {
        return std::unexpected("edit record spans multiple lines");
    }
    return append_text(file_path(session_id, edit_log_file), record.to_line() + "\n");
}

std::expected<bool, std::string> SessionStore::mark_affected(const std::string& session_id,
                                                             const std::string& repo_id) const {
    if (!valid_session_id(session_id)) {
        return std::unexpected(std::format("invalid session id '{}'", session_id));
    }

    if (repo_id.empty() || !single_line(repo_id)) {
        return std::unexpected(std::format("invalid repo id '{}'", repo_id));
    }

    auto path = file_path(session_id, affected_file);
    auto lines = read_lines(path);
    if (!lines) return std::unexpected(lines.error());

    if (std::ranges::find(*lines, repo_id) != lines->end()) return false;

    auto appended = append_text(path, repo_id + "\n");
    if (!appended) return std::unexpected(appended.error());
    return true;
}

std::expected<size_t, std::string> SessionStore::record_commands(
    const std::string& session_id, const std::vector<ValidationCommand>& commands) const {
    if (!valid_session_id(session_id)) {
        return std::unexpected(std::format("invalid session id '{}'", session_id));
    }
    if (commands.empty()) return 0;
    for (const auto& cmd : commands) {
        if (!single_line(cmd.repo_id) || !single_line(cmd.command_line)) {
            return std::unexpected("command spans multiple lines: " + cmd.repo_id);
        }
    }

    auto buffer_path = file_path(session_id, commands_buffer_file);
    auto canonical_path = file_path(session_id, commands_file);

    std::string pending;
    for (const auto& cmd : commands) {
        pending += cmd.to_line();
        pending += '\n';
    }
    if (auto r = append_text(buffer_path, pending); !r) return std::unexpected(r.error());

    auto buffered = read_lines(buffer_path);
    if (!buffered) return std::unexpected(buffered.error());
    auto existing = read_lines(canonical_path);
    if (!existing) return std::unexpected(existing.error());

    // Our own lines are merged directly too; another process may have
    // compacted and removed the buffer since we appended to it.
    std::set<std::string> merged(existing->begin(), existing->end());
    merged.insert(buffered->begin(), buffered->end());
    for (const auto& cmd : commands) merged.insert(cmd.to_line());

    std::string content;
    for (const auto& line : merged) {
        content += line;
        content += '\n';
    }
    if (auto r = replace_file(canonical_path, content); !r) return std::unexpected(r.error());

    std::error_code ec;
    fs::remove(buffer_path, ec);
    if (ec) return std::unexpected(std::format("remove {}: {}", buffer_path, ec.message()));

    return merged.size();
}

std::expected<std::vector<EditRecord>, std::string>
SessionStore::edits(const std::string& session_id) const {
    if (!valid_session_id(session_id)) {
        return std::unexpected(std::format("invalid session id '{}'", session_id));
    }

    auto lines = read_lines(file_path(session_id, edit_log_file));
    if (!lines) return std::unexpected(lines.error());

    std::vector<EditRecord> records;
    for (const auto& line : *lines) {
        if (auto rec = EditRecord::from_line(line)) records.push_back(std::move(*rec));
    }
    return records;
}

std::expected<std::vector<std::string>, std::string>
SessionStore::affected_repos(const std::string& session_id) const {
    if (!valid_session_id(session_id)) {
        return std::unexpected(std::format("invalid session id '{}'", session_id));
    }

    auto lines = read_lines(file_path(session_id, affected_file));
    if (!lines) return std::unexpected(lines.error());

    std::vector<std::string> repos;
    std::set<std::string> seen;
    for (auto& line : *lines) {
        if (seen.insert(line).second) repos.push_back(std::move(line));
    }
    return repos;
}

std::expected<std::vector<ValidationCommand>, std::string>
SessionStore::commands(const std::string& session_id) const {
    if (!valid_session_id(session_id)) {
        return std::unexpected(std::format("invalid session id '{}'", session_id));
    }

    auto lines = read_lines(file_path(session_id, commands_file));
    if (!lines) return std::unexpected(lines.error());

    std::vector<ValidationCommand> result;
    std::set<std::string> seen;
    for (const auto& line : *lines) {
        if (!seen.insert(line).second) continue;
        if (auto cmd = ValidationCommand::from_line(line)) result.push_back(std::move(*cmd));
    }
    return result;
}

std::expected<std::vector<std::string>, std::string> SessionStore::sessions() const {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!fs::exists(cache_root_, ec)) return ids;

    for (auto& entry : fs::directory_iterator(cache_root_, ec)) {
        std::error_code dir_ec;
        if (entry.is_directory(dir_ec)) ids.push_back(entry.path().filename().string());
    }
    if (ec) return std::unexpected(std::format("list {}: {}", cache_root_, ec.message()));

    std::ranges::sort(ids);
    return ids;
}
