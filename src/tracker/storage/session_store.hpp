#pragma once

#include "../command_resolver.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct EditRecord {
    int64_t timestamp = 0;
    std::string file_path;
    std::string repo_id;

    // "<timestamp>:<file_path>:<repo_id>"
    std::string to_line() const;
    static std::optional<EditRecord> from_line(std::string_view line);
};

// Per-session build-impact cache under <cache_root>/<session_id>.
//
// The edit log and the affected-repo file only ever grow. commands.txt is the
// one compacted view and is replaced atomically. Concurrent hook processes may
// duplicate affected-repo lines, so every reader here deduplicates.
class SessionStore {
public:
    static constexpr std::string_view edit_log_file = "edited-files.log";
    static constexpr std::string_view affected_file = "affected-repos.txt";
    static constexpr std::string_view commands_file = "commands.txt";
    static constexpr std::string_view commands_buffer_file = "commands.txt.tmp";

    explicit SessionStore(std::string cache_root);

    const std::string& cache_root() const { return cache_root_; }

    // A session id must be a single path component.
    static bool valid_session_id(std::string_view session_id);

    std::string session_dir(const std::string& session_id) const;

    // Creates the session directory if needed. Returns its path.
    std::expected<std::string, std::string> ensure(const std::string& session_id) const;

    std::expected<void, std::string> record_edit(const std::string& session_id,
                                                 const EditRecord& record) const;

    // Appends repo_id unless already listed. Returns true if a line was written.
    // Read-then-append is not atomic across processes.
    std::expected<bool, std::string> mark_affected(const std::string& session_id,
                                                   const std::string& repo_id) const;

    // Buffers the lines, merges them with commands.txt and atomically rewrites it
    // sorted and deduplicated. Returns the number of canonical lines.
    std::expected<size_t, std::string> record_commands(
        const std::string& session_id, const std::vector<ValidationCommand>& commands) const;

    std::expected<std::vector<EditRecord>, std::string> edits(const std::string& session_id) const;
    std::expected<std::vector<std::string>, std::string> affected_repos(const std::string& session_id) const;
    std::expected<std::vector<ValidationCommand>, std::string> commands(const std::string& session_id) const;

    // Session ids with a cache directory, sorted.
    std::expected<std::vector<std::string>, std::string> sessions() const;

private:
    std::string file_path(const std::string& session_id, std::string_view name) const;

    std::string cache_root_;
};
