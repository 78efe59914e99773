#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace attest {

// ============================================================================
// Durable File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// Write content to a fresh temp file beside `path` and fsync it, without
// renaming. On success the caller owns `temp_path` and must pass it to
// commit_temp_file() or remove_file().
struct TempWriteResult {
    bool ok = false;
    std::string error;
    std::string temp_path;
};
TempWriteResult write_temp_file(const std::string& path, const std::string& content);

// rename(temp_path, path) followed by fsync of the parent directory
AtomicWriteResult commit_temp_file(const std::string& temp_path, const std::string& path);

// Append `line` plus a newline with O_APPEND and fsync before returning
AtomicWriteResult append_line_durable(const std::string& path, const std::string& line);

// Shrink a file back to `size` bytes and fsync it
AtomicWriteResult truncate_file(const std::string& path, std::uint64_t size);

// ============================================================================
// Path Utilities
// ============================================================================

std::optional<std::string> read_file(const std::string& path);
std::optional<std::uint64_t> file_size(const std::string& path);

std::string get_parent_directory(const std::string& path);
std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
std::vector<std::string> list_directory(const std::string& path);
bool create_directories(const std::string& path);
bool remove_file(const std::string& path);

// Generate a UUID string
std::string generate_uuid();

} // namespace attest
