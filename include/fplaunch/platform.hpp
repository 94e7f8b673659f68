#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fplaunch {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content,
                                    unsigned mode = 0644);

// Update symlink atomically (temp symlink + rename + fsync on parent)
AtomicWriteResult atomic_update_symlink(const std::string& link_path, const std::string& target);

// ============================================================================
// Path Utilities
// ============================================================================

std::string get_parent_directory(const std::string& path);

std::string get_filename(const std::string& path);

std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);

bool is_directory(const std::string& path);

bool is_regular_file(const std::string& path);

bool is_symlink(const std::string& path);

// Regular file (after following symlinks) with the execute bit usable by us
bool is_executable_file(const std::string& path);

std::optional<std::string> read_symlink(const std::string& path);

std::vector<std::string> list_directory(const std::string& path);

bool create_directories(const std::string& path);

bool remove_file(const std::string& path);

// ============================================================================
// File Contents
// ============================================================================

std::optional<std::string> read_file(const std::string& path);

// Non-empty lines with surrounding whitespace trimmed; '#' comments skipped
std::vector<std::string> read_lines(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

std::unordered_map<std::string, std::string> get_all_env();

// Home directory from $HOME, falling back to the password database
std::string get_home_directory();

bool stdin_is_terminal();
bool stdout_is_terminal();

// ============================================================================
// Search Path
// ============================================================================

std::vector<std::string> split_search_path(const std::string& path_value);

// First executable called `name` in `path_value` whose location is not `exclude`.
// Locations are compared both lexically and after canonicalization.
std::optional<std::string> find_executable_in_path(const std::string& name,
                                                   const std::string& path_value,
                                                   const std::string& exclude = "");

} // namespace fplaunch
