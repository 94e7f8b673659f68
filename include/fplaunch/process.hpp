#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fplaunch {

// ============================================================================
// Process Spawning
// ============================================================================

struct ProcessSpec {
    std::string program;                 // absolute path or name searched on PATH
    std::vector<std::string> argv;       // argv[0] included
    std::unordered_map<std::string, std::string> env;  // complete environment
    std::optional<std::chrono::milliseconds> timeout;
    bool capture_stdout = false;
    // Run in a new process group. Only for children that never touch the
    // terminal: a background group is stopped when it reads the tty.
    bool own_process_group = false;
};

struct ProcessResult {
    bool ok = false;          // process was started and reaped
    int exit_code = -1;       // exit status, or 128 + signal
    bool timed_out = false;   // killed after exceeding the timeout
    std::string output;       // captured stdout when requested
    std::string error;
};

/**
 * Spawn a child process and wait for it.
 *
 * By default the child shares our process group and stays in the terminal's
 * foreground; SIGINT and SIGQUIT are ignored here until it is reaped, as
 * system(3) does. With own_process_group a timeout kills the whole group,
 * otherwise only the child. Either way the result is flagged timed_out.
 */
ProcessResult run_process(const ProcessSpec& spec);

/**
 * Replace the current process image. Only returns on failure.
 */
ProcessResult exec_replace(const ProcessSpec& spec);

// Flatten an environment map into KEY=VALUE strings
std::vector<std::string> build_environment(const std::unordered_map<std::string, std::string>& env);

} // namespace fplaunch
