#include "fplaunch/process.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fplaunch {

namespace {

struct CArgs {
    std::vector<std::string> argv_strings;
    std::vector<std::string> env_strings;
    std::vector<char*> argv;
    std::vector<char*> envp;

    explicit CArgs(const ProcessSpec& spec)
        : argv_strings(spec.argv), env_strings(build_environment(spec.env)) {
        if (argv_strings.empty()) argv_strings.push_back(spec.program);
        for (auto& s : argv_strings) argv.push_back(const_cast<char*>(s.c_str()));
        argv.push_back(nullptr);
        for (auto& s : env_strings) envp.push_back(const_cast<char*>(s.c_str()));
        envp.push_back(nullptr);
    }
};

// execve when the program contains a slash, otherwise search the PATH given in the child environment
void exec_program(const ProcessSpec& spec, CArgs& args) {
    if (spec.program.find('/') != std::string::npos) {
        execve(spec.program.c_str(), args.argv.data(), args.envp.data());
        return;
    }
    auto path_it = spec.env.find("PATH");
    std::string path_value = path_it != spec.env.end() ? path_it->second : "/usr/bin:/bin";
    size_t start = 0;
    while (start <= path_value.size()) {
        size_t end = path_value.find(':', start);
        if (end == std::string::npos) end = path_value.size();
        std::string dir = path_value.substr(start, end - start);
        if (!dir.empty()) {
            std::string candidate = dir + "/" + spec.program;
            execve(candidate.c_str(), args.argv.data(), args.envp.data());
        }
        start = end + 1;
    }
}

// Terminal interrupts belong to a foreground child while we wait for it
class InterruptGuard {
public:
    explicit InterruptGuard(bool active) : active_(active) {
        if (!active_) return;
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        sigaction(SIGINT, &ignore, &saved_int_);
        sigaction(SIGQUIT, &ignore, &saved_quit_);
    }
    ~InterruptGuard() { restore(); }

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

    void restore() {
        if (!active_) return;
        sigaction(SIGINT, &saved_int_, nullptr);
        sigaction(SIGQUIT, &saved_quit_, nullptr);
        active_ = false;
    }

private:
    bool active_;
    struct sigaction saved_int_ {};
    struct sigaction saved_quit_ {};
};

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

std::vector<std::string> build_environment(const std::unordered_map<std::string, std::string>& env) {
    std::vector<std::string> out;
    out.reserve(env.size());
    for (const auto& [key, value] : env) {
        out.push_back(key + "=" + value);
    }
    std::sort(out.begin(), out.end());
    return out;
}

ProcessResult run_process(const ProcessSpec& spec) {
    ProcessResult result;
    CArgs args(spec);

    int out_pipe[2] = {-1, -1};
    if (spec.capture_stdout && pipe2(out_pipe, O_CLOEXEC) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    InterruptGuard interrupts(!spec.own_process_group);
    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        if (spec.capture_stdout) {
            close(out_pipe[0]);
            close(out_pipe[1]);
        }
        return result;
    }

    if (pid == 0) {
        if (spec.own_process_group) {
            setpgid(0, 0);
        }
        interrupts.restore();
        if (spec.capture_stdout) {
            dup2(out_pipe[1], STDOUT_FILENO);
        }
        exec_program(spec, args);
        _exit(127);
    }

    if (spec.own_process_group) {
        setpgid(pid, pid);
    }

    if (spec.capture_stdout) {
        close(out_pipe[1]);
    }

    auto deadline = spec.timeout
        ? std::optional<std::chrono::steady_clock::time_point>(
              std::chrono::steady_clock::now() + *spec.timeout)
        : std::nullopt;

    int status = 0;
    bool reaped = false;
    bool pipe_open = spec.capture_stdout;
    char buf[4096];

    while (!reaped) {
        if (pipe_open) {
            pollfd pfd{out_pipe[0], POLLIN, 0};
            if (poll(&pfd, 1, 20) > 0) {
                ssize_t n = read(out_pipe[0], buf, sizeof(buf));
                if (n > 0) {
                    result.output.append(buf, static_cast<size_t>(n));
                } else {
                    pipe_open = false;
                }
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            reaped = true;
            break;
        }
        if (waited == -1 && errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            break;
        }

        if (deadline && std::chrono::steady_clock::now() >= *deadline) {
            if (spec.own_process_group) {
                kill(-pid, SIGKILL);
            }
            kill(pid, SIGKILL);
            if (waitpid(pid, &status, 0) == pid) {
                reaped = true;
            }
            result.timed_out = true;
            break;
        }
    }

    // Drain what the child wrote before exiting
    while (pipe_open) {
        ssize_t n = read(out_pipe[0], buf, sizeof(buf));
        if (n <= 0) break;
        result.output.append(buf, static_cast<size_t>(n));
    }
    if (spec.capture_stdout) {
        close(out_pipe[0]);
    }

    if (reaped) {
        result.ok = true;
        result.exit_code = decode_status(status);
    }
    return result;
}

ProcessResult exec_replace(const ProcessSpec& spec) {
    ProcessResult result;
    CArgs args(spec);

    exec_program(spec, args);

    result.error = "exec failed: " + std::string(strerror(errno));
    result.exit_code = 127;
    return result;
}

} // namespace fplaunch
