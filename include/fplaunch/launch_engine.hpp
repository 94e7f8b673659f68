#pragma once

/**
 * @file launch_engine.hpp
 * @brief Decide what a wrapper invocation runs, and run it
 *
 * One invocation walks Start -> InteractivityCheck -> {Bypass, ResolveTarget}
 * -> PreHook -> Execute -> PostHook -> Done. Interactivity is evaluated once
 * and carried as a value. Bypass never reads or writes preferences and runs
 * no hooks.
 */

#include "fplaunch/config_store.hpp"
#include "fplaunch/hook_executor.hpp"
#include "fplaunch/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fplaunch {

// ============================================================================
// States
// ============================================================================

enum class LaunchState {
    Start,
    InteractivityCheck,
    Bypass,
    ResolveTarget,
    PreHook,
    Execute,
    PostHook,
    Done
};

inline const char* launch_state_to_string(LaunchState s) {
    switch (s) {
        case LaunchState::Start: return "START";
        case LaunchState::InteractivityCheck: return "INTERACTIVITY_CHECK";
        case LaunchState::Bypass: return "BYPASS";
        case LaunchState::ResolveTarget: return "RESOLVE_TARGET";
        case LaunchState::PreHook: return "PRE_HOOK";
        case LaunchState::Execute: return "EXECUTE";
        case LaunchState::PostHook: return "POST_HOOK";
        case LaunchState::Done: return "DONE";
        default: return "DONE";
    }
}

// ============================================================================
// Interactivity
// ============================================================================

constexpr char kForceModeEnv[] = "FPWRAPPER_FORCE";

struct InteractivityInputs {
    bool force_interactive_flag = false;
    bool force_desktop_flag = false;
    std::optional<std::string> force_env;   // FPWRAPPER_FORCE
    bool stdin_tty = false;
    bool stdout_tty = false;
};

struct Interactivity {
    bool interactive = false;
    std::string reason;
};

Interactivity evaluate_interactivity(const InteractivityInputs& inputs);

// ============================================================================
// Requests and Decisions
// ============================================================================

struct LaunchRequest {
    std::string wrapper_name;
    std::string package_id;                     // empty: read from the installed wrapper
    std::vector<std::string> args;
    bool force_interactive = false;             // --interactive
    bool force_desktop = false;                 // --desktop
    std::optional<FailureMode> hook_failure;    // --hook-failure
    std::optional<TargetKind> one_shot;         // --launch
    std::string preset;                         // --preset
};

// Process environment and terminal state of the invocation
struct LaunchEnvironment {
    std::unordered_map<std::string, std::string> env;
    bool stdin_tty = false;
    bool stdout_tty = false;

    static LaunchEnvironment current();
};

struct LaunchDecision {
    TargetKind target_kind = TargetKind::System;
    std::string program;                // binary path, or "flatpak"
    std::vector<std::string> argv;      // argv[0] included
    std::unordered_map<std::string, std::string> env;
};

struct LaunchOutcome {
    bool success = false;
    int exit_code = 0;                  // what the caller should exit with
    std::optional<int> app_exit_code;   // set when the application ran and was waited for
    Interactivity interactivity;
    std::optional<LaunchDecision> decision;
    std::optional<HookOutcome> pre_hook;
    std::optional<HookOutcome> post_hook;
    std::vector<LaunchState> states;
    std::vector<std::string> warnings;
};

/**
 * Build the command for a target. System targets get custom_args, then
 * `user_args`, with the env overrides merged into `process_env`. Package
 * targets run `flatpak run --env=K=V... <permissions> <id> <custom_args>
 * <user_args>`.
 */
LaunchDecision build_launch_decision(TargetKind kind,
                                     const std::string& system_binary,
                                     const std::string& package_id,
                                     const ResolvedSettings& settings,
                                     const std::vector<std::string>& permissions,
                                     const std::vector<std::string>& user_args,
                                     const std::unordered_map<std::string, std::string>& process_env);

// ============================================================================
// Collaborators
// ============================================================================

class TargetLocator {
public:
    virtual ~TargetLocator() = default;

    // First executable named `name` on the search path that is not `exclude`
    virtual std::optional<std::string> findSystemBinary(const std::string& name,
                                                        const std::string& exclude) const = 0;

    virtual bool packageInstalled(const std::string& id) const = 0;
};

// Searches $PATH and the system and per-user Flatpak installations
class SystemTargetLocator : public TargetLocator {
public:
    SystemTargetLocator(std::string path_value, std::string home_dir);

    std::optional<std::string> findSystemBinary(const std::string& name,
                                                const std::string& exclude) const override;
    bool packageInstalled(const std::string& id) const override;

private:
    std::string path_value_;
    std::string home_dir_;
};

class ChoicePrompt {
public:
    virtual ~ChoicePrompt() = default;

    // Raw answer, or nullopt on end of input or timeout
    virtual std::optional<std::string> ask(const std::string& question,
                                           std::chrono::seconds timeout) = 0;
};

// Question on stderr, answer from stdin
class TerminalChoicePrompt : public ChoicePrompt {
public:
    std::optional<std::string> ask(const std::string& question,
                                   std::chrono::seconds timeout) override;
};

// "2", "p", "package" or "flatpak" choose the package; anything else,
// including no answer, chooses the system binary
TargetKind interpret_choice(const std::optional<std::string>& answer);

class AppRunner {
public:
    virtual ~AppRunner() = default;

    /**
     * Run the decision. With `wait` false the runner may replace the current
     * process and only returns on failure.
     */
    virtual Result<int> run(const LaunchDecision& decision, bool wait) = 0;
};

class ProcessAppRunner : public AppRunner {
public:
    Result<int> run(const LaunchDecision& decision, bool wait) override;
};

// ============================================================================
// Launch Engine
// ============================================================================

constexpr std::chrono::seconds kChoiceTimeout{30};

class LaunchEngine {
public:
    LaunchEngine(ConfigStore& store, const TargetLocator& locator, ChoicePrompt& prompt,
                 AppRunner& runner, HookExecutor hooks = HookExecutor());

    /**
     * @brief Run one invocation through the state machine
     *
     * Validation and alias errors are returned as errors. A pre-hook abort is
     * a normal outcome with success false and the hook's exit code.
     */
    Result<LaunchOutcome> launch(const LaunchRequest& request, const LaunchEnvironment& environment);

private:
    Result<TargetKind> chooseTarget(const std::string& app, const ResolvedSettings& settings,
                                    const std::optional<std::string>& system_binary,
                                    const std::string& package_id,
                                    LaunchOutcome& outcome);

    ConfigStore& store_;
    const TargetLocator& locator_;
    ChoicePrompt& prompt_;
    AppRunner& runner_;
    HookExecutor hooks_;
};

} // namespace fplaunch
