#pragma once

#include "fplaunch/types.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace fplaunch {

constexpr std::chrono::milliseconds kDefaultHookTimeout{30000};

// Environment variable carrying the level-2 failure mode override
constexpr char kHookFailureEnv[] = "FPWRAPPER_HOOK_FAILURE";

// ============================================================================
// Hook Context and Outcome
// ============================================================================

// Identity of the invocation, exported to the hook as FPWRAPPER_* variables
struct HookContext {
    std::string wrapper_name;
    std::string app_id;
    std::string source;                 // "system" or "package"
    std::optional<int> app_exit_code;   // post hooks only
};

struct HookOutcome {
    bool executed = false;
    std::optional<int> exit_code;
    bool timed_out = false;
    bool failed = false;
    FailureMode applied_mode = FailureModeChain::kBuiltinDefault;
    bool abort_launch = false;
    std::string message;
};

// Failure mode named by FPWRAPPER_HOOK_FAILURE in `env`; unknown values are
// reported and ignored
std::optional<FailureMode> failure_mode_from_env(
    const std::unordered_map<std::string, std::string>& env);

// ============================================================================
// Hook Executor
// ============================================================================

class HookExecutor {
public:
    struct Options {
        std::chrono::milliseconds timeout = kDefaultHookTimeout;
        // Environment the hook inherits; empty means the current process environment
        std::unordered_map<std::string, std::string> base_env;
        // Receives user-facing hook warnings; defaults to the hook logger
        std::function<void(const std::string&)> warn_sink;
    };

    HookExecutor();
    explicit HookExecutor(Options options);

    /**
     * @brief Run one pre or post launch hook
     *
     * A missing or non-executable script is "no hook": executed is false and
     * no failure handling happens. An existing script must pass the
     * executable checks, otherwise the call fails with a validation error.
     * A non-zero exit or a timeout is a failure handled by the mode resolved
     * from `chain`:
     * - abort: pre hooks set abort_launch; post hooks behave like warn
     * - warn: a prefixed message goes to the warning sink
     * - ignore: nothing is reported
     */
    Result<HookOutcome> run(HookKind kind,
                            const std::optional<std::string>& script,
                            const HookContext& context,
                            const FailureModeChain& chain) const;

private:
    Options options_;
};

} // namespace fplaunch
