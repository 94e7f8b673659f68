#include "fplaunch/hook_executor.hpp"
#include "fplaunch/log.hpp"
#include "fplaunch/platform.hpp"
#include "fplaunch/process.hpp"
#include "fplaunch/safety.hpp"

namespace fplaunch {

namespace {

std::string hook_label(HookKind kind) {
    return kind == HookKind::Pre ? "pre-launch hook" : "post-launch hook";
}

} // namespace

std::optional<FailureMode> failure_mode_from_env(
    const std::unordered_map<std::string, std::string>& env) {
    auto it = env.find(kHookFailureEnv);
    if (it == env.end() || it->second.empty()) {
        return std::nullopt;
    }
    auto mode = parse_failure_mode(it->second);
    if (!mode) {
        spdlog::warn("ignoring {}={}: expected abort, warn or ignore",
                     kHookFailureEnv, printable_input(it->second));
    }
    return mode;
}

HookExecutor::HookExecutor() : HookExecutor(Options{}) {}

HookExecutor::HookExecutor(Options options) : options_(std::move(options)) {
    if (!options_.warn_sink) {
        options_.warn_sink = [](const std::string& message) {
            hook_logger()->warn("{}", message);
        };
    }
}

Result<HookOutcome> HookExecutor::run(HookKind kind,
                                      const std::optional<std::string>& script,
                                      const HookContext& context,
                                      const FailureModeChain& chain) const {
    using R = Result<HookOutcome>;

    HookOutcome outcome;

    if (!script || script->empty()) {
        outcome.message = "no " + hook_label(kind) + " configured";
        return R::ok(outcome);
    }
    if (!path_exists(*script) || !is_executable_file(*script)) {
        outcome.message = hook_label(kind) + " " + *script + " is missing or not executable";
        spdlog::debug("{}", outcome.message);
        return R::ok(outcome);
    }

    auto candidate = validate_executable_candidate(*script);
    if (!candidate.ok()) {
        return R::err(Error(ErrorCode::Validation,
            hook_label(kind) + " " + printable_input(*script) + ": " + candidate.reason));
    }

    ProcessSpec spec;
    spec.program = *script;
    spec.argv = {*script};
    spec.env = options_.base_env.empty() ? get_all_env() : options_.base_env;
    spec.env["FPWRAPPER_WRAPPER_NAME"] = context.wrapper_name;
    spec.env["FPWRAPPER_APP_ID"] = context.app_id;
    spec.env["FPWRAPPER_SOURCE"] = context.source;
    spec.env["FPWRAPPER_HOOK"] = hook_kind_to_string(kind);
    if (kind == HookKind::Post && context.app_exit_code) {
        spec.env["FPWRAPPER_EXIT_CODE"] = std::to_string(*context.app_exit_code);
    }
    spec.timeout = options_.timeout;
    spec.own_process_group = true;

    spdlog::debug("running {} {}", hook_label(kind), *script);
    auto result = run_process(spec);

    outcome.executed = true;
    outcome.timed_out = result.timed_out;
    if (result.ok) {
        outcome.exit_code = result.exit_code;
    }

    if (result.ok && !result.timed_out && result.exit_code == 0) {
        return R::ok(outcome);
    }

    outcome.failed = true;
    if (result.timed_out) {
        outcome.message = hook_label(kind) + " " + *script + " timed out after " +
                          std::to_string(options_.timeout.count()) + "ms";
    } else if (!result.ok) {
        outcome.exit_code = 127;
        outcome.message = hook_label(kind) + " " + *script + " could not run: " + result.error;
    } else {
        outcome.message = hook_label(kind) + " " + *script + " exited with status " +
                          std::to_string(result.exit_code);
    }

    FailureMode mode = chain.resolve();
    outcome.applied_mode = mode;

    switch (mode) {
        case FailureMode::Abort:
            if (kind == HookKind::Pre) {
                outcome.abort_launch = true;
                options_.warn_sink(outcome.message + "; launch aborted");
            } else {
                // The application already ran; report like warn
                outcome.applied_mode = FailureMode::Warn;
                options_.warn_sink(outcome.message);
            }
            break;
        case FailureMode::Warn:
            options_.warn_sink(outcome.message);
            break;
        case FailureMode::Ignore:
            break;
    }

    return R::ok(outcome);
}

} // namespace fplaunch
