#include "fplaunch/launch_engine.hpp"
#include "fplaunch/alias_resolver.hpp"
#include "fplaunch/platform.hpp"
#include "fplaunch/process.hpp"
#include "fplaunch/safety.hpp"
#include "fplaunch/wrapper.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>

#include <poll.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace fplaunch {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

Result<void> check_launch_name(const std::string& name, const std::vector<std::string>& blocklist) {
    auto id_check = validate_identifier_format(name, blocklist);
    if (!id_check.ok()) {
        return Result<void>::err(Error(ErrorCode::Validation,
            "wrapper name " + printable_input(name) + ": " + id_check.reason));
    }
    auto file_check = validate_name_component(name);
    if (!file_check.ok()) {
        return Result<void>::err(Error(ErrorCode::Validation,
            "wrapper name " + printable_input(name) + ": " + file_check.reason));
    }
    return Result<void>::ok();
}

} // namespace

// ============================================================================
// Interactivity
// ============================================================================

Interactivity evaluate_interactivity(const InteractivityInputs& inputs) {
    Interactivity result;

    std::string forced = inputs.force_env ? to_lower(trim(*inputs.force_env)) : "";

    if (inputs.force_interactive_flag) {
        result.interactive = true;
        result.reason = "--interactive";
    } else if (forced == "interactive" && !inputs.force_desktop_flag) {
        result.interactive = true;
        result.reason = std::string(kForceModeEnv) + "=interactive";
    } else if (inputs.force_desktop_flag) {
        result.reason = "--desktop";
    } else if (forced == "desktop") {
        result.reason = std::string(kForceModeEnv) + "=desktop";
    } else if (inputs.stdin_tty && inputs.stdout_tty) {
        result.interactive = true;
        result.reason = "terminal";
    } else {
        result.reason = "no terminal";
    }
    return result;
}

LaunchEnvironment LaunchEnvironment::current() {
    LaunchEnvironment environment;
    environment.env = get_all_env();
    environment.stdin_tty = stdin_is_terminal();
    environment.stdout_tty = stdout_is_terminal();
    return environment;
}

// ============================================================================
// Decisions
// ============================================================================

LaunchDecision build_launch_decision(TargetKind kind,
                                     const std::string& system_binary,
                                     const std::string& package_id,
                                     const ResolvedSettings& settings,
                                     const std::vector<std::string>& permissions,
                                     const std::vector<std::string>& user_args,
                                     const std::unordered_map<std::string, std::string>& process_env) {
    LaunchDecision decision;
    decision.target_kind = kind;
    decision.env = process_env;

    if (kind == TargetKind::System) {
        decision.program = system_binary;
        decision.argv.push_back(system_binary);
        decision.argv.insert(decision.argv.end(), settings.custom_args.begin(), settings.custom_args.end());
        decision.argv.insert(decision.argv.end(), user_args.begin(), user_args.end());
        for (const auto& [key, value] : settings.env) {
            decision.env[key] = value;
        }
        return decision;
    }

    decision.program = "flatpak";
    decision.argv = {"flatpak", "run"};

    std::vector<std::string> keys;
    for (const auto& [key, value] : settings.env) keys.push_back(key);
    std::sort(keys.begin(), keys.end());
    for (const auto& key : keys) {
        decision.argv.push_back("--env=" + key + "=" + settings.env.at(key));
    }

    decision.argv.insert(decision.argv.end(), permissions.begin(), permissions.end());
    decision.argv.push_back(package_id);
    decision.argv.insert(decision.argv.end(), settings.custom_args.begin(), settings.custom_args.end());
    decision.argv.insert(decision.argv.end(), user_args.begin(), user_args.end());
    return decision;
}

// ============================================================================
// Collaborators
// ============================================================================

SystemTargetLocator::SystemTargetLocator(std::string path_value, std::string home_dir)
    : path_value_(std::move(path_value)), home_dir_(std::move(home_dir)) {}

std::optional<std::string> SystemTargetLocator::findSystemBinary(const std::string& name,
                                                               const std::string& exclude) const {
    return find_executable_in_path(name, path_value_, exclude);
}

bool SystemTargetLocator::packageInstalled(const std::string& id) const {
    if (is_directory(join_path("/var/lib/flatpak/app", id))) return true;
    if (home_dir_.empty()) return false;
    return is_directory(join_path(join_path(home_dir_, ".local/share/flatpak/app"), id));
}

std::optional<std::string> TerminalChoicePrompt::ask(const std::string& question,
                                                     std::chrono::seconds timeout) {
    std::fputs(question.c_str(), stderr);
    std::fflush(stderr);

    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    int ready = poll(&pfd, 1, static_cast<int>(timeout.count() * 1000));
    if (ready <= 0) {
        std::fputs("\n", stderr);
        return std::nullopt;
    }

    std::string answer;
    char c = 0;
    while (true) {
        ssize_t n = read(STDIN_FILENO, &c, 1);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            if (answer.empty()) return std::nullopt;
            break;
        }
        if (c == '\n') break;
        answer += c;
    }
    return answer;
}

TargetKind interpret_choice(const std::optional<std::string>& answer) {
    if (!answer) return TargetKind::System;
    std::string choice = to_lower(trim(*answer));
    if (choice == "2" || choice == "p" || choice == "package" || choice == "flatpak" || choice == "f") {
        return TargetKind::Package;
    }
    return TargetKind::System;
}

Result<int> ProcessAppRunner::run(const LaunchDecision& decision, bool wait) {
    ProcessSpec spec;
    spec.program = decision.program;
    spec.argv = decision.argv;
    spec.env = decision.env;

    if (!wait) {
        auto failed = exec_replace(spec);
        return Result<int>::err(Error(ErrorCode::Io,
            "cannot execute " + decision.program + ": " + failed.error));
    }

    auto result = run_process(spec);
    if (!result.ok) {
        return Result<int>::err(Error(ErrorCode::Io,
            "cannot execute " + decision.program + ": " + result.error));
    }
    return Result<int>::ok(result.exit_code);
}

// ============================================================================
// Launch Engine
// ============================================================================

LaunchEngine::LaunchEngine(ConfigStore& store, const TargetLocator& locator, ChoicePrompt& prompt,
                           AppRunner& runner, HookExecutor hooks)
    : store_(store), locator_(locator), prompt_(prompt), runner_(runner), hooks_(std::move(hooks)) {}

Result<TargetKind> LaunchEngine::chooseTarget(const std::string& app,
                                              const ResolvedSettings& settings,
                                              const std::optional<std::string>& system_binary,
                                              const std::string& package_id,
                                              LaunchOutcome& outcome) {
    using R = Result<TargetKind>;

    bool has_package = !package_id.empty();
    bool package_present = has_package && locator_.packageInstalled(package_id);

    auto fallback = [&](TargetKind to, const std::string& why) {
        std::string message = why + "; using the " + target_kind_to_string(to) + " target for " + app;
        spdlog::warn("{}", message);
        outcome.warnings.push_back(message);
        return R::ok(to);
    };

    switch (settings.launch_method) {
        case LaunchMethod::System:
            if (system_binary) return R::ok(TargetKind::System);
            if (has_package) return fallback(TargetKind::Package, "no system binary found");
            break;

        case LaunchMethod::Package:
            if (has_package) return R::ok(TargetKind::Package);
            if (system_binary) return fallback(TargetKind::System, "no package id known");
            break;

        case LaunchMethod::Auto:
            if (system_binary && package_present) {
                std::string question =
                    "Both a system binary (" + *system_binary + ") and the Flatpak " + package_id +
                    " are available for '" + app + "'.\n"
                    "Launch with [1] system (default) or [2] flatpak? ";
                TargetKind choice = interpret_choice(prompt_.ask(question, kChoiceTimeout));
                auto saved = store_.writePreference(app, choice);
                if (saved.isErr()) {
                    std::string message = "choice not saved: " + saved.error().message();
                    spdlog::warn("{}", message);
                    outcome.warnings.push_back(message);
                }
                return R::ok(choice);
            }
            if (system_binary) return R::ok(TargetKind::System);
            if (has_package) return R::ok(TargetKind::Package);
            break;
    }

    return R::err(Error(ErrorCode::NotFound,
                        "no system binary or package available for " + printable_input(app)));
}

Result<LaunchOutcome> LaunchEngine::launch(const LaunchRequest& request,
                                           const LaunchEnvironment& environment) {
    using R = Result<LaunchOutcome>;

    LaunchOutcome outcome;
    outcome.states.push_back(LaunchState::Start);

    // Evaluated once; everything below reads outcome.interactivity
    InteractivityInputs inputs;
    inputs.force_interactive_flag = request.force_interactive;
    inputs.force_desktop_flag = request.force_desktop;
    auto forced = environment.env.find(kForceModeEnv);
    if (forced != environment.env.end()) inputs.force_env = forced->second;
    inputs.stdin_tty = environment.stdin_tty;
    inputs.stdout_tty = environment.stdout_tty;
    outcome.interactivity = evaluate_interactivity(inputs);
    outcome.states.push_back(LaunchState::InteractivityCheck);
    spdlog::debug("interactivity: {} ({})", outcome.interactivity.interactive, outcome.interactivity.reason);

    auto blocklist = store_.loadBlocklist();
    auto named = check_launch_name(request.wrapper_name, blocklist);
    if (named.isErr()) {
        return R::err(named.error());
    }

    auto resolved_name = AliasGraph(store_.loadAliases()).resolve(request.wrapper_name);
    if (resolved_name.isErr()) {
        return R::err(resolved_name.error());
    }
    const std::string app = resolved_name.value();
    if (app != request.wrapper_name) {
        auto target_named = check_launch_name(app, blocklist);
        if (target_named.isErr()) {
            return R::err(target_named.error());
        }
        spdlog::debug("alias {} resolves to {}", request.wrapper_name, app);
    }

    std::string self_path = join_path(store_.binDir(), app);
    std::string package_id = request.package_id;
    if (package_id.empty()) {
        package_id = read_wrapper_id(self_path).value_or("");
    }
    if (!package_id.empty()) {
        auto id_check = validate_package_id(package_id, blocklist);
        if (!id_check.ok()) {
            return R::err(Error(ErrorCode::Validation,
                "package id " + printable_input(package_id) + ": " + id_check.reason));
        }
    }

    std::vector<std::string> permissions;
    if (!request.preset.empty()) {
        auto preset = store_.getPreset(request.preset);
        if (preset.isErr()) {
            return R::err(preset.error());
        }
        permissions = preset.value().permissions;
    }

    auto system_binary = locator_.findSystemBinary(app, self_path);

    ResolvedSettings settings;
    settings.app = app;
    TargetKind kind = TargetKind::System;

    if (!outcome.interactivity.interactive) {
        outcome.states.push_back(LaunchState::Bypass);

        if (request.one_shot) {
            kind = *request.one_shot;
        } else if (system_binary) {
            kind = TargetKind::System;
        } else if (!package_id.empty()) {
            kind = TargetKind::Package;
        } else {
            return R::err(Error(ErrorCode::NotFound,
                "no system binary or package available for " + printable_input(app)));
        }
    } else {
        outcome.states.push_back(LaunchState::ResolveTarget);

        auto resolved = store_.resolve(app);
        if (resolved.isErr()) {
            return R::err(resolved.error());
        }
        settings = std::move(resolved.value());
        outcome.warnings.insert(outcome.warnings.end(),
                                settings.warnings.begin(), settings.warnings.end());

        if (request.one_shot) {
            kind = *request.one_shot;
        } else {
            auto chosen = chooseTarget(app, settings, system_binary, package_id, outcome);
            if (chosen.isErr()) {
                return R::err(chosen.error());
            }
            kind = chosen.value();
        }
    }

    if (kind == TargetKind::System && !system_binary) {
        return R::err(Error(ErrorCode::NotFound, "no system binary found for " + printable_input(app)));
    }
    if (kind == TargetKind::Package && package_id.empty()) {
        return R::err(Error(ErrorCode::NotFound, "no package id known for " + printable_input(app)));
    }
    if (kind == TargetKind::System && !permissions.empty()) {
        outcome.warnings.push_back("preset " + request.preset + " only applies to package launches");
    }

    outcome.decision = build_launch_decision(kind, system_binary.value_or(""), package_id, settings,
                                             permissions, request.args, environment.env);

    HookContext context;
    context.wrapper_name = request.wrapper_name;
    context.app_id = kind == TargetKind::Package ? package_id : system_binary.value_or(app);
    context.source = target_kind_to_string(kind);

    bool bypass = !outcome.interactivity.interactive;
    std::optional<FailureMode> env_mode;
    if (!bypass) env_mode = failure_mode_from_env(environment.env);
    auto chain_for = [&](HookKind hook) {
        FailureModeChain chain = settings.chain(hook);
        chain.runtime_override = request.hook_failure;
        chain.env_override = env_mode;
        return chain;
    };

    if (!bypass) {
        outcome.states.push_back(LaunchState::PreHook);
        auto pre = hooks_.run(HookKind::Pre, settings.pre_launch_script, context, chain_for(HookKind::Pre));
        if (pre.isErr()) {
            return R::err(pre.error());
        }
        outcome.pre_hook = pre.value();
        if (pre.value().abort_launch) {
            outcome.success = false;
            int code = pre.value().exit_code.value_or(1);
            outcome.exit_code = code == 0 ? 1 : code;
            outcome.states.push_back(LaunchState::Done);
            return R::ok(std::move(outcome));
        }
    }

    bool has_post = !bypass && settings.post_launch_script.has_value();
    outcome.states.push_back(LaunchState::Execute);
    auto ran = runner_.run(*outcome.decision, has_post);
    if (ran.isErr()) {
        return R::err(ran.error());
    }
    outcome.app_exit_code = ran.value();
    outcome.exit_code = ran.value();
    outcome.success = ran.value() == 0;

    if (has_post) {
        outcome.states.push_back(LaunchState::PostHook);
        context.app_exit_code = ran.value();
        auto post = hooks_.run(HookKind::Post, settings.post_launch_script, context,
                               chain_for(HookKind::Post));
        if (post.isErr()) {
            return R::err(post.error());
        }
        outcome.post_hook = post.value();
        if (post.value().failed && chain_for(HookKind::Post).resolve() == FailureMode::Abort) {
            // Post abort degrades to warn but the hook status becomes the exit code
            outcome.success = false;
            outcome.exit_code = post.value().exit_code.value_or(1);
        }
    }

    outcome.states.push_back(LaunchState::Done);
    return R::ok(std::move(outcome));
}

} // namespace fplaunch
