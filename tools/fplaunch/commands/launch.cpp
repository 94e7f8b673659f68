/**
 * fplaunch CLI - launch command
 *
 * Entry point of every generated wrapper.
 */

#include "../common.hpp"
#include <fplaunch/launch_engine.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace fplaunch::cli::commands {

namespace {

struct LaunchOptions {
    std::string name;
    std::string id;
    std::vector<std::string> args;
    bool interactive = false;
    bool desktop = false;
    std::string hook_failure;
    std::string target;
    std::string preset;
};

int cmd_launch(const GlobalOptions& opts, const LaunchOptions& launch_opts) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    LaunchRequest request;
    request.wrapper_name = launch_opts.name;
    request.package_id = launch_opts.id;
    request.args = launch_opts.args;
    request.force_interactive = launch_opts.interactive;
    request.force_desktop = launch_opts.desktop;
    request.preset = launch_opts.preset;
    if (!launch_opts.hook_failure.empty()) {
        request.hook_failure = parse_failure_mode(launch_opts.hook_failure);
    }
    if (!launch_opts.target.empty()) {
        request.one_shot = parse_target_kind(launch_opts.target);
    }

    SystemTargetLocator locator(get_env("PATH").value_or(""), store->home());
    TerminalChoicePrompt prompt;
    ProcessAppRunner runner;
    LaunchEngine engine(*store, locator, prompt, runner);

    auto outcome = engine.launch(request, LaunchEnvironment::current());
    if (outcome.isErr()) {
        return fail(outcome.error(), opts.json);
    }

    for (const auto& warning : outcome.value().warnings) {
        print_warning(warning, opts.json);
    }
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = outcome.value().success;
        j["exit_code"] = outcome.value().exit_code;
        j["interactive"] = outcome.value().interactivity.interactive;
        if (outcome.value().decision) {
            j["target"] = target_kind_to_string(outcome.value().decision->target_kind);
        }
        output_json(j);
    }

    return outcome.value().exit_code;
}

} // anonymous namespace

void setup_launch(CLI::App* app, GlobalOptions& opts) {
    static LaunchOptions launch_opts;

    app->add_option("name", launch_opts.name, "Wrapper or alias name")->required();
    app->add_option("args", launch_opts.args, "Arguments for the application (after --)");
    app->add_option("--id", launch_opts.id, "Flatpak application id (default: read from the wrapper)");
    app->add_flag("--interactive", launch_opts.interactive, "Treat the invocation as interactive");
    app->add_flag("--desktop", launch_opts.desktop, "Treat the invocation as non-interactive");
    app->add_option("--hook-failure", launch_opts.hook_failure, "Hook failure mode for this run")
        ->check(CLI::IsMember({"abort", "warn", "ignore"}));
    app->add_option("--launch", launch_opts.target, "Target for this run only")
        ->check(CLI::IsMember({"system", "package", "flatpak"}));
    app->add_option("--preset", launch_opts.preset, "Permission preset for a package launch");

    app->callback([&opts]() {
        std::exit(cmd_launch(opts, launch_opts));
    });
}

} // namespace fplaunch::cli::commands
