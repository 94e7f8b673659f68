/**
 * fplaunch CLI - Entry Point
 *
 * Launcher and wrapper manager for Flatpak applications.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

namespace fplaunch::cli::commands {
    void setup_launch(CLI::App* app, GlobalOptions& opts);
    void setup_generate(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_remove(CLI::App* app, GlobalOptions& opts);
    void setup_monitor(CLI::App* app, GlobalOptions& opts);
    void setup_profile(CLI::App* app, GlobalOptions& opts);
    void setup_preset(CLI::App* app, GlobalOptions& opts);
    void setup_alias(CLI::App* app, GlobalOptions& opts);
    void setup_pref(CLI::App* app, GlobalOptions& opts);
    void setup_config(CLI::App* app, GlobalOptions& opts);
    void setup_block(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace fplaunch::cli;

    CLI::App app{"fplaunch - launch Flatpak applications through command-line wrappers"};
    app.set_version_flag("-V,--version", FPLAUNCH_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    app.add_option("--config-dir", opts.config_dir, "Configuration directory");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "More detail (repeat for debug output)");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    auto* launch_cmd = app.add_subcommand("launch", "Run an application through its wrapper");
    commands::setup_launch(launch_cmd, opts);

    auto* generate_cmd = app.add_subcommand("generate", "Create or refresh wrapper scripts");
    commands::setup_generate(generate_cmd, opts);

    auto* list_cmd = app.add_subcommand("list", "Show installed wrappers");
    commands::setup_list(list_cmd, opts);

    auto* remove_cmd = app.add_subcommand("remove", "Remove a wrapper with its preference and aliases");
    commands::setup_remove(remove_cmd, opts);

    auto* monitor_cmd = app.add_subcommand("monitor", "Regenerate wrappers when Flatpak installations change");
    commands::setup_monitor(monitor_cmd, opts);

    auto* profile_cmd = app.add_subcommand("profile", "Manage configuration profiles");
    commands::setup_profile(profile_cmd, opts);

    auto* preset_cmd = app.add_subcommand("preset", "Manage permission presets");
    commands::setup_preset(preset_cmd, opts);

    auto* alias_cmd = app.add_subcommand("alias", "Manage wrapper aliases");
    commands::setup_alias(alias_cmd, opts);

    auto* pref_cmd = app.add_subcommand("pref", "Show or change the saved launch choice");
    commands::setup_pref(pref_cmd, opts);

    auto* config_cmd = app.add_subcommand("config", "Show or change per-app settings");
    commands::setup_config(config_cmd, opts);

    auto* block_cmd = app.add_subcommand("block", "Manage the block list");
    commands::setup_block(block_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
