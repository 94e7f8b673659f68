/**
 * fplaunch CLI - config command
 *
 * Inspect resolved settings and edit configuration layers.
 */

#include "../common.hpp"
#include <fplaunch/safety.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace fplaunch::cli::commands {

namespace {

void print_settings(const ResolvedSettings& settings) {
    std::cout << settings.app << ":" << std::endl;
    std::cout << "  launch_method: " << launch_method_to_string(settings.launch_method)
              << (settings.from_preference ? " (saved preference)" : "") << std::endl;
    if (!settings.custom_args.empty()) {
        std::cout << "  custom_args:";
        for (const auto& arg : settings.custom_args) std::cout << " " << arg;
        std::cout << std::endl;
    }
    for (const auto& [key, value] : settings.env) {
        std::cout << "  env." << key << "=" << value << std::endl;
    }
    if (settings.pre_launch_script) {
        std::cout << "  pre_launch_script: " << *settings.pre_launch_script
                  << " (" << failure_mode_to_string(settings.pre_failure_mode) << ")" << std::endl;
    }
    if (settings.post_launch_script) {
        std::cout << "  post_launch_script: " << *settings.post_launch_script
                  << " (" << failure_mode_to_string(settings.post_failure_mode) << ")" << std::endl;
    }
}

int cmd_config_show(const GlobalOptions& opts, const std::string& app, const std::string& profile) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    std::vector<ResolvedSettings> all;
    if (!app.empty()) {
        auto settings = store->resolve(app, profile);
        if (settings.isErr()) {
            return fail(settings.error(), opts.json);
        }
        all.push_back(settings.value());
    } else {
        auto loaded = store->load(profile);
        if (loaded.isErr()) {
            return fail(loaded.error(), opts.json);
        }
        for (auto& [name, settings] : loaded.value()) {
            all.push_back(settings);
        }
    }

    for (const auto& settings : all) {
        for (const auto& warning : settings.warnings) {
            print_warning(warning, opts.json);
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["profile"] = profile.empty() ? store->activeProfile() : profile;
        j["apps"] = nlohmann::json::array();
        for (const auto& settings : all) {
            j["apps"].push_back(settings_to_json(settings));
        }
        output_json(j);
    } else if (all.empty()) {
        std::cout << "No per-app settings in profile "
                  << (profile.empty() ? store->activeProfile() : profile) << std::endl;
    } else {
        for (const auto& settings : all) {
            print_settings(settings);
        }
    }
    return 0;
}

int cmd_config_set(const GlobalOptions& opts, const std::string& layer_str,
                   const std::string& key, const std::string& value) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    auto layer = parse_layer_ref(layer_str);
    if (!layer) {
        print_error("layer must be 'global', 'app:<name>' or 'pref:<name>', got " +
                    printable_input(layer_str), opts.json);
        return 1;
    }

    auto result = store->save(*layer, key, value);
    if (result.isErr()) {
        return fail(result.error(), opts.json);
    }

    if (opts.json) {
        nlohmann::json j;
        j["layer"] = layer_str;
        j["key"] = key;
        j["value"] = value.empty() ? nlohmann::json(nullptr) : nlohmann::json(value);
        output_json(j);
    } else if (value.empty()) {
        print_success("Unset " + key + " in " + layer_str, opts.json);
    } else {
        print_success("Set " + key + " in " + layer_str, opts.json);
    }
    return 0;
}

int cmd_config_bin_dir(const GlobalOptions& opts, const std::string& path) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    if (!path.empty()) {
        auto result = store->setBinDir(path);
        if (result.isErr()) {
            return fail(result.error(), opts.json);
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["bin_dir"] = store->binDir();
        output_json(j);
    } else {
        std::cout << store->binDir() << std::endl;
    }
    return 0;
}

int cmd_config_path(const GlobalOptions& opts) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["root"] = store->root();
        j["active_profile"] = store->activeProfile();
        output_json(j);
    } else {
        std::cout << store->root() << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_config(CLI::App* app, GlobalOptions& opts) {
    app->require_subcommand(1);

    // config show [app] [--profile name]
    static std::string show_app;
    static std::string show_profile;
    auto* show_cmd = app->add_subcommand("show", "Show resolved settings");
    show_cmd->add_option("app", show_app, "Application (default: every app in the profile)");
    show_cmd->add_option("--profile", show_profile, "Profile to resolve against (default: active)");
    show_cmd->callback([&opts]() {
        std::exit(cmd_config_show(opts, show_app, show_profile));
    });

    // config set <layer> <key> [value]
    static std::string set_layer;
    static std::string set_key;
    static std::string set_value;
    auto* set_cmd = app->add_subcommand("set", "Set a field of a layer (no value unsets it)");
    set_cmd->add_option("layer", set_layer, "global, app:<name> or pref:<name>")->required();
    set_cmd->add_option("key", set_key,
        "launch_method, custom_args, env.NAME, pre_launch_script, post_launch_script, "
        "pre_launch_failure_mode or post_launch_failure_mode")->required();
    set_cmd->add_option("value", set_value, "New value");
    set_cmd->callback([&opts]() {
        std::exit(cmd_config_set(opts, set_layer, set_key, set_value));
    });

    // config bin-dir [path]
    static std::string bin_dir;
    auto* bin_cmd = app->add_subcommand("bin-dir", "Show or change the wrapper directory");
    bin_cmd->add_option("path", bin_dir, "New wrapper directory (inside the home directory)");
    bin_cmd->callback([&opts]() {
        std::exit(cmd_config_bin_dir(opts, bin_dir));
    });

    auto* path_cmd = app->add_subcommand("path", "Print the configuration directory");
    path_cmd->callback([&opts]() {
        std::exit(cmd_config_path(opts));
    });
}

} // namespace fplaunch::cli::commands
