/**
 * fplaunch CLI - preset command
 *
 * Manage named sets of Flatpak permission flags.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace fplaunch::cli::commands {

namespace {

int cmd_preset_list(const GlobalOptions& opts) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    auto presets = store->listPresets();

    if (opts.json) {
        nlohmann::json j;
        j["presets"] = nlohmann::json::object();
        for (const auto& preset : presets) {
            j["presets"][preset.name] = preset.permissions;
        }
        output_json(j);
    } else if (presets.empty()) {
        std::cout << "No presets defined." << std::endl;
    } else {
        for (const auto& preset : presets) {
            std::cout << preset.name << " (" << preset.permissions.size() << " permissions)" << std::endl;
        }
    }
    return 0;
}

int cmd_preset_show(const GlobalOptions& opts, const std::string& name) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    auto preset = store->getPreset(name);
    if (preset.isErr()) {
        return fail(preset.error(), opts.json);
    }

    if (opts.json) {
        nlohmann::json j;
        j["name"] = preset.value().name;
        j["permissions"] = preset.value().permissions;
        output_json(j);
    } else {
        for (const auto& flag : preset.value().permissions) {
            std::cout << flag << std::endl;
        }
    }
    return 0;
}

int cmd_preset_add(const GlobalOptions& opts, const std::string& name,
                   const std::vector<std::string>& permissions) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    auto result = store->putPreset(name, permissions);
    if (result.isErr()) {
        return fail(result.error(), opts.json);
    }

    if (opts.json) {
        nlohmann::json j;
        j["saved"] = name;
        j["permissions"] = permissions;
        output_json(j);
    } else {
        print_success("Saved preset: " + name, opts.json);
    }
    return 0;
}

int cmd_preset_remove(const GlobalOptions& opts, const std::string& name) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    auto result = store->removePreset(name);
    if (result.isErr()) {
        return fail(result.error(), opts.json);
    }

    if (opts.json) {
        nlohmann::json j;
        j["removed"] = name;
        output_json(j);
    } else {
        print_success("Removed preset: " + name, opts.json);
    }
    return 0;
}

} // anonymous namespace

void setup_preset(CLI::App* app, GlobalOptions& opts) {
    app->require_subcommand(1);

    auto* list_cmd = app->add_subcommand("list", "List permission presets");
    list_cmd->callback([&opts]() {
        std::exit(cmd_preset_list(opts));
    });

    static std::string show_name;
    auto* show_cmd = app->add_subcommand("show", "Show the flags of a preset");
    show_cmd->add_option("name", show_name, "Preset name")->required();
    show_cmd->callback([&opts]() {
        std::exit(cmd_preset_show(opts, show_name));
    });

    // preset add <name> -- --share=network --socket=x11 ...
    static std::string add_name;
    static std::vector<std::string> add_permissions;
    auto* add_cmd = app->add_subcommand("add", "Create or replace a preset");
    add_cmd->add_option("name", add_name, "Preset name")->required();
    add_cmd->add_option("permissions", add_permissions, "Permission flags (after --)")->required();
    add_cmd->callback([&opts]() {
        std::exit(cmd_preset_add(opts, add_name, add_permissions));
    });

    static std::string remove_name;
    auto* remove_cmd = app->add_subcommand("remove", "Delete a preset");
    remove_cmd->add_option("name", remove_name, "Preset name")->required();
    remove_cmd->callback([&opts]() {
        std::exit(cmd_preset_remove(opts, remove_name));
    });
}

} // namespace fplaunch::cli::commands
