/**
 * fplaunch CLI - profile command
 *
 * Manage configuration profiles.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace fplaunch::cli::commands {

namespace {

int cmd_profile_list(const GlobalOptions& opts) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    auto profiles = store->listProfiles();
    const std::string& active = store->activeProfile();

    if (opts.json) {
        nlohmann::json j;
        j["profiles"] = profiles;
        j["active"] = active;
        output_json(j);
    } else {
        std::cout << "Available profiles:" << std::endl;
        for (const auto& p : profiles) {
            std::string marker = (p == active) ? " (active)" : "";
            std::cout << "  " << p << marker << std::endl;
        }
    }

    return 0;
}

int cmd_profile_show(const GlobalOptions& opts, const std::string& name) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    std::string profile_name = name.empty() ? store->activeProfile() : name;
    auto document = store->loadProfileDocument(profile_name);
    if (document.isErr()) {
        return fail(document.error(), opts.json);
    }

    if (opts.json) {
        nlohmann::json j = document.value().raw;
        j["name"] = profile_name;
        j["active"] = profile_name == store->activeProfile();
        output_json(j);
        return 0;
    }

    std::cout << "Profile: " << profile_name << std::endl;
    std::cout << document.value().raw.dump(2) << std::endl;

    const auto& profile = document.value().profile;
    if (profile.global_error) {
        print_warning("global_preferences ignored: " + *profile.global_error, opts.json);
    }
    for (const auto& [app, error] : profile.app_errors) {
        print_warning("app_preferences." + app + " ignored: " + error, opts.json);
    }
    return 0;
}

int cmd_profile_set(const GlobalOptions& opts, const std::string& name) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    auto result = store->setActiveProfile(name);
    if (result.isErr()) {
        return fail(result.error(), opts.json);
    }

    if (opts.json) {
        nlohmann::json j;
        j["active"] = name;
        output_json(j);
    } else {
        print_success("Active profile set to: " + name, opts.json);
    }
    return 0;
}

int cmd_profile_create(const GlobalOptions& opts, const std::string& name, const std::string& copy_from) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    auto result = store->createProfile(name, copy_from);
    if (result.isErr()) {
        return fail(result.error(), opts.json);
    }

    if (opts.json) {
        nlohmann::json j;
        j["created"] = name;
        output_json(j);
    } else {
        print_success("Created profile: " + name, opts.json);
    }
    return 0;
}

int cmd_profile_delete(const GlobalOptions& opts, const std::string& name) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    auto result = store->deleteProfile(name);
    if (result.isErr()) {
        return fail(result.error(), opts.json);
    }

    if (opts.json) {
        nlohmann::json j;
        j["deleted"] = name;
        output_json(j);
    } else {
        print_success("Deleted profile: " + name, opts.json);
    }
    return 0;
}

int cmd_profile_export(const GlobalOptions& opts, const std::string& name, const std::string& path) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    auto result = store->exportProfile(name, path);
    if (result.isErr()) {
        return fail(result.error(), opts.json);
    }

    print_success("Exported profile " + name + " to " + path, opts.json);
    if (opts.json) {
        nlohmann::json j;
        j["exported"] = name;
        j["path"] = path;
        output_json(j);
    }
    return 0;
}

int cmd_profile_import(const GlobalOptions& opts, const std::string& name, const std::string& path) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    auto result = store->importProfile(name, path);
    if (result.isErr()) {
        return fail(result.error(), opts.json);
    }

    print_success("Imported profile " + name + " from " + path, opts.json);
    if (opts.json) {
        nlohmann::json j;
        j["imported"] = name;
        output_json(j);
    }
    return 0;
}

} // anonymous namespace

void setup_profile(CLI::App* app, GlobalOptions& opts) {
    app->require_subcommand(1);

    // profile list
    auto* list_cmd = app->add_subcommand("list", "List available profiles");
    list_cmd->callback([&opts]() {
        std::exit(cmd_profile_list(opts));
    });

    // profile show [name]
    static std::string show_name;
    auto* show_cmd = app->add_subcommand("show", "Show a profile document");
    show_cmd->add_option("name", show_name, "Profile name (defaults to active)");
    show_cmd->callback([&opts]() {
        std::exit(cmd_profile_show(opts, show_name));
    });

    // profile set <name>
    static std::string set_name;
    auto* set_cmd = app->add_subcommand("set", "Set active profile");
    set_cmd->alias("switch");
    set_cmd->add_option("name", set_name, "Profile name")->required();
    set_cmd->callback([&opts]() {
        std::exit(cmd_profile_set(opts, set_name));
    });

    // profile create <name> [--copy-from other]
    static std::string create_name;
    static std::string create_from;
    auto* create_cmd = app->add_subcommand("create", "Create a profile");
    create_cmd->add_option("name", create_name, "Profile name")->required();
    create_cmd->add_option("--copy-from", create_from, "Start from a copy of this profile");
    create_cmd->callback([&opts]() {
        std::exit(cmd_profile_create(opts, create_name, create_from));
    });

    // profile delete <name>
    static std::string delete_name;
    auto* delete_cmd = app->add_subcommand("delete", "Delete a profile");
    delete_cmd->add_option("name", delete_name, "Profile name")->required();
    delete_cmd->callback([&opts]() {
        std::exit(cmd_profile_delete(opts, delete_name));
    });

    // profile export <name> <path>
    static std::string export_name;
    static std::string export_path;
    auto* export_cmd = app->add_subcommand("export", "Write a profile to a file");
    export_cmd->add_option("name", export_name, "Profile name")->required();
    export_cmd->add_option("path", export_path, "Destination file")->required();
    export_cmd->callback([&opts]() {
        std::exit(cmd_profile_export(opts, export_name, export_path));
    });

    // profile import <name> <path>
    static std::string import_name;
    static std::string import_path;
    auto* import_cmd = app->add_subcommand("import", "Create a profile from a file");
    import_cmd->add_option("name", import_name, "Profile name")->required();
    import_cmd->add_option("path", import_path, "Source file")->required();
    import_cmd->callback([&opts]() {
        std::exit(cmd_profile_import(opts, import_name, import_path));
    });
}

} // namespace fplaunch::cli::commands
