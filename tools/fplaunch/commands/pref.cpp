/**
 * fplaunch CLI - pref command
 *
 * Show or change the persisted system/package choice of an application.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace fplaunch::cli::commands {

namespace {

int cmd_pref_show(const GlobalOptions& opts, const std::string& app) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    auto pref = store->readPreference(app);
    if (pref.isErr()) {
        return fail(pref.error(), opts.json);
    }

    if (opts.json) {
        nlohmann::json j;
        j["app"] = app;
        j["preference"] = pref.value() ? nlohmann::json(target_kind_to_string(*pref.value()))
                                       : nlohmann::json(nullptr);
        output_json(j);
    } else if (pref.value()) {
        std::cout << target_kind_to_string(*pref.value()) << std::endl;
    } else {
        std::cout << "No saved preference for " << app << std::endl;
    }
    return 0;
}

int cmd_pref_set(const GlobalOptions& opts, const std::string& app, const std::string& value) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    auto kind = parse_target_kind(value);
    if (!kind) {
        print_error("preference must be 'system' or 'package'", opts.json);
        return 1;
    }

    auto result = store->writePreference(app, *kind);
    if (result.isErr()) {
        return fail(result.error(), opts.json);
    }

    if (opts.json) {
        nlohmann::json j;
        j["app"] = app;
        j["preference"] = target_kind_to_string(*kind);
        output_json(j);
    } else {
        print_success(app + " will launch the " + target_kind_to_string(*kind) + " target", opts.json);
    }
    return 0;
}

int cmd_pref_clear(const GlobalOptions& opts, const std::string& app) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    auto result = store->clearPreference(app);
    if (result.isErr()) {
        return fail(result.error(), opts.json);
    }

    if (opts.json) {
        nlohmann::json j;
        j["cleared"] = app;
        output_json(j);
    } else {
        print_success("Cleared preference for " + app, opts.json);
    }
    return 0;
}

} // anonymous namespace

void setup_pref(CLI::App* app, GlobalOptions& opts) {
    app->require_subcommand(1);

    static std::string show_app;
    auto* show_cmd = app->add_subcommand("show", "Print the saved choice");
    show_cmd->add_option("app", show_app, "Wrapper name")->required();
    show_cmd->callback([&opts]() {
        std::exit(cmd_pref_show(opts, show_app));
    });

    static std::string set_app;
    static std::string set_value;
    auto* set_cmd = app->add_subcommand("set", "Save a choice");
    set_cmd->add_option("app", set_app, "Wrapper name")->required();
    set_cmd->add_option("target", set_value, "system or package")
        ->required()
        ->check(CLI::IsMember({"system", "package", "flatpak"}));
    set_cmd->callback([&opts]() {
        std::exit(cmd_pref_set(opts, set_app, set_value));
    });

    static std::string clear_app;
    auto* clear_cmd = app->add_subcommand("clear", "Forget the saved choice");
    clear_cmd->add_option("app", clear_app, "Wrapper name")->required();
    clear_cmd->callback([&opts]() {
        std::exit(cmd_pref_clear(opts, clear_app));
    });
}

} // namespace fplaunch::cli::commands
