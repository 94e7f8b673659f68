/**
 * fplaunch CLI - alias command
 *
 * Manage alternative names for wrappers.
 */

#include "../common.hpp"
#include <fplaunch/alias_resolver.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace fplaunch::cli::commands {

namespace {

int cmd_alias_list(const GlobalOptions& opts) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    AliasResolver aliases(*store);
    auto records = aliases.records();

    if (opts.json) {
        nlohmann::json j;
        j["aliases"] = nlohmann::json::object();
        for (const auto& record : records) {
            j["aliases"][record.alias] = record.target;
        }
        output_json(j);
    } else if (records.empty()) {
        std::cout << "No aliases defined." << std::endl;
    } else {
        for (const auto& record : records) {
            std::cout << record.alias << " -> " << record.target << std::endl;
        }
    }
    return 0;
}

int cmd_alias_add(const GlobalOptions& opts, const std::string& alias, const std::string& target,
                  bool force) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    AliasResolver aliases(*store);
    auto result = aliases.createAlias(alias, target, force);
    if (result.isErr()) {
        return fail(result.error(), opts.json);
    }

    if (opts.json) {
        nlohmann::json j;
        j["alias"] = alias;
        j["target"] = target;
        output_json(j);
    } else {
        print_success("Created alias " + alias + " -> " + target, opts.json);
    }
    return 0;
}

int cmd_alias_remove(const GlobalOptions& opts, const std::string& alias) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    AliasResolver aliases(*store);
    auto result = aliases.removeAlias(alias);
    if (result.isErr()) {
        return fail(result.error(), opts.json);
    }

    if (opts.json) {
        nlohmann::json j;
        j["removed"] = alias;
        output_json(j);
    } else {
        print_success("Removed alias " + alias, opts.json);
    }
    return 0;
}

int cmd_alias_resolve(const GlobalOptions& opts, const std::string& name) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    AliasResolver aliases(*store);
    auto resolved = aliases.resolve(name);
    if (resolved.isErr()) {
        return fail(resolved.error(), opts.json);
    }

    if (opts.json) {
        nlohmann::json j;
        j["name"] = name;
        j["resolved"] = resolved.value();
        output_json(j);
    } else {
        std::cout << resolved.value() << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_alias(CLI::App* app, GlobalOptions& opts) {
    app->require_subcommand(1);

    auto* list_cmd = app->add_subcommand("list", "List aliases");
    list_cmd->callback([&opts]() {
        std::exit(cmd_alias_list(opts));
    });

    static std::string add_alias;
    static std::string add_target;
    static bool add_force = false;
    auto* add_cmd = app->add_subcommand("add", "Create an alias");
    add_cmd->add_option("alias", add_alias, "New name")->required();
    add_cmd->add_option("target", add_target, "Wrapper or alias it stands for")->required();
    add_cmd->add_flag("-f,--force", add_force, "Replace an existing alias or wrapper name");
    add_cmd->callback([&opts]() {
        std::exit(cmd_alias_add(opts, add_alias, add_target, add_force));
    });

    static std::string remove_alias;
    auto* remove_cmd = app->add_subcommand("remove", "Delete an alias");
    remove_cmd->add_option("alias", remove_alias, "Alias name")->required();
    remove_cmd->callback([&opts]() {
        std::exit(cmd_alias_remove(opts, remove_alias));
    });

    static std::string resolve_name;
    auto* resolve_cmd = app->add_subcommand("resolve", "Print the wrapper a name leads to");
    resolve_cmd->add_option("name", resolve_name, "Alias or wrapper name")->required();
    resolve_cmd->callback([&opts]() {
        std::exit(cmd_alias_resolve(opts, resolve_name));
    });
}

} // namespace fplaunch::cli::commands
