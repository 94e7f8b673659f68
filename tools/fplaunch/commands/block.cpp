/**
 * fplaunch CLI - block command
 *
 * Keep applications out of wrapper generation and launching.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace fplaunch::cli::commands {

namespace {

int cmd_block_list(const GlobalOptions& opts) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    auto blocked = store->loadBlocklist();
    if (opts.json) {
        nlohmann::json j;
        j["blocked"] = blocked;
        output_json(j);
    } else if (blocked.empty()) {
        std::cout << "Nothing is blocked." << std::endl;
    } else {
        for (const auto& id : blocked) {
            std::cout << id << std::endl;
        }
    }
    return 0;
}

int cmd_block_add(const GlobalOptions& opts, const std::string& id) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    auto result = store->block(id);
    if (result.isErr()) {
        return fail(result.error(), opts.json);
    }

    if (opts.json) {
        nlohmann::json j;
        j["blocked"] = id;
        output_json(j);
    } else {
        print_success("Blocked " + id, opts.json);
    }
    return 0;
}

int cmd_block_remove(const GlobalOptions& opts, const std::string& id) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    auto result = store->unblock(id);
    if (result.isErr()) {
        return fail(result.error(), opts.json);
    }

    if (opts.json) {
        nlohmann::json j;
        j["unblocked"] = id;
        output_json(j);
    } else {
        print_success("Unblocked " + id, opts.json);
    }
    return 0;
}

} // anonymous namespace

void setup_block(CLI::App* app, GlobalOptions& opts) {
    app->require_subcommand(1);

    auto* list_cmd = app->add_subcommand("list", "List blocked names and ids");
    list_cmd->callback([&opts]() {
        std::exit(cmd_block_list(opts));
    });

    static std::string add_id;
    auto* add_cmd = app->add_subcommand("add", "Block an application id or wrapper name");
    add_cmd->add_option("id", add_id, "Application id or wrapper name")->required();
    add_cmd->callback([&opts]() {
        std::exit(cmd_block_add(opts, add_id));
    });

    static std::string remove_id;
    auto* remove_cmd = app->add_subcommand("remove", "Unblock an application id or wrapper name");
    remove_cmd->add_option("id", remove_id, "Application id or wrapper name")->required();
    remove_cmd->callback([&opts]() {
        std::exit(cmd_block_remove(opts, remove_id));
    });
}

} // namespace fplaunch::cli::commands
