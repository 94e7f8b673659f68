/**
 * fplaunch CLI - remove command
 *
 * Delete a wrapper together with its saved preference and aliases.
 */

#include "../common.hpp"
#include <fplaunch/wrapper.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace fplaunch::cli::commands {

namespace {

struct RemoveCmdOptions {
    std::string name;
};

int cmd_remove(const GlobalOptions& opts, const RemoveCmdOptions& rm_opts) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    WrapperGenerator generator(*store);
    auto removed = generator.remove(rm_opts.name);
    if (removed.isErr()) {
        return fail(removed.error(), opts.json);
    }
    const auto& w = removed.value();

    if (opts.json) {
        nlohmann::json j;
        j["removed"] = w.name;
        j["id"] = w.id;
        j["path"] = w.path;
        output_json(j);
        return 0;
    }

    if (!opts.quiet) {
        std::cout << "Removed " << w.name << " (" << w.id << ")" << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_remove(CLI::App* app, GlobalOptions& opts) {
    static RemoveCmdOptions rm_opts;

    app->add_option("name", rm_opts.name, "Wrapper name")->required();

    app->callback([&opts]() {
        std::exit(cmd_remove(opts, rm_opts));
    });
}

} // namespace fplaunch::cli::commands
