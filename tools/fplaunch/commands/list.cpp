/**
 * fplaunch CLI - list command
 *
 * Show the wrappers in the bin directory and the application each one runs.
 */

#include "../common.hpp"
#include <fplaunch/wrapper.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace fplaunch::cli::commands {

namespace {

struct ListCmdOptions {
    bool names_only = false;
};

int cmd_list(const GlobalOptions& opts, const ListCmdOptions& list_opts) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    WrapperGenerator generator(*store);
    auto wrappers = generator.list();

    if (opts.json) {
        nlohmann::json j;
        j["bin_dir"] = store->binDir();
        j["wrappers"] = nlohmann::json::array();
        for (const auto& w : wrappers) {
            j["wrappers"].push_back({{"name", w.name}, {"id", w.id}, {"path", w.path}});
        }
        output_json(j);
        return 0;
    }

    if (wrappers.empty()) {
        if (!opts.quiet) {
            std::cout << "No wrappers in " << store->binDir() << std::endl;
        }
        return 0;
    }

    for (const auto& w : wrappers) {
        if (list_opts.names_only) {
            std::cout << w.name << std::endl;
        } else {
            std::cout << w.name << " -> " << w.id << std::endl;
        }
    }
    return 0;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    static ListCmdOptions list_opts;

    app->add_flag("--names", list_opts.names_only, "Print wrapper names only");

    app->callback([&opts]() {
        std::exit(cmd_list(opts, list_opts));
    });
}

} // namespace fplaunch::cli::commands
