/**
 * fplaunch CLI - generate command
 *
 * Create, refresh and clean up wrapper scripts in the bin directory.
 */

#include "../common.hpp"
#include <fplaunch/wrapper.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace fplaunch::cli::commands {

namespace {

struct GenerateCmdOptions {
    std::vector<std::string> ids;
    std::string bin_dir;
    std::string launcher;
    bool emit = false;
    bool no_cleanup = false;
};

int cmd_generate(const GlobalOptions& opts, const GenerateCmdOptions& gen_opts) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    if (!gen_opts.bin_dir.empty()) {
        auto set = store->setBinDir(gen_opts.bin_dir);
        if (set.isErr()) {
            return fail(set.error(), opts.json);
        }
    }

    std::vector<std::string> ids = gen_opts.ids;
    if (ids.empty()) {
        auto installed = list_installed_packages();
        if (installed.isErr()) {
            return fail(installed.error(), opts.json);
        }
        ids = installed.value();
    }

    GenerateOptions options;
    options.launcher = gen_opts.launcher;
    if (options.launcher.empty()) {
        options.launcher = read_symlink("/proc/self/exe").value_or("fplaunch");
    }
    options.emit = gen_opts.emit;
    options.cleanup = !gen_opts.no_cleanup;

    WrapperGenerator generator(*store, options);
    auto report = generator.generate(ids);
    if (report.isErr()) {
        return fail(report.error(), opts.json);
    }
    const auto& r = report.value();

    for (const auto& skipped : r.skipped) {
        print_warning("skipped " + skipped, opts.json);
    }

    if (opts.json) {
        nlohmann::json j;
        j["bin_dir"] = store->binDir();
        j["emit"] = gen_opts.emit;
        j["created"] = r.created;
        j["updated"] = r.updated;
        j["unchanged"] = r.unchanged;
        j["removed"] = r.removed;
        j["skipped"] = r.skipped;
        output_json(j);
        return 0;
    }

    std::string prefix = gen_opts.emit ? "would " : "";
    for (const auto& name : r.created) std::cout << prefix << "create " << name << std::endl;
    for (const auto& name : r.updated) std::cout << prefix << "update " << name << std::endl;
    for (const auto& name : r.removed) std::cout << prefix << "remove " << name << std::endl;
    if (!opts.quiet) {
        std::cout << r.created.size() << " created, " << r.updated.size() << " updated, "
                  << r.unchanged.size() << " unchanged, " << r.removed.size() << " removed in "
                  << store->binDir() << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_generate(CLI::App* app, GlobalOptions& opts) {
    static GenerateCmdOptions gen_opts;

    app->add_option("ids", gen_opts.ids, "Application ids (default: flatpak list --app)");
    app->add_option("--bin-dir", gen_opts.bin_dir, "Store and use this wrapper directory");
    app->add_option("--launcher", gen_opts.launcher, "fplaunch binary the wrappers call");
    app->add_flag("--emit", gen_opts.emit, "Show what would change without writing");
    app->add_flag("--no-cleanup", gen_opts.no_cleanup, "Keep wrappers of uninstalled applications");

    app->callback([&opts]() {
        std::exit(cmd_generate(opts, gen_opts));
    });
}

} // namespace fplaunch::cli::commands
