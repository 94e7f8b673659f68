/**
 * fplaunch CLI - monitor command
 *
 * Watch the Flatpak installations and regenerate wrappers after changes.
 */

#include "../common.hpp"
#include <fplaunch/event_batcher.hpp>
#include <fplaunch/fs_watcher.hpp>
#include <fplaunch/wrapper.hpp>
#include <CLI/CLI.hpp>
#include <csignal>
#include <cstdlib>

namespace fplaunch::cli::commands {

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) {
    g_stop_requested = 1;
}

struct MonitorOptions {
    int window_ms = 1000;
    int cooldown_ms = 2000;
    std::string launcher;
};

int cmd_monitor(const GlobalOptions& opts, const MonitorOptions& mon_opts) {
    init_command(opts);

    auto store = open_store(opts);
    if (!store) {
        return 1;
    }

    GenerateOptions gen_options;
    gen_options.launcher = mon_opts.launcher;
    if (gen_options.launcher.empty()) {
        gen_options.launcher = read_symlink("/proc/self/exe").value_or("fplaunch");
    }

    // Runs on the batcher's worker thread; the main thread only pumps inotify
    auto regenerate = [&store, &gen_options](const EventBatch& batch) {
        spdlog::info("{} change(s) detected, regenerating wrappers", batch.size());
        auto installed = list_installed_packages();
        if (installed.isErr()) {
            spdlog::error("{}", installed.error().toString());
            return;
        }
        WrapperGenerator generator(*store, gen_options);
        auto report = generator.generate(installed.value());
        if (report.isErr()) {
            spdlog::error("{}", report.error().toString());
            return;
        }
        spdlog::info("{} created, {} updated, {} removed",
                     report.value().created.size(), report.value().updated.size(),
                     report.value().removed.size());
    };

    EventBatcher::Options batch_options;
    batch_options.window = std::chrono::milliseconds(mon_opts.window_ms);
    batch_options.cooldown = std::chrono::milliseconds(mon_opts.cooldown_ms);
    EventBatcher batcher(batch_options, regenerate);

    auto watcher = FsWatcher::create(default_watch_directories(store->home()), batcher);
    if (watcher.isErr()) {
        return fail(watcher.error(), opts.json);
    }

    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    if (!opts.quiet && !opts.json) {
        for (const auto& dir : watcher.value()->watched()) {
            std::cout << "Watching " << dir << std::endl;
        }
    }

    batcher.start();
    int status = 0;
    while (!g_stop_requested) {
        auto pumped = watcher.value()->pump(std::chrono::milliseconds(500));
        if (pumped.isErr()) {
            print_error(pumped.error(), opts.json);
            status = 1;
            break;
        }
    }
    batcher.stop();

    return status;
}

} // anonymous namespace

void setup_monitor(CLI::App* app, GlobalOptions& opts) {
    static MonitorOptions mon_opts;

    app->add_option("--window", mon_opts.window_ms, "Batching window in milliseconds")
        ->check(CLI::PositiveNumber);
    app->add_option("--cooldown", mon_opts.cooldown_ms, "Minimum milliseconds between regenerations")
        ->check(CLI::NonNegativeNumber);
    app->add_option("--launcher", mon_opts.launcher, "fplaunch binary the wrappers call");

    app->callback([&opts]() {
        std::exit(cmd_monitor(opts, mon_opts));
    });
}

} // namespace fplaunch::cli::commands
