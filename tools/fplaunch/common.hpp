/**
 * fplaunch CLI - Common utilities and types
 */

#pragma once

#include <fplaunch/config_store.hpp>
#include <fplaunch/log.hpp>
#include <fplaunch/platform.hpp>
#include <fplaunch/types.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fplaunch::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config_dir;        // --config-dir
    bool json = false;             // --json
    int verbose = 0;               // -v, --verbose (repeatable)
    bool quiet = false;            // -q, --quiet
};

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_error(const Error& error, bool json_mode) {
    print_error(error.toString(), json_mode);
}

inline void print_warning(const std::string& msg, bool /* json_mode */) {
    get_warning_collector().add(msg);
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Per-command setup: warning collection and the stderr logger.
 */
inline void init_command(const GlobalOptions& opts) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = opts.json;
    collector.quiet = opts.quiet;

    init_logging(log_level_from(opts.verbose, opts.quiet, get_env("FPWRAPPER_DEBUG")));
}

/**
 * Open the configuration root.
 * Priority: --config-dir flag > FPLAUNCH_CONFIG_DIR > XDG_CONFIG_HOME > ~/.config
 */
inline std::unique_ptr<ConfigStore> open_store(const GlobalOptions& opts) {
    ConfigStoreOptions options;
    options.root = opts.config_dir;

    auto store = ConfigStore::open(options);
    if (store.isErr()) {
        print_error(store.error(), opts.json);
        return nullptr;
    }
    return std::move(store.value());
}

// Exit status for a failed operation
inline int exit_code_for(const Error& error) {
    switch (error.code()) {
        case ErrorCode::NotFound: return 127;
        case ErrorCode::LockContention: return 75;
        default: return 1;
    }
}

inline int fail(const Error& error, bool json_mode) {
    print_error(error, json_mode);
    return exit_code_for(error);
}

inline nlohmann::json settings_to_json(const ResolvedSettings& settings) {
    nlohmann::json j;
    j["app"] = settings.app;
    j["launch_method"] = launch_method_to_string(settings.launch_method);
    j["from_preference"] = settings.from_preference;
    j["custom_args"] = settings.custom_args;
    j["env_vars"] = nlohmann::json::object();
    for (const auto& [key, value] : settings.env) {
        j["env_vars"][key] = value;
    }
    j["pre_launch_script"] = settings.pre_launch_script ? nlohmann::json(*settings.pre_launch_script)
                                                        : nlohmann::json(nullptr);
    j["post_launch_script"] = settings.post_launch_script ? nlohmann::json(*settings.post_launch_script)
                                                          : nlohmann::json(nullptr);
    j["pre_launch_failure_mode"] = failure_mode_to_string(settings.pre_failure_mode);
    j["post_launch_failure_mode"] = failure_mode_to_string(settings.post_failure_mode);
    return j;
}

} // namespace fplaunch::cli
