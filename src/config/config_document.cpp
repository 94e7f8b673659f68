#include "fplaunch/config_document.hpp"
#include "fplaunch/safety.hpp"

#include <cctype>

namespace fplaunch {

namespace {

bool present(const nlohmann::json& j, const std::string& key) {
    return j.contains(key) && !j[key].is_null();
}

// Reads an optional string field; returns false if the field has the wrong type
bool read_string(const nlohmann::json& j, const std::string& key,
                 std::optional<std::string>& out, std::string& error) {
    if (!present(j, key)) return true;
    if (!j[key].is_string()) {
        error = key + " must be a string";
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

bool read_failure_mode(const nlohmann::json& j, const std::string& key,
                       std::optional<FailureMode>& out, std::string& error) {
    std::optional<std::string> raw;
    if (!read_string(j, key, raw, error)) return false;
    if (!raw) return true;
    auto mode = parse_failure_mode(*raw);
    if (!mode) {
        error = key + " has unknown value '" + *raw + "'";
        return false;
    }
    out = *mode;
    return true;
}

} // namespace

LayerParseResult parse_app_layer(const nlohmann::json& j) {
    LayerParseResult result;

    if (!j.is_object()) {
        result.error = "layer must be an object";
        return result;
    }

    std::optional<std::string> method;
    if (!read_string(j, "launch_method", method, result.error)) return result;
    if (method) {
        auto parsed = parse_launch_method(*method);
        if (!parsed) {
            result.error = "launch_method has unknown value '" + *method + "'";
            return result;
        }
        result.layer.launch_method = *parsed;
    }

    if (present(j, "custom_args")) {
        if (!j["custom_args"].is_array()) {
            result.error = "custom_args must be an array";
            return result;
        }
        std::vector<std::string> args;
        for (const auto& elem : j["custom_args"]) {
            if (!elem.is_string()) {
                result.error = "custom_args must contain only strings";
                return result;
            }
            args.push_back(elem.get<std::string>());
        }
        result.layer.custom_args = std::move(args);
    }

    if (present(j, "env_vars")) {
        if (!j["env_vars"].is_object()) {
            result.error = "env_vars must be an object";
            return result;
        }
        std::unordered_map<std::string, std::string> env;
        for (auto& [key, val] : j["env_vars"].items()) {
            if (!is_valid_env_name(key)) {
                result.error = "invalid environment variable name '" + key + "'";
                return result;
            }
            if (!val.is_string()) {
                result.error = "env_vars." + key + " must be a string";
                return result;
            }
            env[key] = val.get<std::string>();
        }
        result.layer.env_vars = std::move(env);
    }

    if (!read_string(j, "pre_launch_script", result.layer.pre_launch_script, result.error)) {
        return result;
    }
    if (!read_string(j, "post_launch_script", result.layer.post_launch_script, result.error)) {
        return result;
    }
    if (!read_failure_mode(j, "pre_launch_failure_mode",
                           result.layer.pre_launch_failure_mode, result.error)) {
        return result;
    }
    if (!read_failure_mode(j, "post_launch_failure_mode",
                           result.layer.post_launch_failure_mode, result.error)) {
        return result;
    }

    result.ok = true;
    return result;
}

nlohmann::json serialize_app_layer(const AppLayer& layer) {
    nlohmann::json j = nlohmann::json::object();
    if (layer.launch_method) {
        j["launch_method"] = launch_method_to_string(*layer.launch_method);
    }
    if (layer.custom_args) {
        j["custom_args"] = *layer.custom_args;
    }
    if (layer.env_vars) {
        nlohmann::json env = nlohmann::json::object();
        for (const auto& [key, value] : *layer.env_vars) {
            env[key] = value;
        }
        j["env_vars"] = env;
    }
    if (layer.pre_launch_script) {
        j["pre_launch_script"] = *layer.pre_launch_script;
    }
    if (layer.post_launch_script) {
        j["post_launch_script"] = *layer.post_launch_script;
    }
    if (layer.pre_launch_failure_mode) {
        j["pre_launch_failure_mode"] = failure_mode_to_string(*layer.pre_launch_failure_mode);
    }
    if (layer.post_launch_failure_mode) {
        j["post_launch_failure_mode"] = failure_mode_to_string(*layer.post_launch_failure_mode);
    }
    return j;
}

bool is_valid_env_name(const std::string& name) {
    if (name.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(name[0])) && name[0] != '_') return false;
    for (unsigned char c : name) {
        if (!std::isalnum(c) && c != '_') return false;
    }
    return true;
}

const std::vector<PermissionPreset>& builtin_presets() {
    static const std::vector<PermissionPreset> presets = {
        {"development", {"--filesystem=home", "--filesystem=host", "--device=dri",
                         "--socket=x11", "--socket=wayland", "--share=network",
                         "--share=ipc"}},
        {"gaming", {"--filesystem=home", "--device=dri", "--device=all",
                    "--socket=pulseaudio", "--socket=wayland", "--socket=x11",
                    "--share=network", "--share=ipc"}},
        {"media", {"--device=dri", "--device=all", "--socket=pulseaudio",
                   "--socket=wayland", "--socket=x11", "--share=ipc"}},
        {"network", {"--share=network", "--share=ipc", "--socket=wayland", "--socket=x11"}},
        {"minimal", {"--share=ipc"}},
        {"offline", {"--filesystem=home", "--device=dri", "--socket=wayland",
                     "--socket=x11", "--share=ipc"}},
    };
    return presets;
}

bool is_valid_permission_flag(const std::string& flag) {
    if (flag.size() < 3 || flag.compare(0, 2, "--") != 0) return false;
    for (unsigned char c : flag) {
        if (c < 0x20 || c == 0x7f) return false;
    }
    return true;
}

MigrationResult migrate_document(const nlohmann::json& document, DocumentKind kind) {
    MigrationResult result;

    if (!document.is_object()) {
        result.error = "document must be a JSON object";
        return result;
    }

    result.document = document;
    auto& doc = result.document;

    if (present(doc, "schema_version")) {
        if (!doc["schema_version"].is_number_integer()) {
            result.error = "schema_version must be an integer";
            return result;
        }
        int version = doc["schema_version"].get<int>();
        if (version > kSchemaVersion) {
            result.error = "schema_version " + std::to_string(version) +
                           " is newer than supported (" + std::to_string(kSchemaVersion) + ")";
            return result;
        }
        if (version < kSchemaVersion) {
            doc["schema_version"] = kSchemaVersion;
            result.changed = true;
        }
    } else {
        doc["schema_version"] = kSchemaVersion;
        result.changed = true;
    }

    auto ensure_object = [&](const char* key) {
        if (!doc.contains(key)) {
            doc[key] = nlohmann::json::object();
            result.changed = true;
        }
    };

    switch (kind) {
        case DocumentKind::Config:
            ensure_object("permission_presets");
            break;
        case DocumentKind::Profile:
            ensure_object("global_preferences");
            ensure_object("app_preferences");
            break;
    }

    result.ok = true;
    return result;
}

ProfileParseResult parse_profile_document(const std::string& json_str) {
    ProfileParseResult result;

    try {
        auto j = nlohmann::json::parse(json_str);

        auto migrated = migrate_document(j, DocumentKind::Profile);
        if (!migrated.ok) {
            result.error = migrated.error;
            return result;
        }
        result.raw = std::move(migrated.document);

        const auto& global = result.raw["global_preferences"];
        if (!global.is_null()) {
            auto parsed = parse_app_layer(global);
            if (parsed.ok) {
                result.profile.global = std::move(parsed.layer);
            } else {
                result.profile.global_error = parsed.error;
            }
        }

        const auto& apps = result.raw["app_preferences"];
        if (!apps.is_null() && !apps.is_object()) {
            result.error = "app_preferences must be an object";
            return result;
        }
        if (apps.is_object()) {
            for (auto& [name, block] : apps.items()) {
                auto parsed = parse_app_layer(block);
                if (parsed.ok) {
                    result.profile.apps[name] = std::move(parsed.layer);
                } else {
                    result.profile.app_errors[name] = parsed.error;
                }
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

Result<void> validate_profile_document(const ProfileDocument& profile,
                                       const std::string& home_dir) {
    auto check_scripts = [&](const AppLayer& layer, const std::string& scope) -> Result<void> {
        for (const auto* script : {&layer.pre_launch_script, &layer.post_launch_script}) {
            if (!*script || (*script)->empty()) continue;
            auto check = validate_path_within_home(**script, home_dir);
            if (!check.ok()) {
                return Result<void>::err(Error(ErrorCode::Validation,
                    scope + ": script " + printable_input(**script) + ": " + check.reason));
            }
        }
        return Result<void>::ok();
    };

    if (profile.global_error) {
        return Result<void>::err(Error(ErrorCode::Config,
                                       "global_preferences: " + *profile.global_error));
    }
    auto global = check_scripts(profile.global, "global_preferences");
    if (global.isErr()) return global;

    for (const auto& [name, error] : profile.app_errors) {
        return Result<void>::err(Error(ErrorCode::Config,
                                       "app_preferences." + name + ": " + error));
    }

    for (const auto& [name, layer] : profile.apps) {
        auto id_check = validate_identifier_format(name);
        if (!id_check.ok()) {
            return Result<void>::err(Error(ErrorCode::Validation,
                "app name " + printable_input(name) + ": " + id_check.reason));
        }
        auto scripts = check_scripts(layer, "app_preferences." + name);
        if (scripts.isErr()) return scripts;
    }

    return Result<void>::ok();
}

} // namespace fplaunch
