#include "fplaunch/config_store.hpp"
#include "fplaunch/platform.hpp"
#include "fplaunch/safety.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <spdlog/spdlog.h>

namespace fplaunch {

namespace {

constexpr char kProfileSuffix[] = ".json";
constexpr char kLinkPrefix[] = "profiles/";

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Error validation_error(const std::string& what, const std::string& input,
                       const SafetyCheck& check) {
    return Error(ErrorCode::Validation,
                 what + " " + printable_input(input) + ": " + check.reason);
}

// App names double as file names under prefs/ and the wrapper directory
Result<void> check_app_name(const std::string& app) {
    auto id_check = validate_identifier_format(app);
    if (!id_check.ok()) {
        return Result<void>::err(validation_error("app name", app, id_check));
    }
    auto name_check = validate_name_component(app);
    if (!name_check.ok()) {
        return Result<void>::err(validation_error("app name", app, name_check));
    }
    return Result<void>::ok();
}

Result<void> check_profile_name(const std::string& name) {
    auto check = validate_name_component(name);
    if (!check.ok()) {
        return Result<void>::err(validation_error("profile name", name, check));
    }
    return Result<void>::ok();
}

Result<void> write_document(const std::string& path, const nlohmann::json& doc) {
    auto written = atomic_write_file(path, doc.dump(2) + "\n");
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::Io, path + ": " + written.error));
    }
    return Result<void>::ok();
}

nlohmann::json empty_profile_document() {
    nlohmann::json doc;
    doc["schema_version"] = kSchemaVersion;
    doc["global_preferences"] = nlohmann::json::object();
    doc["app_preferences"] = nlohmann::json::object();
    return doc;
}

nlohmann::json default_config_document(const std::string& home) {
    nlohmann::json doc;
    doc["schema_version"] = kSchemaVersion;
    doc["bin_dir"] = join_path(home, "bin");
    nlohmann::json presets = nlohmann::json::object();
    for (const auto& preset : builtin_presets()) {
        presets[preset.name] = {{"permissions", preset.permissions}};
    }
    doc["permission_presets"] = presets;
    return doc;
}

void apply_layer(ResolvedSettings& settings, const AppLayer& layer, bool app_level) {
    if (layer.launch_method) {
        settings.launch_method = *layer.launch_method;
    }
    if (layer.custom_args) {
        settings.custom_args = *layer.custom_args;
    }
    if (layer.env_vars) {
        for (const auto& [key, value] : *layer.env_vars) {
            settings.env[key] = value;
        }
    }
    // An explicit empty script path removes a hook set by a lower layer
    if (layer.pre_launch_script) {
        settings.pre_launch_script = layer.pre_launch_script->empty()
            ? std::nullopt : layer.pre_launch_script;
    }
    if (layer.post_launch_script) {
        settings.post_launch_script = layer.post_launch_script->empty()
            ? std::nullopt : layer.post_launch_script;
    }

    auto& pre_level = app_level ? settings.pre_chain.app_config : settings.pre_chain.global_default;
    auto& post_level = app_level ? settings.post_chain.app_config : settings.post_chain.global_default;
    if (layer.pre_launch_failure_mode) pre_level = layer.pre_launch_failure_mode;
    if (layer.post_launch_failure_mode) post_level = layer.post_launch_failure_mode;
}

std::optional<std::string> profile_name_from_link(const std::string& target) {
    std::string prefix = kLinkPrefix;
    if (target.compare(0, prefix.size(), prefix) != 0 || !ends_with(target, kProfileSuffix)) {
        return std::nullopt;
    }
    std::string name = target.substr(prefix.size(),
                                     target.size() - prefix.size() - std::string(kProfileSuffix).size());
    if (!validate_name_component(name).ok()) return std::nullopt;
    return name;
}

} // namespace

std::string default_config_root() {
    auto explicit_root = get_env("FPLAUNCH_CONFIG_DIR");
    if (explicit_root && !explicit_root->empty()) {
        return *explicit_root;
    }
    auto xdg = get_env("XDG_CONFIG_HOME");
    if (xdg && !xdg->empty()) {
        return join_path(*xdg, "fplaunchwrapper");
    }
    std::string home = get_home_directory();
    if (home.empty()) return "";
    return join_path(join_path(home, ".config"), "fplaunchwrapper");
}

std::optional<LayerRef> parse_layer_ref(const std::string& s) {
    LayerRef ref;
    if (s == "global") {
        ref.kind = LayerKind::Global;
        return ref;
    }
    auto colon = s.find(':');
    if (colon == std::string::npos || colon + 1 >= s.size()) {
        return std::nullopt;
    }
    std::string kind = s.substr(0, colon);
    ref.app = s.substr(colon + 1);
    if (kind == "app") {
        ref.kind = LayerKind::App;
    } else if (kind == "pref") {
        ref.kind = LayerKind::Preference;
    } else {
        return std::nullopt;
    }
    return ref;
}

ResolvedSettings merge_layers(const std::string& app,
                              const AppLayer* global,
                              const AppLayer* app_layer,
                              std::optional<TargetKind> preference) {
    ResolvedSettings settings;
    settings.app = app;

    if (global) apply_layer(settings, *global, false);
    if (app_layer) apply_layer(settings, *app_layer, true);

    if (preference) {
        settings.launch_method = *preference == TargetKind::System
            ? LaunchMethod::System : LaunchMethod::Package;
        settings.from_preference = true;
    }

    settings.pre_failure_mode = settings.pre_chain.resolve();
    settings.post_failure_mode = settings.post_chain.resolve();
    return settings;
}

// ============================================================================
// Setup
// ============================================================================

Result<std::unique_ptr<ConfigStore>> ConfigStore::open(const ConfigStoreOptions& options) {
    using R = Result<std::unique_ptr<ConfigStore>>;

    std::string home = options.home_dir.empty() ? get_home_directory() : options.home_dir;
    if (home.empty()) {
        return R::err(Error(ErrorCode::Config, "cannot determine the home directory"));
    }
    std::string root = options.root.empty() ? default_config_root() : options.root;
    if (root.empty()) {
        return R::err(Error(ErrorCode::Config, "cannot determine the configuration directory"));
    }

    std::unique_ptr<ConfigStore> store(new ConfigStore(root, home));
    auto init = store->initialize();
    if (init.isErr()) {
        return R::err(init.error());
    }
    return R::ok(std::move(store));
}

Result<void> ConfigStore::initialize() {
    for (const char* sub : {"", "profiles", "prefs", "locks"}) {
        std::string dir = *sub ? join_path(root_, sub) : root_;
        if (!create_directories(dir)) {
            return Result<void>::err(Error(ErrorCode::Io, "cannot create directory: " + dir));
        }
    }

    bool need_config = !path_exists(configPath());
    bool config_changed = false;
    if (need_config) {
        config_ = default_config_document(home_);
    } else {
        auto content = read_file(configPath());
        MigrationResult migrated;
        try {
            migrated = migrate_document(nlohmann::json::parse(content.value_or("")),
                                        DocumentKind::Config);
        } catch (const nlohmann::json::exception& e) {
            migrated.error = std::string("parse error: ") + e.what();
        }
        if (migrated.ok) {
            config_ = std::move(migrated.document);
            config_changed = migrated.changed;
        } else {
            spdlog::warn("ignoring {}: {}", configPath(), migrated.error);
            config_ = default_config_document(home_);
        }
    }

    bool need_default = !path_exists(profilePath("default"));

    std::vector<std::pair<std::string, nlohmann::json>> migrated_profiles;
    for (const auto& name : listProfiles()) {
        auto content = read_file(profilePath(name));
        if (!content) continue;
        try {
            auto migrated = migrate_document(nlohmann::json::parse(*content), DocumentKind::Profile);
            if (migrated.ok && migrated.changed) {
                migrated_profiles.emplace_back(name, std::move(migrated.document));
            } else if (!migrated.ok) {
                spdlog::warn("profile '{}' left unmigrated: {}", name, migrated.error);
            }
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("profile '{}' is not valid JSON: {}", name, e.what());
        }
    }

    std::string link_path = join_path(root_, "profile.current");
    bool need_link = true;
    if (auto target = read_symlink(link_path)) {
        auto name = profile_name_from_link(*target);
        if (name && path_exists(profilePath(*name))) {
            active_profile_ = *name;
            need_link = false;
        }
    }

    if (!need_config && !config_changed && !need_default &&
        migrated_profiles.empty() && !need_link) {
        return Result<void>::ok();
    }

    auto guard = lock();
    if (guard.isErr()) {
        // Another process is mutating the root; it will finish the setup
        spdlog::debug("skipping first-run setup: {}", guard.error().message());
        return Result<void>::ok();
    }

    if (need_config && !path_exists(configPath())) {
        auto written = write_document(configPath(), config_);
        if (written.isErr()) return written;
    } else if (config_changed) {
        auto written = write_document(configPath(), config_);
        if (written.isErr()) return written;
        spdlog::info("migrated {} to schema version {}", configPath(), kSchemaVersion);
    }

    if (need_default && !path_exists(profilePath("default"))) {
        auto written = write_document(profilePath("default"), empty_profile_document());
        if (written.isErr()) return written;
    }

    for (const auto& [name, doc] : migrated_profiles) {
        auto written = write_document(profilePath(name), doc);
        if (written.isErr()) return written;
        spdlog::info("migrated profile '{}' to schema version {}", name, kSchemaVersion);
    }

    if (need_link) {
        auto linked = atomic_update_symlink(link_path, std::string(kLinkPrefix) + "default.json");
        if (!linked.ok) {
            return Result<void>::err(Error(ErrorCode::Io, linked.error));
        }
        active_profile_ = "default";
    }

    return Result<void>::ok();
}

std::string ConfigStore::lockDir() const {
    return join_path(root_, "locks");
}

Result<std::unique_ptr<DirLock>> ConfigStore::lock() const {
    return DirLock::acquire(lockDir(), "config");
}

std::string ConfigStore::configPath() const {
    return join_path(root_, "config.json");
}

std::string ConfigStore::profilePath(const std::string& name) const {
    return join_path(join_path(root_, "profiles"), name + kProfileSuffix);
}

std::string ConfigStore::preferencePath(const std::string& app) const {
    return join_path(join_path(root_, "prefs"), app + ".pref");
}

Result<nlohmann::json> ConfigStore::readConfigDocument() const {
    using R = Result<nlohmann::json>;

    auto content = read_file(configPath());
    if (!content) {
        return R::ok(default_config_document(home_));
    }
    try {
        auto migrated = migrate_document(nlohmann::json::parse(*content), DocumentKind::Config);
        if (!migrated.ok) {
            return R::err(Error(ErrorCode::Config, configPath() + ": " + migrated.error));
        }
        return R::ok(std::move(migrated.document));
    } catch (const nlohmann::json::exception& e) {
        return R::err(Error(ErrorCode::Config, configPath() + ": " + e.what()));
    }
}

Result<void> ConfigStore::writeConfigDocument(const nlohmann::json& config) {
    auto written = write_document(configPath(), config);
    if (written.isOk()) {
        config_ = config;
    }
    return written;
}

Result<std::string> ConfigStore::validateStoredScript(const std::string& path) const {
    using R = Result<std::string>;

    auto within = validate_path_within_home(path, home_);
    if (!within.ok()) {
        return R::err(validation_error("script", path, within));
    }
    // Checked before resolution so a symlinked script is rejected
    if (path_exists(within.expanded)) {
        auto candidate = validate_executable_candidate(within.expanded);
        if (!candidate.ok()) {
            return R::err(validation_error("script", path, candidate));
        }
    }
    return R::ok(within.canonical);
}

// ============================================================================
// Resolution
// ============================================================================

Result<ResolvedSettings> ConfigStore::resolve(const std::string& app,
                                              const std::string& profile) const {
    using R = Result<ResolvedSettings>;

    auto name_ok = check_app_name(app);
    if (name_ok.isErr()) {
        return R::err(name_ok.error());
    }

    std::string profile_name = profile.empty() ? active_profile_ : profile;
    std::vector<std::string> warnings;
    auto skip = [&](const std::string& message) {
        spdlog::warn("{}; using lower-precedence settings", message);
        warnings.push_back(message);
    };

    const AppLayer* global = nullptr;
    const AppLayer* app_layer = nullptr;

    auto doc = loadProfileDocument(profile_name);
    if (doc.isErr()) {
        skip(doc.error().message());
    } else {
        const auto& parsed = doc.value().profile;
        if (parsed.global_error) {
            skip("profile '" + profile_name + "' global_preferences: " + *parsed.global_error);
        } else {
            global = &parsed.global;
        }
        auto bad = parsed.app_errors.find(app);
        if (bad != parsed.app_errors.end()) {
            skip("profile '" + profile_name + "' app_preferences." + app + ": " + bad->second);
        }
        auto it = parsed.apps.find(app);
        if (it != parsed.apps.end()) {
            app_layer = &it->second;
        }
    }

    std::optional<TargetKind> preference;
    auto pref = readPreference(app);
    if (pref.isErr()) {
        skip(pref.error().message());
    } else {
        preference = pref.value();
    }

    auto settings = merge_layers(app, global, app_layer, preference);
    settings.warnings = std::move(warnings);

    for (auto* script : {&settings.pre_launch_script, &settings.post_launch_script}) {
        if (!*script) continue;
        auto checked = validateStoredScript(**script);
        if (checked.isErr()) {
            return R::err(checked.error().withContext(app));
        }
        *script = checked.value();
    }

    return R::ok(std::move(settings));
}

Result<std::map<std::string, ResolvedSettings>> ConfigStore::load(const std::string& profile) const {
    using R = Result<std::map<std::string, ResolvedSettings>>;

    std::string profile_name = profile.empty() ? active_profile_ : profile;
    auto doc = loadProfileDocument(profile_name);
    if (doc.isErr()) {
        return R::err(doc.error());
    }

    std::vector<std::string> apps;
    for (const auto& [name, layer] : doc.value().profile.apps) apps.push_back(name);
    for (const auto& [name, error] : doc.value().profile.app_errors) apps.push_back(name);

    std::map<std::string, ResolvedSettings> result;
    for (const auto& app : apps) {
        auto settings = resolve(app, profile_name);
        if (settings.isErr()) {
            return R::err(settings.error());
        }
        result[app] = std::move(settings.value());
    }
    return R::ok(std::move(result));
}

Result<void> ConfigStore::save(const LayerRef& layer, const std::string& key,
                               const std::string& value) {
    if (layer.kind != LayerKind::Global) {
        auto name_ok = check_app_name(layer.app);
        if (name_ok.isErr()) return name_ok;
    }

    bool unset = value.empty();

    if (layer.kind == LayerKind::Preference) {
        if (key != "launch_method") {
            return Result<void>::err(Error(ErrorCode::Validation,
                "preference records only hold launch_method"));
        }
        if (unset) return clearPreference(layer.app);
        auto kind = parse_target_kind(value);
        if (!kind) {
            return Result<void>::err(Error(ErrorCode::Validation,
                "preference must be system or package, got " + printable_input(value)));
        }
        return writePreference(layer.app, *kind);
    }

    // Validate the new value before touching anything on disk
    std::string field = key;
    std::string env_name;
    nlohmann::json field_value;

    if (key == "launch_method") {
        if (!unset) {
            auto method = parse_launch_method(value);
            if (!method) {
                return Result<void>::err(Error(ErrorCode::Validation,
                    "launch_method must be auto, system or package, got " + printable_input(value)));
            }
            field_value = launch_method_to_string(*method);
        }
    } else if (key == "custom_args") {
        if (!unset) {
            if (value[0] == '[') {
                try {
                    auto parsed = nlohmann::json::parse(value);
                    nlohmann::json wrapped = {{"custom_args", parsed}};
                    auto layer_check = parse_app_layer(wrapped);
                    if (!layer_check.ok) {
                        return Result<void>::err(Error(ErrorCode::Validation, layer_check.error));
                    }
                    field_value = parsed;
                } catch (const nlohmann::json::exception& e) {
                    return Result<void>::err(Error(ErrorCode::Validation,
                        std::string("custom_args: ") + e.what()));
                }
            } else {
                field_value = nlohmann::json::array({value});
            }
        }
    } else if (key.compare(0, 4, "env.") == 0) {
        env_name = key.substr(4);
        if (!is_valid_env_name(env_name)) {
            return Result<void>::err(Error(ErrorCode::Validation,
                "invalid environment variable name " + printable_input(env_name)));
        }
        field = "env_vars";
        field_value = value;
    } else if (key == "pre_launch_script" || key == "post_launch_script") {
        if (!unset) {
            auto checked = validateStoredScript(value);
            if (checked.isErr()) {
                return Result<void>::err(checked.error());
            }
            field_value = value;
        }
    } else if (key == "pre_launch_failure_mode" || key == "post_launch_failure_mode") {
        if (!unset) {
            auto mode = parse_failure_mode(value);
            if (!mode) {
                return Result<void>::err(Error(ErrorCode::Validation,
                    key + " must be abort, warn or ignore, got " + printable_input(value)));
            }
            field_value = failure_mode_to_string(*mode);
        }
    } else {
        return Result<void>::err(Error(ErrorCode::Validation, "unknown key " + printable_input(key)));
    }

    auto guard = lock();
    if (guard.isErr()) {
        return Result<void>::err(guard.error());
    }

    auto doc = loadProfileDocument(active_profile_);
    if (doc.isErr()) {
        return Result<void>::err(doc.error());
    }
    auto& raw = doc.value().raw;

    nlohmann::json& block = layer.kind == LayerKind::Global
        ? raw["global_preferences"]
        : raw["app_preferences"][layer.app];
    if (block.is_null()) {
        block = nlohmann::json::object();
    }
    if (!block.is_object()) {
        return Result<void>::err(Error(ErrorCode::Config,
            "cannot update a malformed layer in profile '" + active_profile_ + "'"));
    }

    if (!env_name.empty()) {
        auto& env = block["env_vars"];
        if (env.is_null()) env = nlohmann::json::object();
        if (!env.is_object()) {
            return Result<void>::err(Error(ErrorCode::Config, "env_vars is not an object"));
        }
        if (unset) {
            env.erase(env_name);
            if (env.empty()) block.erase("env_vars");
        } else {
            env[env_name] = field_value;
        }
    } else if (unset) {
        block.erase(field);
    } else {
        block[field] = field_value;
    }

    if (layer.kind == LayerKind::App && block.empty()) {
        raw["app_preferences"].erase(layer.app);
    }

    return write_document(profilePath(active_profile_), raw);
}

// ============================================================================
// Profiles
// ============================================================================

std::vector<std::string> ConfigStore::listProfiles() const {
    std::vector<std::string> profiles;
    for (const auto& entry : list_directory(join_path(root_, "profiles"))) {
        if (!ends_with(entry, kProfileSuffix)) continue;
        std::string name = entry.substr(0, entry.size() - std::string(kProfileSuffix).size());
        if (!name.empty() && is_regular_file(profilePath(name))) {
            profiles.push_back(name);
        }
    }
    return profiles;
}

Result<ProfileParseResult> ConfigStore::loadProfileDocument(const std::string& name) const {
    using R = Result<ProfileParseResult>;

    auto name_ok = check_profile_name(name);
    if (name_ok.isErr()) {
        return R::err(name_ok.error());
    }

    auto content = read_file(profilePath(name));
    if (!content) {
        return R::err(Error(ErrorCode::NotFound, "profile not found: " + name));
    }

    auto parsed = parse_profile_document(*content);
    if (!parsed.ok) {
        return R::err(Error(ErrorCode::Config, "profile '" + name + "': " + parsed.error));
    }
    return R::ok(std::move(parsed));
}

Result<void> ConfigStore::setActiveProfile(const std::string& name) {
    auto doc = loadProfileDocument(name);
    if (doc.isErr()) {
        return Result<void>::err(doc.error());
    }
    auto valid = validate_profile_document(doc.value().profile, home_);
    if (valid.isErr()) {
        return Result<void>::err(valid.error().withContext("profile '" + name + "'"));
    }

    auto guard = lock();
    if (guard.isErr()) {
        return Result<void>::err(guard.error());
    }

    auto linked = atomic_update_symlink(join_path(root_, "profile.current"),
                                        std::string(kLinkPrefix) + name + kProfileSuffix);
    if (!linked.ok) {
        return Result<void>::err(Error(ErrorCode::Io, linked.error));
    }

    active_profile_ = name;
    return Result<void>::ok();
}

Result<void> ConfigStore::createProfile(const std::string& name, const std::string& copy_from) {
    auto name_ok = check_profile_name(name);
    if (name_ok.isErr()) return name_ok;

    nlohmann::json doc = empty_profile_document();
    if (!copy_from.empty()) {
        auto source = loadProfileDocument(copy_from);
        if (source.isErr()) {
            return Result<void>::err(source.error());
        }
        doc = source.value().raw;
    }

    auto guard = lock();
    if (guard.isErr()) {
        return Result<void>::err(guard.error());
    }
    if (path_exists(profilePath(name))) {
        return Result<void>::err(Error(ErrorCode::Config, "profile already exists: " + name));
    }
    return write_document(profilePath(name), doc);
}

Result<void> ConfigStore::deleteProfile(const std::string& name) {
    auto name_ok = check_profile_name(name);
    if (name_ok.isErr()) return name_ok;

    if (name == "default") {
        return Result<void>::err(Error(ErrorCode::Validation,
                                       "the default profile cannot be deleted"));
    }
    if (name == active_profile_) {
        return Result<void>::err(Error(ErrorCode::Validation,
                                       "cannot delete the active profile: " + name));
    }

    auto guard = lock();
    if (guard.isErr()) {
        return Result<void>::err(guard.error());
    }
    if (!path_exists(profilePath(name))) {
        return Result<void>::err(Error(ErrorCode::NotFound, "profile not found: " + name));
    }
    if (!remove_file(profilePath(name))) {
        return Result<void>::err(Error(ErrorCode::Io, "cannot remove " + profilePath(name)));
    }
    return Result<void>::ok();
}

Result<void> ConfigStore::exportProfile(const std::string& name, const std::string& dest_path) const {
    auto doc = loadProfileDocument(name);
    if (doc.isErr()) {
        return Result<void>::err(doc.error());
    }

    auto dest = validate_path_within_home(dest_path, home_);
    if (!dest.ok()) {
        return Result<void>::err(validation_error("export destination", dest_path, dest));
    }
    return write_document(dest.canonical, doc.value().raw);
}

Result<void> ConfigStore::importProfile(const std::string& name, const std::string& src_path) {
    auto name_ok = check_profile_name(name);
    if (name_ok.isErr()) return name_ok;

    auto content = read_file(src_path);
    if (!content) {
        return Result<void>::err(Error(ErrorCode::NotFound, "cannot read " + src_path));
    }

    auto parsed = parse_profile_document(*content);
    if (!parsed.ok) {
        return Result<void>::err(Error(ErrorCode::Config, src_path + ": " + parsed.error));
    }
    auto valid = validate_profile_document(parsed.profile, home_);
    if (valid.isErr()) {
        return Result<void>::err(valid.error().withContext("import " + name));
    }

    auto guard = lock();
    if (guard.isErr()) {
        return Result<void>::err(guard.error());
    }
    if (path_exists(profilePath(name))) {
        return Result<void>::err(Error(ErrorCode::Config, "profile already exists: " + name));
    }
    return write_document(profilePath(name), parsed.raw);
}

// ============================================================================
// Preferences
// ============================================================================

Result<std::optional<TargetKind>> ConfigStore::readPreference(const std::string& app) const {
    using R = Result<std::optional<TargetKind>>;

    auto name_ok = check_app_name(app);
    if (name_ok.isErr()) {
        return R::err(name_ok.error());
    }

    auto content = read_file(preferencePath(app));
    if (!content) {
        return R::ok(std::nullopt);
    }
    auto kind = parse_target_kind(trim(*content));
    if (!kind) {
        return R::err(Error(ErrorCode::Config, "invalid preference record for " + app));
    }
    return R::ok(kind);
}

Result<void> ConfigStore::writePreference(const std::string& app, TargetKind kind) {
    auto name_ok = check_app_name(app);
    if (name_ok.isErr()) return name_ok;

    auto guard = lock();
    if (guard.isErr()) {
        return Result<void>::err(guard.error());
    }

    auto written = atomic_write_file(preferencePath(app),
                                     std::string(target_kind_to_string(kind)) + "\n");
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::Io, written.error));
    }
    return Result<void>::ok();
}

Result<void> ConfigStore::clearPreference(const std::string& app) {
    auto name_ok = check_app_name(app);
    if (name_ok.isErr()) return name_ok;

    auto guard = lock();
    if (guard.isErr()) {
        return Result<void>::err(guard.error());
    }
    remove_file(preferencePath(app));
    return Result<void>::ok();
}

// ============================================================================
// Permission presets
// ============================================================================

std::vector<PermissionPreset> ConfigStore::listPresets() const {
    std::vector<PermissionPreset> presets;
    if (!config_.contains("permission_presets") || !config_["permission_presets"].is_object()) {
        return presets;
    }

    for (auto& [name, val] : config_["permission_presets"].items()) {
        if (!val.is_object() || !val.contains("permissions") || !val["permissions"].is_array()) {
            spdlog::warn("ignoring malformed permission preset '{}'", name);
            continue;
        }
        PermissionPreset preset;
        preset.name = name;
        for (const auto& flag : val["permissions"]) {
            if (flag.is_string()) {
                preset.permissions.push_back(flag.get<std::string>());
            }
        }
        presets.push_back(std::move(preset));
    }

    std::sort(presets.begin(), presets.end(),
              [](const PermissionPreset& a, const PermissionPreset& b) { return a.name < b.name; });
    return presets;
}

Result<PermissionPreset> ConfigStore::getPreset(const std::string& name) const {
    for (auto& preset : listPresets()) {
        if (preset.name == name) {
            return Result<PermissionPreset>::ok(std::move(preset));
        }
    }
    return Result<PermissionPreset>::err(Error(ErrorCode::NotFound, "preset not found: " + name));
}

Result<void> ConfigStore::putPreset(const std::string& name,
                                    const std::vector<std::string>& permissions) {
    auto check = validate_name_component(name);
    if (!check.ok()) {
        return Result<void>::err(validation_error("preset name", name, check));
    }
    if (permissions.empty()) {
        return Result<void>::err(Error(ErrorCode::Validation, "preset needs at least one permission"));
    }
    for (const auto& flag : permissions) {
        if (!is_valid_permission_flag(flag)) {
            return Result<void>::err(Error(ErrorCode::Validation,
                                           "invalid permission flag " + printable_input(flag)));
        }
    }

    auto guard = lock();
    if (guard.isErr()) {
        return Result<void>::err(guard.error());
    }
    auto doc = readConfigDocument();
    if (doc.isErr()) {
        return Result<void>::err(doc.error());
    }
    auto& config = doc.value();
    if (!config["permission_presets"].is_object()) {
        return Result<void>::err(Error(ErrorCode::Config, "permission_presets is not an object"));
    }
    config["permission_presets"][name] = {{"permissions", permissions}};
    return writeConfigDocument(config);
}

Result<void> ConfigStore::removePreset(const std::string& name) {
    auto guard = lock();
    if (guard.isErr()) {
        return Result<void>::err(guard.error());
    }
    auto doc = readConfigDocument();
    if (doc.isErr()) {
        return Result<void>::err(doc.error());
    }
    auto& config = doc.value();
    if (!config["permission_presets"].is_object() || !config["permission_presets"].contains(name)) {
        return Result<void>::err(Error(ErrorCode::NotFound, "preset not found: " + name));
    }
    config["permission_presets"].erase(name);
    return writeConfigDocument(config);
}

// ============================================================================
// Aliases and block list
// ============================================================================

std::vector<AliasRecord> ConfigStore::loadAliases() const {
    std::vector<AliasRecord> records;
    for (const auto& line : read_lines(join_path(root_, "aliases"))) {
        std::istringstream in(line);
        AliasRecord record;
        std::string extra;
        if (!(in >> record.alias >> record.target) || (in >> extra)) {
            spdlog::warn("ignoring malformed alias record {}", printable_input(line));
            continue;
        }
        records.push_back(std::move(record));
    }
    return records;
}

Result<void> ConfigStore::saveAliases(const std::vector<AliasRecord>& records) {
    std::string content;
    for (const auto& record : records) {
        content += record.alias + " " + record.target + "\n";
    }
    auto written = atomic_write_file(join_path(root_, "aliases"), content);
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::Io, written.error));
    }
    return Result<void>::ok();
}

std::vector<std::string> ConfigStore::loadBlocklist() const {
    return read_lines(join_path(root_, "blocklist"));
}

Result<void> ConfigStore::block(const std::string& id) {
    auto check = validate_identifier_format(id);
    if (!check.ok()) {
        return Result<void>::err(validation_error("identifier", id, check));
    }
    if (id.find_first_of(" \t#") != std::string::npos) {
        return Result<void>::err(Error(ErrorCode::Validation,
                                       "identifier " + printable_input(id) + " cannot be stored"));
    }

    auto guard = lock();
    if (guard.isErr()) {
        return Result<void>::err(guard.error());
    }

    auto entries = loadBlocklist();
    if (std::find(entries.begin(), entries.end(), id) != entries.end()) {
        return Result<void>::ok();
    }
    entries.push_back(id);

    std::string content;
    for (const auto& entry : entries) content += entry + "\n";
    auto written = atomic_write_file(join_path(root_, "blocklist"), content);
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::Io, written.error));
    }
    return Result<void>::ok();
}

Result<void> ConfigStore::unblock(const std::string& id) {
    auto guard = lock();
    if (guard.isErr()) {
        return Result<void>::err(guard.error());
    }

    auto entries = loadBlocklist();
    auto it = std::find(entries.begin(), entries.end(), id);
    if (it == entries.end()) {
        return Result<void>::err(Error(ErrorCode::NotFound, "not blocked: " + printable_input(id)));
    }
    entries.erase(it);

    std::string content;
    for (const auto& entry : entries) content += entry + "\n";
    auto written = atomic_write_file(join_path(root_, "blocklist"), content);
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::Io, written.error));
    }
    return Result<void>::ok();
}

// ============================================================================
// Wrapper directory
// ============================================================================

std::string ConfigStore::binDir() const {
    if (config_.contains("bin_dir") && config_["bin_dir"].is_string()) {
        std::string dir = config_["bin_dir"].get<std::string>();
        if (dir == "~") return home_;
        if (dir.compare(0, 2, "~/") == 0) return join_path(home_, dir.substr(2));
        if (!dir.empty()) return dir;
    }
    return join_path(home_, "bin");
}

Result<void> ConfigStore::setBinDir(const std::string& path) {
    auto check = validate_path_within_home(path, home_);
    if (!check.ok()) {
        return Result<void>::err(validation_error("bin_dir", path, check));
    }

    auto guard = lock();
    if (guard.isErr()) {
        return Result<void>::err(guard.error());
    }
    auto doc = readConfigDocument();
    if (doc.isErr()) {
        return Result<void>::err(doc.error());
    }
    doc.value()["bin_dir"] = check.canonical;
    return writeConfigDocument(doc.value());
}

} // namespace fplaunch
