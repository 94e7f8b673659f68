#pragma once

/**
 * @file config_store.hpp
 * @brief Layered configuration for wrapped applications
 *
 * A ConfigStore owns one configuration root:
 * - config.json: schema_version, bin_dir, permission_presets
 * - profiles/<name>.json: global_preferences and app_preferences
 * - profile.current: symlink to the active profile
 * - prefs/<app>.pref: persisted system/package choice
 * - aliases, blocklist: line-based records
 * - locks/: mutual exclusion for mutations
 *
 * @example
 * ```cpp
 * auto store = fplaunch::ConfigStore::open();
 * if (store.isOk()) {
 *     auto settings = store.value()->resolve("firefox");
 * }
 * ```
 */

#include "fplaunch/config_document.hpp"
#include "fplaunch/dir_lock.hpp"
#include "fplaunch/types.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fplaunch {

// ============================================================================
// Options
// ============================================================================

struct ConfigStoreOptions {
    std::string root;       // empty: default_config_root()
    std::string home_dir;   // empty: get_home_directory()
};

// $FPLAUNCH_CONFIG_DIR, else $XDG_CONFIG_HOME/fplaunchwrapper,
// else ~/.config/fplaunchwrapper
std::string default_config_root();

// ============================================================================
// Layer Addressing
// ============================================================================

enum class LayerKind {
    Global,       // profile global_preferences
    App,          // profile app_preferences.<app>
    Preference    // prefs/<app>.pref
};

struct LayerRef {
    LayerKind kind = LayerKind::Global;
    std::string app;
};

// "global", "app:<name>" or "pref:<name>"
std::optional<LayerRef> parse_layer_ref(const std::string& s);

/**
 * Merge layers lowest precedence first: built-in defaults, global, app,
 * then the preference record (launch method only). Each layer only sets the
 * fields it declares. custom_args is replaced as a whole, env_vars per key.
 */
ResolvedSettings merge_layers(const std::string& app,
                              const AppLayer* global,
                              const AppLayer* app_layer,
                              std::optional<TargetKind> preference);

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
public:
    /**
     * @brief Open (and on first run, initialize) a configuration root
     *
     * Creates the directory layout, seeds config.json with the built-in
     * presets and a "default" profile, migrates older documents and reads
     * the active profile name from profile.current.
     */
    static Result<std::unique_ptr<ConfigStore>> open(const ConfigStoreOptions& options = {});

    const std::string& root() const { return root_; }
    const std::string& home() const { return home_; }
    std::string lockDir() const;

    /// Acquire the configuration mutation lock
    Result<std::unique_ptr<DirLock>> lock() const;

    // ------------------------------------------------------------------------
    // Resolution
    // ------------------------------------------------------------------------

    /// Resolve one app against `profile` (default: the active profile)
    Result<ResolvedSettings> resolve(const std::string& app,
                                     const std::string& profile = "") const;

    /// Resolve every app that has an override block in `profile`
    Result<std::map<std::string, ResolvedSettings>> load(const std::string& profile = "") const;

    /// Set or, with an empty value, unset one field of one layer
    Result<void> save(const LayerRef& layer, const std::string& key, const std::string& value);

    // ------------------------------------------------------------------------
    // Profiles
    // ------------------------------------------------------------------------

    const std::string& activeProfile() const { return active_profile_; }

    Result<void> setActiveProfile(const std::string& name);

    std::vector<std::string> listProfiles() const;

    Result<void> createProfile(const std::string& name, const std::string& copy_from = "");

    Result<void> deleteProfile(const std::string& name);

    Result<ProfileParseResult> loadProfileDocument(const std::string& name) const;

    Result<void> exportProfile(const std::string& name, const std::string& dest_path) const;

    Result<void> importProfile(const std::string& name, const std::string& src_path);

    // ------------------------------------------------------------------------
    // Preferences
    // ------------------------------------------------------------------------

    Result<std::optional<TargetKind>> readPreference(const std::string& app) const;

    Result<void> writePreference(const std::string& app, TargetKind kind);

    Result<void> clearPreference(const std::string& app);

    // ------------------------------------------------------------------------
    // Permission presets
    // ------------------------------------------------------------------------

    std::vector<PermissionPreset> listPresets() const;

    Result<PermissionPreset> getPreset(const std::string& name) const;

    Result<void> putPreset(const std::string& name, const std::vector<std::string>& permissions);

    Result<void> removePreset(const std::string& name);

    // ------------------------------------------------------------------------
    // Aliases and block list
    // ------------------------------------------------------------------------

    std::vector<AliasRecord> loadAliases() const;

    /// Replace the alias file. The caller must hold lock().
    Result<void> saveAliases(const std::vector<AliasRecord>& records);

    std::vector<std::string> loadBlocklist() const;

    Result<void> block(const std::string& id);

    Result<void> unblock(const std::string& id);

    // ------------------------------------------------------------------------
    // Wrapper directory
    // ------------------------------------------------------------------------

    std::string binDir() const;

    Result<void> setBinDir(const std::string& path);

private:
    ConfigStore(std::string root, std::string home)
        : root_(std::move(root)), home_(std::move(home)) {}

    Result<void> initialize();

    std::string configPath() const;
    std::string profilePath(const std::string& name) const;
    std::string preferencePath(const std::string& app) const;

    Result<nlohmann::json> readConfigDocument() const;
    Result<void> writeConfigDocument(const nlohmann::json& config);
    Result<std::string> validateStoredScript(const std::string& path) const;

    std::string root_;
    std::string home_;
    std::string active_profile_ = "default";
    nlohmann::json config_;
};

} // namespace fplaunch
