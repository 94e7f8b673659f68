#pragma once

#include "fplaunch/types.hpp"

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace fplaunch {

// Newest document layout this build reads and writes
constexpr int kSchemaVersion = 2;

// ============================================================================
// App Layers
// ============================================================================

struct LayerParseResult {
    bool ok = false;
    std::string error;
    AppLayer layer;
};

// Parse one layer object ("global_preferences" or "app_preferences.<name>").
// A field of the wrong type or with an unknown enum value fails the whole layer.
LayerParseResult parse_app_layer(const nlohmann::json& j);

// Only fields that are set are written
nlohmann::json serialize_app_layer(const AppLayer& layer);

// [A-Za-z_][A-Za-z0-9_]*
bool is_valid_env_name(const std::string& name);

// ============================================================================
// Permission Presets
// ============================================================================

struct PermissionPreset {
    std::string name;
    std::vector<std::string> permissions;
};

// Built-in presets seeded into a fresh config.json
const std::vector<PermissionPreset>& builtin_presets();

// A permission flag must look like "--xxx" and contain no control characters
bool is_valid_permission_flag(const std::string& flag);

// ============================================================================
// Migration
// ============================================================================

enum class DocumentKind {
    Config,    // config.json
    Profile    // profiles/<name>.json
};

struct MigrationResult {
    bool ok = false;
    std::string error;
    nlohmann::json document;
    bool changed = false;
};

/**
 * Bring a document up to kSchemaVersion.
 *
 * Additive only: missing sections are created and schema_version is set, no
 * user value is removed or rewritten. Running it on its own output is a
 * no-op. A document from a newer schema is refused.
 */
MigrationResult migrate_document(const nlohmann::json& document, DocumentKind kind);

// ============================================================================
// Profile Documents
// ============================================================================

struct ProfileDocument {
    AppLayer global;
    std::map<std::string, AppLayer> apps;

    // Layers that failed to parse, with the reason; the layer itself is absent
    std::optional<std::string> global_error;
    std::map<std::string, std::string> app_errors;
};

struct ProfileParseResult {
    bool ok = false;
    std::string error;
    nlohmann::json raw;         // migrated document, unknown fields kept
    ProfileDocument profile;
};

// Parse, migrate and split a profile document into typed layers. Fails when the
// text is not a JSON object, app_preferences is not an object, or the schema
// is too new. A bad individual layer only lands in the *_error fields.
ProfileParseResult parse_profile_document(const std::string& json_str);

// Every embedded script path must stay inside `home_dir`, every app name must
// be a valid identifier. Returns the first problem found.
Result<void> validate_profile_document(const ProfileDocument& profile,
                                       const std::string& home_dir);

} // namespace fplaunch
