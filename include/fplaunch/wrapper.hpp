#pragma once

#include "fplaunch/config_store.hpp"
#include "fplaunch/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fplaunch {

// First comment line of every generated wrapper
constexpr char kWrapperMarker[] = "# Generated by fplaunchwrapper";

// ============================================================================
// Wrapper Scripts
// ============================================================================

/**
 * Wrapper name for a package id: the last dot-separated segment, lowercased,
 * characters outside [a-z0-9_-] replaced by '-', runs of '-' collapsed and
 * trimmed, at most 100 characters. An empty result becomes
 * "app-<first 8 hex digits of sha256(id)>".
 */
std::string sanitize_id_to_name(const std::string& id);

// POSIX shell script that hands the invocation to `<launcher> launch`
std::string render_wrapper_script(const std::string& name, const std::string& id,
                                  const std::string& launcher);

// Regular file within the size limit carrying kWrapperMarker
bool is_wrapper_file(const std::string& path);

// Value of the ID="..." line of a wrapper
std::optional<std::string> read_wrapper_id(const std::string& path);

// `flatpak list --app --columns=application`, de-duplicated and sorted
Result<std::vector<std::string>> list_installed_packages(const std::string& flatpak = "flatpak");

// ============================================================================
// Wrapper Generation
// ============================================================================

struct GenerateOptions {
    std::string launcher;       // path of the fplaunch binary written into wrappers
    bool emit = false;          // report what would change without writing
    bool cleanup = true;        // remove wrappers whose package is gone
};

struct GenerateReport {
    std::vector<std::string> created;
    std::vector<std::string> updated;
    std::vector<std::string> unchanged;
    std::vector<std::string> removed;
    std::vector<std::string> skipped;   // "<id>: <reason>"
};

struct WrapperInfo {
    std::string name;
    std::string id;
    std::string path;
};

class WrapperGenerator {
public:
    WrapperGenerator(ConfigStore& store, GenerateOptions options = {});

    /**
     * @brief Bring <bin_dir> in line with the installed package ids
     *
     * Runs under the "generate" lock. Blocked or invalid ids and names that
     * collide with a different wrapper or a foreign file are skipped. Wrappers
     * for packages no longer installed are removed together with their
     * preference record and the aliases pointing at them.
     */
    Result<GenerateReport> generate(const std::vector<std::string>& installed_ids);

    // Executable wrappers in <bin_dir>, ordered by name
    std::vector<WrapperInfo> list() const;

    /**
     * Remove one wrapper with its preference record and the aliases that
     * point at it. Fails with NotFound when there is no such file and with
     * Validation when the file was not generated by fplaunch.
     */
    Result<WrapperInfo> remove(const std::string& name);

private:
    void removeObsolete(const std::vector<std::string>& installed_ids, GenerateReport& report);

    // Drop the preference and aliases of a removed wrapper
    std::vector<std::string> forget(const std::string& name);

    ConfigStore& store_;
    GenerateOptions options_;
};

} // namespace fplaunch
