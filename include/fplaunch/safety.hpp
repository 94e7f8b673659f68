#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fplaunch {

// ============================================================================
// Safety Verdicts
// ============================================================================

enum class SafetyVerdict {
    Ok,
    Forbidden,   // identifier rejected
    Traversal,   // path escapes the home boundary
    Rejected,    // executable candidate rejected
};

inline const char* safety_verdict_to_string(SafetyVerdict v) {
    switch (v) {
        case SafetyVerdict::Ok: return "OK";
        case SafetyVerdict::Forbidden: return "FORBIDDEN";
        case SafetyVerdict::Traversal: return "TRAVERSAL";
        case SafetyVerdict::Rejected: return "REJECTED";
        default: return "REJECTED";
    }
}

struct SafetyCheck {
    SafetyVerdict verdict = SafetyVerdict::Ok;
    std::string reason;      // empty when ok
    std::string canonical;   // canonical path, set by validate_path_within_home on success
    std::string expanded;    // absolute path with '~' expanded, symlinks not followed

    bool ok() const { return verdict == SafetyVerdict::Ok; }
};

// Largest file accepted as a hook script or wrapper
constexpr std::uintmax_t kMaxExecutableSize = 100000;

// Built-in deny list of system-critical command names (exact match)
const std::vector<std::string>& builtin_denied_identifiers();

// ============================================================================
// Validators
// ============================================================================

// Rejects empty/whitespace-only identifiers, shell metacharacters and
// exact, case-sensitive matches against the deny list or `blocklist`.
SafetyCheck validate_identifier_format(const std::string& raw,
                                       const std::vector<std::string>& blocklist = {});

// Canonicalizes `path` (following symlinks) and requires it to be `home_dir`
// or a descendant of it. Any ".." segment or encoded traversal is rejected
// before resolution.
SafetyCheck validate_path_within_home(const std::string& path, const std::string& home_dir);

// Regular, readable, non-symlink file no larger than kMaxExecutableSize.
// With require_interpreter the first line must be "#!/absolute/interpreter".
SafetyCheck validate_executable_candidate(const std::string& path,
                                          bool require_interpreter = true);

// Sandboxed package identifier such as org.mozilla.firefox
SafetyCheck validate_package_id(const std::string& id,
                                const std::vector<std::string>& blocklist = {});

// Name usable as a single file name inside the configuration root
SafetyCheck validate_name_component(const std::string& name);

// Render untrusted input for a single-line diagnostic
std::string printable_input(const std::string& raw, size_t max_len = 64);

} // namespace fplaunch
