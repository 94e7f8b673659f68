#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fplaunch {

// ============================================================================
// Launch Method
// ============================================================================

enum class LaunchMethod {
    Auto,
    System,
    Package
};

inline const char* launch_method_to_string(LaunchMethod m) {
    switch (m) {
        case LaunchMethod::Auto: return "auto";
        case LaunchMethod::System: return "system";
        case LaunchMethod::Package: return "package";
        default: return "auto";
    }
}

// Accepts "auto", "system", "package" and the legacy spelling "flatpak"
std::optional<LaunchMethod> parse_launch_method(const std::string& s);

// ============================================================================
// Target Kind
// ============================================================================

enum class TargetKind {
    System,
    Package
};

inline const char* target_kind_to_string(TargetKind k) {
    switch (k) {
        case TargetKind::System: return "system";
        case TargetKind::Package: return "package";
        default: return "package";
    }
}

std::optional<TargetKind> parse_target_kind(const std::string& s);

// ============================================================================
// Hook Failure Mode
// ============================================================================

enum class FailureMode {
    Abort,
    Warn,
    Ignore
};

inline const char* failure_mode_to_string(FailureMode m) {
    switch (m) {
        case FailureMode::Abort: return "abort";
        case FailureMode::Warn: return "warn";
        case FailureMode::Ignore: return "ignore";
        default: return "warn";
    }
}

std::optional<FailureMode> parse_failure_mode(const std::string& s);

enum class HookKind {
    Pre,
    Post
};

inline const char* hook_kind_to_string(HookKind k) {
    return k == HookKind::Pre ? "pre" : "post";
}

// ============================================================================
// Failure Mode Chain
// ============================================================================

// Levels, highest precedence first. The built-in level is always Warn.
struct FailureModeChain {
    std::optional<FailureMode> runtime_override;
    std::optional<FailureMode> env_override;
    std::optional<FailureMode> app_config;
    std::optional<FailureMode> global_default;

    static constexpr FailureMode kBuiltinDefault = FailureMode::Warn;

    FailureMode resolve() const {
        if (runtime_override) return *runtime_override;
        if (env_override) return *env_override;
        if (app_config) return *app_config;
        if (global_default) return *global_default;
        return kBuiltinDefault;
    }
};

// ============================================================================
// Configuration Layers
// ============================================================================

// One layer of configuration. Unset fields fall through to the next lower layer.
struct AppLayer {
    std::optional<LaunchMethod> launch_method;
    std::optional<std::vector<std::string>> custom_args;
    std::optional<std::unordered_map<std::string, std::string>> env_vars;
    std::optional<std::string> pre_launch_script;
    std::optional<std::string> post_launch_script;
    std::optional<FailureMode> pre_launch_failure_mode;
    std::optional<FailureMode> post_launch_failure_mode;

    bool empty() const {
        return !launch_method && !custom_args && !env_vars &&
               !pre_launch_script && !post_launch_script &&
               !pre_launch_failure_mode && !post_launch_failure_mode;
    }
};

inline bool operator==(const AppLayer& a, const AppLayer& b) {
    return a.launch_method == b.launch_method &&
           a.custom_args == b.custom_args &&
           a.env_vars == b.env_vars &&
           a.pre_launch_script == b.pre_launch_script &&
           a.post_launch_script == b.post_launch_script &&
           a.pre_launch_failure_mode == b.pre_launch_failure_mode &&
           a.post_launch_failure_mode == b.post_launch_failure_mode;
}

inline bool operator!=(const AppLayer& a, const AppLayer& b) {
    return !(a == b);
}

// ============================================================================
// Resolved Settings
// ============================================================================

struct ResolvedSettings {
    std::string app;
    LaunchMethod launch_method = LaunchMethod::Auto;
    std::vector<std::string> custom_args;
    std::unordered_map<std::string, std::string> env;
    std::optional<std::string> pre_launch_script;
    std::optional<std::string> post_launch_script;
    FailureMode pre_failure_mode = FailureModeChain::kBuiltinDefault;
    FailureMode post_failure_mode = FailureModeChain::kBuiltinDefault;

    // Per-app and global levels the failure modes were computed from
    FailureModeChain pre_chain;
    FailureModeChain post_chain;

    // True when launch_method came from a persisted preference record
    bool from_preference = false;

    // Non-fatal configuration problems met while merging
    std::vector<std::string> warnings;

    const FailureModeChain& chain(HookKind kind) const {
        return kind == HookKind::Pre ? pre_chain : post_chain;
    }
    const std::optional<std::string>& script(HookKind kind) const {
        return kind == HookKind::Pre ? pre_launch_script : post_launch_script;
    }
};

// ============================================================================
// Alias Record
// ============================================================================

struct AliasRecord {
    std::string alias;
    std::string target;
};

inline bool operator==(const AliasRecord& a, const AliasRecord& b) {
    return a.alias == b.alias && a.target == b.target;
}

// ============================================================================
// Error Handling
// ============================================================================

enum class ErrorCode {
    Validation,
    Config,
    AliasResolution,
    HookFailure,
    LockContention,
    NotFound,
    Io,
};

inline const char* error_code_to_string(ErrorCode c) {
    switch (c) {
        case ErrorCode::Validation: return "validation error";
        case ErrorCode::Config: return "config error";
        case ErrorCode::AliasResolution: return "alias resolution error";
        case ErrorCode::HookFailure: return "hook failure";
        case ErrorCode::LockContention: return "lock contention";
        case ErrorCode::NotFound: return "not found";
        case ErrorCode::Io: return "I/O error";
        default: return "error";
    }
}

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const {
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

/**
 * @brief Result type for fallible operations
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace fplaunch
