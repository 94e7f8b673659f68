#include "fplaunch/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace fplaunch {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

std::optional<LaunchMethod> parse_launch_method(const std::string& s) {
    std::string lower = to_lower(trim(s));
    if (lower == "auto") return LaunchMethod::Auto;
    if (lower == "system") return LaunchMethod::System;
    if (lower == "package") return LaunchMethod::Package;
    if (lower == "flatpak") return LaunchMethod::Package;
    return std::nullopt;
}

std::optional<TargetKind> parse_target_kind(const std::string& s) {
    auto method = parse_launch_method(s);
    if (!method || *method == LaunchMethod::Auto) return std::nullopt;
    return *method == LaunchMethod::System ? TargetKind::System : TargetKind::Package;
}

std::optional<FailureMode> parse_failure_mode(const std::string& s) {
    std::string lower = to_lower(trim(s));
    if (lower == "abort") return FailureMode::Abort;
    if (lower == "warn") return FailureMode::Warn;
    if (lower == "ignore") return FailureMode::Ignore;
    return std::nullopt;
}

} // namespace fplaunch
