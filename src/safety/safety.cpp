#include "fplaunch/safety.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <sys/stat.h>
#include <unistd.h>

namespace fplaunch {

namespace fs = std::filesystem;

namespace {

constexpr char kShellMetacharacters[] = ";|&`$()<>\n\r";

// Percent-encoded sequences that can smuggle traversal or separators past a
// string check: dot, slash, backslash, NUL, overlong UTF-8 and double encoding.
const char* const kEncodedTraversal[] = {
    "%2e", "%2f", "%5c", "%00", "%c0", "%c1", "%25", "%u002e", "%u2215",
};

SafetyCheck fail(SafetyVerdict verdict, std::string reason) {
    SafetyCheck check;
    check.verdict = verdict;
    check.reason = std::move(reason);
    return check;
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool all_whitespace(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool has_dotdot_segment(const std::string& path) {
    std::string segment;
    for (size_t i = 0; i <= path.size(); ++i) {
        if (i == path.size() || path[i] == '/' || path[i] == '\\') {
            if (segment == "..") return true;
            segment.clear();
        } else {
            segment += path[i];
        }
    }
    return false;
}

bool is_descendant_or_equal(const fs::path& root, const fs::path& candidate) {
    auto root_it = root.begin();
    auto cand_it = candidate.begin();
    for (; root_it != root.end() && cand_it != candidate.end(); ++root_it, ++cand_it) {
        // A trailing separator shows up as an empty element
        if (root_it->empty()) break;
        if (*root_it != *cand_it) {
            return false;
        }
    }
    return root_it == root.end() || root_it->empty();
}

} // namespace

const std::vector<std::string>& builtin_denied_identifiers() {
    static const std::vector<std::string> denied = {
        // shells and interpreters
        "sh", "bash", "dash", "zsh", "ksh", "csh", "tcsh", "fish", "busybox",
        "env", "exec", "eval", "xargs",
        // privilege escalation
        "sudo", "su", "doas", "pkexec", "runuser", "setpriv", "chroot",
        // destructive or system-critical
        "rm", "dd", "mkfs", "fdisk", "parted", "shred", "init", "systemctl",
        "shutdown", "reboot", "halt", "poweroff", "login", "passwd", "mount",
        "umount", "chmod", "chown", "kill", "killall",
        // the tooling itself
        "flatpak", "fplaunch",
    };
    return denied;
}

SafetyCheck validate_identifier_format(const std::string& raw,
                                       const std::vector<std::string>& blocklist) {
    if (raw.empty() || all_whitespace(raw)) {
        return fail(SafetyVerdict::Forbidden, "identifier is empty");
    }
    if (raw.find('\0') != std::string::npos) {
        return fail(SafetyVerdict::Forbidden, "identifier contains a NUL byte");
    }
    if (raw.find_first_of(kShellMetacharacters) != std::string::npos) {
        return fail(SafetyVerdict::Forbidden, "identifier contains shell metacharacters");
    }

    const auto& denied = builtin_denied_identifiers();
    if (std::find(denied.begin(), denied.end(), raw) != denied.end()) {
        return fail(SafetyVerdict::Forbidden, "identifier names a protected system command");
    }
    if (std::find(blocklist.begin(), blocklist.end(), raw) != blocklist.end()) {
        return fail(SafetyVerdict::Forbidden, "identifier is on the block list");
    }
    return {};
}

SafetyCheck validate_path_within_home(const std::string& path, const std::string& home_dir) {
    if (path.empty()) {
        return fail(SafetyVerdict::Traversal, "path is empty");
    }
    if (home_dir.empty()) {
        return fail(SafetyVerdict::Traversal, "home directory is unknown");
    }
    if (path.find('\0') != std::string::npos) {
        return fail(SafetyVerdict::Traversal, "path contains a NUL byte");
    }
    if (has_dotdot_segment(path)) {
        return fail(SafetyVerdict::Traversal, "path contains a '..' segment");
    }
    std::string lower = to_lower(path);
    for (const char* seq : kEncodedTraversal) {
        if (lower.find(seq) != std::string::npos) {
            return fail(SafetyVerdict::Traversal, "path contains an encoded traversal sequence");
        }
    }

    fs::path candidate;
    if (path == "~") {
        candidate = home_dir;
    } else if (path.rfind("~/", 0) == 0) {
        candidate = fs::path(home_dir) / path.substr(2);
    } else if (path[0] == '~') {
        return fail(SafetyVerdict::Traversal, "other users' home directories are not allowed");
    } else if (path[0] != '/') {
        candidate = fs::path(home_dir) / path;
    } else {
        candidate = path;
    }

    std::error_code ec;
    fs::path canonical_home = fs::weakly_canonical(home_dir, ec);
    if (ec) {
        return fail(SafetyVerdict::Traversal, "cannot resolve home directory");
    }
    fs::path canonical = fs::weakly_canonical(candidate, ec);
    if (ec) {
        return fail(SafetyVerdict::Traversal, "cannot resolve path");
    }

    if (!is_descendant_or_equal(canonical_home, canonical)) {
        return fail(SafetyVerdict::Traversal, "path resolves outside the home directory");
    }

    SafetyCheck check;
    check.canonical = canonical.string();
    check.expanded = candidate.lexically_normal().string();
    return check;
}

SafetyCheck validate_executable_candidate(const std::string& path, bool require_interpreter) {
    if (path.empty() || path.find('\0') != std::string::npos) {
        return fail(SafetyVerdict::Rejected, "invalid path");
    }

    struct stat st {};
    if (lstat(path.c_str(), &st) != 0) {
        return fail(SafetyVerdict::Rejected, "file does not exist");
    }
    if (S_ISLNK(st.st_mode)) {
        return fail(SafetyVerdict::Rejected, "file is a symlink");
    }
    if (!S_ISREG(st.st_mode)) {
        return fail(SafetyVerdict::Rejected, "not a regular file");
    }
    if (access(path.c_str(), R_OK) != 0) {
        return fail(SafetyVerdict::Rejected, "file is not readable");
    }
    if (static_cast<std::uintmax_t>(st.st_size) > kMaxExecutableSize) {
        return fail(SafetyVerdict::Rejected, "file exceeds the size limit");
    }

    if (require_interpreter) {
        std::ifstream in(path, std::ios::binary);
        std::string first_line;
        if (!in || !std::getline(in, first_line)) {
            return fail(SafetyVerdict::Rejected, "file is empty");
        }
        if (first_line.rfind("#!", 0) != 0) {
            return fail(SafetyVerdict::Rejected, "missing interpreter line");
        }
        size_t pos = 2;
        while (pos < first_line.size() && (first_line[pos] == ' ' || first_line[pos] == '\t')) ++pos;
        if (pos >= first_line.size() || first_line[pos] != '/') {
            return fail(SafetyVerdict::Rejected, "interpreter must be an absolute path");
        }
        for (unsigned char c : first_line) {
            if (c < 0x20 && c != '\t' && c != '\r') {
                return fail(SafetyVerdict::Rejected, "control characters in interpreter line");
            }
        }
    }

    return {};
}

SafetyCheck validate_package_id(const std::string& id, const std::vector<std::string>& blocklist) {
    auto format = validate_identifier_format(id, blocklist);
    if (!format.ok()) {
        return format;
    }
    if (id.find('.') == std::string::npos || id.front() == '.' || id.back() == '.') {
        return fail(SafetyVerdict::Forbidden, "package id must be dot-separated");
    }
    for (unsigned char c : id) {
        if (!std::isalnum(c) && c != '.' && c != '_' && c != '-') {
            return fail(SafetyVerdict::Forbidden, "package id contains invalid characters");
        }
    }
    return {};
}

SafetyCheck validate_name_component(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return fail(SafetyVerdict::Forbidden, "invalid name");
    }
    if (name.front() == '.' || name.front() == '-') {
        return fail(SafetyVerdict::Forbidden, "name must not start with '.' or '-'");
    }
    if (name.size() > 255) {
        return fail(SafetyVerdict::Forbidden, "name is too long");
    }
    for (unsigned char c : name) {
        if (!std::isalnum(c) && c != '.' && c != '_' && c != '-' && c != '+') {
            return fail(SafetyVerdict::Forbidden, "name contains invalid characters");
        }
    }
    return {};
}

std::string printable_input(const std::string& raw, size_t max_len) {
    std::string out;
    out.reserve(std::min(raw.size(), max_len) + 2);
    out += '\'';
    size_t shown = 0;
    for (unsigned char c : raw) {
        if (shown >= max_len) {
            out += "...";
            break;
        }
        bool meta = std::string(kShellMetacharacters).find(static_cast<char>(c)) != std::string::npos;
        if (c < 0x20 || c == 0x7f || c == '\'' || c == '\\' || meta) {
            char buf[5];
            std::snprintf(buf, sizeof(buf), "\\x%02x", c);
            out += buf;
        } else {
            out += static_cast<char>(c);
        }
        ++shown;
    }
    out += '\'';
    return out;
}

} // namespace fplaunch
