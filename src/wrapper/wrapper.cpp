#include "fplaunch/wrapper.hpp"
#include "fplaunch/alias_resolver.hpp"
#include "fplaunch/digest.hpp"
#include "fplaunch/dir_lock.hpp"
#include "fplaunch/platform.hpp"
#include "fplaunch/process.hpp"
#include "fplaunch/safety.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>
#include <sstream>

#include <spdlog/spdlog.h>

namespace fplaunch {

namespace {

constexpr size_t kMaxWrapperName = 100;

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

// ============================================================================
// Wrapper Scripts
// ============================================================================

std::string sanitize_id_to_name(const std::string& id) {
    std::string segment = id;
    auto dot = id.rfind('.');
    if (dot != std::string::npos) {
        segment = id.substr(dot + 1);
    }

    std::string name;
    for (unsigned char c : segment) {
        char lower = static_cast<char>(std::tolower(c));
        bool allowed = (lower >= 'a' && lower <= 'z') || (lower >= '0' && lower <= '9') ||
                       lower == '_' || lower == '-';
        char out = allowed ? lower : '-';
        if (out == '-' && !name.empty() && name.back() == '-') continue;
        name += out;
    }
    while (!name.empty() && name.front() == '-') name.erase(name.begin());
    while (!name.empty() && name.back() == '-') name.pop_back();

    if (name.empty()) {
        auto digest = compute_sha256(id);
        name = "app-" + (digest.ok ? digest.hex_digest.substr(0, 8) : std::string("fallback"));
    }
    if (name.size() > kMaxWrapperName) {
        name.resize(kMaxWrapperName);
    }
    return name;
}

std::string render_wrapper_script(const std::string& name, const std::string& id,
                                  const std::string& launcher) {
    std::ostringstream out;
    out << "#!/bin/sh\n"
        << kWrapperMarker << "\n"
        << "NAME=\"" << name << "\"\n"
        << "ID=\"" << id << "\"\n"
        << "exec " << shell_quote(launcher) << " launch --id \"$ID\" \"$NAME\" -- \"$@\"\n";
    return out.str();
}

bool is_wrapper_file(const std::string& path) {
    if (is_symlink(path) || !is_regular_file(path)) return false;

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec || size > kMaxExecutableSize) return false;

    auto content = read_file(path);
    if (!content) return false;

    std::istringstream in(*content);
    std::string line;
    for (int i = 0; i < 5 && std::getline(in, line); ++i) {
        if (trim(line) == kWrapperMarker) return true;
    }
    return false;
}

std::optional<std::string> read_wrapper_id(const std::string& path) {
    if (!is_wrapper_file(path)) return std::nullopt;

    auto content = read_file(path);
    std::istringstream in(content.value_or(""));
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.compare(0, 4, "ID=\"") == 0 && line.size() > 5 && line.back() == '"') {
            return line.substr(4, line.size() - 5);
        }
    }
    return std::nullopt;
}

Result<std::vector<std::string>> list_installed_packages(const std::string& flatpak) {
    using R = Result<std::vector<std::string>>;

    ProcessSpec spec;
    spec.program = flatpak;
    spec.argv = {flatpak, "list", "--app", "--columns=application"};
    spec.env = get_all_env();
    spec.capture_stdout = true;
    spec.timeout = std::chrono::milliseconds(60000);
    spec.own_process_group = true;

    auto result = run_process(spec);
    if (!result.ok) {
        return R::err(Error(ErrorCode::Io, "cannot run " + flatpak + ": " + result.error));
    }
    if (result.exit_code != 0) {
        return R::err(Error(ErrorCode::Io, flatpak + " list exited with status " +
                                           std::to_string(result.exit_code)));
    }

    std::set<std::string> ids;
    std::istringstream in(result.output);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line == "Application ID") continue;
        ids.insert(line);
    }
    return R::ok(std::vector<std::string>(ids.begin(), ids.end()));
}

// ============================================================================
// Wrapper Generation
// ============================================================================

WrapperGenerator::WrapperGenerator(ConfigStore& store, GenerateOptions options)
    : store_(store), options_(std::move(options)) {}

Result<GenerateReport> WrapperGenerator::generate(const std::vector<std::string>& installed_ids) {
    using R = Result<GenerateReport>;

    auto guard = DirLock::acquire(store_.lockDir(), "generate");
    if (guard.isErr()) {
        return R::err(guard.error());
    }

    std::string bin_dir = store_.binDir();
    if (!options_.emit && !create_directories(bin_dir)) {
        return R::err(Error(ErrorCode::Io, "cannot create " + bin_dir));
    }

    GenerateReport report;
    auto blocklist = store_.loadBlocklist();
    std::set<std::string> ids(installed_ids.begin(), installed_ids.end());

    for (const auto& id : ids) {
        auto id_check = validate_package_id(id, blocklist);
        if (!id_check.ok()) {
            report.skipped.push_back(printable_input(id) + ": " + id_check.reason);
            continue;
        }

        std::string name = sanitize_id_to_name(id);
        auto name_check = validate_identifier_format(name, blocklist);
        if (name_check.ok()) name_check = validate_name_component(name);
        if (!name_check.ok()) {
            report.skipped.push_back(id + ": wrapper name '" + name + "' " + name_check.reason);
            continue;
        }

        std::string path = join_path(bin_dir, name);
        bool existed = path_exists(path);
        if (existed) {
            if (!is_wrapper_file(path)) {
                report.skipped.push_back(id + ": " + path + " exists and was not generated by fplaunchwrapper");
                continue;
            }
            auto existing_id = read_wrapper_id(path);
            if (existing_id && *existing_id != id) {
                report.skipped.push_back(id + ": name '" + name + "' already used by " + *existing_id);
                continue;
            }
        }

        std::string content = render_wrapper_script(name, id, options_.launcher);
        if (existed) {
            auto current = compute_file_sha256(path);
            auto wanted = compute_sha256(content);
            if (current.ok && wanted.ok && current.hex_digest == wanted.hex_digest) {
                report.unchanged.push_back(name);
                continue;
            }
        }

        if (!options_.emit) {
            auto written = atomic_write_file(path, content, 0755);
            if (!written.ok) {
                report.skipped.push_back(id + ": " + written.error);
                continue;
            }
        }
        (existed ? report.updated : report.created).push_back(name);
        spdlog::debug("{} wrapper {} for {}", existed ? "updated" : "created", name, id);
    }

    if (options_.cleanup) {
        removeObsolete(installed_ids, report);
    }

    return R::ok(std::move(report));
}

void WrapperGenerator::removeObsolete(const std::vector<std::string>& installed_ids,
                                      GenerateReport& report) {
    std::set<std::string> installed(installed_ids.begin(), installed_ids.end());
    std::string bin_dir = store_.binDir();

    for (const auto& name : list_directory(bin_dir)) {
        std::string path = join_path(bin_dir, name);
        auto id = read_wrapper_id(path);
        if (!id || installed.count(*id) > 0) continue;

        report.removed.push_back(name);
        if (options_.emit) continue;

        if (!remove_file(path)) {
            spdlog::warn("could not remove obsolete wrapper {}", path);
            continue;
        }
        spdlog::info("removed obsolete wrapper {} ({})", name, *id);

        forget(name);
    }
}

std::vector<std::string> WrapperGenerator::forget(const std::string& name) {
    std::vector<std::string> dropped;
    if (!validate_name_component(name).ok()) return dropped;

    auto cleared = store_.clearPreference(name);
    if (cleared.isErr()) {
        spdlog::warn("could not clear preference for {}: {}", name, cleared.error().message());
    }

    AliasResolver aliases(store_);
    for (const auto& record : aliases.records()) {
        if (record.target != name) continue;
        auto removed = aliases.removeAlias(record.alias);
        if (removed.isErr()) {
            spdlog::warn("could not remove alias {}: {}", record.alias, removed.error().message());
            continue;
        }
        dropped.push_back(record.alias);
    }
    return dropped;
}

std::vector<WrapperInfo> WrapperGenerator::list() const {
    std::vector<WrapperInfo> wrappers;
    std::string bin_dir = store_.binDir();
    for (const auto& name : list_directory(bin_dir)) {
        std::string path = join_path(bin_dir, name);
        if (!is_executable_file(path)) continue;
        auto id = read_wrapper_id(path);
        if (!id) continue;
        wrappers.push_back(WrapperInfo{name, *id, path});
    }
    return wrappers;
}

Result<WrapperInfo> WrapperGenerator::remove(const std::string& name) {
    using R = Result<WrapperInfo>;

    auto name_check = validate_identifier_format(name);
    if (name_check.ok()) name_check = validate_name_component(name);
    if (!name_check.ok()) {
        return R::err(Error(ErrorCode::Validation,
                            "wrapper name " + printable_input(name) + ": " + name_check.reason));
    }

    auto guard = DirLock::acquire(store_.lockDir(), "generate");
    if (guard.isErr()) {
        return R::err(guard.error());
    }

    std::string path = join_path(store_.binDir(), name);
    if (!path_exists(path)) {
        return R::err(Error(ErrorCode::NotFound, "no wrapper named " + name + " in " + store_.binDir()));
    }
    auto id = read_wrapper_id(path);
    if (!id) {
        return R::err(Error(ErrorCode::Validation,
                            path + " was not generated by fplaunchwrapper; leaving it alone"));
    }
    if (!remove_file(path)) {
        return R::err(Error(ErrorCode::Io, "cannot remove " + path));
    }

    auto aliases = forget(name);
    spdlog::info("removed wrapper {} ({}) and {} alias(es)", name, *id, aliases.size());
    return R::ok(WrapperInfo{name, *id, path});
}

} // namespace fplaunch
