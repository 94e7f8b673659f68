#include "fplaunch/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

extern "C" char** environ;

namespace fplaunch {

namespace fs = std::filesystem;

namespace {

// Unlinks the temp entry unless the rename went through
class TempEntry {
public:
    explicit TempEntry(const std::string& target) : path_(target + ".tmp." + random_suffix()) {}
    ~TempEntry() {
        if (!committed_) unlink(path_.c_str());
    }

    TempEntry(const TempEntry&) = delete;
    TempEntry& operator=(const TempEntry&) = delete;

    const std::string& path() const { return path_; }

    // rename over `target`, then flush the directory entry
    bool commitTo(const std::string& target, std::string& error) {
        if (rename(path_.c_str(), target.c_str()) != 0) {
            error = "rename to " + target + " failed: " + std::strerror(errno);
            return false;
        }
        committed_ = true;
        sync_directory(get_parent_directory(target));
        return true;
    }

private:
    static std::string random_suffix() {
        static const char digits[] = "0123456789abcdef";
        std::random_device rd;
        std::uniform_int_distribution<int> pick(0, 15);
        std::string suffix(8, '0');
        for (auto& c : suffix) c = digits[pick(rd)];
        return suffix;
    }

    static void sync_directory(const std::string& dir) {
        if (dir.empty()) return;
        int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
        if (fd < 0) return;
        fsync(fd);
        close(fd);
    }

    std::string path_;
    bool committed_ = false;
};

bool write_all(int fd, const std::string& content) {
    size_t done = 0;
    while (done < content.size()) {
        ssize_t n = write(fd, content.data() + done, content.size() - done);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        done += static_cast<size_t>(n);
    }
    return true;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content,
                                    unsigned mode) {
    AtomicWriteResult result;
    TempEntry temp(path);

    int fd = open(temp.path().c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                  static_cast<mode_t>(mode));
    if (fd < 0) {
        result.error = "cannot create " + temp.path() + ": " + std::strerror(errno);
        return result;
    }

    // The umask applies to open(); fchmod sets the exact mode
    bool written = fchmod(fd, static_cast<mode_t>(mode)) == 0 &&
                   write_all(fd, content) &&
                   fsync(fd) == 0;
    int saved_errno = errno;
    close(fd);
    if (!written) {
        result.error = "cannot write " + temp.path() + ": " + std::strerror(saved_errno);
        return result;
    }

    result.ok = temp.commitTo(path, result.error);
    return result;
}

AtomicWriteResult atomic_update_symlink(const std::string& link_path, const std::string& target) {
    AtomicWriteResult result;
    TempEntry temp(link_path);

    if (symlink(target.c_str(), temp.path().c_str()) != 0) {
        result.error = "cannot create symlink " + temp.path() + ": " + std::strerror(errno);
        return result;
    }

    result.ok = temp.commitTo(link_path, result.error);
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return p.string();
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool is_symlink(const std::string& path) {
    std::error_code ec;
    return fs::is_symlink(path, ec);
}

bool is_executable_file(const std::string& path) {
    return is_regular_file(path) && access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> read_symlink(const std::string& path) {
    std::error_code ec;
    auto target = fs::read_symlink(path, ec);
    if (ec) return std::nullopt;
    return target.string();
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;

    std::error_code ec;
    if (!fs::is_directory(path, ec)) return entries;

    for (const auto& entry : fs::directory_iterator(path, ec)) {
        entries.push_back(entry.path().filename().string());
    }
    std::sort(entries.begin(), entries.end());

    return entries;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    auto content = read_file(path);
    if (!content) return lines;

    std::istringstream in(*content);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        lines.push_back(line);
    }
    return lines;
}

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
}

std::unordered_map<std::string, std::string> get_all_env() {
    std::unordered_map<std::string, std::string> env;

    for (char** ep = environ; *ep; ++ep) {
        std::string entry(*ep);
        auto eq = entry.find('=');
        if (eq != std::string::npos) {
            env[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }

    return env;
}

std::string get_home_directory() {
    if (auto home = get_env("HOME"); home && !home->empty()) {
        return *home;
    }
    if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) {
        return pw->pw_dir;
    }
    return {};
}

bool stdin_is_terminal() {
    return isatty(STDIN_FILENO) == 1;
}

bool stdout_is_terminal() {
    return isatty(STDOUT_FILENO) == 1;
}

std::vector<std::string> split_search_path(const std::string& path_value) {
    std::vector<std::string> dirs;
    std::string current;
    std::istringstream ss(path_value);
    while (std::getline(ss, current, ':')) {
        if (!current.empty()) dirs.push_back(current);
    }
    return dirs;
}

std::optional<std::string> find_executable_in_path(const std::string& name,
                                                   const std::string& path_value,
                                                   const std::string& exclude) {
    if (name.empty() || name.find('/') != std::string::npos) return std::nullopt;

    std::error_code ec;
    fs::path excluded_canonical;
    if (!exclude.empty()) {
        excluded_canonical = fs::weakly_canonical(exclude, ec);
        if (ec) excluded_canonical = fs::path(exclude).lexically_normal();
    }

    for (const auto& dir : split_search_path(path_value)) {
        fs::path candidate = fs::path(dir) / name;
        if (!is_executable_file(candidate.string())) continue;

        if (!exclude.empty()) {
            if (candidate.lexically_normal() == fs::path(exclude).lexically_normal()) continue;
            auto canonical = fs::weakly_canonical(candidate, ec);
            if (!ec && canonical == excluded_canonical) continue;
        }
        return candidate.string();
    }
    return std::nullopt;
}

} // namespace fplaunch
