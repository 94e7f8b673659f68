#include "fplaunch/dir_lock.hpp"
#include "fplaunch/platform.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace fplaunch {

namespace {

bool owner_is_gone(const std::string& pid_path) {
    auto content = read_file(pid_path);
    if (!content) return false;
    try {
        long pid = std::stol(*content);
        if (pid <= 0) return false;
        return kill(static_cast<pid_t>(pid), 0) == -1 && errno == ESRCH;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

Result<std::unique_ptr<DirLock>> DirLock::acquire(const std::string& lock_dir,
                                                  const std::string& name) {
    using R = Result<std::unique_ptr<DirLock>>;

    if (!create_directories(lock_dir)) {
        return R::err(Error(ErrorCode::Io, "cannot create lock directory: " + lock_dir));
    }

    std::string lock_path = join_path(lock_dir, name + ".lock");
    std::string pid_path = join_path(lock_dir, name + ".pid");

    for (int attempt = 0; attempt < 2; ++attempt) {
        if (mkdir(lock_path.c_str(), 0700) == 0) {
            auto written = atomic_write_file(pid_path, std::to_string(getpid()) + "\n");
            if (!written.ok) {
                spdlog::debug("could not record lock owner for {}: {}", name, written.error);
            }
            return R::ok(std::unique_ptr<DirLock>(new DirLock(lock_path, pid_path)));
        }
        if (errno != EEXIST) {
            return R::err(Error(ErrorCode::Io,
                                "cannot create lock " + lock_path + ": " + strerror(errno)));
        }
        if (attempt == 0 && owner_is_gone(pid_path)) {
            spdlog::warn("reclaiming stale lock {}", lock_path);
            remove_file(pid_path);
            rmdir(lock_path.c_str());
            continue;
        }
        break;
    }

    return R::err(Error(ErrorCode::LockContention,
                        "another '" + name + "' operation is in progress, try again"));
}

DirLock::~DirLock() {
    remove_file(pid_path_);
    rmdir(lock_path_.c_str());
}

} // namespace fplaunch
