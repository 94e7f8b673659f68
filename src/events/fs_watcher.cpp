#include "fplaunch/fs_watcher.hpp"
#include "fplaunch/platform.hpp"

#include <cerrno>
#include <cstring>
#include <optional>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace fplaunch {

namespace {

constexpr uint32_t kWatchMask = IN_CREATE | IN_DELETE | IN_MODIFY | IN_CLOSE_WRITE |
                                IN_MOVED_FROM | IN_MOVED_TO;

std::optional<ChangeType> change_type_from_mask(uint32_t mask) {
    if (mask & IN_CREATE) return ChangeType::Created;
    if (mask & IN_DELETE) return ChangeType::Deleted;
    if (mask & (IN_MOVED_FROM | IN_MOVED_TO)) return ChangeType::Moved;
    if (mask & (IN_MODIFY | IN_CLOSE_WRITE)) return ChangeType::Modified;
    return std::nullopt;
}

} // namespace

std::vector<std::string> default_watch_directories(const std::string& home_dir) {
    std::vector<std::string> dirs = {
        "/var/lib/flatpak/app",
        "/var/lib/flatpak/exports/bin",
    };
    if (!home_dir.empty()) {
        dirs.push_back(join_path(home_dir, ".local/share/flatpak/app"));
        dirs.push_back(join_path(home_dir, ".local/share/flatpak/exports/bin"));
    }
    return dirs;
}

Result<std::unique_ptr<FsWatcher>> FsWatcher::create(const std::vector<std::string>& directories,
                                                     EventBatcher& batcher) {
    using R = Result<std::unique_ptr<FsWatcher>>;

    int fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        return R::err(Error(ErrorCode::Io, std::string("inotify_init1 failed: ") + std::strerror(errno)));
    }

    std::unique_ptr<FsWatcher> watcher(new FsWatcher(fd, batcher));
    for (const auto& dir : directories) {
        if (!is_directory(dir)) {
            spdlog::debug("not watching {}: no such directory", dir);
            continue;
        }
        int wd = inotify_add_watch(fd, dir.c_str(), kWatchMask);
        if (wd < 0) {
            spdlog::warn("cannot watch {}: {}", dir, std::strerror(errno));
            continue;
        }
        watcher->watches_[wd] = dir;
        spdlog::debug("watching {}", dir);
    }

    if (watcher->watches_.empty()) {
        return R::err(Error(ErrorCode::NotFound, "none of the Flatpak directories can be watched"));
    }
    return R::ok(std::move(watcher));
}

FsWatcher::~FsWatcher() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

std::vector<std::string> FsWatcher::watched() const {
    std::vector<std::string> dirs;
    for (const auto& [wd, dir] : watches_) {
        dirs.push_back(dir);
    }
    return dirs;
}

Result<size_t> FsWatcher::pump(std::chrono::milliseconds timeout) {
    using R = Result<size_t>;

    pollfd pfd{fd_, POLLIN, 0};
    int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno == EINTR) return R::ok(0);
        return R::err(Error(ErrorCode::Io, std::string("poll failed: ") + std::strerror(errno)));
    }
    if (ready == 0) return R::ok(0);

    size_t forwarded = 0;
    alignas(inotify_event) char buffer[4096];
    while (true) {
        ssize_t len = read(fd_, buffer, sizeof(buffer));
        if (len < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            if (errno == EINTR) continue;
            return R::err(Error(ErrorCode::Io, std::string("inotify read failed: ") + std::strerror(errno)));
        }
        if (len == 0) break;

        for (char* ptr = buffer; ptr < buffer + len;) {
            auto* event = reinterpret_cast<inotify_event*>(ptr);
            ptr += sizeof(inotify_event) + event->len;

            if (event->mask & IN_Q_OVERFLOW) {
                spdlog::warn("inotify queue overflow; some changes were missed");
                continue;
            }
            auto type = change_type_from_mask(event->mask);
            auto dir = watches_.find(event->wd);
            if (!type || dir == watches_.end()) continue;

            std::string path = dir->second;
            if (event->len > 0) {
                path = join_path(path, event->name);
            }
            batcher_.notify(path, *type);
            ++forwarded;
        }
    }
    return R::ok(forwarded);
}

} // namespace fplaunch
