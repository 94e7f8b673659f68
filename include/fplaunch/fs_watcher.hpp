#pragma once

#include "fplaunch/event_batcher.hpp"
#include "fplaunch/types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace fplaunch {

// System and per-user Flatpak app and exports/bin directories
std::vector<std::string> default_watch_directories(const std::string& home_dir);

/**
 * inotify watches on a set of directories, forwarding create, delete,
 * modify and move events to an EventBatcher. Directories that do not exist
 * are skipped; creation fails only when nothing could be watched.
 */
class FsWatcher {
public:
    static Result<std::unique_ptr<FsWatcher>> create(const std::vector<std::string>& directories,
                                                     EventBatcher& batcher);
    ~FsWatcher();

    FsWatcher(const FsWatcher&) = delete;
    FsWatcher& operator=(const FsWatcher&) = delete;

    std::vector<std::string> watched() const;

    /// Wait up to `timeout` for events and forward them. Returns the number
    /// of events forwarded.
    Result<size_t> pump(std::chrono::milliseconds timeout);

private:
    FsWatcher(int fd, EventBatcher& batcher) : fd_(fd), batcher_(batcher) {}

    int fd_;
    EventBatcher& batcher_;
    std::unordered_map<int, std::string> watches_;
};

} // namespace fplaunch
