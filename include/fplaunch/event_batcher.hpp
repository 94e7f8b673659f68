#pragma once

/**
 * @file event_batcher.hpp
 * @brief Coalesce filesystem change events into regeneration triggers
 *
 * The first event after an idle period opens a window. When the window has
 * elapsed, and no cooldown from a previous trigger is running, the collected
 * events are handed to the trigger as one batch and a cooldown starts.
 * Events arriving during the cooldown are held until it ends.
 *
 * poll() drives the batcher from the caller's clock; start() runs the same
 * logic on a worker thread against steady_clock.
 */

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace fplaunch {

enum class ChangeType {
    Created,
    Deleted,
    Modified,
    Moved
};

inline const char* change_type_to_string(ChangeType t) {
    switch (t) {
        case ChangeType::Created: return "created";
        case ChangeType::Deleted: return "deleted";
        case ChangeType::Modified: return "modified";
        case ChangeType::Moved: return "moved";
        default: return "modified";
    }
}

struct ChangeEvent {
    std::string path;
    ChangeType type = ChangeType::Modified;
};

inline bool operator<(const ChangeEvent& a, const ChangeEvent& b) {
    if (a.path != b.path) return a.path < b.path;
    return a.type < b.type;
}

inline bool operator==(const ChangeEvent& a, const ChangeEvent& b) {
    return a.path == b.path && a.type == b.type;
}

// Deduplicated by (path, type)
using EventBatch = std::set<ChangeEvent>;

class EventBatcher {
public:
    using Clock = std::chrono::steady_clock;
    using Trigger = std::function<void(const EventBatch&)>;

    struct Options {
        std::chrono::milliseconds window{1000};
        std::chrono::milliseconds cooldown{2000};
    };

    EventBatcher(Options options, Trigger trigger);
    ~EventBatcher();

    EventBatcher(const EventBatcher&) = delete;
    EventBatcher& operator=(const EventBatcher&) = delete;

    void notify(const std::string& path, ChangeType type);
    void notify(const std::string& path, ChangeType type, Clock::time_point now);

    /// Flush the pending batch if it is due at `now`. Returns true when the
    /// trigger ran.
    bool poll(Clock::time_point now);

    /// Run a worker thread that flushes batches as they come due
    void start();

    /// Stop the worker. Events still pending are dropped.
    void stop();

    size_t pending() const;
    bool running() const;

private:
    std::optional<Clock::time_point> nextDeadlineLocked() const;
    std::optional<EventBatch> takeDueLocked(Clock::time_point now);
    void fire(const EventBatch& batch);
    void workerLoop();

    Options options_;
    Trigger trigger_;

    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    EventBatch pending_;
    std::optional<Clock::time_point> window_start_;
    std::optional<Clock::time_point> cooldown_until_;

    std::thread worker_;
    bool running_ = false;
    bool stopping_ = false;
};

} // namespace fplaunch
