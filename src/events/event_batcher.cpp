#include "fplaunch/event_batcher.hpp"

#include <algorithm>
#include <exception>

#include <spdlog/spdlog.h>

namespace fplaunch {

EventBatcher::EventBatcher(Options options, Trigger trigger)
    : options_(options), trigger_(std::move(trigger)) {}

EventBatcher::~EventBatcher() {
    stop();
}

void EventBatcher::notify(const std::string& path, ChangeType type) {
    notify(path, type, Clock::now());
}

void EventBatcher::notify(const std::string& path, ChangeType type, Clock::time_point now) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.insert(ChangeEvent{path, type});
        if (!window_start_) {
            window_start_ = now;
        }
    }
    wakeup_.notify_one();
}

std::optional<EventBatcher::Clock::time_point> EventBatcher::nextDeadlineLocked() const {
    if (!window_start_) return std::nullopt;
    auto deadline = *window_start_ + options_.window;
    if (cooldown_until_) {
        deadline = std::max(deadline, *cooldown_until_);
    }
    return deadline;
}

std::optional<EventBatch> EventBatcher::takeDueLocked(Clock::time_point now) {
    auto deadline = nextDeadlineLocked();
    if (!deadline || now < *deadline) return std::nullopt;

    EventBatch batch;
    batch.swap(pending_);
    window_start_.reset();
    cooldown_until_ = now + options_.cooldown;
    return batch;
}

void EventBatcher::fire(const EventBatch& batch) {
    spdlog::debug("flushing {} filesystem event(s)", batch.size());
    if (!trigger_) return;
    try {
        trigger_(batch);
    } catch (const std::exception& e) {
        spdlog::error("regeneration trigger failed: {}", e.what());
    }
}

bool EventBatcher::poll(Clock::time_point now) {
    std::optional<EventBatch> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch = takeDueLocked(now);
    }
    if (!batch) return false;
    fire(*batch);
    return true;
}

void EventBatcher::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    stopping_ = false;
    running_ = true;
    worker_ = std::thread(&EventBatcher::workerLoop, this);
}

void EventBatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        stopping_ = true;
    }
    wakeup_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    pending_.clear();
    window_start_.reset();
}

size_t EventBatcher::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool EventBatcher::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_ && !stopping_;
}

void EventBatcher::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        auto deadline = nextDeadlineLocked();
        if (!deadline) {
            wakeup_.wait(lock);
            continue;
        }
        if (wakeup_.wait_until(lock, *deadline) != std::cv_status::timeout) {
            // Woken by notify or stop; recompute the deadline
            continue;
        }

        auto batch = takeDueLocked(Clock::now());
        if (!batch) continue;

        // Trigger runs unlocked so it may take as long as regeneration needs
        lock.unlock();
        fire(*batch);
        lock.lock();
    }
}

} // namespace fplaunch
