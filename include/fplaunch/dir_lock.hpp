#pragma once

#include "fplaunch/types.hpp"

#include <memory>
#include <string>

namespace fplaunch {

/**
 * @brief Advisory lock backed by an atomically created directory
 *
 * Acquired by mkdir("<lock_dir>/<name>.lock"); the owner's pid is written to
 * "<lock_dir>/<name>.pid". A lock whose recorded owner no longer exists is
 * reclaimed once. Released when the object is destroyed.
 */
class DirLock {
public:
    static Result<std::unique_ptr<DirLock>> acquire(const std::string& lock_dir,
                                                    const std::string& name);

    ~DirLock();

    DirLock(const DirLock&) = delete;
    DirLock& operator=(const DirLock&) = delete;

    const std::string& path() const { return lock_path_; }

private:
    DirLock(std::string lock_path, std::string pid_path)
        : lock_path_(std::move(lock_path)), pid_path_(std::move(pid_path)) {}

    std::string lock_path_;
    std::string pid_path_;
};

} // namespace fplaunch
