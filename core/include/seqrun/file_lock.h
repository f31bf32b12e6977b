#pragma once

#include <filesystem>

namespace seqrun {

// FileLock: exclusive advisory lock (flock) on a lock file, released on
// destruction. Locks belong to the open file description, so two FileLock
// objects on the same path exclude each other even inside one process.
class FileLock {
public:
    // Holds nothing.
    FileLock() = default;

    // Blocks until the lock is held. Throws std::runtime_error if the lock
    // file cannot be opened or locked.
    explicit FileLock(const std::filesystem::path& path);

    // Non-blocking variant: returns an unlocked FileLock (held() == false)
    // when another holder exists.
    static FileLock try_acquire(const std::filesystem::path& path);

    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    bool held() const { return fd_ >= 0; }
    void release();

private:
    int fd_ = -1;
};

} // namespace seqrun
