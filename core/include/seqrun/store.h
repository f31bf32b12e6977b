#pragma once

#include "types.h"

#include <filesystem>
#include <functional>
#include <string>

namespace seqrun {

// JobStore: the queue file, sole source of truth for job records.
//
// Readers call load() without locking; save() replaces the file with
// write-temp-then-rename, so a reader sees either the old or the new
// document and never a torn one.
//
// Writers go through update(), which holds an exclusive flock on
// <queue_file>.lock for the whole load -> modify -> save cycle. That lock is
// what keeps concurrent CLI invocations and the worker from losing updates.
class JobStore {
public:
    explicit JobStore(std::filesystem::path queue_file);

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    // fsync the temp file and directory on every save.
    void set_fsync(bool enable) { fsync_ = enable; }

    // Missing file -> empty queue. Throws StoreCorruption if the file exists
    // but cannot be parsed.
    QueueState load() const;

    // Atomic full replace. Throws std::runtime_error on I/O failure.
    void save(const QueueState& qs) const;

    // One critical section: lock, load, fn, save if fn returned true.
    // Returns fn's result. Exceptions from fn propagate and nothing is saved.
    bool update(const std::function<bool(QueueState&)>& fn) const;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path lock_path() const;

private:
    std::filesystem::path path_;
    bool fsync_ = false;
};

} // namespace seqrun
