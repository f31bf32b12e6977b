#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace seqrun {

// AuditLog: append-only plain-text event log shared by every process.
//
// Each event is one line: "[YYYY-MM-DD HH:MM:SS] <message>\n", written with
// a single write() on an O_APPEND descriptor, so concurrent appenders from
// different processes interleave whole lines and need no lock. The file is
// never truncated or rewritten.
class AuditLog {
public:
    explicit AuditLog(std::filesystem::path path);
    ~AuditLog();

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    void set_fsync(bool enable);

    // Opens the log (creates parent dirs if needed).
    // Returns empty string on success.
    std::string open();

    // Appends one timestamped line. Opens lazily.
    // Returns empty string on success.
    std::string append(const std::string& message);

    // Last n lines, oldest first. Missing file -> empty.
    std::vector<std::string> tail(size_t n) const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
    bool fsync_ = false;
    std::mutex mu_;

    std::string open_locked();
};

// "[2026-10-17 14:03:11] message" with the current local time.
std::string format_event_line(const std::string& message);

} // namespace seqrun
