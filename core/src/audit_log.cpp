#include "seqrun/audit_log.h"
#include "seqrun/types.h"

#include <cerrno>
#include <cstring>
#include <deque>
#include <fstream>

#include <fcntl.h>
#include <unistd.h>

namespace seqrun {

std::string format_event_line(const std::string& message) {
    std::string line = "[" + format_local_time(now_ms()) + "] ";
    // one event per line; embedded newlines would split it
    for (char c : message) line.push_back((c == '\n' || c == '\r') ? ' ' : c);
    line.push_back('\n');
    return line;
}

AuditLog::AuditLog(std::filesystem::path path) : path_(std::move(path)) {}

AuditLog::~AuditLog() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void AuditLog::set_fsync(bool enable) {
    std::lock_guard<std::mutex> lk(mu_);
    fsync_ = enable;
}

std::string AuditLog::open_locked() {
    if (fd_ >= 0) return "";

    std::error_code ec;
    auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return std::string("create_directories: ") + ec.message();
    }

    fd_ = ::open(path_.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        return std::string("open: ") + std::strerror(errno);
    }
    return "";
}

std::string AuditLog::open() {
    std::lock_guard<std::mutex> lk(mu_);
    return open_locked();
}

std::string AuditLog::append(const std::string& message) {
    std::lock_guard<std::mutex> lk(mu_);
    std::string err = open_locked();
    if (!err.empty()) return err;

    const std::string line = format_event_line(message);
    const char* p = line.data();
    size_t off = 0;
    while (off < line.size()) {
        ssize_t w = ::write(fd_, p + off, line.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            return std::string("write: ") + std::strerror(errno);
        }
        off += (size_t)w;
    }

    if (fsync_) {
        if (::fsync(fd_) != 0) {
            return std::string("fsync: ") + std::strerror(errno);
        }
    }
    return "";
}

std::vector<std::string> AuditLog::tail(size_t n) const {
    std::vector<std::string> out;
    if (n == 0) return out;

    std::ifstream f(path_);
    if (!f) return out;

    std::deque<std::string> window;
    std::string line;
    while (std::getline(f, line)) {
        window.push_back(std::move(line));
        if (window.size() > n) window.pop_front();
    }
    out.assign(window.begin(), window.end());
    return out;
}

} // namespace seqrun
