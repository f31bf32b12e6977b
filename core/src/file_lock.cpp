#include "seqrun/file_lock.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace seqrun {

static int open_lock_file(const std::filesystem::path& path) {
    std::error_code ec;
    auto parent = path.parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw std::runtime_error("open lock " + path.string() + ": " + std::strerror(errno));
    }
    return fd;
}

FileLock::FileLock(const std::filesystem::path& path) {
    int fd = open_lock_file(path);
    while (::flock(fd, LOCK_EX) != 0) {
        if (errno == EINTR) continue;
        int e = errno;
        ::close(fd);
        throw std::runtime_error("flock " + path.string() + ": " + std::strerror(e));
    }
    fd_ = fd;
}

FileLock FileLock::try_acquire(const std::filesystem::path& path) {
    FileLock lk;
    int fd = open_lock_file(path);
    while (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        if (errno == EINTR) continue;
        int e = errno;
        ::close(fd);
        if (e == EWOULDBLOCK) return lk;
        throw std::runtime_error("flock " + path.string() + ": " + std::strerror(e));
    }
    lk.fd_ = fd;
    return lk;
}

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

void FileLock::release() {
    if (fd_ < 0) return;
    // closing the descriptor drops the flock
    ::close(fd_);
    fd_ = -1;
}

} // namespace seqrun
