#include "seqrun/store.h"
#include "seqrun/file_lock.h"
#include "seqrun/serialization.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fcntl.h>
#include <unistd.h>

namespace seqrun {

static std::string write_all_fd(int fd, const std::string& body) {
    const char* p = body.data();
    size_t off = 0;
    while (off < body.size()) {
        ssize_t w = ::write(fd, p + off, body.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            return std::string("write: ") + std::strerror(errno);
        }
        off += (size_t)w;
    }
    return "";
}

JobStore::JobStore(std::filesystem::path queue_file) : path_(std::move(queue_file)) {}

std::filesystem::path JobStore::lock_path() const {
    auto p = path_;
    p += ".lock";
    return p;
}

QueueState JobStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        if (ec) throw std::runtime_error("stat " + path_.string() + ": " + ec.message());
        return QueueState{};
    }

    std::ifstream f(path_, std::ios::binary);
    if (!f) throw StoreCorruption("cannot open: " + path_.string());
    std::stringstream ss;
    ss << f.rdbuf();
    if (f.bad()) throw StoreCorruption("read failed: " + path_.string());

    return queue_state_from_json(ss.str(), path_.string());
}

void JobStore::save(const QueueState& qs) const {
    std::error_code ec;
    auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) throw std::runtime_error("create_directories: " + ec.message());
    }

    // pid suffix keeps two writers that somehow bypassed the lock from
    // sharing one temp file
    auto tmp = path_;
    tmp += ".tmp." + std::to_string(::getpid());

    int fd = ::open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw std::runtime_error("open " + tmp.string() + ": " + std::strerror(errno));
    }

    std::string err = write_all_fd(fd, queue_state_to_json(qs));
    if (err.empty() && fsync_ && ::fsync(fd) != 0) {
        err = std::string("fsync: ") + std::strerror(errno);
    }
    if (::close(fd) != 0 && err.empty()) {
        err = std::string("close: ") + std::strerror(errno);
    }
    if (!err.empty()) {
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error(tmp.string() + ": " + err);
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        std::error_code ec2;
        std::filesystem::remove(tmp, ec2);
        throw std::runtime_error("rename " + tmp.string() + ": " + ec.message());
    }

    if (fsync_) {
        // fsync parent directory for rename durability
        int dir_fd = ::open(parent.empty() ? "." : parent.c_str(), O_RDONLY | O_DIRECTORY);
        if (dir_fd >= 0) { ::fsync(dir_fd); ::close(dir_fd); }
    }
}

bool JobStore::update(const std::function<bool(QueueState&)>& fn) const {
    FileLock lock(lock_path());
    QueueState qs = load();
    if (!fn(qs)) return false;
    save(qs);
    return true;
}

} // namespace seqrun
