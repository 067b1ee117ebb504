#include "trovi/migration/worker_lock.hpp"
#include "trovi/core/log.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/file.h>
#include <unistd.h>

namespace trovi {

WorkerLock::WorkerLock(std::string path) : path_(std::move(path)) {}

WorkerLock::~WorkerLock() {
    unlock();
}

bool WorkerLock::try_lock() {
    if (fd_ >= 0) {
        return true;
    }

    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw std::runtime_error("Cannot open worker lock " + path_ + ": " + std::strerror(errno));
    }

    int rc;
    do {
        rc = flock(fd, LOCK_EX | LOCK_NB);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            return false;
        }
        throw std::runtime_error("Cannot lock " + path_ + ": " + std::strerror(err));
    }

    fd_ = fd;
    log_debug("Holding worker lock %s", path_.c_str());
    return true;
}

void WorkerLock::unlock() {
    if (fd_ < 0) {
        return;
    }
    flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

}  // namespace trovi
