#include "platform/file_lock.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <thread>
#include <unistd.h>

FileLock::~FileLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

FileLock::FileLock(FileLock&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

std::expected<FileLock, std::string> FileLock::acquire(const std::filesystem::path& path,
                                                       std::stop_token stop) {
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return std::unexpected("open(" + path.string() + ") failed: " + std::strerror(errno));
    }

    while (::flock(fd, LOCK_EX | LOCK_NB) < 0) {
        if (errno == EINTR) continue;
        if (errno != EWOULDBLOCK) {
            int e = errno;
            ::close(fd);
            return std::unexpected("flock(" + path.string() + ") failed: " + std::strerror(e));
        }
        if (stop.stop_requested()) {
            ::close(fd);
            return std::unexpected("cancelled while waiting for " + path.string());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return FileLock(fd);
}
