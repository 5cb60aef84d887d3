#pragma once

#include <expected>
#include <filesystem>
#include <stop_token>
#include <string>

// Exclusive advisory lock on a lock file, held for the object's lifetime.
// Serializes builds of the same key across processes sharing a cache root.
class FileLock {
public:
    FileLock() = default;
    ~FileLock();

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    // Waits for the lock, giving up when `stop` is requested.
    static std::expected<FileLock, std::string> acquire(const std::filesystem::path& path,
                                                        std::stop_token stop = {});

private:
    explicit FileLock(int fd) : fd_(fd) {}

    int fd_ = -1;
};
