/**
 * @file file_util.hpp
 * @brief POSIX file helpers: owned descriptors and crash-safe writes.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace cloudlet {

/**
 * @brief Owning wrapper around a POSIX file descriptor.
 */
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) reset(other.release());
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept;

private:
    int fd_{-1};
};

/// Human-readable errno description prefixed with the failing operation.
[[nodiscard]] std::string errno_message(std::string_view operation);

/// Write all bytes at the current offset, retrying on EINTR and short writes.
Result<void> write_all(int fd, const uint8_t* data, size_t size);

/// Read exactly size bytes at offset; fails on EOF.
Result<void> pread_exact(int fd, uint8_t* data, size_t size, uint64_t offset);

/// fsync a directory so that renames and creations inside it are durable.
Result<void> fsync_directory(const std::filesystem::path& dir);

/**
 * @brief Replace a file atomically: write a sibling .tmp, fsync, rename, fsync dir.
 */
Result<void> write_file_atomic(const std::filesystem::path& path, std::string_view content);

/// Read a whole file into memory.
Result<Bytes> read_file(const std::filesystem::path& path);

}  // namespace cloudlet
