/**
 * @file file_util.cpp
 * @brief POSIX file helper implementations.
 */

#include "core/file_util.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace cloudlet {

void UniqueFd::reset(int fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

std::string errno_message(std::string_view operation) {
    return std::string(operation) + ": " + std::strerror(errno);
}

Result<void> write_all(int fd, const uint8_t* data, size_t size) {
    size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(fd, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Error{errno_message("write")};
        }
        written += static_cast<size_t>(n);
    }
    return Result<void>{};
}

Result<void> pread_exact(int fd, uint8_t* data, size_t size, uint64_t offset) {
    size_t done = 0;
    while (done < size) {
        ssize_t n = ::pread(fd, data + done, size - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return Error{errno_message("pread")};
        }
        if (n == 0) {
            return Error{"pread: unexpected end of file"};
        }
        done += static_cast<size_t>(n);
    }
    return Result<void>{};
}

Result<void> fsync_directory(const std::filesystem::path& dir) {
    UniqueFd fd{::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC)};
    if (!fd) {
        return Error{errno_message("open directory " + dir.string())};
    }
    if (::fsync(fd.get()) != 0) {
        return Error{errno_message("fsync directory " + dir.string())};
    }
    return Result<void>{};
}

Result<void> write_file_atomic(const std::filesystem::path& path, std::string_view content) {
    auto temp_path = path;
    temp_path += ".tmp";

    {
        UniqueFd fd{::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)};
        if (!fd) {
            return Error{errno_message("create " + temp_path.string())};
        }

        auto written = write_all(fd.get(), reinterpret_cast<const uint8_t*>(content.data()),
                                 content.size());
        if (!written) {
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            return written.error();
        }
        if (::fdatasync(fd.get()) != 0) {
            auto err = Error{errno_message("fdatasync " + temp_path.string())};
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            return err;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return Error{"rename " + temp_path.string() + " failed: " + ec.message()};
    }

    return fsync_directory(path.parent_path().empty() ? std::filesystem::path{"."}
                                                      : path.parent_path());
}

Result<Bytes> read_file(const std::filesystem::path& path) {
    UniqueFd fd{::open(path.c_str(), O_RDONLY | O_CLOEXEC)};
    if (!fd) {
        return Error{errno_message("open " + path.string())};
    }

    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) {
        return Error{errno_message("fstat " + path.string())};
    }

    Bytes data(static_cast<size_t>(st.st_size));
    if (!data.empty()) {
        auto read = pread_exact(fd.get(), data.data(), data.size(), 0);
        if (!read) return read.error();
    }
    return data;
}

}  // namespace cloudlet
