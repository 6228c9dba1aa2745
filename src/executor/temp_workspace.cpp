/**
 * @file temp_workspace.cpp
 * @brief TempWorkspace implementation.
 */

#include "executor/temp_workspace.hpp"

#include "core/file_util.hpp"
#include "core/id.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace cloudlet {

Result<TempWorkspace> TempWorkspace::create(const std::filesystem::path& root,
                                            std::string_view blob_id) {
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        return Error{"Cannot create temp root " + root.string() + ": " + ec.message()};
    }

    auto path = root / (std::string(kWorkspacePrefix) + std::string(blob_id) + "_"
                        + generate_id());
    if (::mkdir(path.c_str(), 0700) != 0) {
        return Error{errno_message("mkdir " + path.string())};
    }
    return TempWorkspace{std::move(path)};
}

TempWorkspace::~TempWorkspace() {
    if (!path_.empty()) {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
}

TempWorkspace::TempWorkspace(TempWorkspace&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempWorkspace& TempWorkspace::operator=(TempWorkspace&& other) noexcept {
    if (this != &other) {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

Result<std::filesystem::path> TempWorkspace::write_file(std::string_view name,
                                                        const Bytes& data,
                                                        unsigned mode) const {
    auto file = path_ / std::filesystem::path(name).filename();
    UniqueFd fd{::open(file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                       static_cast<mode_t>(mode))};
    if (!fd) {
        return Error{errno_message("create " + file.string())};
    }
    if (!data.empty()) {
        if (auto w = write_all(fd.get(), data.data(), data.size()); !w) return w.error();
    }
    if (::fchmod(fd.get(), static_cast<mode_t>(mode)) != 0) {
        return Error{errno_message("chmod " + file.string())};
    }
    return file;
}

Result<void> TempWorkspace::remove() {
    if (path_.empty()) return Result<void>{};

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        return Error{"Cannot remove workspace " + path_.string() + ": " + ec.message()};
    }
    path_.clear();
    return Result<void>{};
}

}  // namespace cloudlet
