/**
 * @file temp_workspace.hpp
 * @brief Per-invocation scratch directory, removed when the owner goes away.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <string_view>

namespace cloudlet {

/// Every workspace directory name starts with this; the cleaner keys on it.
inline constexpr std::string_view kWorkspacePrefix = "cloudlet_fn_";

class TempWorkspace {
public:
    /// Create <root>/cloudlet_fn_<blob_id>_<random>.
    static Result<TempWorkspace> create(const std::filesystem::path& root,
                                        std::string_view blob_id);

    ~TempWorkspace();

    TempWorkspace(TempWorkspace&& other) noexcept;
    TempWorkspace& operator=(TempWorkspace&& other) noexcept;
    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /**
     * @brief Write @p data to a file inside the workspace.
     * @param mode POSIX permission bits, e.g. 0700 for executables.
     */
    Result<std::filesystem::path> write_file(std::string_view name,
                                             const Bytes& data,
                                             unsigned mode = 0600) const;

    /// Remove the directory now, reporting failure. The destructor becomes a no-op.
    Result<void> remove();

private:
    explicit TempWorkspace(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
};

}  // namespace cloudlet
