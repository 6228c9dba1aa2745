/**
 * @file file_blob_store.hpp
 * @brief Filesystem-backed blob store.
 *
 * Layout under the root directory:
 *   <id>.bin    object bytes
 *   <id>.toml   BlobInfo and metadata (written last; its presence marks a
 *               complete object)
 */

#pragma once

#include "blob/blob_store.hpp"
#include "core/config.hpp"

#include <filesystem>
#include <shared_mutex>

namespace cloudlet {

class FileBlobStore : public IBlobStore {
public:
    explicit FileBlobStore(BlobStoreConfig config);

    /// Create the root directory.
    Result<void> open();

    Result<BlobObject> get(const BlobId& id) override;
    Result<BlobInfo> info(const BlobId& id) override;
    Result<BlobInfo> put(Bytes data, BlobPutRequest request) override;
    Result<void> remove(const BlobId& id) override;
    Result<BlobInfo> set_metadata(const BlobId& id, std::vector<BlobMetadata> metadata) override;
    Result<std::vector<BlobInfo>> list() override;

private:
    [[nodiscard]] std::filesystem::path data_path(const BlobId& id) const;
    [[nodiscard]] std::filesystem::path info_path(const BlobId& id) const;

    Result<BlobInfo> read_info(const BlobId& id) const;
    Result<void> write_info(const BlobInfo& info);

    BlobStoreConfig config_;
    mutable std::shared_mutex mutex_;
};

}  // namespace cloudlet
