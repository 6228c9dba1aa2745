/**
 * @file memory_blob_store.hpp
 * @brief Process-local blob store for embedding and tests.
 */

#pragma once

#include "blob/blob_store.hpp"

#include <map>
#include <mutex>

namespace cloudlet {

class InMemoryBlobStore : public IBlobStore {
public:
    explicit InMemoryBlobStore(uint64_t max_blob_bytes = 100ULL * 1024 * 1024);

    Result<BlobObject> get(const BlobId& id) override;
    Result<BlobInfo> info(const BlobId& id) override;
    Result<BlobInfo> put(Bytes data, BlobPutRequest request) override;
    Result<void> remove(const BlobId& id) override;
    Result<BlobInfo> set_metadata(const BlobId& id, std::vector<BlobMetadata> metadata) override;
    Result<std::vector<BlobInfo>> list() override;

    [[nodiscard]] size_t size() const;

private:
    uint64_t max_blob_bytes_;
    mutable std::mutex mutex_;
    std::map<BlobId, BlobObject> objects_;
};

}  // namespace cloudlet
