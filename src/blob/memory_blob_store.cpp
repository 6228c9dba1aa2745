/**
 * @file memory_blob_store.cpp
 * @brief InMemoryBlobStore implementation.
 */

#include "blob/memory_blob_store.hpp"

#include "core/id.hpp"

namespace cloudlet {

InMemoryBlobStore::InMemoryBlobStore(uint64_t max_blob_bytes)
    : max_blob_bytes_(max_blob_bytes) {}

Result<BlobObject> InMemoryBlobStore::get(const BlobId& id) {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(id);
    if (it == objects_.end()) return Error::blob_not_found(id);
    return it->second;
}

Result<BlobInfo> InMemoryBlobStore::info(const BlobId& id) {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(id);
    if (it == objects_.end()) return Error::blob_not_found(id);
    return it->second.info;
}

Result<BlobInfo> InMemoryBlobStore::put(Bytes data, BlobPutRequest request) {
    if (data.size() > max_blob_bytes_) {
        return Error::blob_operation_failed(
            "", "object of " + std::to_string(data.size()) + " bytes exceeds the limit of "
            + std::to_string(max_blob_bytes_) + " bytes");
    }

    BlobObject object;
    object.info.id = generate_id();
    object.info.file_name = std::move(request.file_name);
    object.info.content_type = std::move(request.content_type);
    object.info.size = data.size();
    object.info.created_at = std::chrono::system_clock::now();
    object.info.metadata = std::move(request.metadata);
    object.data = std::move(data);

    std::lock_guard lock(mutex_);
    BlobInfo info = object.info;
    objects_.emplace(info.id, std::move(object));
    return info;
}

Result<void> InMemoryBlobStore::remove(const BlobId& id) {
    std::lock_guard lock(mutex_);
    if (objects_.erase(id) == 0) return Error::blob_not_found(id);
    return Result<void>{};
}

Result<BlobInfo> InMemoryBlobStore::set_metadata(const BlobId& id,
                                                 std::vector<BlobMetadata> metadata) {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(id);
    if (it == objects_.end()) return Error::blob_not_found(id);
    it->second.info.metadata = std::move(metadata);
    return it->second.info;
}

Result<std::vector<BlobInfo>> InMemoryBlobStore::list() {
    std::lock_guard lock(mutex_);
    std::vector<BlobInfo> out;
    out.reserve(objects_.size());
    for (const auto& [id, object] : objects_) {
        out.push_back(object.info);
    }
    return out;
}

size_t InMemoryBlobStore::size() const {
    std::lock_guard lock(mutex_);
    return objects_.size();
}

}  // namespace cloudlet
