/**
 * @file blob_store.hpp
 * @brief Blob collaborator interface and metadata vocabulary.
 *
 * The execution core only ever talks to IBlobStore. Implementations are
 * chosen at startup, so virtual dispatch is used here.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cloudlet {

// ─────────────────────────────────────────────
// Metadata
// ─────────────────────────────────────────────

struct BlobMetadata {
    std::string name;
    std::string value;
    std::string content_type = "text/plain";

    bool operator==(const BlobMetadata&) const = default;
};

/// Look a metadata value up by name. Names compare case-insensitively.
[[nodiscard]] std::optional<std::string> find_metadata(const std::vector<BlobMetadata>& metadata,
                                                       std::string_view name);

/// Insert or replace a metadata entry.
void set_metadata_value(std::vector<BlobMetadata>& metadata,
                        std::string_view name,
                        std::string value);

/// Remove a metadata entry if present.
void erase_metadata(std::vector<BlobMetadata>& metadata, std::string_view name);

struct BlobInfo {
    BlobId id;
    std::string file_name;
    std::string content_type = "application/octet-stream";
    uint64_t size{0};
    Timestamp created_at;
    std::vector<BlobMetadata> metadata;
};

struct BlobObject {
    BlobInfo info;
    Bytes data;
};

/**
 * @brief What the caller supplies when storing a new object.
 */
struct BlobPutRequest {
    std::string file_name;
    std::string content_type = "application/octet-stream";
    std::vector<BlobMetadata> metadata;
};

// ─────────────────────────────────────────────
// IBlobStore
// ─────────────────────────────────────────────

class IBlobStore {
public:
    virtual ~IBlobStore() = default;

    /// Fails with BlobNotFound when the id is unknown.
    virtual Result<BlobObject> get(const BlobId& id) = 0;

    virtual Result<BlobInfo> info(const BlobId& id) = 0;

    /// Store a new object; fails with BlobOperationFailed above the size limit.
    virtual Result<BlobInfo> put(Bytes data, BlobPutRequest request) = 0;

    virtual Result<void> remove(const BlobId& id) = 0;

    /// Replace the full metadata list of an existing object.
    virtual Result<BlobInfo> set_metadata(const BlobId& id,
                                          std::vector<BlobMetadata> metadata) = 0;

    virtual Result<std::vector<BlobInfo>> list() = 0;
};

}  // namespace cloudlet
