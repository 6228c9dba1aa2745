/**
 * @file file_blob_store.cpp
 * @brief FileBlobStore implementation; metadata is serialized with toml++.
 */

#include "blob/file_blob_store.hpp"

#include "core/file_util.hpp"
#include "core/id.hpp"
#include "core/validation.hpp"

#include <mutex>
#include <sstream>

#include <toml++/toml.hpp>

namespace cloudlet {

FileBlobStore::FileBlobStore(BlobStoreConfig config) : config_(std::move(config)) {}

Result<void> FileBlobStore::open() {
    std::error_code ec;
    std::filesystem::create_directories(config_.root, ec);
    if (ec) {
        return Error::blob_operation_failed("", "cannot create root "
                                            + config_.root.string() + ": " + ec.message());
    }
    return Result<void>{};
}

std::filesystem::path FileBlobStore::data_path(const BlobId& id) const {
    return config_.root / (id + ".bin");
}

std::filesystem::path FileBlobStore::info_path(const BlobId& id) const {
    return config_.root / (id + ".toml");
}

// ─────────────────────────────────────────────
// Info (de)serialization
// ─────────────────────────────────────────────

Result<BlobInfo> FileBlobStore::read_info(const BlobId& id) const {
    auto path = info_path(id);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error::blob_not_found(id);
    }

    try {
        auto tbl = toml::parse_file(path.string());

        BlobInfo info;
        info.id = tbl["id"].value_or(id);
        info.file_name = tbl["file_name"].value_or(std::string{});
        info.content_type = tbl["content_type"].value_or(std::string{"application/octet-stream"});
        info.size = static_cast<uint64_t>(tbl["size"].value_or(int64_t{0}));
        info.created_at = from_unix_ms(tbl["created_at_ms"].value_or(int64_t{0}));

        if (auto* entries = tbl["metadata"].as_array()) {
            for (const auto& node : *entries) {
                const auto* entry = node.as_table();
                if (entry == nullptr) continue;
                BlobMetadata m;
                m.name = (*entry)["name"].value_or(std::string{});
                m.value = (*entry)["value"].value_or(std::string{});
                m.content_type = (*entry)["content_type"].value_or(std::string{"text/plain"});
                if (!m.name.empty()) info.metadata.push_back(std::move(m));
            }
        }
        return info;

    } catch (const toml::parse_error& err) {
        return Error::blob_operation_failed(id, "corrupt metadata: "
                                            + std::string{err.description()});
    }
}

Result<void> FileBlobStore::write_info(const BlobInfo& info) {
    toml::array entries;
    for (const auto& m : info.metadata) {
        entries.push_back(toml::table{
            {"name", m.name},
            {"value", m.value},
            {"content_type", m.content_type},
        });
    }

    toml::table tbl{
        {"id", info.id},
        {"file_name", info.file_name},
        {"content_type", info.content_type},
        {"size", static_cast<int64_t>(info.size)},
        {"created_at_ms", to_unix_ms(info.created_at)},
    };
    tbl.insert("metadata", std::move(entries));

    std::ostringstream oss;
    oss << tbl << '\n';

    auto written = write_file_atomic(info_path(info.id), oss.str());
    if (!written) {
        return Error::blob_operation_failed(info.id, written.error().message);
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// IBlobStore
// ─────────────────────────────────────────────

Result<BlobObject> FileBlobStore::get(const BlobId& id) {
    if (auto valid = validate_identifier("blob_id", id); !valid) return valid.error();

    std::shared_lock lock(mutex_);
    auto info = read_info(id);
    if (!info) return info.error();

    auto data = read_file(data_path(id));
    if (!data) {
        return Error::blob_operation_failed(id, data.error().message);
    }
    return BlobObject{.info = std::move(*info), .data = std::move(*data)};
}

Result<BlobInfo> FileBlobStore::info(const BlobId& id) {
    if (auto valid = validate_identifier("blob_id", id); !valid) return valid.error();

    std::shared_lock lock(mutex_);
    return read_info(id);
}

Result<BlobInfo> FileBlobStore::put(Bytes data, BlobPutRequest request) {
    if (data.size() > config_.max_blob_bytes) {
        return Error::blob_operation_failed(
            "", "object of " + std::to_string(data.size()) + " bytes exceeds the limit of "
            + std::to_string(config_.max_blob_bytes) + " bytes");
    }

    BlobInfo info;
    info.id = generate_id();
    info.file_name = std::move(request.file_name);
    info.content_type = std::move(request.content_type);
    info.size = data.size();
    info.created_at = std::chrono::system_clock::now();
    info.metadata = std::move(request.metadata);

    std::unique_lock lock(mutex_);

    auto written = write_file_atomic(
        data_path(info.id),
        std::string_view(reinterpret_cast<const char*>(data.data()), data.size()));
    if (!written) {
        return Error::blob_operation_failed(info.id, written.error().message);
    }

    if (auto meta = write_info(info); !meta) {
        std::error_code ec;
        std::filesystem::remove(data_path(info.id), ec);
        return meta.error();
    }
    return info;
}

Result<void> FileBlobStore::remove(const BlobId& id) {
    if (auto valid = validate_identifier("blob_id", id); !valid) return valid.error();

    std::unique_lock lock(mutex_);
    std::error_code ec;
    if (!std::filesystem::exists(info_path(id), ec)) {
        return Error::blob_not_found(id);
    }

    // Metadata first: without it the object is no longer visible
    std::filesystem::remove(info_path(id), ec);
    if (ec) return Error::blob_operation_failed(id, ec.message());
    std::filesystem::remove(data_path(id), ec);
    if (ec) return Error::blob_operation_failed(id, ec.message());
    return Result<void>{};
}

Result<BlobInfo> FileBlobStore::set_metadata(const BlobId& id,
                                             std::vector<BlobMetadata> metadata) {
    if (auto valid = validate_identifier("blob_id", id); !valid) return valid.error();

    std::unique_lock lock(mutex_);
    auto info = read_info(id);
    if (!info) return info.error();

    info->metadata = std::move(metadata);
    if (auto written = write_info(*info); !written) return written.error();
    return info;
}

Result<std::vector<BlobInfo>> FileBlobStore::list() {
    std::shared_lock lock(mutex_);

    std::vector<BlobInfo> out;
    std::error_code ec;
    std::filesystem::directory_iterator it(config_.root, ec);
    for (; !ec && it != std::filesystem::directory_iterator{}; it.increment(ec)) {
        const auto& path = it->path();
        if (path.extension() != ".toml") continue;

        auto info = read_info(path.stem().string());
        if (!info) return info.error();
        out.push_back(std::move(*info));
    }
    if (ec) {
        return Error::blob_operation_failed("", "cannot list " + config_.root.string()
                                            + ": " + ec.message());
    }
    return out;
}

}  // namespace cloudlet
