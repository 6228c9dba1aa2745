/**
 * @file record_codec.hpp
 * @brief Binary encoding of queue log records.
 *
 * Log layout (all multi-byte values are big-endian):
 *
 * File header:
 *   [4B magic "CLQL"][4B version]
 *
 * Record:
 *   [1B type][4B body_len][body...][4B crc32(type, body_len, body)]
 *
 * Bodies:
 *   ENQUEUE  [8B seq][8B enqueued_at_ms][4B id_len][id][4B ct_len][content_type]
 *            [4B payload_len][payload]
 *   REMOVE   [8B seq]
 *   PURGE    (empty)
 */

#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace cloudlet {

enum class RecordType : uint8_t {
    Enqueue = 1,
    Remove = 2,
    Purge = 3
};

/**
 * @brief A decoded record. Payload bytes are not copied; payload_offset points
 *        into the record buffer.
 */
struct DecodedRecord {
    RecordType type{RecordType::Enqueue};
    uint64_t seq{0};
    int64_t enqueued_at_ms{0};
    MessageId id;
    std::string content_type;
    uint64_t payload_size{0};
    size_t payload_offset{0};       ///< Relative to the start of the record
};

/**
 * @brief Stateless encoder/decoder for the queue log format.
 */
class RecordCodec {
public:
    static constexpr uint32_t kMagic = 0x434C514C;     // "CLQL"
    static constexpr uint32_t kVersion = 1;
    static constexpr size_t kFileHeaderSize = 8;
    static constexpr size_t kRecordPrefixSize = 5;     // type + body_len
    static constexpr size_t kRecordSuffixSize = 4;     // crc32
    static constexpr uint32_t kMaxBodySize = 1U << 30;

    static constexpr size_t kEnqueueFixedSize = 8 + 8 + 4 + 4 + 4;   // seq, time, 3 lengths
    static constexpr size_t kMaxFieldSize = 4096;      // message id or content type
    /// Largest payload whose ENQUEUE record replay still accepts.
    static constexpr uint64_t kMaxPayloadSize = kMaxBodySize - kEnqueueFixedSize - 2 * kMaxFieldSize;

    [[nodiscard]] static constexpr uint64_t enqueue_body_size(size_t id_size,
                                                              size_t content_type_size,
                                                              uint64_t payload_size) noexcept {
        return kEnqueueFixedSize + id_size + content_type_size + payload_size;
    }

    static void encode_file_header(Bytes& buf);
    [[nodiscard]] static bool check_file_header(const uint8_t* p, size_t size);

    /// Append an ENQUEUE record; returns the payload offset relative to buf's start.
    static size_t encode_enqueue(Bytes& buf,
                                 uint64_t seq,
                                 const MessageId& id,
                                 const std::string& content_type,
                                 Timestamp enqueued_at,
                                 const Bytes& payload);
    static void encode_remove(Bytes& buf, uint64_t seq);
    static void encode_purge(Bytes& buf);

    /// Body length from a record prefix, or nullopt for an unknown type or oversize body.
    [[nodiscard]] static std::optional<uint32_t> peek_body_size(const uint8_t* prefix);

    /// Decode a complete record, verifying its checksum.
    [[nodiscard]] static std::optional<DecodedRecord> decode(const uint8_t* record, size_t size);

    [[nodiscard]] static uint32_t crc32(const uint8_t* data, size_t size, uint32_t crc = 0);

    static void put_u64(Bytes& buf, uint64_t val);
    static void put_u32(Bytes& buf, uint32_t val);
    [[nodiscard]] static uint64_t get_u64(const uint8_t* p);
    [[nodiscard]] static uint32_t get_u32(const uint8_t* p);

private:
    static void seal(Bytes& buf, size_t record_start);
};

}  // namespace cloudlet
