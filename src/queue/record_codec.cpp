/**
 * @file record_codec.cpp
 * @brief RecordCodec implementation.
 */

#include "queue/record_codec.hpp"

#include <array>

namespace cloudlet {

namespace {

constexpr std::array<uint32_t, 256> make_crc_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1U) ? (0xEDB88320U ^ (c >> 1)) : (c >> 1);
        }
        table[i] = c;
    }
    return table;
}

constexpr auto kCrcTable = make_crc_table();

}  // namespace

// ─────────────────────────────────────────────
// Helpers: big-endian encode/decode, CRC-32
// ─────────────────────────────────────────────

void RecordCodec::put_u64(Bytes& buf, uint64_t val) {
    for (int i = 7; i >= 0; --i) {
        buf.push_back(static_cast<uint8_t>((val >> (i * 8)) & 0xFF));
    }
}

void RecordCodec::put_u32(Bytes& buf, uint32_t val) {
    buf.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

uint64_t RecordCodec::get_u64(const uint8_t* p) {
    uint64_t val = 0;
    for (int i = 0; i < 8; ++i) {
        val = (val << 8) | p[i];
    }
    return val;
}

uint32_t RecordCodec::get_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24)
         | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8)
         | static_cast<uint32_t>(p[3]);
}

uint32_t RecordCodec::crc32(const uint8_t* data, size_t size, uint32_t crc) {
    crc = ~crc;
    for (size_t i = 0; i < size; ++i) {
        crc = kCrcTable[(crc ^ data[i]) & 0xFFU] ^ (crc >> 8);
    }
    return ~crc;
}

// ─────────────────────────────────────────────
// Encoding
// ─────────────────────────────────────────────

void RecordCodec::encode_file_header(Bytes& buf) {
    put_u32(buf, kMagic);
    put_u32(buf, kVersion);
}

bool RecordCodec::check_file_header(const uint8_t* p, size_t size) {
    if (size < kFileHeaderSize) return false;
    return get_u32(p) == kMagic && get_u32(p + 4) == kVersion;
}

size_t RecordCodec::encode_enqueue(Bytes& buf,
                                   uint64_t seq,
                                   const MessageId& id,
                                   const std::string& content_type,
                                   Timestamp enqueued_at,
                                   const Bytes& payload) {
    const size_t start = buf.size();
    buf.reserve(start + kRecordPrefixSize + 32 + id.size() + content_type.size()
                + payload.size() + kRecordSuffixSize);

    buf.push_back(static_cast<uint8_t>(RecordType::Enqueue));
    put_u32(buf, 0);  // body_len, patched by seal()

    put_u64(buf, seq);
    put_u64(buf, static_cast<uint64_t>(to_unix_ms(enqueued_at)));
    put_u32(buf, static_cast<uint32_t>(id.size()));
    buf.insert(buf.end(), id.begin(), id.end());
    put_u32(buf, static_cast<uint32_t>(content_type.size()));
    buf.insert(buf.end(), content_type.begin(), content_type.end());
    put_u32(buf, static_cast<uint32_t>(payload.size()));

    const size_t payload_offset = buf.size();
    buf.insert(buf.end(), payload.begin(), payload.end());

    seal(buf, start);
    return payload_offset;
}

void RecordCodec::encode_remove(Bytes& buf, uint64_t seq) {
    const size_t start = buf.size();
    buf.push_back(static_cast<uint8_t>(RecordType::Remove));
    put_u32(buf, 0);
    put_u64(buf, seq);
    seal(buf, start);
}

void RecordCodec::encode_purge(Bytes& buf) {
    const size_t start = buf.size();
    buf.push_back(static_cast<uint8_t>(RecordType::Purge));
    put_u32(buf, 0);
    seal(buf, start);
}

void RecordCodec::seal(Bytes& buf, size_t record_start) {
    auto body_len = static_cast<uint32_t>(buf.size() - record_start - kRecordPrefixSize);
    buf[record_start + 1] = static_cast<uint8_t>((body_len >> 24) & 0xFF);
    buf[record_start + 2] = static_cast<uint8_t>((body_len >> 16) & 0xFF);
    buf[record_start + 3] = static_cast<uint8_t>((body_len >> 8) & 0xFF);
    buf[record_start + 4] = static_cast<uint8_t>(body_len & 0xFF);

    uint32_t crc = crc32(buf.data() + record_start, buf.size() - record_start);
    put_u32(buf, crc);
}

// ─────────────────────────────────────────────
// Decoding
// ─────────────────────────────────────────────

std::optional<uint32_t> RecordCodec::peek_body_size(const uint8_t* prefix) {
    auto type = prefix[0];
    if (type < static_cast<uint8_t>(RecordType::Enqueue)
        || type > static_cast<uint8_t>(RecordType::Purge)) {
        return std::nullopt;
    }
    uint32_t body_len = get_u32(prefix + 1);
    if (body_len > kMaxBodySize) return std::nullopt;
    return body_len;
}

std::optional<DecodedRecord> RecordCodec::decode(const uint8_t* record, size_t size) {
    if (size < kRecordPrefixSize + kRecordSuffixSize) return std::nullopt;

    auto body_len = peek_body_size(record);
    if (!body_len || kRecordPrefixSize + *body_len + kRecordSuffixSize != size) {
        return std::nullopt;
    }

    const size_t crc_offset = kRecordPrefixSize + *body_len;
    if (crc32(record, crc_offset) != get_u32(record + crc_offset)) {
        return std::nullopt;
    }

    DecodedRecord out;
    out.type = static_cast<RecordType>(record[0]);

    const uint8_t* body = record + kRecordPrefixSize;
    const size_t body_size = *body_len;
    size_t offset = 0;

    auto need = [&](size_t n) { return offset + n <= body_size; };

    switch (out.type) {
        case RecordType::Purge:
            if (body_size != 0) return std::nullopt;
            return out;

        case RecordType::Remove:
            if (body_size != 8) return std::nullopt;
            out.seq = get_u64(body);
            return out;

        case RecordType::Enqueue: {
            if (!need(20)) return std::nullopt;
            out.seq = get_u64(body + offset);
            offset += 8;
            out.enqueued_at_ms = static_cast<int64_t>(get_u64(body + offset));
            offset += 8;

            uint32_t id_len = get_u32(body + offset);
            offset += 4;
            if (!need(id_len + 4)) return std::nullopt;
            out.id.assign(reinterpret_cast<const char*>(body + offset), id_len);
            offset += id_len;

            uint32_t ct_len = get_u32(body + offset);
            offset += 4;
            if (!need(ct_len + 4)) return std::nullopt;
            out.content_type.assign(reinterpret_cast<const char*>(body + offset), ct_len);
            offset += ct_len;

            uint32_t payload_len = get_u32(body + offset);
            offset += 4;
            if (offset + payload_len != body_size) return std::nullopt;

            out.payload_size = payload_len;
            out.payload_offset = kRecordPrefixSize + offset;
            return out;
        }
    }
    return std::nullopt;
}

}  // namespace cloudlet
