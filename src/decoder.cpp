/**
 * @file decoder.cpp
 * @brief Delta decoder.
 */

#include <hdrdelta/decoder.hpp>

namespace hdrdelta {

namespace {

// Any reader failure inside a record means the record was cut short
inline Error as_decode_error(Error status) noexcept {
    return (status == Error::Ok) ? Error::Ok : Error::DecodeError;
}

} // namespace

void Decoder::begin(const Header& anchor) noexcept {
    prev_ = anchor;
    versions_.seed(anchor.version);
    records_ = 0;
    started_ = true;
}

void Decoder::reset() noexcept {
    prev_ = Header{};
    versions_.reset();
    records_ = 0;
    started_ = false;
}

Error Decoder::decode_next(ByteReader& reader, DecodeResult& result) noexcept {
    if (!started_) {
        return Error::DecodeError;
    }

    Header header;
    Error status = Error::Ok;

    // Control byte
    std::uint8_t control = 0;
    status = as_decode_error(reader.read_u8(control));
    if (status != Error::Ok) return status;

    if ((control & MASK_RESERVED) != 0) {
        return Error::DecodeError;
    }

    // Version
    const auto code = static_cast<std::uint8_t>((control & MASK_VERSION) >> VERSION_SHIFT);
    const bool new_version = (code == VERSION_LITERAL);
    if (new_version) {
        status = as_decode_error(reader.read_le32(header.version));
        if (status != Error::Ok) return status;

        // A conforming encoder only sends literals the cache lacks
        if (versions_.index_of(header.version)) {
            return Error::DecodeError;
        }
    } else {
        if (code >= versions_.size()) {
            return Error::DecodeError;
        }
        header.version = versions_.at(code);
    }

    // Previous digest
    if ((control & MASK_PREV_DIGEST) != 0) {
        header.prev_digest = prev_.digest();
    } else {
        status = as_decode_error(reader.read_bytes(header.prev_digest.data(), DIGEST_SIZE));
        if (status != Error::Ok) return status;
    }

    // Payload root
    status = as_decode_error(reader.read_bytes(header.payload_root.data(), DIGEST_SIZE));
    if (status != Error::Ok) return status;

    // Time
    if ((control & MASK_TIME_DELTA) != 0) {
        std::uint16_t raw = 0;
        status = as_decode_error(reader.read_le16(raw));
        if (status != Error::Ok) return status;

        // Sign-extend, then add modulo 2^32
        const auto delta = static_cast<std::int32_t>(static_cast<std::int16_t>(raw));
        header.time = prev_.time + static_cast<std::uint32_t>(delta);
    } else {
        status = as_decode_error(reader.read_le32(header.time));
        if (status != Error::Ok) return status;
    }

    // Difficulty target
    if ((control & MASK_TARGET_SAME) != 0) {
        header.difficulty_target = prev_.difficulty_target;
    } else {
        status = as_decode_error(reader.read_le32(header.difficulty_target));
        if (status != Error::Ok) return status;
    }

    // Nonce
    status = as_decode_error(reader.read_le32(header.nonce));
    if (status != Error::Ok) return status;

    // Commit, in the same order as the encoder
    if (new_version) {
        versions_.note_new(header.version);
    }
    prev_ = header;
    ++records_;

    result.header = header;
    result.sequence_end = (control & MASK_SEQUENCE_END) != 0;

    return Error::Ok;
}

Error Decoder::decode_next(const CompressedRecord& record, DecodeResult& result) noexcept {
    if (record.size() != record_size_for(record.control)) {
        return Error::DecodeError;
    }

    std::uint8_t bytes[MAX_RECORD_BYTES];
    std::size_t size = 0;
    Error status = record.to_bytes(bytes, sizeof(bytes), size);
    if (status != Error::Ok) {
        return Error::DecodeError;
    }

    ByteReader reader(bytes, size);
    return decode_next(reader, result);
}

} // namespace hdrdelta
