/**
 * @file encoder.cpp
 * @brief Delta encoder.
 */

#include <hdrdelta/encoder.hpp>

namespace hdrdelta {

void Encoder::begin(const Header& anchor) noexcept {
    prev_ = anchor;
    versions_.seed(anchor.version);
    records_ = 0;
    started_ = true;
}

void Encoder::reset() noexcept {
    prev_ = Header{};
    versions_.reset();
    records_ = 0;
    started_ = false;
}

Error Encoder::encode_next(const Header& header, CompressedRecord& record) noexcept {
    record.clear();
    if (!started_) {
        return Error::EncodeError;
    }

    // prev_digest is never transmitted after the anchor
    std::uint8_t control = MASK_PREV_DIGEST;
    Error status = Error::Ok;

    // Version
    const auto slot = versions_.index_of(header.version);
    if (slot) {
        control = static_cast<std::uint8_t>(control | (*slot << VERSION_SHIFT));
    } else {
        control = static_cast<std::uint8_t>(control | (VERSION_LITERAL << VERSION_SHIFT));
        status = record.payload.append_le32(header.version);
        if (status != Error::Ok) return Error::EncodeError;
    }

    // Payload root
    status = record.payload.append_bytes(header.payload_root.data(), DIGEST_SIZE);
    if (status != Error::Ok) return Error::EncodeError;

    // Time
    const std::int64_t delta = time_delta(prev_.time, header.time);
    if (time_delta_fits(delta)) {
        control = static_cast<std::uint8_t>(control | MASK_TIME_DELTA);
        const auto delta16 = static_cast<std::int16_t>(delta);
        status = record.payload.append_le16(static_cast<std::uint16_t>(delta16));
    } else {
        status = record.payload.append_le32(header.time);
    }
    if (status != Error::Ok) return Error::EncodeError;

    // Difficulty target
    if (header.difficulty_target == prev_.difficulty_target) {
        control = static_cast<std::uint8_t>(control | MASK_TARGET_SAME);
    } else {
        status = record.payload.append_le32(header.difficulty_target);
        if (status != Error::Ok) return Error::EncodeError;
    }

    // Nonce
    status = record.payload.append_le32(header.nonce);
    if (status != Error::Ok) return Error::EncodeError;

    record.control = control;

    // Commit: the decoder performs the same cache update on the literal
    if (!slot) {
        versions_.note_new(header.version);
    }
    prev_ = header;
    ++records_;

    return Error::Ok;
}

} // namespace hdrdelta
