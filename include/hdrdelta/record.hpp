/**
 * @file record.hpp
 * @brief One compressed header record.
 *
 * @cond INTERNAL
 * ============================================================================
 *  _          _            _        _  _
 * | |__    __| | _ __   __| |  ___ | || |_   __ _
 * | '_ \  / _` || '__| / _` | / _ \| || __| / _` |
 * | | | || (_| || |   | (_| ||  __/| || |_ | (_| |
 * |_| |_| \__,_||_|    \__,_| \___||_| \__| \__,_|
 * ============================================================================
 * @endcond
 *
 * Wire layout:
 *
 *     [control] [version: 0|4] [prev_digest: 0|32] [payload_root: 32]
 *     [time: 2|4] [difficulty_target: 0|4] [nonce: 4]
 *
 * The control byte is kept apart from the payload so the sequence-end
 * bit can still be changed after the payload has been built.
 *
 * @authors hdrdelta contributors
 *
 * @see https://developer.bitcoin.org/reference/block_chain.html#block-headers Block header layout
 */

#ifndef HDRDELTA_RECORD_HPP
#define HDRDELTA_RECORD_HPP

#include "bytebuffer.hpp"
#include "config.hpp"
#include "error.hpp"

namespace hdrdelta {

/**
 * @brief Total record size announced by a control byte.
 *
 * Includes the control byte itself.
 */
constexpr std::size_t record_size_for(std::uint8_t control) noexcept {
    std::size_t size = 1U + DIGEST_SIZE + 4U; // control, payload_root, nonce
    if (((control & MASK_VERSION) >> VERSION_SHIFT) == VERSION_LITERAL) size += 4U;
    if ((control & MASK_PREV_DIGEST) == 0) size += DIGEST_SIZE;
    size += ((control & MASK_TIME_DELTA) != 0) ? 2U : 4U;
    if ((control & MASK_TARGET_SAME) == 0) size += 4U;
    return size;
}

/**
 * @brief Control byte plus variable payload.
 */
struct CompressedRecord {
    std::uint8_t control = 0;
    ByteBuffer<MAX_RECORD_BYTES - 1> payload;

    /**
     * @brief Reset to an empty record.
     */
    void clear() noexcept {
        control = 0;
        payload.clear();
    }

    /// Version code from bits 0-2 (7 = literal follows)
    [[nodiscard]] std::uint8_t version_code() const noexcept {
        return static_cast<std::uint8_t>((control & MASK_VERSION) >> VERSION_SHIFT);
    }

    [[nodiscard]] bool prev_digest_omitted() const noexcept {
        return (control & MASK_PREV_DIGEST) != 0;
    }

    [[nodiscard]] bool time_is_delta() const noexcept {
        return (control & MASK_TIME_DELTA) != 0;
    }

    [[nodiscard]] bool target_is_same() const noexcept {
        return (control & MASK_TARGET_SAME) != 0;
    }

    [[nodiscard]] bool sequence_end() const noexcept {
        return (control & MASK_SEQUENCE_END) != 0;
    }

    void set_sequence_end(bool end) noexcept {
        if (end) {
            control = static_cast<std::uint8_t>(control | MASK_SEQUENCE_END);
        } else {
            control = static_cast<std::uint8_t>(control & ~MASK_SEQUENCE_END);
        }
    }

    /**
     * @brief Encoded size including the control byte.
     */
    [[nodiscard]] std::size_t size() const noexcept {
        return 1U + payload.size();
    }

    /**
     * @brief Copy the record in wire order.
     *
     * @param bytes Destination buffer
     * @param max_bytes Destination capacity
     * @param[out] written Bytes written
     * @return Error::Ok on success, Error::Overflow if it does not fit
     */
    Error to_bytes(std::uint8_t* bytes, std::size_t max_bytes, std::size_t& written) const noexcept {
        written = 0;
        if (max_bytes < size()) {
            return Error::Overflow;
        }
        bytes[0] = control;
        written = 1U + payload.to_bytes(bytes + 1, max_bytes - 1);
        return Error::Ok;
    }
};

} // namespace hdrdelta

#endif // HDRDELTA_RECORD_HPP
