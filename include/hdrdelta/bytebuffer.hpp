/**
 * @file bytebuffer.hpp
 * @brief Fixed-capacity byte buffer for building compressed records.
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
 * Bytes are appended sequentially. Multi-byte integers are written
 * little-endian, which is how every integer field of the header and of
 * the compressed record travels on the wire.
 *
 * @authors hdrdelta contributors
 *
 * @see https://developer.bitcoin.org/reference/block_chain.html#block-headers Block header layout
 */

#ifndef HDRDELTA_BYTEBUFFER_HPP
#define HDRDELTA_BYTEBUFFER_HPP

#include "config.hpp"
#include "error.hpp"

#include <array>
#include <cstring>

namespace hdrdelta {

/**
 * @brief Byte buffer with static allocation.
 *
 * @tparam MaxBytes Maximum size in bytes
 *
 * A failed append leaves the buffer unchanged.
 */
template <std::size_t MaxBytes = MAX_RECORD_BYTES>
class ByteBuffer {
public:
    /**
     * @brief Default constructor - initializes to empty state.
     */
    constexpr ByteBuffer() noexcept : data_{}, size_(0) {}

    /**
     * @brief Clear buffer to empty state.
     */
    void clear() noexcept {
        size_ = 0;
        data_.fill(0);
    }

    /**
     * @brief Get number of bytes in buffer.
     */
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

    /**
     * @brief Get buffer capacity.
     */
    [[nodiscard]] static constexpr std::size_t capacity() noexcept { return MaxBytes; }

    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    [[nodiscard]] const std::uint8_t* data() const noexcept { return data_.data(); }

    std::uint8_t operator[](std::size_t index) const noexcept { return data_[index]; }

    /**
     * @brief Append a single byte.
     *
     * @param value Byte value
     * @return Error::Ok on success, Error::Overflow if buffer is full
     */
    Error append_byte(std::uint8_t value) noexcept {
        if (size_ >= MaxBytes) {
            return Error::Overflow;
        }
        data_[size_++] = value;
        return Error::Ok;
    }

    /**
     * @brief Append a byte range verbatim.
     *
     * @param bytes Source bytes
     * @param count Number of bytes to append
     * @return Error::Ok on success, Error::Overflow if it does not fit
     */
    Error append_bytes(const std::uint8_t* bytes, std::size_t count) noexcept {
        if (count > MaxBytes - size_) {
            return Error::Overflow;
        }
        if (count > 0) {
            std::memcpy(&data_[size_], bytes, count);
        }
        size_ += count;
        return Error::Ok;
    }

    /**
     * @brief Append a 16-bit value, little-endian.
     */
    Error append_le16(std::uint16_t value) noexcept {
        const std::uint8_t bytes[2] = {
            static_cast<std::uint8_t>(value & 0xFFU),
            static_cast<std::uint8_t>((value >> 8) & 0xFFU)
        };
        return append_bytes(bytes, sizeof(bytes));
    }

    /**
     * @brief Append a 32-bit value, little-endian.
     */
    Error append_le32(std::uint32_t value) noexcept {
        const std::uint8_t bytes[4] = {
            static_cast<std::uint8_t>(value & 0xFFU),
            static_cast<std::uint8_t>((value >> 8) & 0xFFU),
            static_cast<std::uint8_t>((value >> 16) & 0xFFU),
            static_cast<std::uint8_t>((value >> 24) & 0xFFU)
        };
        return append_bytes(bytes, sizeof(bytes));
    }

    /**
     * @brief Copy buffer contents to a byte array.
     *
     * @param bytes Destination byte array
     * @param max_bytes Maximum bytes to write
     * @return Number of bytes written
     */
    std::size_t to_bytes(std::uint8_t* bytes, std::size_t max_bytes) const noexcept {
        std::size_t num_bytes = (size_ < max_bytes) ? size_ : max_bytes;
        if (num_bytes > 0) {
            std::memcpy(bytes, data_.data(), num_bytes);
        }
        return num_bytes;
    }

private:
    std::array<std::uint8_t, MaxBytes> data_;
    std::size_t size_;
};

} // namespace hdrdelta

#endif // HDRDELTA_BYTEBUFFER_HPP
