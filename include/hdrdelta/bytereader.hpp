/**
 * @file bytereader.hpp
 * @brief Sequential byte reading from compressed data.
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
 * The byte reader tracks a position within a borrowed buffer. Integers
 * are read little-endian. A read that would run past the end fails with
 * Error::Underflow and leaves the position untouched, so a truncated
 * record is never decoded from a short read.
 *
 * @authors hdrdelta contributors
 *
 * @see https://developer.bitcoin.org/reference/block_chain.html#block-headers Block header layout
 */

#ifndef HDRDELTA_BYTEREADER_HPP
#define HDRDELTA_BYTEREADER_HPP

#include "config.hpp"
#include "error.hpp"

#include <cstring>

namespace hdrdelta {

/**
 * @brief Sequential byte reader for compressed data.
 */
class ByteReader {
public:
    /**
     * @brief Construct a byte reader.
     *
     * @param data Pointer to source data buffer (not owned)
     * @param size Number of valid bytes in buffer
     */
    ByteReader(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0) {}

    /**
     * @brief Read a single byte.
     */
    Error read_u8(std::uint8_t& value) noexcept {
        if (remaining() < 1) [[unlikely]] {
            return Error::Underflow;
        }
        value = data_[pos_++];
        return Error::Ok;
    }

    /**
     * @brief Read a 16-bit little-endian value.
     */
    Error read_le16(std::uint16_t& value) noexcept {
        if (remaining() < 2) [[unlikely]] {
            return Error::Underflow;
        }
        value = static_cast<std::uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
        pos_ += 2;
        return Error::Ok;
    }

    /**
     * @brief Read a 32-bit little-endian value.
     */
    Error read_le32(std::uint32_t& value) noexcept {
        if (remaining() < 4) [[unlikely]] {
            return Error::Underflow;
        }
        value = static_cast<std::uint32_t>(data_[pos_]) |
                (static_cast<std::uint32_t>(data_[pos_ + 1]) << 8) |
                (static_cast<std::uint32_t>(data_[pos_ + 2]) << 16) |
                (static_cast<std::uint32_t>(data_[pos_ + 3]) << 24);
        pos_ += 4;
        return Error::Ok;
    }

    /**
     * @brief Read a byte range verbatim.
     *
     * @param out Destination buffer (at least count bytes)
     * @param count Number of bytes to read
     */
    Error read_bytes(std::uint8_t* out, std::size_t count) noexcept {
        if (remaining() < count) [[unlikely]] {
            return Error::Underflow;
        }
        if (count > 0) {
            std::memcpy(out, &data_[pos_], count);
        }
        pos_ += count;
        return Error::Ok;
    }

    /**
     * @brief Get current position.
     *
     * @return Number of bytes already read
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    /**
     * @brief Get remaining bytes.
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return size_ - pos_;
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

} // namespace hdrdelta

#endif // HDRDELTA_BYTEREADER_HPP
