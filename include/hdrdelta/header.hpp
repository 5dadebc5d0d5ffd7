/**
 * @file header.hpp
 * @brief Fixed 80-byte chain header model.
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
 * A header is six fields laid out back to back:
 *
 * | field             | offset | size |
 * |-------------------|--------|------|
 * | version           | 0      | 4    |
 * | prev_digest       | 4      | 32   |
 * | payload_root      | 36     | 32   |
 * | time              | 68     | 4    |
 * | difficulty_target | 72     | 4    |
 * | nonce             | 76     | 4    |
 *
 * Integer fields are little-endian on the wire. The header digest is
 * SHA-256 applied twice to the serialized form; the following header's
 * prev_digest carries it.
 *
 * @authors hdrdelta contributors
 *
 * @see https://developer.bitcoin.org/reference/block_chain.html#block-headers Block header layout
 */

#ifndef HDRDELTA_HEADER_HPP
#define HDRDELTA_HEADER_HPP

#include "config.hpp"
#include "error.hpp"

#include <array>
#include <string>

namespace hdrdelta {

using Digest = std::array<std::uint8_t, DIGEST_SIZE>;
using HeaderBytes = std::array<std::uint8_t, HEADER_SIZE>;

/**
 * @brief A parsed chain header.
 */
struct Header {
    std::uint32_t version = 0;
    Digest prev_digest{};
    Digest payload_root{};
    std::uint32_t time = 0;
    std::uint32_t difficulty_target = 0;
    std::uint32_t nonce = 0;

    /**
     * @brief Parse a raw header.
     *
     * @param data Raw header bytes
     * @param size Number of bytes available (must be HEADER_SIZE)
     * @param[out] out Parsed header
     * @return Error::Ok on success, Error::MalformedHeader if size != 80
     */
    static Error parse(const std::uint8_t* data, std::size_t size, Header& out) noexcept;

    /**
     * @brief Serialize into the 80-byte wire layout.
     */
    [[nodiscard]] HeaderBytes serialize() const noexcept;

    /**
     * @brief Double SHA-256 of the serialized header.
     */
    [[nodiscard]] Digest digest() const noexcept;

    bool operator==(const Header& other) const = default;
};

/**
 * @brief Lowercase hex encoding of a byte range.
 */
std::string to_hex(const std::uint8_t* data, std::size_t size);

/**
 * @brief Display form of a header hash.
 *
 * Chain explorers print the digest byte-reversed, so the genesis header
 * reads 000000000019d6...
 */
std::string display_hash(const Header& header);

} // namespace hdrdelta

#endif // HDRDELTA_HEADER_HPP
