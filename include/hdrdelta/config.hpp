/**
 * @file config.hpp
 * @brief hdrdelta compile-time configuration.
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
 * Layout of the fixed 80-byte chain header and of the compressed record
 * control byte. All values are part of the wire format.
 *
 * @see https://github.com/willcl-ark/compressed-block-headers Compressed block headers
 *
 * @authors hdrdelta contributors
 *
 * @see https://developer.bitcoin.org/reference/block_chain.html#block-headers Block header layout
 */

#ifndef HDRDELTA_CONFIG_HPP
#define HDRDELTA_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace hdrdelta {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup layout Header Layout
 *
 * Field offsets within a serialized header. Multi-byte integers are
 * little-endian as transmitted.
 * @{
 */
inline constexpr std::size_t HEADER_SIZE = 80U;
inline constexpr std::size_t DIGEST_SIZE = 32U;

inline constexpr std::size_t OFF_VERSION = 0U;
inline constexpr std::size_t OFF_PREV_DIGEST = 4U;
inline constexpr std::size_t OFF_PAYLOAD_ROOT = 36U;
inline constexpr std::size_t OFF_TIME = 68U;
inline constexpr std::size_t OFF_TARGET = 72U;
inline constexpr std::size_t OFF_NONCE = 76U;
/** @} */

/**
 * @defgroup control Control Byte
 *
 * Bit numbering below is MSB-first, matching the format description:
 *
 * | bits | mask | meaning                                           |
 * |------|------|---------------------------------------------------|
 * | 0-2  | 0xE0 | version cache index 0-6, or 7 for a literal       |
 * | 3    | 0x10 | prev_digest omitted (recomputed by the decoder)   |
 * | 4    | 0x08 | time sent as a signed 16-bit delta                |
 * | 5    | 0x04 | difficulty target identical to previous header    |
 * | 6    | 0x02 | last record of the sequence                       |
 * | 7    | 0x01 | reserved, always zero                             |
 * @{
 */
inline constexpr std::uint8_t MASK_VERSION = 0xE0U;
inline constexpr unsigned VERSION_SHIFT = 5U;
inline constexpr std::uint8_t MASK_PREV_DIGEST = 0x10U;
inline constexpr std::uint8_t MASK_TIME_DELTA = 0x08U;
inline constexpr std::uint8_t MASK_TARGET_SAME = 0x04U;
inline constexpr std::uint8_t MASK_SEQUENCE_END = 0x02U;
inline constexpr std::uint8_t MASK_RESERVED = 0x01U;

/// Version code announcing a 4-byte literal
inline constexpr std::uint8_t VERSION_LITERAL = 7U;

/// Distinct versions remembered by the recency cache (codes 0-6)
inline constexpr std::size_t VERSION_CACHE_SLOTS = 7U;
/** @} */

/**
 * @defgroup delta Time Delta Bounds
 *
 * A delta is sent in two bytes only when TIME_DELTA_MIN < delta < TIME_DELTA_MAX.
 * Both bounds are exclusive; -32768 and 32767 go out as literals.
 * @{
 */
inline constexpr std::int64_t TIME_DELTA_MIN = -32768;
inline constexpr std::int64_t TIME_DELTA_MAX = 32767;
/** @} */

/**
 * @defgroup sizes Record Sizes
 * @{
 */
/// Control byte, version, prev_digest, payload_root, time, target, nonce
inline constexpr std::size_t MAX_RECORD_BYTES = 1U + 4U + 32U + 32U + 4U + 4U + 4U;
/// Control byte, payload_root, 2-byte delta, nonce
inline constexpr std::size_t MIN_RECORD_BYTES = 1U + 32U + 2U + 4U;
/** @} */

} // namespace hdrdelta

#endif // HDRDELTA_CONFIG_HPP
