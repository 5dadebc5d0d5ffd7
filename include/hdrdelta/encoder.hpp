/**
 * @file encoder.hpp
 * @brief Delta encoder for chain headers.
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
 * The encoder keeps the last header it saw and a version recency cache.
 * Each header is encoded against its predecessor:
 * - version: cache slot index, or a 4-byte literal that then enters the cache
 * - prev_digest: never sent; the decoder recomputes it from its own copy
 *   of the previous header
 * - payload_root: 32 literal bytes
 * - time: signed 16-bit delta when it fits the exclusive bounds, else 4 bytes
 * - difficulty_target: omitted when identical, else 4 bytes
 * - nonce: 4 literal bytes
 *
 * The encoder never sets the sequence-end bit. Whoever drives it knows
 * when the run is over (see Compressor).
 *
 * @authors hdrdelta contributors
 *
 * @see https://developer.bitcoin.org/reference/block_chain.html#block-headers Block header layout
 */

#ifndef HDRDELTA_ENCODER_HPP
#define HDRDELTA_ENCODER_HPP

#include "config.hpp"
#include "error.hpp"
#include "header.hpp"
#include "record.hpp"
#include "version_cache.hpp"

namespace hdrdelta {

/**
 * @brief Signed difference next - prev, computed without wrapping.
 */
constexpr std::int64_t time_delta(std::uint32_t prev, std::uint32_t next) noexcept {
    return static_cast<std::int64_t>(next) - static_cast<std::int64_t>(prev);
}

/**
 * @brief Whether a time delta is sent in its 2-byte form.
 */
constexpr bool time_delta_fits(std::int64_t delta) noexcept {
    return delta > TIME_DELTA_MIN && delta < TIME_DELTA_MAX;
}

/**
 * @brief Stateful header encoder.
 */
class Encoder {
public:
    Encoder() noexcept = default;

    /**
     * @brief Start a session from the anchor header.
     *
     * Stores the anchor as previous header and seeds the version cache
     * with its version. Produces no output.
     */
    void begin(const Header& anchor) noexcept;

    /**
     * @brief Discard all session state.
     */
    void reset() noexcept;

    /**
     * @brief Encode the next header of the chain.
     *
     * State advances only when encoding succeeds.
     *
     * @param header Next header in chain order
     * @param[out] record Compressed form, sequence-end bit clear
     * @return Error::Ok on success, Error::EncodeError if begin() was not
     *         called or the record could not be built
     */
    Error encode_next(const Header& header, CompressedRecord& record) noexcept;

    [[nodiscard]] bool started() const noexcept { return started_; }

    /// Last header encoded (or the anchor)
    [[nodiscard]] const Header& previous() const noexcept { return prev_; }

    [[nodiscard]] const VersionCache& versions() const noexcept { return versions_; }

    /// Records produced since begin()
    [[nodiscard]] std::size_t records_encoded() const noexcept { return records_; }

private:
    Header prev_;
    VersionCache versions_;
    std::size_t records_ = 0;
    bool started_ = false;
};

} // namespace hdrdelta

#endif // HDRDELTA_ENCODER_HPP
