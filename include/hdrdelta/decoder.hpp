/**
 * @file decoder.hpp
 * @brief Delta decoder for chain headers.
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
 * Mirror of the Encoder. The decoder must see exactly the records the
 * encoder produced, in order: prev_digest is rebuilt by hashing the
 * decoder's own previous header, so any divergence propagates silently
 * to every later header. Errors are therefore fatal for the session.
 *
 * @authors hdrdelta contributors
 *
 * @see https://developer.bitcoin.org/reference/block_chain.html#block-headers Block header layout
 */

#ifndef HDRDELTA_DECODER_HPP
#define HDRDELTA_DECODER_HPP

#include "bytereader.hpp"
#include "config.hpp"
#include "error.hpp"
#include "header.hpp"
#include "record.hpp"
#include "version_cache.hpp"

namespace hdrdelta {

/**
 * @brief Outcome of decoding one record.
 */
struct DecodeResult {
    Header header;
    bool sequence_end = false; ///< Record carried the sequence-end bit
};

/**
 * @brief Stateful header decoder.
 */
class Decoder {
public:
    Decoder() noexcept = default;

    /**
     * @brief Start a session from the anchor header.
     */
    void begin(const Header& anchor) noexcept;

    /**
     * @brief Discard all session state.
     */
    void reset() noexcept;

    /**
     * @brief Decode the next record from a byte stream.
     *
     * On success the reader is positioned after the record. State advances
     * only when decoding succeeds.
     *
     * @param reader Reader positioned at a control byte
     * @param[out] result Reconstructed header and sequence-end bit
     * @return Error::Ok on success, Error::DecodeError on truncated input,
     *         a reserved bit, a version code naming an empty cache slot,
     *         a literal version already cached, or if begin() was not called
     */
    Error decode_next(ByteReader& reader, DecodeResult& result) noexcept;

    /**
     * @brief Decode a single, already framed record.
     *
     * Fails with Error::DecodeError if the record carries bytes its
     * control byte does not account for.
     */
    Error decode_next(const CompressedRecord& record, DecodeResult& result) noexcept;

    [[nodiscard]] bool started() const noexcept { return started_; }

    /// Last header decoded (or the anchor)
    [[nodiscard]] const Header& previous() const noexcept { return prev_; }

    [[nodiscard]] const VersionCache& versions() const noexcept { return versions_; }

    /// Records decoded since begin()
    [[nodiscard]] std::size_t records_decoded() const noexcept { return records_; }

private:
    Header prev_;
    VersionCache versions_;
    std::size_t records_ = 0;
    bool started_ = false;
};

} // namespace hdrdelta

#endif // HDRDELTA_DECODER_HPP
