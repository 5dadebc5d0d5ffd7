/**
 * @file decompressor.hpp
 * @brief Streaming header decompressor.
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
 * Drives the Decoder over a byte stream until the record carrying the
 * sequence-end bit has been decoded.
 *
 * @authors hdrdelta contributors
 *
 * @see https://developer.bitcoin.org/reference/block_chain.html#block-headers Block header layout
 */

#ifndef HDRDELTA_DECOMPRESSOR_HPP
#define HDRDELTA_DECOMPRESSOR_HPP

#include "bytereader.hpp"
#include "config.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "header.hpp"

namespace hdrdelta {

/**
 * @brief Run-aware wrapper around Decoder.
 */
class Decompressor {
public:
    Decompressor() noexcept = default;

    /**
     * @brief Start a run from its anchor header.
     */
    void begin(const Header& anchor) noexcept {
        decoder_.begin(anchor);
        ended_ = false;
    }

    /**
     * @brief Discard all state.
     */
    void reset() noexcept {
        decoder_.reset();
        ended_ = false;
    }

    /**
     * @brief Decode the next header of the run.
     *
     * @param reader Reader positioned at a record
     * @param[out] header Reconstructed header
     * @return Error::Ok on success, Error::DecodeError on corrupt or
     *         truncated input, or when the run has already ended
     */
    Error next(ByteReader& reader, Header& header) noexcept {
        if (ended_) {
            return Error::DecodeError;
        }

        DecodeResult result;
        Error status = decoder_.decode_next(reader, result);
        if (status != Error::Ok) {
            return status;
        }

        header = result.header;
        ended_ = result.sequence_end;
        return Error::Ok;
    }

    /// The last decoded record carried the sequence-end bit
    [[nodiscard]] bool sequence_ended() const noexcept { return ended_; }

    /// Headers decoded for the current run, anchor excluded
    [[nodiscard]] std::size_t headers_decoded() const noexcept { return decoder_.records_decoded(); }

    [[nodiscard]] const Decoder& decoder() const noexcept { return decoder_; }

private:
    Decoder decoder_;
    bool ended_ = false;
};

} // namespace hdrdelta

#endif // HDRDELTA_DECOMPRESSOR_HPP
