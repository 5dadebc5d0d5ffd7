/**
 * @file compressor.hpp
 * @brief Streaming header compressor.
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
 * The last record of a run carries the sequence-end bit, but the run is
 * only known to be over once no further header arrives. The compressor
 * holds back exactly one encoded record: push() releases the previous
 * record with the bit clear, finish() releases the final one with the
 * bit set. Output is append-only, so sinks need not be seekable.
 *
 * @authors hdrdelta contributors
 *
 * @see https://developer.bitcoin.org/reference/block_chain.html#block-headers Block header layout
 */

#ifndef HDRDELTA_COMPRESSOR_HPP
#define HDRDELTA_COMPRESSOR_HPP

#include "config.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "header.hpp"
#include "record.hpp"

namespace hdrdelta {

/**
 * @brief One-record-lookahead wrapper around Encoder.
 */
class Compressor {
public:
    Compressor() noexcept = default;

    /**
     * @brief Start a run from its anchor header.
     *
     * Any record still pending from a previous run is dropped; call
     * finish() first to keep it.
     */
    void begin(const Header& anchor) noexcept {
        encoder_.begin(anchor);
        pending_.clear();
        has_pending_ = false;
        headers_ = 1;
        bytes_ = 0;
    }

    /**
     * @brief Discard all state.
     */
    void reset() noexcept {
        encoder_.reset();
        pending_.clear();
        has_pending_ = false;
        headers_ = 0;
        bytes_ = 0;
    }

    /**
     * @brief Compress the next header of the run.
     *
     * The record held from the previous push is written to the sink,
     * then the header is encoded and held in its place.
     *
     * If the sink fails, the header is not consumed and the held record
     * stays pending. Retrying is only sound with a sink that writes
     * nothing on failure (VectorSink, BufferSink); a StreamSink failure
     * ends the run.
     *
     * @tparam Sink Output target (see sink.hpp)
     * @param header Next header in chain order
     * @param sink Output target
     * @return Error::Ok on success, Error::EncodeError if begin() was not
     *         called, or the sink's error
     */
    template <typename Sink>
    Error push(const Header& header, Sink& sink) {
        if (!encoder_.started()) {
            return Error::EncodeError;
        }

        // Release the held record first so a sink failure leaves the encoder untouched
        if (has_pending_) {
            Error status = flush(sink);
            if (status != Error::Ok) {
                return status;
            }
        }

        Error status = encoder_.encode_next(header, pending_);
        if (status != Error::Ok) {
            return status;
        }

        has_pending_ = true;
        ++headers_;
        return Error::Ok;
    }

    /**
     * @brief End the run, writing the held record with sequence-end set.
     *
     * A run consisting of the anchor alone writes nothing.
     */
    template <typename Sink>
    Error finish(Sink& sink) {
        if (!has_pending_) {
            return Error::Ok;
        }
        pending_.set_sequence_end(true);
        return flush(sink);
    }

    [[nodiscard]] bool has_pending() const noexcept { return has_pending_; }

    /// Headers taken in for the current run, anchor included
    [[nodiscard]] std::size_t headers_consumed() const noexcept { return headers_; }

    /// Bytes released to the sink for the current run
    [[nodiscard]] std::size_t bytes_written() const noexcept { return bytes_; }

    [[nodiscard]] const Encoder& encoder() const noexcept { return encoder_; }

private:
    template <typename Sink>
    Error flush(Sink& sink) {
        std::uint8_t bytes[MAX_RECORD_BYTES];
        std::size_t size = 0;
        Error status = pending_.to_bytes(bytes, sizeof(bytes), size);
        if (status != Error::Ok) {
            return Error::EncodeError;
        }

        status = sink.write(bytes, size);
        if (status != Error::Ok) {
            return status;
        }

        bytes_ += size;
        pending_.clear();
        has_pending_ = false;
        return Error::Ok;
    }

    Encoder encoder_;
    CompressedRecord pending_;
    bool has_pending_ = false;
    std::size_t headers_ = 0;
    std::size_t bytes_ = 0;
};

} // namespace hdrdelta

#endif // HDRDELTA_COMPRESSOR_HPP
