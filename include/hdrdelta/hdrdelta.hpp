/**
 * @file hdrdelta.hpp
 * @brief High-level hdrdelta compression API.
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
 * Buffer-to-buffer compress() and decompress() for whole runs of
 * concatenated 80-byte headers, suitable for file-level operations.
 *
 * A compressed run holds records for headers 2..N. Header 1, the anchor,
 * is not part of the output; both sides must obtain it out of band.
 *
 * @authors hdrdelta contributors
 *
 * @see https://developer.bitcoin.org/reference/block_chain.html#block-headers Block header layout
 */

#ifndef HDRDELTA_HPP
#define HDRDELTA_HPP

#include "bytebuffer.hpp"
#include "bytereader.hpp"
#include "compressor.hpp"
#include "config.hpp"
#include "decoder.hpp"
#include "decompressor.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "header.hpp"
#include "record.hpp"
#include "sink.hpp"
#include "version_cache.hpp"

namespace hdrdelta {

/**
 * @brief Upper bound on compressed output for a run.
 *
 * @param header_count Headers in the run, anchor included
 * @return Maximum number of bytes compress() can produce
 */
std::size_t max_compressed_size(std::size_t header_count) noexcept;

/**
 * @brief Compress a run of concatenated headers.
 *
 * @param input_data Raw headers, anchor first
 * @param input_size Input size in bytes (positive multiple of 80)
 * @param output_buffer Output buffer for compressed records
 * @param output_buffer_size Output buffer capacity
 * @param[out] output_size Compressed size
 * @param[out] headers_consumed Headers read, anchor included (may be nullptr)
 * @return Error::Ok on success, Error::MalformedHeader if the input is not
 *         a positive multiple of 80 bytes, Error::Overflow if the output
 *         buffer is too small
 */
Error compress(const std::uint8_t* input_data, std::size_t input_size,
               std::uint8_t* output_buffer, std::size_t output_buffer_size,
               std::size_t& output_size, std::size_t* headers_consumed = nullptr) noexcept;

/**
 * @brief Decompress one run.
 *
 * Decodes records until the one carrying the sequence-end bit. Bytes after
 * it are left alone and excluded from bytes_consumed. Empty input is an
 * empty run.
 *
 * @param anchor_data Raw anchor header
 * @param anchor_size Anchor size in bytes (must be 80)
 * @param input_data Compressed records
 * @param input_size Compressed size in bytes
 * @param output_buffer Output buffer for raw headers (anchor excluded)
 * @param output_buffer_size Output buffer capacity
 * @param[out] output_size Decompressed size
 * @param[out] bytes_consumed Compressed bytes used (may be nullptr)
 * @return Error::Ok on success, Error::MalformedHeader for a bad anchor,
 *         Error::DecodeError on corrupt input or input that ends before a
 *         sequence-end bit, Error::Overflow if the output buffer is too small,
 *         Error::InvalidArg for a null buffer with non-zero size
 */
Error decompress(const std::uint8_t* anchor_data, std::size_t anchor_size,
                 const std::uint8_t* input_data, std::size_t input_size,
                 std::uint8_t* output_buffer, std::size_t output_buffer_size,
                 std::size_t& output_size, std::size_t* bytes_consumed = nullptr) noexcept;

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace hdrdelta

#endif // HDRDELTA_HPP
