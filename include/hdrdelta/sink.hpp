/**
 * @file sink.hpp
 * @brief Output targets for the streaming compressor.
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
 * A sink is any type with
 *
 *     Error write(const std::uint8_t* data, std::size_t size);
 *
 * Sinks only ever append. Nothing written is revisited, so a pipe or
 * socket wrapper works as well as a memory buffer.
 *
 * @authors hdrdelta contributors
 *
 * @see https://developer.bitcoin.org/reference/block_chain.html#block-headers Block header layout
 */

#ifndef HDRDELTA_SINK_HPP
#define HDRDELTA_SINK_HPP

#include "config.hpp"
#include "error.hpp"

#include <cstring>
#include <ostream>
#include <vector>

namespace hdrdelta {

/**
 * @brief Appends to a caller-owned std::vector.
 */
class VectorSink {
public:
    explicit VectorSink(std::vector<std::uint8_t>& out) noexcept : out_(out) {}

    Error write(const std::uint8_t* data, std::size_t size) {
        out_.insert(out_.end(), data, data + size);
        return Error::Ok;
    }

private:
    std::vector<std::uint8_t>& out_;
};

/**
 * @brief Writes into a caller-owned fixed buffer.
 *
 * A write that does not fit fails with Error::Overflow and writes nothing.
 */
class BufferSink {
public:
    BufferSink(std::uint8_t* buffer, std::size_t capacity) noexcept
        : buffer_(buffer), capacity_(capacity), size_(0) {}

    Error write(const std::uint8_t* data, std::size_t size) noexcept {
        if (size > capacity_ - size_) {
            return Error::Overflow;
        }
        if (size > 0) {
            std::memcpy(buffer_ + size_, data, size);
        }
        size_ += size;
        return Error::Ok;
    }

    /// Bytes written so far
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

private:
    std::uint8_t* buffer_;
    std::size_t capacity_;
    std::size_t size_;
};

/**
 * @brief Writes to a std::ostream (file, pipe, stringstream).
 *
 * A failed write may already have put part of the data on the stream, so
 * the first failure is terminal: every later write returns Error::Overflow
 * without touching the stream, even if its state is cleared.
 */
class StreamSink {
public:
    explicit StreamSink(std::ostream& os) noexcept : os_(os) {}

    Error write(const std::uint8_t* data, std::size_t size) {
        if (failed_) {
            return Error::Overflow;
        }
        os_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        if (!os_.good()) {
            failed_ = true;
            return Error::Overflow;
        }
        return Error::Ok;
    }

    /// A write has failed; the run on this stream is lost
    [[nodiscard]] bool failed() const noexcept { return failed_; }

private:
    std::ostream& os_;
    bool failed_ = false;
};

} // namespace hdrdelta

#endif // HDRDELTA_SINK_HPP
