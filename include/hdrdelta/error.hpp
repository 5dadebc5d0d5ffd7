/**
 * @file error.hpp
 * @brief hdrdelta error handling.
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
 * Every fallible operation returns an Error and hands results back through
 * out-parameters. No codec path throws.
 *
 * @authors hdrdelta contributors
 *
 * @see https://developer.bitcoin.org/reference/block_chain.html#block-headers Block header layout
 */

#ifndef HDRDELTA_ERROR_HPP
#define HDRDELTA_ERROR_HPP

namespace hdrdelta {

/**
 * @brief Error codes returned by all codec operations.
 */
enum class Error {
    Ok = 0,              ///< Success
    InvalidArg = -1,     ///< Invalid argument
    Overflow = -2,       ///< Output buffer too small
    Underflow = -3,      ///< Not enough input bytes
    MalformedHeader = -4,///< Raw header is not exactly 80 bytes
    EncodeError = -5,    ///< Encoder invariant violated
    DecodeError = -6     ///< Truncated or corrupted compressed input
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::Overflow:
        return "Output buffer overflow";
    case Error::Underflow:
        return "Input buffer underflow";
    case Error::MalformedHeader:
        return "Malformed header (expected 80 bytes)";
    case Error::EncodeError:
        return "Encoder state error";
    case Error::DecodeError:
        return "Truncated or corrupted compressed data";
    default:
        return "Unknown error";
    }
}

} // namespace hdrdelta

#endif // HDRDELTA_ERROR_HPP
