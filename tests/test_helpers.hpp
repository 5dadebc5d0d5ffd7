/**
 * @file test_helpers.hpp
 * @brief Shared fixtures for the hdrdelta test suite.
 */

#ifndef HDRDELTA_TEST_HELPERS_HPP
#define HDRDELTA_TEST_HELPERS_HPP

#include <hdrdelta/hdrdelta.hpp>

#include <string_view>
#include <vector>

namespace hdrdelta::test {

inline std::vector<std::uint8_t> from_hex(std::string_view hex) {
    auto nibble = [](char c) -> std::uint8_t {
        if (c >= '0' && c <= '9') return static_cast<std::uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<std::uint8_t>(c - 'a' + 10);
        return static_cast<std::uint8_t>(c - 'A' + 10);
    };
    std::vector<std::uint8_t> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<std::uint8_t>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
    }
    return out;
}

/**
 * @brief Deterministic header; payload_root and nonce differ per seed.
 */
inline Header make_header(std::uint32_t seed) {
    Header h;
    h.version = 0x20000000U;
    h.time = 1600000000U + seed * 600U;
    h.difficulty_target = 0x1703A30CU;
    for (std::size_t i = 0; i < h.payload_root.size(); ++i) {
        h.payload_root[i] = static_cast<std::uint8_t>(seed * 31U + i * 7U + 1U);
    }
    h.nonce = seed * 2654435761U + 12345U;
    return h;
}

/**
 * @brief Recompute every prev_digest after fields were edited.
 */
inline void relink(std::vector<Header>& chain) {
    for (std::size_t i = 1; i < chain.size(); ++i) {
        chain[i].prev_digest = chain[i - 1].digest();
    }
}

/**
 * @brief Linked chain of count headers, each 600 s after the previous.
 */
inline std::vector<Header> make_chain(std::size_t count) {
    std::vector<Header> chain;
    chain.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        chain.push_back(make_header(static_cast<std::uint32_t>(i)));
    }
    relink(chain);
    return chain;
}

inline std::vector<std::uint8_t> to_bytes(const std::vector<Header>& chain) {
    std::vector<std::uint8_t> out;
    out.reserve(chain.size() * HEADER_SIZE);
    for (const auto& h : chain) {
        const HeaderBytes bytes = h.serialize();
        out.insert(out.end(), bytes.begin(), bytes.end());
    }
    return out;
}

/**
 * @brief Compress chain[1..] against chain[0] with the streaming API.
 */
inline std::vector<std::uint8_t> compress_chain(const std::vector<Header>& chain) {
    std::vector<std::uint8_t> out;
    VectorSink sink(out);
    Compressor comp;
    comp.begin(chain.front());
    for (std::size_t i = 1; i < chain.size(); ++i) {
        if (comp.push(chain[i], sink) != Error::Ok) {
            return {};
        }
    }
    if (comp.finish(sink) != Error::Ok) {
        return {};
    }
    return out;
}

} // namespace hdrdelta::test

#endif // HDRDELTA_TEST_HELPERS_HPP
