/**
 * @file header.cpp
 * @brief Header parsing, serialization and digest.
 */

#include <hdrdelta/header.hpp>

#include <openssl/sha.h>

#include <algorithm>
#include <cstring>

namespace hdrdelta {

namespace {

std::uint32_t read_le32(const std::uint8_t* p) noexcept {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

void write_le32(std::uint8_t* p, std::uint32_t value) noexcept {
    p[0] = static_cast<std::uint8_t>(value & 0xFFU);
    p[1] = static_cast<std::uint8_t>((value >> 8) & 0xFFU);
    p[2] = static_cast<std::uint8_t>((value >> 16) & 0xFFU);
    p[3] = static_cast<std::uint8_t>((value >> 24) & 0xFFU);
}

} // namespace

Error Header::parse(const std::uint8_t* data, std::size_t size, Header& out) noexcept {
    if (data == nullptr || size != HEADER_SIZE) {
        return Error::MalformedHeader;
    }

    out.version = read_le32(data + OFF_VERSION);
    std::memcpy(out.prev_digest.data(), data + OFF_PREV_DIGEST, DIGEST_SIZE);
    std::memcpy(out.payload_root.data(), data + OFF_PAYLOAD_ROOT, DIGEST_SIZE);
    out.time = read_le32(data + OFF_TIME);
    out.difficulty_target = read_le32(data + OFF_TARGET);
    out.nonce = read_le32(data + OFF_NONCE);

    return Error::Ok;
}

HeaderBytes Header::serialize() const noexcept {
    HeaderBytes bytes{};
    write_le32(bytes.data() + OFF_VERSION, version);
    std::memcpy(bytes.data() + OFF_PREV_DIGEST, prev_digest.data(), DIGEST_SIZE);
    std::memcpy(bytes.data() + OFF_PAYLOAD_ROOT, payload_root.data(), DIGEST_SIZE);
    write_le32(bytes.data() + OFF_TIME, time);
    write_le32(bytes.data() + OFF_TARGET, difficulty_target);
    write_le32(bytes.data() + OFF_NONCE, nonce);
    return bytes;
}

Digest Header::digest() const noexcept {
    const HeaderBytes bytes = serialize();

    std::uint8_t first[SHA256_DIGEST_LENGTH];
    SHA256(bytes.data(), bytes.size(), first);

    Digest out{};
    SHA256(first, sizeof(first), out.data());
    return out;
}

std::string to_hex(const std::uint8_t* data, std::size_t size) {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(DIGITS[data[i] >> 4]);
        out.push_back(DIGITS[data[i] & 0x0FU]);
    }
    return out;
}

std::string display_hash(const Header& header) {
    Digest digest = header.digest();
    std::reverse(digest.begin(), digest.end());
    return to_hex(digest.data(), digest.size());
}

} // namespace hdrdelta
