/**
 * @file test_edge_cases.cpp
 * @brief Boundary and corruption tests across the whole codec.
 */

#include <catch2/catch_test_macros.hpp>
#include <hdrdelta/hdrdelta.hpp>

#include <algorithm>

#include "test_helpers.hpp"

using namespace hdrdelta;
using namespace hdrdelta::test;

namespace {

std::vector<Header> decode_all(const Header& anchor, const std::vector<std::uint8_t>& data) {
    std::vector<Header> out;
    Decompressor decomp;
    decomp.begin(anchor);
    ByteReader reader(data.data(), data.size());
    while (!decomp.sequence_ended()) {
        Header h;
        if (decomp.next(reader, h) != Error::Ok) {
            return {};
        }
        out.push_back(h);
    }
    return out;
}

void require_round_trip(const std::vector<Header>& chain) {
    auto data = compress_chain(chain);
    REQUIRE_FALSE(data.empty());
    auto decoded = decode_all(chain.front(), data);
    REQUIRE(decoded.size() == chain.size() - 1);
    for (std::size_t i = 0; i < decoded.size(); ++i) {
        REQUIRE(decoded[i] == chain[i + 1]);
    }
}

CompressedRecord encode_pair(const Header& prev, const Header& next) {
    Encoder enc;
    enc.begin(prev);
    CompressedRecord record;
    REQUIRE(enc.encode_next(next, record) == Error::Ok);
    return record;
}

} // namespace

TEST_CASE("Round trip of varied chains", "[edge]") {
    SECTION("minimal run") {
        require_round_trip(make_chain(2));
    }

    SECTION("every field changing") {
        auto chain = make_chain(12);
        for (std::size_t i = 1; i < chain.size(); ++i) {
            chain[i].version = 0x20000000U + static_cast<std::uint32_t>(i % 3);
            chain[i].difficulty_target = 0x17000000U + static_cast<std::uint32_t>(i / 4);
            chain[i].time = chain[i - 1].time + ((i % 2) ? 70000U : 0xFFFFFFF0U);
        }
        relink(chain);
        require_round_trip(chain);
    }

    SECTION("time wrapping around zero") {
        auto chain = make_chain(4);
        chain[1].time = 0xFFFFFF00U;
        chain[2].time = 0x00000010U;
        chain[3].time = 0xFFFFFFF0U;
        relink(chain);
        require_round_trip(chain);
    }

    SECTION("arbitrary prev_digest in the anchor") {
        auto chain = make_chain(3);
        chain[0].prev_digest.fill(0x5A);
        relink(chain);
        require_round_trip(chain);
    }
}

TEST_CASE("Cache stays in step", "[edge]") {
    auto chain = make_chain(30);
    for (std::size_t i = 1; i < chain.size(); ++i) {
        chain[i].version = 0x20000000U + static_cast<std::uint32_t>((i * 7) % 11);
    }
    relink(chain);

    Encoder enc;
    Decoder dec;
    enc.begin(chain[0]);
    dec.begin(chain[0]);
    REQUIRE(enc.versions() == dec.versions());

    for (std::size_t i = 1; i < chain.size(); ++i) {
        CompressedRecord record;
        REQUIRE(enc.encode_next(chain[i], record) == Error::Ok);
        DecodeResult result;
        REQUIRE(dec.decode_next(record, result) == Error::Ok);
        REQUIRE(enc.versions() == dec.versions());
        REQUIRE(result.header == chain[i]);
    }
}

TEST_CASE("Time delta boundaries", "[edge]") {
    Header prev = make_header(0);
    prev.time = 1000000U;
    Header next = make_header(1);
    next.prev_digest = prev.digest();

    struct Case {
        std::int64_t delta;
        bool fits;
    };
    const Case cases[] = {
        {-32768, false}, {-32767, true}, {32766, true}, {32767, false}, {0, true},
    };

    for (const auto& c : cases) {
        next.time = static_cast<std::uint32_t>(static_cast<std::int64_t>(prev.time) + c.delta);
        CompressedRecord record = encode_pair(prev, next);
        REQUIRE(record.time_is_delta() == c.fits);
        REQUIRE(record.size() == (c.fits ? MIN_RECORD_BYTES : MIN_RECORD_BYTES + 2));

        Decoder dec;
        dec.begin(prev);
        DecodeResult result;
        REQUIRE(dec.decode_next(record, result) == Error::Ok);
        REQUIRE(result.header.time == next.time);
    }
}

TEST_CASE("Version cache eviction", "[edge]") {
    SECTION("anchor version pushed out by seven new ones") {
        auto chain = make_chain(10);
        for (std::size_t i = 1; i <= 7; ++i) {
            chain[i].version = 0x30000000U + static_cast<std::uint32_t>(i);
        }
        chain[8].version = chain[0].version;
        chain[9].version = 0x30000007U;
        relink(chain);

        Encoder enc;
        enc.begin(chain[0]);
        CompressedRecord record;
        for (std::size_t i = 1; i <= 7; ++i) {
            REQUIRE(enc.encode_next(chain[i], record) == Error::Ok);
            REQUIRE(record.version_code() == VERSION_LITERAL);
        }
        REQUIRE_FALSE(enc.versions().index_of(chain[0].version));

        REQUIRE(enc.encode_next(chain[8], record) == Error::Ok);
        REQUIRE(record.version_code() == VERSION_LITERAL);

        // 0x30000007 moved from slot 0 to slot 1
        REQUIRE(enc.encode_next(chain[9], record) == Error::Ok);
        REQUIRE(record.version_code() == 1);

        require_round_trip(chain);
    }

    SECTION("eight distinct record versions, then the first again") {
        auto chain = make_chain(10);
        for (std::size_t i = 1; i <= 8; ++i) {
            chain[i].version = 0x40000000U + static_cast<std::uint32_t>(i);
        }
        chain[9].version = chain[1].version;
        relink(chain);

        auto data = compress_chain(chain);
        // Nine records, nine version literals
        REQUIRE(data.size() == 9 * (MIN_RECORD_BYTES + 4));
        require_round_trip(chain);
    }

    SECTION("seven distinct versions stay cached") {
        auto chain = make_chain(9);
        for (std::size_t i = 1; i <= 6; ++i) {
            chain[i].version = 0x50000000U + static_cast<std::uint32_t>(i);
        }
        chain[7].version = chain[0].version;
        chain[8].version = chain[1].version;
        relink(chain);

        Encoder enc;
        enc.begin(chain[0]);
        CompressedRecord record;
        for (std::size_t i = 1; i <= 6; ++i) {
            REQUIRE(enc.encode_next(chain[i], record) == Error::Ok);
        }
        REQUIRE(enc.encode_next(chain[7], record) == Error::Ok);
        REQUIRE(record.version_code() == 6);
        REQUIRE(enc.encode_next(chain[8], record) == Error::Ok);
        REQUIRE(record.version_code() == 5);
    }
}

TEST_CASE("Sequence end on exactly the last record", "[edge]") {
    SECTION("anchor plus three headers") {
        auto chain = make_chain(4);
        auto data = compress_chain(chain);
        REQUIRE(data.size() == 3 * MIN_RECORD_BYTES);
        for (std::size_t r = 0; r < 3; ++r) {
            const bool end = (data[r * MIN_RECORD_BYTES] & MASK_SEQUENCE_END) != 0;
            REQUIRE(end == (r == 2));
        }
    }

    SECTION("three-header run") {
        auto chain = make_chain(3);
        auto data = compress_chain(chain);
        REQUIRE(data.size() == 2 * MIN_RECORD_BYTES);
        REQUIRE((data[0] & MASK_SEQUENCE_END) == 0);
        REQUIRE((data[MIN_RECORD_BYTES] & MASK_SEQUENCE_END) != 0);
    }
}

TEST_CASE("Steady header compresses to 39 bytes", "[edge]") {
    Header anchor = make_header(0);
    anchor.version = 0x00000001U;
    Header next = make_header(1);
    next.version = 0x00000001U;
    next.time = anchor.time + 600U;
    next.prev_digest = anchor.digest();

    CompressedRecord record = encode_pair(anchor, next);
    REQUIRE(record.version_code() == 0);
    REQUIRE(record.control == 0x1C);
    REQUIRE(record.size() == 39);

    std::uint8_t bytes[MAX_RECORD_BYTES];
    std::size_t size = 0;
    REQUIRE(record.to_bytes(bytes, sizeof(bytes), size) == Error::Ok);
    REQUIRE(size == 39);
    REQUIRE(std::equal(next.payload_root.begin(), next.payload_root.end(), bytes + 1));
    REQUIRE(bytes[33] == 0x58);
    REQUIRE(bytes[34] == 0x02);
}

TEST_CASE("Time literal cut short", "[edge]") {
    const Header anchor = make_header(0);
    const Header next = make_header(1);

    std::vector<std::uint8_t> data;
    data.push_back(0x14); // slot 0 | prev | same, 4-byte time literal
    data.insert(data.end(), next.payload_root.begin(), next.payload_root.end());
    data.push_back(0x01);
    data.push_back(0x02);

    Decoder dec;
    dec.begin(anchor);
    ByteReader reader(data.data(), data.size());
    DecodeResult result;
    REQUIRE(dec.decode_next(reader, result) == Error::DecodeError);
    REQUIRE(dec.records_decoded() == 0);
}

TEST_CASE("Corruption propagates through prev_digest", "[edge]") {
    auto chain = make_chain(4);
    auto data = compress_chain(chain);
    data[5] ^= 0x01; // payload_root of the first record

    auto decoded = decode_all(chain[0], data);
    REQUIRE(decoded.size() == 3);
    REQUIRE(decoded[0] != chain[1]);
    REQUIRE(decoded[1].prev_digest != chain[2].prev_digest);
    REQUIRE(decoded[2].prev_digest != chain[3].prev_digest);
}
