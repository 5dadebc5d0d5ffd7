/**
 * @file test_header.cpp
 * @brief Unit tests for the Header model.
 */

#include <catch2/catch_test_macros.hpp>
#include <hdrdelta/header.hpp>

#include "test_helpers.hpp"

using namespace hdrdelta;
using namespace hdrdelta::test;

TEST_CASE("Header parse", "[header]") {
    SECTION("field offsets and little-endian integers") {
        std::uint8_t raw[HEADER_SIZE];
        for (std::size_t i = 0; i < HEADER_SIZE; ++i) {
            raw[i] = static_cast<std::uint8_t>(i);
        }

        Header h;
        REQUIRE(Header::parse(raw, HEADER_SIZE, h) == Error::Ok);
        REQUIRE(h.version == 0x03020100U);
        REQUIRE(h.prev_digest[0] == 4);
        REQUIRE(h.prev_digest[31] == 35);
        REQUIRE(h.payload_root[0] == 36);
        REQUIRE(h.payload_root[31] == 67);
        REQUIRE(h.time == 0x47464544U);
        REQUIRE(h.difficulty_target == 0x4B4A4948U);
        REQUIRE(h.nonce == 0x4F4E4D4CU);
    }

    SECTION("wrong size is malformed") {
        std::uint8_t raw[HEADER_SIZE + 1] = {0};
        Header h;
        REQUIRE(Header::parse(raw, HEADER_SIZE - 1, h) == Error::MalformedHeader);
        REQUIRE(Header::parse(raw, HEADER_SIZE + 1, h) == Error::MalformedHeader);
        REQUIRE(Header::parse(raw, 0, h) == Error::MalformedHeader);
    }

    SECTION("null data is malformed") {
        Header h;
        REQUIRE(Header::parse(nullptr, HEADER_SIZE, h) == Error::MalformedHeader);
    }
}

TEST_CASE("Header serialize", "[header]") {
    SECTION("parse then serialize reproduces the input") {
        std::uint8_t raw[HEADER_SIZE];
        for (std::size_t i = 0; i < HEADER_SIZE; ++i) {
            raw[i] = static_cast<std::uint8_t>(255 - i);
        }

        Header h;
        REQUIRE(Header::parse(raw, HEADER_SIZE, h) == Error::Ok);
        const HeaderBytes out = h.serialize();
        for (std::size_t i = 0; i < HEADER_SIZE; ++i) {
            REQUIRE(out[i] == raw[i]);
        }
    }

    SECTION("time is written little-endian at offset 68") {
        Header h;
        h.time = 0xAABBCCDDU;
        const HeaderBytes out = h.serialize();
        REQUIRE(out[OFF_TIME] == 0xDD);
        REQUIRE(out[OFF_TIME + 3] == 0xAA);
    }
}

TEST_CASE("Header digest", "[header]") {
    SECTION("digest depends on every field") {
        const Header base = make_header(5);
        const Digest d = base.digest();

        Header h = base;
        h.nonce ^= 1U;
        REQUIRE(h.digest() != d);

        h = base;
        h.payload_root[17] ^= 0x80U;
        REQUIRE(h.digest() != d);

        h = base;
        h.prev_digest[0] ^= 0x01U;
        REQUIRE(h.digest() != d);
    }

    SECTION("digest is deterministic") {
        REQUIRE(make_header(9).digest() == make_header(9).digest());
    }

    SECTION("chain links through prev_digest") {
        auto chain = make_chain(4);
        for (std::size_t i = 1; i < chain.size(); ++i) {
            REQUIRE(chain[i].prev_digest == chain[i - 1].digest());
        }
    }
}

TEST_CASE("Header equality", "[header]") {
    Header a = make_header(3);
    Header b = make_header(3);
    REQUIRE(a == b);

    b.difficulty_target += 1U;
    REQUIRE(a != b);
}

TEST_CASE("Hex helpers", "[header]") {
    SECTION("to_hex") {
        const std::uint8_t bytes[] = {0x00, 0x0F, 0xA5, 0xFF};
        REQUIRE(to_hex(bytes, sizeof(bytes)) == "000fa5ff");
        REQUIRE(to_hex(bytes, 0).empty());
    }

    SECTION("display_hash is the reversed digest") {
        const Header h = make_header(1);
        Digest d = h.digest();
        const std::string shown = display_hash(h);
        REQUIRE(shown.size() == 64);
        REQUIRE(shown.substr(0, 2) == to_hex(&d[31], 1));
        REQUIRE(shown.substr(62, 2) == to_hex(&d[0], 1));
    }
}
