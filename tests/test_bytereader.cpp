/**
 * @file test_bytereader.cpp
 * @brief Unit tests for ByteReader class.
 */

#include <catch2/catch_test_macros.hpp>
#include <hdrdelta/bytereader.hpp>

using namespace hdrdelta;

TEST_CASE("ByteReader construction", "[bytereader]") {
    std::uint8_t data[] = {0xAB, 0xCD};
    ByteReader reader(data, 2);

    REQUIRE(reader.position() == 0);
    REQUIRE(reader.remaining() == 2);
}

TEST_CASE("ByteReader reads", "[bytereader]") {
    std::uint8_t data[] = {0x01, 0x34, 0x12, 0xEF, 0xBE, 0xAD, 0xDE, 0x55, 0x66};
    ByteReader reader(data, sizeof(data));

    std::uint8_t u8 = 0;
    std::uint16_t u16 = 0;
    std::uint32_t u32 = 0;
    std::uint8_t tail[2] = {0};

    REQUIRE(reader.read_u8(u8) == Error::Ok);
    REQUIRE(u8 == 0x01);

    REQUIRE(reader.read_le16(u16) == Error::Ok);
    REQUIRE(u16 == 0x1234);

    REQUIRE(reader.read_le32(u32) == Error::Ok);
    REQUIRE(u32 == 0xDEADBEEFU);

    REQUIRE(reader.read_bytes(tail, 2) == Error::Ok);
    REQUIRE(tail[0] == 0x55);
    REQUIRE(tail[1] == 0x66);

    REQUIRE(reader.remaining() == 0);
    REQUIRE(reader.position() == sizeof(data));
}

TEST_CASE("ByteReader underflow", "[bytereader]") {
    std::uint8_t data[] = {0x01, 0x02, 0x03};

    SECTION("le32 on three bytes") {
        ByteReader reader(data, 3);
        std::uint32_t value = 0xFFFFFFFFU;
        REQUIRE(reader.read_le32(value) == Error::Underflow);
        REQUIRE(reader.position() == 0);
        REQUIRE(value == 0xFFFFFFFFU);
    }

    SECTION("le16 after two bytes read") {
        ByteReader reader(data, 3);
        std::uint16_t value = 0;
        REQUIRE(reader.read_le16(value) == Error::Ok);
        REQUIRE(reader.read_le16(value) == Error::Underflow);
        REQUIRE(reader.remaining() == 1);
    }

    SECTION("u8 on empty reader") {
        ByteReader reader(data, 0);
        std::uint8_t value = 0;
        REQUIRE(reader.read_u8(value) == Error::Underflow);
    }

    SECTION("byte range longer than input") {
        ByteReader reader(data, 3);
        std::uint8_t out[4] = {0};
        REQUIRE(reader.read_bytes(out, 4) == Error::Underflow);
        REQUIRE(reader.remaining() == 3);
    }
}
