/**
 * @file test_header.cpp
 * @brief Unit tests for element header parsing.
 */

#include <catch2/catch_test_macros.hpp>
#include <jsonb/header.hpp>

#include <cstring>
#include <limits>

using namespace jsonb;

TEST_CASE("Header inline sizes", "[header]") {
    for (std::uint8_t size = 0; size <= 11; ++size) {
        std::uint8_t data[] = {static_cast<std::uint8_t>((size << 4) | 0x07)};
        ByteReader reader(data, 1);
        Header header;

        REQUIRE(read_header(reader, header) == Error::Ok);
        REQUIRE(header.type == Type::Text);
        REQUIRE(header.payload_size == size);
        REQUIRE(header.header_size == 1);
        REQUIRE(reader.position() == 1);
    }
}

TEST_CASE("Header size prefixes", "[header]") {
    Header header;

    SECTION("selector 12: one size byte") {
        std::uint8_t data[] = {0xC7, 0xFF};
        ByteReader reader(data, sizeof(data));
        REQUIRE(read_header(reader, header) == Error::Ok);
        REQUIRE(header.payload_size == 255);
        REQUIRE(header.header_size == 2);
    }

    SECTION("selector 12 may hold small sizes") {
        std::uint8_t data[] = {0xCB, 0x00};
        ByteReader reader(data, sizeof(data));
        REQUIRE(read_header(reader, header) == Error::Ok);
        REQUIRE(header.type == Type::Array);
        REQUIRE(header.payload_size == 0);
        REQUIRE(header.header_size == 2);
    }

    SECTION("selector 13: two size bytes") {
        std::uint8_t data[] = {0xD7, 0x01, 0x00};
        ByteReader reader(data, sizeof(data));
        REQUIRE(read_header(reader, header) == Error::Ok);
        REQUIRE(header.payload_size == 256);
        REQUIRE(header.header_size == 3);
    }

    SECTION("selector 14: four size bytes") {
        std::uint8_t data[] = {0xEB, 0x00, 0x01, 0x12, 0xA4};
        ByteReader reader(data, sizeof(data));
        REQUIRE(read_header(reader, header) == Error::Ok);
        REQUIRE(header.type == Type::Array);
        REQUIRE(header.payload_size == 70308);
        REQUIRE(header.header_size == 5);
    }

    SECTION("selector 15: eight size bytes") {
        std::uint8_t data[] = {0xF7, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00};
        ByteReader reader(data, sizeof(data));
        REQUIRE(read_header(reader, header) == Error::Ok);
        REQUIRE(header.payload_size == 0x100000000ULL);
        REQUIRE(header.header_size == 9);
        REQUIRE(reader.position() == 9);
    }

    SECTION("selector 15: maximum size") {
        std::uint8_t data[9];
        std::memset(data, 0xFF, sizeof(data));
        data[0] = 0xFC;
        ByteReader reader(data, sizeof(data));
        REQUIRE(read_header(reader, header) == Error::Ok);
        REQUIRE(header.type == Type::Object);
        REQUIRE(header.payload_size == std::numeric_limits<std::uint64_t>::max());
    }
}

TEST_CASE("Header truncation", "[header]") {
    Header header;

    SECTION("empty window") {
        ByteReader reader(nullptr, 0);
        REQUIRE(read_header(reader, header) == Error::TruncatedHeader);
    }

    SECTION("missing one-byte size") {
        std::uint8_t data[] = {0xC7};
        ByteReader reader(data, sizeof(data));
        REQUIRE(read_header(reader, header) == Error::TruncatedHeader);
    }

    SECTION("short two-byte size") {
        std::uint8_t data[] = {0xD7, 0x01};
        ByteReader reader(data, sizeof(data));
        REQUIRE(read_header(reader, header) == Error::TruncatedHeader);
    }

    SECTION("short four-byte size") {
        std::uint8_t data[] = {0xE7, 0x00, 0x00, 0x01};
        ByteReader reader(data, sizeof(data));
        REQUIRE(read_header(reader, header) == Error::TruncatedHeader);
    }

    SECTION("short eight-byte size") {
        std::uint8_t data[] = {0xF7, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
        ByteReader reader(data, sizeof(data));
        REQUIRE(read_header(reader, header) == Error::TruncatedHeader);
    }
}

TEST_CASE("Header type validation", "[header]") {
    Header header;

    SECTION("reserved types") {
        for (std::uint8_t tag = 0x0D; tag <= 0x0F; ++tag) {
            std::uint8_t data[] = {tag};
            ByteReader reader(data, 1);
            REQUIRE(read_header(reader, header) == Error::InvalidType);
        }
    }

    SECTION("reserved type reported before truncated size") {
        std::uint8_t data[] = {0xFD};
        ByteReader reader(data, 1);
        REQUIRE(read_header(reader, header) == Error::InvalidType);
    }

    SECTION("TextJ and Text5 are unsupported") {
        std::uint8_t textj[] = {0x38, 'a', '\\', 'n'};
        ByteReader textj_reader(textj, sizeof(textj));
        REQUIRE(read_header(textj_reader, header) == Error::UnsupportedEncoding);

        std::uint8_t text5[] = {0xF9};
        ByteReader text5_reader(text5, sizeof(text5));
        REQUIRE(read_header(text5_reader, header) == Error::UnsupportedEncoding);
    }

    SECTION("all supported types parse") {
        const Type supported[] = {Type::Null,  Type::True,   Type::False, Type::Int,
                                  Type::Int5,  Type::Float,  Type::Float5, Type::Text,
                                  Type::TextRaw, Type::Array, Type::Object};
        for (Type type : supported) {
            std::uint8_t data[] = {static_cast<std::uint8_t>(type)};
            ByteReader reader(data, 1);
            REQUIRE(read_header(reader, header) == Error::Ok);
            REQUIRE(header.type == type);
        }
    }
}

TEST_CASE("Type helpers", "[header]") {
    REQUIRE(std::strcmp(type_name(Type::Int5), "INT5") == 0);
    REQUIRE(std::strcmp(type_name(Type::Object), "OBJECT") == 0);
    REQUIRE(std::strcmp(type_name(Type::Reserved14), "RESERVED") == 0);

    REQUIRE(is_composite(Type::Array));
    REQUIRE(is_composite(Type::Object));
    REQUIRE_FALSE(is_composite(Type::Text));

    REQUIRE(is_reserved(Type::Reserved13));
    REQUIRE_FALSE(is_reserved(Type::Object));
}
