#include <catch2/catch_test_macros.hpp>
#include "uma/utilities/tlv.hpp"
#include <string>
using namespace uma::protocol;
using namespace uma::protocol::utilities;

TEST_CASE("TLV - Number width", "[tlv][codec]") {
    SECTION("Numbers use the smallest signed width") {
        TlvWriter writer;
        REQUIRE(writer.PutNumber(1, 100).IsOk());
        REQUIRE(writer.PutNumber(2, 200).IsOk());
        REQUIRE(writer.PutNumber(3, -1).IsOk());
        REQUIRE(writer.PutNumber(4, 100000).IsOk());
        REQUIRE(writer.PutNumber(5, 10000000000LL).IsOk());
        const std::vector<uint8_t> expected = {
            1, 1, 0x64,
            2, 2, 0x00, 0xC8,
            3, 1, 0xFF,
            4, 4, 0x00, 0x01, 0x86, 0xA0,
            5, 8, 0x00, 0x00, 0x00, 0x02, 0x54, 0x0B, 0xE4, 0x00};
        REQUIRE(writer.Bytes() == expected);
    }
    SECTION("Reader sign-extends every width") {
        TlvWriter writer;
        for (const int64_t value : {int64_t{-5}, int64_t{-300}, int64_t{-70000}, int64_t{-10000000000LL}}) {
            REQUIRE(writer.PutNumber(9, value).IsOk());
        }
        TlvReader reader(writer.Bytes());
        for (const int64_t expected : {int64_t{-5}, int64_t{-300}, int64_t{-70000}, int64_t{-10000000000LL}}) {
            auto record = reader.Next();
            REQUIRE(record.IsOk());
            REQUIRE(TlvReader::ReadNumber(record.Unwrap()).Unwrap() == expected);
        }
        REQUIRE_FALSE(reader.HasNext());
    }
    SECTION("Three byte numbers are rejected") {
        const std::vector<uint8_t> bytes = {2, 3, 0x01, 0x02, 0x03};
        TlvReader reader(bytes);
        auto record = reader.Next();
        REQUIRE(record.IsOk());
        auto number = TlvReader::ReadNumber(record.Unwrap());
        REQUIRE(number.IsErr());
        REQUIRE(number.UnwrapErr().codec_failure == CodecFailureKind::Structure);
    }
}

TEST_CASE("TLV - Strings and booleans", "[tlv][codec]") {
    TlvWriter writer;
    REQUIRE(writer.PutString(0, "$bob@vasp.com").IsOk());
    REQUIRE(writer.PutBool(5, true).IsOk());
    TlvReader reader(writer.Bytes());
    auto first = reader.Next();
    REQUIRE(first.IsOk());
    REQUIRE(first.Unwrap().tag == 0);
    REQUIRE(TlvReader::ReadString(first.Unwrap()) == "$bob@vasp.com");
    auto second = reader.Next();
    REQUIRE(TlvReader::ReadBool(second.Unwrap()).Unwrap());
}

TEST_CASE("TLV - Limits and truncation", "[tlv][codec]") {
    SECTION("Values over 255 bytes are refused") {
        TlvWriter writer;
        REQUIRE(writer.PutString(0, std::string(255, 'a')).IsOk());
        REQUIRE(writer.PutString(1, std::string(256, 'a')).IsErr());
    }
    SECTION("Declared length past the end is a structure failure") {
        const std::vector<uint8_t> bytes = {0, 10, 'a', 'b'};
        TlvReader reader(bytes);
        auto record = reader.Next();
        REQUIRE(record.IsErr());
        REQUIRE(record.UnwrapErr().codec_failure == CodecFailureKind::Structure);
    }
    SECTION("Dangling tag byte is a structure failure") {
        const std::vector<uint8_t> bytes = {0, 1, 'a', 7};
        TlvReader reader(bytes);
        REQUIRE(reader.Next().IsOk());
        REQUIRE(reader.Next().IsErr());
    }
}
