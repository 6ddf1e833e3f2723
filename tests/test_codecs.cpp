#include <catch2/catch_test_macros.hpp>

#include "base64.hpp"
#include "base64_decode.hpp"
#include "gzip.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace {

std::vector<uint8_t> bytes(const std::string& s) {
    return {s.begin(), s.end()};
}

} // namespace

TEST_CASE("Payload codecs", "[codec]") {

    SECTION("Base64KnownVectors") {
        REQUIRE(base64::encode(bytes("")) == "");
        REQUIRE(base64::encode(bytes("f")) == "Zg==");
        REQUIRE(base64::encode(bytes("fo")) == "Zm8=");
        REQUIRE(base64::encode(bytes("foo")) == "Zm9v");
        REQUIRE(base64::encode(bytes("foobar")) == "Zm9vYmFy");
    }

    SECTION("Base64Decode") {
        auto out = b64_check::decode("Zm9vYmE=");
        REQUIRE(out.has_value());
        REQUIRE(*out == bytes("fooba"));
        REQUIRE_FALSE(b64_check::decode("Zm9v!").has_value());
    }

    SECTION("Base64BinaryBytes") {
        std::vector<uint8_t> raw = {0x00, 0xff, 0x10, 0x80, 0x7f};
        auto enc = base64::encode(raw);
        auto dec = b64_check::decode(enc);
        REQUIRE(dec.has_value());
        REQUIRE(*dec == raw);
    }

    SECTION("GzipHeader") {
        auto packed = gzip::compress(bytes(R"({"audio":{"rate":16000}})"));
        REQUIRE(packed.has_value());
        REQUIRE(packed->size() > 10);
        REQUIRE((*packed)[0] == 0x1f);
        REQUIRE((*packed)[1] == 0x8b);
    }

    SECTION("GzipRestoresPayload") {
        std::string payload(4096, 'x');
        payload += "tail";
        auto packed = gzip::compress(bytes(payload));
        REQUIRE(packed.has_value());
        REQUIRE(packed->size() < payload.size());
        auto unpacked = gzip::decompress(*packed);
        REQUIRE(unpacked.has_value());
        REQUIRE(*unpacked == bytes(payload));
    }

    SECTION("GzipRejectsGarbage") {
        REQUIRE_FALSE(gzip::decompress(bytes("definitely not gzip")).has_value());
    }

    SECTION("GzipRejectsTruncated") {
        auto packed = gzip::compress(bytes("some payload that will be cut short"));
        REQUIRE(packed.has_value());
        std::vector<uint8_t> cut(packed->begin(), packed->begin() + packed->size() / 2);
        REQUIRE_FALSE(gzip::decompress(cut).has_value());
    }
}
