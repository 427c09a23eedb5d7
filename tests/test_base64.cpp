#include <catch2/catch_test_macros.hpp>
#include "core/base64.hpp"

#include <string>

using namespace textshield;

namespace {

std::string as_string(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

TEST_CASE("Base64: RFC 4648 vectors", "[base64]") {
    CHECK(base64::encode("").empty());
    CHECK(base64::encode("f") == "Zg==");
    CHECK(base64::encode("fo") == "Zm8=");
    CHECK(base64::encode("foo") == "Zm9v");
    CHECK(base64::encode("foobar") == "Zm9vYmFy");
}

TEST_CASE("Base64: decode accepts padded input", "[base64]") {
    auto decoded = base64::decode("Zm9vYg==");
    REQUIRE(decoded.has_value());
    CHECK(as_string(*decoded) == "foob");

    decoded = base64::decode("");
    REQUIRE(decoded.has_value());
    CHECK(decoded->empty());
}

TEST_CASE("Base64: decode skips line breaks", "[base64]") {
    auto decoded = base64::decode("Zm9v\r\nYmFy");
    REQUIRE(decoded.has_value());
    CHECK(as_string(*decoded) == "foobar");
}

TEST_CASE("Base64: decode rejects malformed input", "[base64]") {
    CHECK_FALSE(base64::decode("Zm9").has_value());        // length
    CHECK_FALSE(base64::decode("Zm9v!A==").has_value());   // alphabet
    CHECK_FALSE(base64::decode("Zg=v").has_value());       // padding in data
    CHECK_FALSE(base64::decode("Zh==").has_value());       // non-zero trailing bits
    CHECK_FALSE(base64::decode("Zm9\xC3\xA9").has_value());
}
