#include <catch2/catch.hpp>
#include <launchpad/core/codec.hpp>

#include <string>

using namespace launchpad;

namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // anonymous namespace

TEST_CASE("base64_encode", "[codec]") {
    // RFC 4648 test vectors
    CHECK(base64_encode(bytes_of("")) == "");
    CHECK(base64_encode(bytes_of("f")) == "Zg==");
    CHECK(base64_encode(bytes_of("fo")) == "Zm8=");
    CHECK(base64_encode(bytes_of("foo")) == "Zm9v");
    CHECK(base64_encode(bytes_of("foobar")) == "Zm9vYmFy");
}

TEST_CASE("base64_encode of a 32-byte key has no line breaks", "[codec]") {
    std::vector<uint8_t> key(32);
    for (size_t i = 0; i < key.size(); ++i) key[i] = static_cast<uint8_t>(i);

    auto encoded = base64_encode(key);
    CHECK(encoded == "AAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8=");
    CHECK(encoded.size() == 44);
    CHECK(encoded.find('\n') == std::string::npos);
}

TEST_CASE("base64_decode", "[codec]") {
    SECTION("padding is not counted as data") {
        CHECK(base64_decode("Zg==").value() == bytes_of("f"));
        CHECK(base64_decode("Zm8=").value() == bytes_of("fo"));
        CHECK(base64_decode("Zm9vYmFy").value() == bytes_of("foobar"));
        CHECK(base64_decode("").value().empty());
    }

    SECTION("malformed input") {
        CHECK_FALSE(base64_decode("Zg=").has_value());
        CHECK_FALSE(base64_decode("Zm9v\n").has_value());
        CHECK_FALSE(base64_decode("Zm*v").has_value());
        CHECK_FALSE(base64_decode("====").has_value());
        CHECK_FALSE(base64_decode("Z===").has_value());
        CHECK(base64_decode("not base64!").error().kind() == BootError::InvalidKey);
    }
}
