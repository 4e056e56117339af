#include <catch2/catch_test_macros.hpp>

#include <chatmedia/crypto/dat_decryptor.h>
#include "support/media_fixtures.hpp"

using namespace chatmedia;
using namespace chatmedia::crypto;
namespace ts = chatmedia::test_support;

namespace {

constexpr uint8_t XOR_KEY = 0x37;

KeySet xorOnly() {
    return KeySet{XOR_KEY, std::nullopt};
}

KeySet withAes(std::string_view aes) {
    return KeySet{XOR_KEY, ts::aesKeyFrom(aes)};
}

} // namespace

TEST_CASE("DatDecryptor passes plain images through", "[crypto][dat]") {
    DatDecryptor decryptor(xorOnly());
    auto png = ts::tinyPng();

    auto out = decryptor.decrypt(png);
    REQUIRE(out);
    CHECK(out.value().scheme == DatScheme::Plain);
    CHECK(out.value().format == detection::ImageFormat::Png);
    CHECK(out.value().bytes == png);
}

TEST_CASE("DatDecryptor decrypts XOR blobs without an AES key", "[crypto][dat]") {
    DatDecryptor decryptor(xorOnly());
    auto png = ts::tinyPng();
    auto blob = ts::xorWith(png, XOR_KEY);

    CHECK(DatDecryptor::detectScheme(blob) == DatScheme::Xor);
    auto out = decryptor.decrypt(blob);
    REQUIRE(out);
    CHECK(out.value().scheme == DatScheme::Xor);
    CHECK(out.value().bytes == png);
}

TEST_CASE("DatDecryptor rejects XOR blobs under the wrong key", "[crypto][dat]") {
    DatDecryptor decryptor(KeySet{0x12, std::nullopt});
    auto blob = ts::xorWith(ts::tinyPng(), XOR_KEY);

    auto out = decryptor.decrypt(blob);
    REQUIRE_FALSE(out);
    CHECK(out.error().code == ErrorCode::DecryptionFailed);
}

TEST_CASE("DatDecryptor handles V4 containers", "[crypto][dat]") {
    const auto png = ts::tinyPng();
    const std::string_view aes = "0123456789abcdef";

    SECTION("V1 uses the legacy key") {
        auto blob = ts::encryptV4(png, LEGACY_V1_AES_KEY, XOR_KEY, V4_SIGNATURE_V1, 32, 8);
        CHECK(DatDecryptor::detectScheme(blob) == DatScheme::AesV1);

        DatDecryptor decryptor(xorOnly());
        auto out = decryptor.decrypt(blob);
        REQUIRE(out);
        CHECK(out.value().scheme == DatScheme::AesV1);
        CHECK(out.value().bytes == png);
    }

    SECTION("V2 with the configured AES key") {
        auto blob = ts::encryptV4(png, ts::aesKeyFrom(aes), XOR_KEY, V4_SIGNATURE_V2, 20, 10);
        CHECK(DatDecryptor::detectScheme(blob) == DatScheme::AesV2);

        DatDecryptor decryptor(withAes(aes));
        auto out = decryptor.decrypt(blob);
        REQUIRE(out);
        CHECK(out.value().scheme == DatScheme::AesV2);
        CHECK(out.value().bytes == png);
    }

    SECTION("V2 fails with only the XOR key") {
        auto blob = ts::encryptV4(png, ts::aesKeyFrom(aes), XOR_KEY, V4_SIGNATURE_V2, 20, 10);

        DatDecryptor decryptor(xorOnly());
        auto out = decryptor.decrypt(blob);
        REQUIRE_FALSE(out);
        CHECK(out.error().code == ErrorCode::DecryptionFailed);
    }

    SECTION("V2 fails under a different AES key") {
        auto blob = ts::encryptV4(png, ts::aesKeyFrom(aes), XOR_KEY, V4_SIGNATURE_V2, 20, 10);

        DatDecryptor decryptor(withAes("fedcba9876543210"));
        auto out = decryptor.decrypt(blob);
        REQUIRE_FALSE(out);
        CHECK(out.error().code == ErrorCode::DecryptionFailed);
    }

    SECTION("block-aligned AES region carries a full padding block") {
        auto blob = ts::encryptV4(png, LEGACY_V1_AES_KEY, XOR_KEY, V4_SIGNATURE_V1, 16, 0);
        auto header = DatDecryptor::parseV4Header(blob);
        REQUIRE(header);
        CHECK(header.value().aesSize == 16);
        CHECK(header.value().xorSize == 0);
        CHECK(blob.size() == V4Header::SIZE + 32 + (png.size() - 16));

        auto out = DatDecryptor::decryptV4(blob, LEGACY_V1_AES_KEY, XOR_KEY);
        REQUIRE(out);
        CHECK(out.value() == png);
    }

    SECTION("truncated body is rejected") {
        auto blob = ts::encryptV4(png, LEGACY_V1_AES_KEY, XOR_KEY, V4_SIGNATURE_V1, 32, 8);
        blob.resize(V4Header::SIZE + 10);
        auto out = DatDecryptor::decryptV4(blob, LEGACY_V1_AES_KEY, XOR_KEY);
        REQUIRE_FALSE(out);
        CHECK(out.error().code == ErrorCode::DecryptionFailed);
    }
}

TEST_CASE("DatDecryptor reports empty input as missing", "[crypto][dat]") {
    DatDecryptor decryptor(xorOnly());
    auto out = decryptor.decrypt(ByteSpan{});
    REQUIRE_FALSE(out);
    CHECK(out.error().code == ErrorCode::SourceMissing);
}
