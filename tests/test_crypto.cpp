#include <catch2/catch_test_macros.hpp>
#include "arbiter/crypto.hpp"
#include <string>

using namespace arbiter::crypto;

TEST_CASE("SHA-256 hashing", "[crypto]")
{
    // FIPS 180-2 test vector
    REQUIRE(SHA256::hex_digest("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    auto hash = SHA256::hash(std::string_view("test data"));
    std::string hex = SHA256::to_hex(hash);
    REQUIRE(hex.length() == 64);
    REQUIRE(hex == SHA256::hex_digest("test data"));
    REQUIRE(hex.find_first_not_of("0123456789abcdef") == std::string::npos);
}

TEST_CASE("AES-256-GCM encryption/decryption", "[crypto]")
{
    if (!AES256GCM::is_available())
    {
        WARN("AES-256-GCM unavailable on this CPU");
        return;
    }

    auto key = AES256GCM::generate_key();

    std::string plaintext = "Sensitive data for encryption";
    Bytes plaintext_bytes(plaintext.begin(), plaintext.end());
    Bytes ad{'k', 'e', 'y'};

    auto encrypted = AES256GCM::encrypt(key, plaintext_bytes, ad);
    REQUIRE(encrypted.has_value());
    REQUIRE(encrypted->size() == plaintext_bytes.size() + 12 + 16);

    auto decrypted = AES256GCM::decrypt(key, *encrypted, ad);
    REQUIRE(decrypted.has_value());
    REQUIRE(*decrypted == plaintext_bytes);

    SECTION("wrong associated data fails authentication")
    {
        REQUIRE_FALSE(AES256GCM::decrypt(key, *encrypted, Bytes{'o', 't', 'h', 'e', 'r'}).has_value());
    }

    SECTION("tampered ciphertext fails authentication")
    {
        auto tampered = *encrypted;
        tampered[14] ^= 0x01;
        REQUIRE_FALSE(AES256GCM::decrypt(key, tampered, ad).has_value());
    }

    SECTION("truncated ciphertext is rejected")
    {
        REQUIRE_FALSE(AES256GCM::decrypt(key, Bytes(10, 0), ad).has_value());
    }
}

TEST_CASE("Base64 encoding/decoding", "[crypto]")
{
    Bytes data = {0x00, 0x01, 0x02, 0x03, 0xFF, 0xFE};

    std::string encoded = Base64::encode(data);
    REQUIRE(encoded == "AAECA//+");

    auto decoded = Base64::decode(encoded);
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == data);

    REQUIRE_FALSE(Base64::decode("not base64!").has_value());
}

TEST_CASE("Secure random generation", "[crypto]")
{
    auto bytes1 = SecureRandom::generate_bytes(32);
    auto bytes2 = SecureRandom::generate_bytes(32);

    REQUIRE(bytes1.size() == 32);
    REQUIRE(bytes1 != bytes2);

    auto id = SecureRandom::generate_id("led");
    REQUIRE(id.starts_with("led_"));
    REQUIRE(id.size() == 4 + 32);
    REQUIRE(id != SecureRandom::generate_id("led"));
}
