#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace arbiter::crypto
{

    using Bytes = std::vector<uint8_t>;
    using SHA256Hash = std::array<uint8_t, 32>;
    using AESKey = std::array<uint8_t, 32>;
    using AESNonce = std::array<uint8_t, 12>;

    /**
     * Initialize libsodium. Safe to call repeatedly and from several threads.
     */
    Result<void> initialize();

    /**
     * SHA-256 hashing (ledger content hashes)
     */
    class SHA256
    {
    public:
        static SHA256Hash hash(std::string_view data);

        /** Lowercase hex, 64 characters */
        static std::string to_hex(const SHA256Hash &hash);

        /** hash + to_hex in one step */
        static std::string hex_digest(std::string_view data);
    };

    /**
     * AES-256-GCM for values encrypted at rest.
     * Blob layout: [12-byte nonce][ciphertext][16-byte tag]
     */
    class AES256GCM
    {
    public:
        /** False on CPUs without AES-NI; libsodium's AES-GCM refuses to run there */
        static bool is_available();

        static Result<Bytes> encrypt(
            const AESKey &key,
            const Bytes &plaintext,
            const Bytes &associated_data = {});

        static Result<Bytes> decrypt(
            const AESKey &key,
            const Bytes &ciphertext_with_nonce,
            const Bytes &associated_data = {});

        static AESKey generate_key();
    };

    class Base64
    {
    public:
        static std::string encode(const Bytes &data);

        static Result<Bytes> decode(std::string_view encoded);
    };

    class SecureRandom
    {
    public:
        static Bytes generate_bytes(std::size_t n);

        /**
         * Random identifier of the form "<prefix>_<32 hex chars>"
         */
        static std::string generate_id(std::string_view prefix);
    };

} // namespace arbiter::crypto
