#include "arbiter/crypto.hpp"
#include <sodium.h>
#include <algorithm>
#include <cstring>
#include <format>

namespace arbiter::crypto
{

    Result<void> initialize()
    {
        // sodium_init returns 1 when already initialized
        if (sodium_init() < 0)
        {
            return std::unexpected(ArbiterError::crypto("Failed to initialize libsodium"));
        }
        return {};
    }

    namespace
    {
        // Initialize libsodium on library load
        struct SodiumInitializer
        {
            SodiumInitializer()
            {
                if (!initialize())
                {
                    throw std::runtime_error("Failed to initialize libsodium");
                }
            }
        } sodium_initializer;
    } // namespace

    // ============================================================================
    // SHA256
    // ============================================================================

    SHA256Hash SHA256::hash(std::string_view data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size());
        return output;
    }

    std::string SHA256::to_hex(const SHA256Hash &hash)
    {
        // sodium_bin2hex writes a trailing NUL
        std::string hex(hash.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), hash.data(), hash.size());
        hex.resize(hash.size() * 2);
        return hex;
    }

    std::string SHA256::hex_digest(std::string_view data)
    {
        return to_hex(hash(data));
    }

    // ============================================================================
    // AES256GCM
    // ============================================================================

    bool AES256GCM::is_available()
    {
        return crypto_aead_aes256gcm_is_available() == 1;
    }

    Result<Bytes> AES256GCM::encrypt(
        const AESKey &key,
        const Bytes &plaintext,
        const Bytes &associated_data)
    {
        if (!is_available())
        {
            return std::unexpected(ArbiterError::crypto("AES-256-GCM not supported on this CPU"));
        }

        AESNonce nonce;
        randombytes_buf(nonce.data(), nonce.size());

        Bytes output(nonce.size() + plaintext.size() + crypto_aead_aes256gcm_ABYTES);
        std::copy(nonce.begin(), nonce.end(), output.begin());

        unsigned long long ciphertext_len;
        if (crypto_aead_aes256gcm_encrypt(
                output.data() + nonce.size(),
                &ciphertext_len,
                plaintext.data(),
                plaintext.size(),
                associated_data.data(),
                associated_data.size(),
                nullptr,
                nonce.data(),
                key.data()) != 0)
        {
            return std::unexpected(ArbiterError::crypto("AES-256-GCM encryption failed"));
        }

        output.resize(nonce.size() + ciphertext_len);
        return output;
    }

    Result<Bytes> AES256GCM::decrypt(
        const AESKey &key,
        const Bytes &ciphertext_with_nonce,
        const Bytes &associated_data)
    {
        if (!is_available())
        {
            return std::unexpected(ArbiterError::crypto("AES-256-GCM not supported on this CPU"));
        }

        constexpr std::size_t nonce_len = std::tuple_size_v<AESNonce>;
        if (ciphertext_with_nonce.size() < nonce_len + crypto_aead_aes256gcm_ABYTES)
        {
            return std::unexpected(ArbiterError::crypto("Ciphertext too short"));
        }

        AESNonce nonce;
        std::copy_n(ciphertext_with_nonce.begin(), nonce_len, nonce.begin());

        Bytes plaintext(ciphertext_with_nonce.size() - nonce_len - crypto_aead_aes256gcm_ABYTES);
        unsigned long long plaintext_len;

        if (crypto_aead_aes256gcm_decrypt(
                plaintext.data(),
                &plaintext_len,
                nullptr,
                ciphertext_with_nonce.data() + nonce_len,
                ciphertext_with_nonce.size() - nonce_len,
                associated_data.data(),
                associated_data.size(),
                nonce.data(),
                key.data()) != 0)
        {
            return std::unexpected(ArbiterError::crypto("AES-256-GCM decryption failed (authentication failed)"));
        }

        plaintext.resize(plaintext_len);
        return plaintext;
    }

    AESKey AES256GCM::generate_key()
    {
        AESKey key;
        crypto_aead_aes256gcm_keygen(key.data());
        return key;
    }

    // ============================================================================
    // Base64
    // ============================================================================

    std::string Base64::encode(const Bytes &data)
    {
        std::size_t b64_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string encoded(b64_len, '\0');

        sodium_bin2base64(
            encoded.data(),
            b64_len,
            data.data(),
            data.size(),
            sodium_base64_VARIANT_ORIGINAL);

        encoded.resize(std::strlen(encoded.c_str()));
        return encoded;
    }

    Result<Bytes> Base64::decode(std::string_view encoded)
    {
        Bytes decoded(encoded.size());
        std::size_t decoded_len;

        if (sodium_base642bin(
                decoded.data(),
                decoded.size(),
                encoded.data(),
                encoded.size(),
                nullptr,
                &decoded_len,
                nullptr,
                sodium_base64_VARIANT_ORIGINAL) != 0)
        {
            return std::unexpected(ArbiterError::crypto("Invalid base64 encoding"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    // ============================================================================
    // SecureRandom
    // ============================================================================

    Bytes SecureRandom::generate_bytes(std::size_t n)
    {
        Bytes buffer(n);
        randombytes_buf(buffer.data(), n);
        return buffer;
    }

    std::string SecureRandom::generate_id(std::string_view prefix)
    {
        auto raw = generate_bytes(16);
        std::string hex(raw.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), raw.data(), raw.size());
        hex.resize(raw.size() * 2);
        return std::format("{}_{}", prefix, hex);
    }

} // namespace arbiter::crypto
