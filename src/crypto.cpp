#include "veil/crypto.hpp"
#include <sodium.h>
#include <cstring>
#include <stdexcept>

namespace veil::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    // ============================================================================
    // KeyedHash Implementation
    // ============================================================================

    const std::size_t KeyedHash::KEY_MIN = crypto_generichash_KEYBYTES_MIN;
    const std::size_t KeyedHash::KEY_MAX = crypto_generichash_KEYBYTES_MAX;

    bool KeyedHash::is_valid_key_size(std::size_t size)
    {
        return size >= crypto_generichash_KEYBYTES_MIN && size <= crypto_generichash_KEYBYTES_MAX;
    }

    uint64_t KeyedHash::hash64(const Bytes &key, std::string_view data)
    {
        std::array<uint8_t, crypto_generichash_BYTES_MIN> digest{};
        crypto_generichash(digest.data(),
                           digest.size(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size(),
                           key.data(),
                           key.size());

        uint64_t value = 0;
        for (std::size_t i = 0; i < 8; ++i)
        {
            value |= static_cast<uint64_t>(digest[i]) << (8 * i);
        }
        return value;
    }

    // ============================================================================
    // Hex Implementation
    // ============================================================================

    namespace
    {
        constexpr char HEX_LOWER_CHARS[] = "0123456789abcdef";
    }

    std::array<char, 16> Hex::encode_u64(uint64_t value)
    {
        std::array<char, 16> buffer{};
        for (auto it = buffer.rbegin(); it != buffer.rend(); ++it)
        {
            *it = HEX_LOWER_CHARS[value & 0x0f];
            value >>= 4;
        }
        return buffer;
    }

    std::string Hex::encode(const uint8_t *data, std::size_t size)
    {
        std::string hex;
        hex.reserve(size * 2);
        for (std::size_t i = 0; i < size; ++i)
        {
            hex.push_back(HEX_LOWER_CHARS[data[i] >> 4]);
            hex.push_back(HEX_LOWER_CHARS[data[i] & 0x0f]);
        }
        return hex;
    }

    std::string Hex::encode(const Bytes &data)
    {
        return encode(data.data(), data.size());
    }

    // ============================================================================
    // SHA256 Implementation
    // ============================================================================

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

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
        return Hex::encode(hash.data(), hash.size());
    }

    // ============================================================================
    // Base64 Implementation
    // ============================================================================

    std::string Base64::encode(const Bytes &data)
    {
        size_t b64_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string encoded(b64_len, '\0');

        sodium_bin2base64(
            encoded.data(),
            b64_len,
            data.data(),
            data.size(),
            sodium_base64_VARIANT_ORIGINAL);

        // Remove null terminator
        encoded.resize(std::strlen(encoded.c_str()));
        return encoded;
    }

    Result<Bytes> Base64::decode(std::string_view encoded)
    {
        Bytes decoded(encoded.size()); // Worst case size
        size_t decoded_len = 0;

        if (sodium_base642bin(
                decoded.data(),
                decoded.size(),
                encoded.data(),
                encoded.size(),
                " \t\r\n", // tolerate wrapped input
                &decoded_len,
                nullptr,
                sodium_base64_VARIANT_ORIGINAL) != 0)
        {
            return std::unexpected(VeilError::crypto("Invalid base64 encoding"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    // ============================================================================
    // SecureRandom Implementation
    // ============================================================================

    void SecureRandom::fill_bytes(Bytes &buffer)
    {
        randombytes_buf(buffer.data(), buffer.size());
    }

    Bytes SecureRandom::generate_bytes(std::size_t n)
    {
        Bytes buffer(n);
        fill_bytes(buffer);
        return buffer;
    }

} // namespace veil::crypto
