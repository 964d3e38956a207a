#pragma once

#include "types.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace veil::crypto
{

    // Type aliases for clarity
    using Bytes = std::vector<uint8_t>;
    using SHA256Hash = std::array<uint8_t, 32>;

    /**
     * Keyed 64-bit hash built on libsodium's BLAKE2b (crypto_generichash).
     * The 16-byte keyed digest is folded to 64 bits by reading its first
     * 8 bytes little-endian.
     */
    class KeyedHash
    {
    public:
        /** Smallest accepted key, crypto_generichash_KEYBYTES_MIN */
        static const std::size_t KEY_MIN;

        /** Largest accepted key, crypto_generichash_KEYBYTES_MAX */
        static const std::size_t KEY_MAX;

        static bool is_valid_key_size(std::size_t size);

        /**
         * Hash data under key. The caller guarantees is_valid_key_size(key.size()).
         */
        static uint64_t hash64(const Bytes &key, std::string_view data);
    };

    /**
     * Lowercase hex rendering
     */
    class Hex
    {
    public:
        /** Render a 64-bit value as exactly 16 hex digits, most significant first. */
        static std::array<char, 16> encode_u64(uint64_t value);

        static std::string encode(const uint8_t *data, std::size_t size);

        static std::string encode(const Bytes &data);
    };

    /**
     * SHA-256 hashing
     */
    class SHA256
    {
    public:
        /**
         * Compute SHA-256 hash of data
         */
        static SHA256Hash hash(const Bytes &data);

        /**
         * Compute SHA-256 hash of string
         */
        static SHA256Hash hash(std::string_view data);

        /**
         * Convert hash to hex string
         */
        static std::string to_hex(const SHA256Hash &hash);
    };

    /**
     * Base64 encoding/decoding (standard alphabet, padded)
     */
    class Base64
    {
    public:
        static std::string encode(const Bytes &data);

        static Result<Bytes> decode(std::string_view encoded);
    };

    /**
     * Cryptographically secure random number generation
     */
    class SecureRandom
    {
    public:
        /**
         * Fill buffer with cryptographically secure random bytes
         */
        static void fill_bytes(Bytes &buffer);

        /**
         * Generate N random bytes
         */
        static Bytes generate_bytes(std::size_t n);
    };

} // namespace veil::crypto
