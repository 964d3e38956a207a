#include "veil/hash_redactor.hpp"
#include <array>
#include <cstdint>
#include <format>
#include <string>

namespace veil
{

    namespace
    {
        // First 32 bytes of the xxHash3 default secret: public, only fit for development.
        constexpr std::array<uint8_t, 32> DEFAULT_SECRET = {
            0xb8, 0xfe, 0x6c, 0x39, 0x23, 0xa4, 0x4b, 0xbe, 0x7c, 0x01, 0x81, 0x2c, 0xf7, 0x21, 0xad, 0x1c,
            0xde, 0xd4, 0x6d, 0xe9, 0x83, 0x90, 0x97, 0xdb, 0x72, 0x40, 0xa4, 0xa4, 0xb7, 0xb3, 0x67, 0x1f,
        };
    } // namespace

    const crypto::Bytes &HashRedactor::default_secret()
    {
        static const crypto::Bytes secret(DEFAULT_SECRET.begin(), DEFAULT_SECRET.end());
        return secret;
    }

    HashRedactor::HashRedactor() : HashRedactor(default_secret()) {}

    HashRedactor::HashRedactor(crypto::Bytes secret, bool tagged)
        : secret_(std::move(secret)), tagged_(tagged)
    {
        if (!crypto::KeyedHash::is_valid_key_size(secret_.size()))
        {
            throw VeilError::invalid_secret(std::format(
                "Hash secret must be {}..{} bytes, got {}",
                crypto::KeyedHash::KEY_MIN,
                crypto::KeyedHash::KEY_MAX,
                secret_.size()));
        }
    }

    void HashRedactor::redact(const ClassId &class_id, std::string_view value, const RedactionOutput &output) const
    {
        auto digest = crypto::Hex::encode_u64(crypto::KeyedHash::hash64(secret_, value));
        std::string_view text(digest.data(), digest.size());
        if (!tagged_)
        {
            output(text);
            return;
        }
        output(std::format("<{}:{}>", class_id.to_string(), text));
    }

    std::optional<std::size_t> HashRedactor::exact_len(const ClassId &class_id) const
    {
        if (tagged_)
        {
            return class_id.display_len() + 3 + REDACTED_LEN;
        }
        return REDACTED_LEN;
    }

} // namespace veil
