#include <catch2/catch_test_macros.hpp>
#include "veil/hash_redactor.hpp"
#include <algorithm>
#include <string>

using namespace veil;

namespace
{
    std::string run(const Redactor &redactor, const ClassId &id, std::string_view value)
    {
        std::string out;
        redactor.redact(id, value, [&out](std::string_view chunk) { out.append(chunk); });
        return out;
    }

    bool is_lower_hex(const std::string &s)
    {
        return std::all_of(s.begin(), s.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        });
    }

    const ClassId EMAIL{"pii", "email"};
    const ClassId NAME{"pii", "name"};

    // Constructed during static initialization of this file
    const HashRedactor STATIC_REDACTOR;
} // namespace

TEST_CASE("HashRedactor produces 16 lowercase hex digits", "[hash_redactor]")
{
    HashRedactor redactor;
    for (std::string_view value : {"", "a", "john@example.com", "a much longer value than sixteen bytes"})
    {
        auto out = run(redactor, EMAIL, value);
        REQUIRE(out.size() == HashRedactor::REDACTED_LEN);
        REQUIRE(is_lower_hex(out));
    }
}

TEST_CASE("HashRedactor is deterministic per secret", "[hash_redactor]")
{
    HashRedactor redactor;
    REQUIRE(run(redactor, EMAIL, "john@example.com") == run(redactor, EMAIL, "john@example.com"));
    REQUIRE(run(redactor, EMAIL, "john@example.com") != run(redactor, EMAIL, "jane@example.com"));

    // A second instance with the same key agrees
    HashRedactor same(HashRedactor::default_secret());
    REQUIRE(run(same, EMAIL, "john@example.com") == run(redactor, EMAIL, "john@example.com"));
}

TEST_CASE("HashRedactor ignores the class id", "[hash_redactor]")
{
    HashRedactor redactor;
    REQUIRE(run(redactor, EMAIL, "value") == run(redactor, NAME, "value"));
}

TEST_CASE("Different secrets give different digests", "[hash_redactor]")
{
    auto a = HashRedactor::with_secret(crypto::Bytes(32, 0x01));
    auto b = HashRedactor::with_secret(crypto::Bytes(32, 0x02));
    REQUIRE(run(a, EMAIL, "john@example.com") != run(b, EMAIL, "john@example.com"));
}

TEST_CASE("Secret length is checked", "[hash_redactor]")
{
    REQUIRE_THROWS_AS(HashRedactor(crypto::Bytes(crypto::KeyedHash::KEY_MIN - 1, 0x00)), VeilError);
    REQUIRE_THROWS_AS(HashRedactor(crypto::Bytes(crypto::KeyedHash::KEY_MAX + 1, 0x00)), VeilError);
    REQUIRE_NOTHROW(HashRedactor(crypto::Bytes(crypto::KeyedHash::KEY_MIN, 0x00)));
    REQUIRE_NOTHROW(HashRedactor(crypto::Bytes(crypto::KeyedHash::KEY_MAX, 0x00)));

    try
    {
        HashRedactor redactor(crypto::Bytes{});
        FAIL("expected VeilError");
    }
    catch (const VeilError &e)
    {
        REQUIRE(e.code == ErrorCode::InvalidSecret);
    }
}

TEST_CASE("Tagged hash output", "[hash_redactor]")
{
    auto plain = HashRedactor::with_secret(crypto::Bytes(32, 0x07));
    auto tagged = HashRedactor::with_secret_and_tag(crypto::Bytes(32, 0x07));

    REQUIRE(tagged.tagged());
    REQUIRE_FALSE(plain.tagged());

    auto digest = run(plain, EMAIL, "john@example.com");
    REQUIRE(run(tagged, EMAIL, "john@example.com") == "<pii.email:" + digest + ">");
}

TEST_CASE("HashRedactor exact_len", "[hash_redactor]")
{
    HashRedactor plain;
    auto tagged = HashRedactor::with_secret_and_tag(HashRedactor::default_secret());

    REQUIRE(plain.exact_len(EMAIL) == HashRedactor::REDACTED_LEN);
    REQUIRE(tagged.exact_len(EMAIL) == EMAIL.display_len() + 3 + HashRedactor::REDACTED_LEN);
    REQUIRE(run(tagged, EMAIL, "x").size() == *tagged.exact_len(EMAIL));
}

TEST_CASE("Development key is usable during static initialization", "[hash_redactor]")
{
    REQUIRE(HashRedactor::default_secret().size() == 32);
    REQUIRE(crypto::KeyedHash::is_valid_key_size(HashRedactor::default_secret().size()));

    auto keyed = HashRedactor::with_secret(HashRedactor::default_secret());
    REQUIRE(run(STATIC_REDACTOR, EMAIL, "john@example.com") == run(keyed, EMAIL, "john@example.com"));
}
