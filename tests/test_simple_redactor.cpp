#include <catch2/catch_test_macros.hpp>
#include "veil/simple_redactor.hpp"
#include <string>
#include <vector>

using namespace veil;

namespace
{
    std::string run(const Redactor &redactor, const ClassId &id, std::string_view value)
    {
        std::string out;
        redactor.redact(id, value, [&out](std::string_view chunk) { out.append(chunk); });
        return out;
    }

    const ClassId EMAIL{"pii", "email"};
} // namespace

TEST_CASE("Default SimpleRedactor replaces with asterisks", "[simple_redactor]")
{
    SimpleRedactor redactor;
    REQUIRE(redactor.mode() == SimpleRedactorMode{redaction_mode::Replace{'*'}});
    REQUIRE(run(redactor, EMAIL, "John Doe") == "********");
}

TEST_CASE("Erase modes", "[simple_redactor]")
{
    REQUIRE(run(SimpleRedactor::erase(), EMAIL, "john@example.com").empty());
    REQUIRE(run(SimpleRedactor::erase_and_tag(), EMAIL, "john@example.com") == "<pii.email:>");
}

TEST_CASE("Passthrough modes", "[simple_redactor]")
{
    REQUIRE(run(SimpleRedactor::passthrough(), EMAIL, "john@example.com") == "john@example.com");
    REQUIRE(run(SimpleRedactor::passthrough_and_tag(), EMAIL, "john@example.com") == "<pii.email:john@example.com>");
}

TEST_CASE("Replace modes keep the byte length", "[simple_redactor]")
{
    SECTION("Custom character")
    {
        REQUIRE(run(SimpleRedactor::replace('#'), EMAIL, "abcd") == "####");
        REQUIRE(run(SimpleRedactor::replace_and_tag('#'), EMAIL, "abcd") == "<pii.email:####>");
    }

    SECTION("Lengths beyond the asterisk fast path")
    {
        for (std::size_t len : {0u, 1u, 31u, 32u, 33u, 200u})
        {
            std::string value(len, 'v');
            REQUIRE(run(SimpleRedactor::replace('*'), EMAIL, value) == std::string(len, '*'));
            REQUIRE(run(SimpleRedactor::replace('x'), EMAIL, value) == std::string(len, 'x'));
        }
    }

    SECTION("Length counts bytes, not characters")
    {
        // "é" is two bytes in UTF-8
        REQUIRE(run(SimpleRedactor::replace('*'), EMAIL, "caf\xc3\xa9") == "*****");
    }
}

TEST_CASE("Insert modes ignore the input", "[simple_redactor]")
{
    REQUIRE(run(SimpleRedactor::insert("[REDACTED]"), EMAIL, "anything") == "[REDACTED]");
    REQUIRE(run(SimpleRedactor::insert("[REDACTED]"), EMAIL, "") == "[REDACTED]");
    REQUIRE(run(SimpleRedactor::insert_and_tag("x"), EMAIL, "anything") == "<pii.email:x>");
}

TEST_CASE("SimpleRedactor exact_len", "[simple_redactor]")
{
    const auto overhead = EMAIL.display_len() + 3;

    REQUIRE(SimpleRedactor::erase().exact_len(EMAIL) == 0);
    REQUIRE(SimpleRedactor::erase_and_tag().exact_len(EMAIL) == overhead);
    REQUIRE(SimpleRedactor::insert("[REDACTED]").exact_len(EMAIL) == 10);
    REQUIRE(SimpleRedactor::insert_and_tag("[REDACTED]").exact_len(EMAIL) == overhead + 10);
    REQUIRE_FALSE(SimpleRedactor::passthrough().exact_len(EMAIL).has_value());
    REQUIRE_FALSE(SimpleRedactor::replace('*').exact_len(EMAIL).has_value());

    // Reported lengths match real output
    REQUIRE(run(SimpleRedactor::erase_and_tag(), EMAIL, "abc").size() == overhead);
    REQUIRE(run(SimpleRedactor::insert_and_tag("[REDACTED]"), EMAIL, "abc").size() == overhead + 10);
}

TEST_CASE("Mode names", "[simple_redactor]")
{
    REQUIRE(mode_name(SimpleRedactor::erase().mode()) == "erase");
    REQUIRE(mode_name(SimpleRedactor::passthrough_and_tag().mode()) == "passthrough_and_tag");
    REQUIRE(mode_name(SimpleRedactor::replace_and_tag('*').mode()) == "replace_and_tag");
    REQUIRE(mode_name(SimpleRedactor::insert("x").mode()) == "insert");
}
