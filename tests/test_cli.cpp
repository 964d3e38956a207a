#include <catch2/catch_test_macros.hpp>
#include "veil/cli.hpp"
#include "veil/crypto.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace veil;

namespace
{
    struct CliResult
    {
        int code;
        std::string out;
        std::string err;
    };

    // Runs the CLI with stdout and stderr captured
    CliResult run_cli(std::vector<std::string> args)
    {
        args.insert(args.begin(), "veil");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        std::ostringstream out;
        std::ostringstream err;
        auto *old_out = std::cout.rdbuf(out.rdbuf());
        auto *old_err = std::cerr.rdbuf(err.rdbuf());
        int code = cli::run(static_cast<int>(args.size()), argv.data());
        std::cout.rdbuf(old_out);
        std::cerr.rdbuf(old_err);

        return CliResult{code, out.str(), err.str()};
    }

    std::string write_policy()
    {
        auto path = std::filesystem::temp_directory_path() / "veil_cli_test_policy.toml";
        std::ofstream file(path);
        file << R"(
[logging]
level = "off"

[[class]]
taxonomy = "pii"
name = "full_name"
mode = "replace"

[[class]]
taxonomy = "pii"
name = "email"
mode = "erase_and_tag"
)";
        return path.string();
    }
} // namespace

TEST_CASE("redact --value applies the policy", "[cli]")
{
    auto policy = write_policy();

    auto result = run_cli({"redact", "--config", policy, "--class", "pii.full_name", "--value", "John Doe"});
    REQUIRE(result.code == 0);
    REQUIRE(result.out == "********\n");

    auto tagged = run_cli({"redact", "--config", policy, "--class", "pii.email", "--value", "john@example.com"});
    REQUIRE(tagged.code == 0);
    REQUIRE(tagged.out == "<pii.email:>\n");
}

TEST_CASE("Configuration and input errors exit with 1", "[cli]")
{
    auto policy = write_policy();

    SECTION("Missing policy file")
    {
        auto result = run_cli({"redact", "--config", "/nonexistent/veil.toml", "--class", "pii.email", "--value", "x"});
        REQUIRE(result.code == 1);
        REQUIRE(result.err.find("IOError") != std::string::npos);
    }

    SECTION("Malformed class id")
    {
        auto result = run_cli({"redact", "--config", policy, "--class", "email", "--value", "x"});
        REQUIRE(result.code == 1);
        REQUIRE(result.out.empty());
    }

    SECTION("Missing required option")
    {
        REQUIRE(run_cli({"redact", "--config", policy, "--value", "x"}).code == 1);
    }

    SECTION("Secret size outside the key range")
    {
        REQUIRE(run_cli({"gen-secret", "--bytes", "8"}).code == 1);
        REQUIRE(run_cli({"gen-secret", "--bytes", "65"}).code == 1);
    }
}

TEST_CASE("Help exits with 0", "[cli]")
{
    auto result = run_cli({"--help"});
    REQUIRE(result.code == 0);
    REQUIRE(result.out.find("gen-secret") != std::string::npos);
}

TEST_CASE("gen-secret prints a decodable secret", "[cli]")
{
    auto result = run_cli({"gen-secret", "--bytes", "24"});
    REQUIRE(result.code == 0);

    auto secret = crypto::Base64::decode(result.out);
    REQUIRE(secret.has_value());
    REQUIRE(secret->size() == 24);
}

TEST_CASE("describe lists classes with fixed lengths", "[cli]")
{
    auto result = run_cli({"describe", "--config", write_policy()});
    REQUIRE(result.code == 0);
    REQUIRE(result.out == "pii.email exact_len=12\npii.full_name\n");
}
