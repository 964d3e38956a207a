#include "veil/config.hpp"
#include "veil/dispatcher_builder.hpp"
#include "veil/hash_redactor.hpp"
#include "veil/simple_redactor.hpp"
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <array>
#include <cstdlib>
#include <format>
#include <fstream>
#include <memory>
#include <sstream>
#include <utility>

namespace veil
{

    namespace
    {
        struct KindName
        {
            RedactorKind kind;
            std::string_view name;
        };

        constexpr std::array<KindName, 10> kKindNames = {
            KindName{RedactorKind::Erase, "erase"},
            KindName{RedactorKind::EraseAndTag, "erase_and_tag"},
            KindName{RedactorKind::Passthrough, "passthrough"},
            KindName{RedactorKind::PassthroughAndTag, "passthrough_and_tag"},
            KindName{RedactorKind::Replace, "replace"},
            KindName{RedactorKind::ReplaceAndTag, "replace_and_tag"},
            KindName{RedactorKind::Insert, "insert"},
            KindName{RedactorKind::InsertAndTag, "insert_and_tag"},
            KindName{RedactorKind::Hash, "hash"},
            KindName{RedactorKind::HashAndTag, "hash_and_tag"},
        };

        bool is_replace(RedactorKind kind)
        {
            return kind == RedactorKind::Replace || kind == RedactorKind::ReplaceAndTag;
        }

        bool is_insert(RedactorKind kind)
        {
            return kind == RedactorKind::Insert || kind == RedactorKind::InsertAndTag;
        }

        bool is_hash(RedactorKind kind)
        {
            return kind == RedactorKind::Hash || kind == RedactorKind::HashAndTag;
        }

        // `where` names the table in error messages
        Result<RedactorSpec> parse_redactor(const toml::table &tbl, const std::string &where)
        {
            auto mode = tbl["mode"].value<std::string>();
            if (!mode)
                return std::unexpected(VeilError::config(std::format("{}: missing 'mode'", where)));

            auto kind = redactor_kind_from_string(*mode);
            if (!kind)
                return std::unexpected(VeilError::config(std::format("{}: {}", where, kind.error().what())));

            RedactorSpec spec;
            spec.kind = *kind;

            if (is_replace(spec.kind))
            {
                if (tbl.contains("char"))
                {
                    auto ch = tbl["char"].value<std::string>();
                    if (!ch)
                        return std::unexpected(VeilError::config(std::format("{}: 'char' must be a string", where)));
                    if (ch->size() != 1)
                        return std::unexpected(VeilError::config(
                            std::format("{}: 'char' must be a single byte, got \"{}\"", where, *ch)));
                    spec.ch = (*ch)[0];
                }
            }

            if (is_insert(spec.kind))
            {
                auto text = tbl["text"].value<std::string>();
                if (!text)
                    return std::unexpected(VeilError::config(std::format("{}: mode '{}' requires 'text'", where, *mode)));
                spec.text = *text;
            }

            return spec;
        }

        Result<RedactionConfig> parse_toml(const toml::table &tbl)
        {
            RedactionConfig cfg{};

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
                if (auto pattern = (*logging)["pattern"].value<std::string>())
                    cfg.logging.pattern = *pattern;
            }

            if (auto hash = tbl["hash"].as_table())
            {
                if (auto secret_b64 = (*hash)["secret_b64"].value<std::string>())
                {
                    auto secret = ConfigLoader::decode_secret(*secret_b64);
                    if (!secret)
                        return std::unexpected(secret.error());
                    cfg.hash_secret = std::move(*secret);
                }
            }

            if (auto fallback = tbl["fallback"].as_table())
            {
                auto spec = parse_redactor(*fallback, "[fallback]");
                if (!spec)
                    return std::unexpected(spec.error());
                cfg.fallback = std::move(*spec);
            }

            if (tbl.contains("class"))
            {
                auto classes = tbl["class"].as_array();
                if (!classes)
                    return std::unexpected(VeilError::config("'class' must be an array of tables; write [[class]], not [class]"));

                std::size_t index = 0;
                for (const auto &node : *classes)
                {
                    auto where = std::format("[[class]] #{}", index++);
                    auto entry = node.as_table();
                    if (!entry)
                        return std::unexpected(VeilError::config(where + ": expected a table"));

                    auto taxonomy = (*entry)["taxonomy"].value<std::string>();
                    auto name = (*entry)["name"].value<std::string>();
                    if (!taxonomy || taxonomy->empty() || !name || name->empty())
                        return std::unexpected(VeilError::config(where + ": 'taxonomy' and 'name' are required"));

                    auto spec = parse_redactor(*entry, where);
                    if (!spec)
                        return std::unexpected(spec.error());

                    cfg.classes.push_back(ClassRedactorSpec{ClassId(*taxonomy, *name), std::move(*spec)});
                }
            }

            return cfg;
        }

        nlohmann::json spec_to_json(const RedactorSpec &spec)
        {
            nlohmann::json j{{"mode", redactor_kind_to_string(spec.kind)}};
            if (is_replace(spec.kind))
                j["char"] = std::string(1, spec.ch);
            if (is_insert(spec.kind))
                j["text"] = spec.text;
            return j;
        }

    } // namespace

    std::string redactor_kind_to_string(RedactorKind kind)
    {
        for (const auto &entry : kKindNames)
        {
            if (entry.kind == kind)
                return std::string(entry.name);
        }
        return "unknown";
    }

    Result<RedactorKind> redactor_kind_from_string(std::string_view s)
    {
        for (const auto &entry : kKindNames)
        {
            if (entry.name == s)
                return entry.kind;
        }
        return std::unexpected(VeilError::config(std::format("Unknown redaction mode: {}", s)));
    }

    Result<RedactionConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(VeilError::io("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<RedactionConfig> ConfigLoader::from_string(std::string_view toml_content)
    {
        RedactionConfig cfg{};
        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl);
            if (!parsed)
                return parsed;
            cfg = std::move(*parsed);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(VeilError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        auto env = apply_env_overrides(cfg);
        if (!env)
            return std::unexpected(env.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(RedactionConfig &cfg)
    {
        if (const char *secret_b64 = std::getenv("VEIL_HASH_SECRET"))
        {
            auto secret = decode_secret(secret_b64);
            if (!secret)
                return std::unexpected(VeilError::config(std::string("VEIL_HASH_SECRET: ") + secret.error().what()));
            cfg.hash_secret = std::move(*secret);
        }
        if (const char *level = std::getenv("VEIL_LOG_LEVEL"))
            cfg.logging.level = level;
        if (const char *mode = std::getenv("VEIL_FALLBACK_MODE"))
        {
            auto kind = redactor_kind_from_string(mode);
            if (!kind)
                return std::unexpected(VeilError::config(std::string("VEIL_FALLBACK_MODE: ") + kind.error().what()));
            if (is_insert(*kind))
                return std::unexpected(VeilError::config("VEIL_FALLBACK_MODE: insert modes need 'text' and must be set in the file"));
            cfg.fallback = RedactorSpec{*kind};
        }
        return {};
    }

    Result<crypto::Bytes> ConfigLoader::decode_secret(std::string_view secret_b64)
    {
        auto secret = crypto::Base64::decode(secret_b64);
        if (!secret)
            return std::unexpected(VeilError::config("Hash secret is not valid base64"));
        if (!crypto::KeyedHash::is_valid_key_size(secret->size()))
        {
            return std::unexpected(VeilError::config(std::format(
                "Hash secret must decode to {}..{} bytes, got {}",
                crypto::KeyedHash::KEY_MIN,
                crypto::KeyedHash::KEY_MAX,
                secret->size())));
        }
        return secret;
    }

    nlohmann::json ConfigLoader::to_json(const RedactionConfig &cfg)
    {
        nlohmann::json j;
        j["logging"] = {{"level", cfg.logging.level}, {"pattern", cfg.logging.pattern}};
        j["fallback"] = spec_to_json(cfg.fallback);
        j["classes"] = nlohmann::json::array();
        for (const auto &entry : cfg.classes)
        {
            auto c = spec_to_json(entry.redactor);
            c["class"] = entry.class_id.to_string();
            j["classes"].push_back(std::move(c));
        }
        j["has_hash_secret"] = cfg.hash_secret.has_value();
        return j;
    }

    Result<RedactionDispatcher::RedactorPtr> make_redactor(const RedactorSpec &spec,
                                                           const std::optional<crypto::Bytes> &secret)
    {
        switch (spec.kind)
        {
        case RedactorKind::Erase:
            return std::make_shared<SimpleRedactor>(SimpleRedactor::erase());
        case RedactorKind::EraseAndTag:
            return std::make_shared<SimpleRedactor>(SimpleRedactor::erase_and_tag());
        case RedactorKind::Passthrough:
            return std::make_shared<SimpleRedactor>(SimpleRedactor::passthrough());
        case RedactorKind::PassthroughAndTag:
            return std::make_shared<SimpleRedactor>(SimpleRedactor::passthrough_and_tag());
        case RedactorKind::Replace:
            return std::make_shared<SimpleRedactor>(SimpleRedactor::replace(spec.ch));
        case RedactorKind::ReplaceAndTag:
            return std::make_shared<SimpleRedactor>(SimpleRedactor::replace_and_tag(spec.ch));
        case RedactorKind::Insert:
            return std::make_shared<SimpleRedactor>(SimpleRedactor::insert(spec.text));
        case RedactorKind::InsertAndTag:
            return std::make_shared<SimpleRedactor>(SimpleRedactor::insert_and_tag(spec.text));
        case RedactorKind::Hash:
        case RedactorKind::HashAndTag:
            break;
        }

        bool tagged = spec.kind == RedactorKind::HashAndTag;
        if (!secret)
        {
            spdlog::warn("No hash secret configured; hash redaction uses the public development key");
            return std::make_shared<HashRedactor>(HashRedactor::default_secret(), tagged);
        }
        try
        {
            return std::make_shared<HashRedactor>(*secret, tagged);
        }
        catch (const VeilError &e)
        {
            return std::unexpected(VeilError::config(e.what()));
        }
    }

    Result<RedactionDispatcher> build_dispatcher(const RedactionConfig &cfg)
    {
        DispatcherBuilder builder;
        for (const auto &entry : cfg.classes)
        {
            auto redactor = make_redactor(entry.redactor, cfg.hash_secret);
            if (!redactor)
                return std::unexpected(redactor.error());
            builder.add_class_redactor(entry.class_id, std::move(*redactor));
        }

        auto fallback = make_redactor(cfg.fallback, cfg.hash_secret);
        if (!fallback)
            return std::unexpected(fallback.error());
        builder.set_fallback_redactor(std::move(*fallback));

        return builder.build();
    }

} // namespace veil
