#pragma once

#include "class_id.hpp"
#include "crypto.hpp"
#include "logging.hpp"
#include "redaction_dispatcher.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace veil
{

    /**
     * Redaction modes available from configuration
     */
    enum class RedactorKind
    {
        Erase,
        EraseAndTag,
        Passthrough,
        PassthroughAndTag,
        Replace,
        ReplaceAndTag,
        Insert,
        InsertAndTag,
        Hash,
        HashAndTag
    };

    /**
     * Convert RedactorKind to its configuration name ("replace_and_tag", ...)
     */
    std::string redactor_kind_to_string(RedactorKind kind);

    /**
     * Parse RedactorKind from its configuration name
     */
    Result<RedactorKind> redactor_kind_from_string(std::string_view s);

    struct RedactorSpec
    {
        RedactorKind kind{RedactorKind::Erase};
        char ch{'*'};     // replace modes
        std::string text; // insert modes
    };

    struct ClassRedactorSpec
    {
        ClassId class_id;
        RedactorSpec redactor;
    };

    struct RedactionConfig
    {
        LoggingConfig logging{};
        RedactorSpec fallback{};
        std::vector<ClassRedactorSpec> classes;
        std::optional<crypto::Bytes> hash_secret; // from [hash] or VEIL_HASH_SECRET
    };

    /**
     * ConfigLoader reads a redaction policy from TOML. Environment overrides
     * (VEIL_HASH_SECRET, VEIL_LOG_LEVEL, VEIL_FALLBACK_MODE) are applied after
     * the file and take precedence.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. */
        static Result<RedactionConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<RedactionConfig> from_string(std::string_view toml_content);

        /** Serialize config to JSON for inspection. The hash secret is never included. */
        static nlohmann::json to_json(const RedactionConfig &cfg);

        /** Decode a base64 hash secret and check it against the keyed hash's key range. */
        static Result<crypto::Bytes> decode_secret(std::string_view secret_b64);

    private:
        static Result<void> apply_env_overrides(RedactionConfig &cfg);
    };

    /**
     * Instantiate the redactor a spec describes. Hash modes use secret, or the
     * development key when none is configured.
     */
    Result<RedactionDispatcher::RedactorPtr> make_redactor(const RedactorSpec &spec,
                                                           const std::optional<crypto::Bytes> &secret);

    /** Build a dispatcher holding every class redactor and the fallback in cfg. */
    Result<RedactionDispatcher> build_dispatcher(const RedactionConfig &cfg);

} // namespace veil
