#pragma once

#include "redactor.hpp"
#include <string>
#include <utility>
#include <variant>

namespace veil
{

    /**
     * Modes understood by SimpleRedactor. Each "tagged" mode wraps its output
     * as "<taxonomy.class:output>".
     */
    namespace redaction_mode
    {
        /** No output at all. */
        struct Erase
        {
            bool tagged{false};
            bool operator==(const Erase &) const = default;
        };

        /** The original text, unchanged. */
        struct Passthrough
        {
            bool tagged{false};
            bool operator==(const Passthrough &) const = default;
        };

        /** One `ch` per byte of input. */
        struct Replace
        {
            char ch{'*'};
            bool tagged{false};
            bool operator==(const Replace &) const = default;
        };

        /** A fixed string regardless of input. */
        struct Insert
        {
            std::string text;
            bool tagged{false};
            bool operator==(const Insert &) const = default;
        };
    } // namespace redaction_mode

    using SimpleRedactorMode = std::variant<
        redaction_mode::Erase,
        redaction_mode::Passthrough,
        redaction_mode::Replace,
        redaction_mode::Insert>;

    /** Short name of a mode, e.g. "replace_and_tag". */
    std::string mode_name(const SimpleRedactorMode &mode);

    /**
     * Built-in redactor implementing the erase/passthrough/replace/insert
     * family. Defaults to Replace('*').
     */
    class SimpleRedactor : public Redactor
    {
    public:
        SimpleRedactor();
        explicit SimpleRedactor(SimpleRedactorMode mode);

        static SimpleRedactor erase() { return SimpleRedactor(redaction_mode::Erase{}); }
        static SimpleRedactor erase_and_tag() { return SimpleRedactor(redaction_mode::Erase{true}); }
        static SimpleRedactor passthrough() { return SimpleRedactor(redaction_mode::Passthrough{}); }
        static SimpleRedactor passthrough_and_tag() { return SimpleRedactor(redaction_mode::Passthrough{true}); }
        static SimpleRedactor replace(char ch) { return SimpleRedactor(redaction_mode::Replace{ch}); }
        static SimpleRedactor replace_and_tag(char ch) { return SimpleRedactor(redaction_mode::Replace{ch, true}); }
        static SimpleRedactor insert(std::string text) { return SimpleRedactor(redaction_mode::Insert{std::move(text)}); }
        static SimpleRedactor insert_and_tag(std::string text) { return SimpleRedactor(redaction_mode::Insert{std::move(text), true}); }

        const SimpleRedactorMode &mode() const { return mode_; }

        void redact(const ClassId &class_id, std::string_view value, const RedactionOutput &output) const override;

        std::optional<std::size_t> exact_len(const ClassId &class_id) const override;

    private:
        SimpleRedactorMode mode_;
    };

} // namespace veil
