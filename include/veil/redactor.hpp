#pragma once

#include "class_id.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>

namespace veil
{

    /**
     * Receives redacted text. May be called zero or more times per redaction;
     * the concatenation of all chunks is the redacted value.
     */
    using RedactionOutput = std::function<void(std::string_view)>;

    /**
     * A redaction strategy.
     *
     * Implementations transform the text form of a classified value into
     * something safe to emit. They must be total (any input produces output,
     * possibly empty), deterministic, and must not retain the input past the
     * call. The class id is only for decorating output (tagging); it must not
     * change how the value itself is transformed.
     */
    class Redactor
    {
    public:
        virtual ~Redactor() = default;

        virtual void redact(const ClassId &class_id, std::string_view value, const RedactionOutput &output) const = 0;

        /**
         * Length of every output this redactor produces for class_id, if it
         * does not depend on the input. Callers use it to size buffers.
         */
        virtual std::optional<std::size_t> exact_len(const ClassId &class_id) const
        {
            (void)class_id;
            return std::nullopt;
        }
    };

} // namespace veil
