#pragma once

#include "class_id.hpp"
#include "extractor.hpp"
#include "redactor.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace veil
{

    class DispatcherBuilder;

    /**
     * Routes classified values to the redactor registered for their data
     * class, or to the fallback redactor when the class is not registered.
     *
     * Lookup is by exact ClassId; a registered taxonomy gives no default for
     * its other classes. Instances are immutable once built and safe to share
     * across threads without locking. Build them with DispatcherBuilder.
     */
    class RedactionDispatcher
    {
    public:
        using RedactorPtr = std::shared_ptr<const Redactor>;

        /**
         * Redact a classified container: extract its text, resolve its
         * redactor and stream the result to output.
         */
        template <Extractable C>
        void redact(const C &value, const RedactionOutput &output) const
        {
            const Extractor::Sink sink = [this, &output](const ClassId &class_id, std::string_view text) {
                redact_as(class_id, text, output);
            };
            value.extract(Extractor(sink));
        }

        /** Redact text that is already known to belong to class_id. */
        void redact_as(const ClassId &class_id, std::string_view value, const RedactionOutput &output) const;

        /** redact() collected into a string. */
        template <Extractable C>
        std::string redacted(const C &value) const
        {
            std::string out;
            const Extractor::Sink sink = [this, &out](const ClassId &class_id, std::string_view text) {
                out = redacted_as(class_id, text);
            };
            value.extract(Extractor(sink));
            return out;
        }

        /** redact_as() collected into a string. */
        std::string redacted_as(const ClassId &class_id, std::string_view value) const;

        /**
         * Fixed output length of the redactor resolved for class_id, or empty
         * when the length depends on the input.
         */
        std::optional<std::size_t> exact_len(const ClassId &class_id) const;

        bool has_class_redactor(const ClassId &class_id) const;

        /** Registered classes, sorted. */
        std::vector<ClassId> registered_classes() const;

        /** "[taxonomy.class, ...]" over the registered classes, sorted. */
        std::string describe() const;

    private:
        friend class DispatcherBuilder;

        RedactionDispatcher(std::unordered_map<ClassId, RedactorPtr, ClassIdHash> redactors,
                            RedactorPtr fallback);

        const Redactor &resolve(const ClassId &class_id) const;

        std::unordered_map<ClassId, RedactorPtr, ClassIdHash> redactors_;
        RedactorPtr fallback_;
    };

} // namespace veil
