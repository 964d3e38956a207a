#pragma once

#include "redaction_dispatcher.hpp"
#include <string>
#include <unordered_map>

namespace veil
{

    /**
     * Accumulates class-to-redactor registrations and produces an immutable
     * RedactionDispatcher.
     *
     * Registering the same class twice keeps the later redactor. The fallback
     * is Erase until set_fallback_redactor() is called, so unknown classes
     * produce no output. Registration cannot fail; a null redactor counts as
     * Erase.
     *
     *   auto dispatcher = DispatcherBuilder()
     *                         .add_class_redactor(pii_email, std::make_shared<HashRedactor>(secret))
     *                         .set_fallback_redactor(std::make_shared<SimpleRedactor>(SimpleRedactor::erase()))
     *                         .build();
     */
    class DispatcherBuilder
    {
    public:
        using RedactorPtr = RedactionDispatcher::RedactorPtr;

        DispatcherBuilder();

        DispatcherBuilder &add_class_redactor(ClassId class_id, RedactorPtr redactor);

        DispatcherBuilder &set_fallback_redactor(RedactorPtr redactor);

        /** Snapshot of the current registrations; the builder stays usable. */
        RedactionDispatcher build() const;

        std::string describe() const;

    private:
        std::unordered_map<ClassId, RedactorPtr, ClassIdHash> redactors_;
        RedactorPtr fallback_;
    };

} // namespace veil
