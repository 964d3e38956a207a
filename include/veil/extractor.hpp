#pragma once

#include "class_id.hpp"
#include <concepts>
#include <functional>
#include <string_view>
#include <utility>

namespace veil
{

    /**
     * One-shot sink a classified container writes its text form into.
     *
     * An Extractor is move-only and write() consumes it, so a container can
     * hand over exactly one (class id, text) pair. The text is only valid for
     * the duration of the call; sinks must not retain the view.
     *
     * The extractor refers to the sink, which must outlive it; temporaries
     * are rejected.
     */
    class Extractor
    {
    public:
        using Sink = std::function<void(const ClassId &, std::string_view)>;

        explicit Extractor(const Sink &sink) : sink_(&sink) {}
        Extractor(Sink &&) = delete;
        Extractor(const Sink &&) = delete;

        Extractor(Extractor &&other) noexcept : sink_(std::exchange(other.sink_, nullptr)) {}
        Extractor &operator=(Extractor &&) = delete;
        Extractor(const Extractor &) = delete;
        Extractor &operator=(const Extractor &) = delete;

        /** Deliver the text; later calls on a moved-from or spent extractor do nothing. */
        void write(const ClassId &id, std::string_view text) &&
        {
            if (auto sink = std::exchange(sink_, nullptr))
            {
                (*sink)(id, text);
            }
        }

    private:
        const Sink *sink_;
    };

    /**
     * A type that can hand its text form to an Extractor.
     */
    template <typename T>
    concept Extractable = requires(const T &value, Extractor extractor) {
        value.extract(std::move(extractor));
    };

} // namespace veil
