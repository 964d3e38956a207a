#pragma once

#include "classified.hpp"
#include "redaction_dispatcher.hpp"
#include "types.hpp"
#include <spdlog/logger.h>
#include <format>
#include <memory>
#include <string>
#include <string_view>

namespace veil
{

    class TelemetryLogger;

    /**
     * One structured log line, assembled field by field.
     *
     * Plain values are rendered with std::format. Classified values only get
     * in through classified()/classified_as(), which run them through the
     * owning logger's dispatcher; passing a container to field() does not
     * compile because containers have no formatter.
     */
    class LogRecord
    {
    public:
        template <typename V>
            requires TextRenderable<V>
        LogRecord &field(std::string_view name, const V &value)
        {
            append(name, std::format("{}", value));
            return *this;
        }

        template <Extractable C>
        LogRecord &classified(std::string_view name, const C &value);

        LogRecord &classified_as(std::string_view name, const ClassId &class_id, std::string_view text);

        /** event="..." name="value" ...; '"' and backslash in values are escaped */
        const std::string &to_string() const { return line_; }

        void emit(spdlog::level::level_enum level = spdlog::level::info) const;

    private:
        friend class TelemetryLogger;

        LogRecord(const TelemetryLogger &owner, std::string_view event);

        void append(std::string_view name, std::string_view rendered);

        const TelemetryLogger *owner_;
        std::string line_;
    };

    /**
     * Telemetry front end that pairs a shared dispatcher with a spdlog
     * logger. This is the path classified data takes into log output.
     */
    class TelemetryLogger
    {
    public:
        /** Uses spdlog's default logger when logger is null; throws VeilError when dispatcher is null. */
        explicit TelemetryLogger(std::shared_ptr<const RedactionDispatcher> dispatcher,
                                 std::shared_ptr<spdlog::logger> logger = nullptr);

        LogRecord record(std::string_view event) const { return LogRecord(*this, event); }

        const RedactionDispatcher &dispatcher() const { return *dispatcher_; }

        spdlog::logger &logger() const { return *logger_; }

    private:
        std::shared_ptr<const RedactionDispatcher> dispatcher_;
        std::shared_ptr<spdlog::logger> logger_;
    };

    template <Extractable C>
    LogRecord &LogRecord::classified(std::string_view name, const C &value)
    {
        append(name, owner_->dispatcher().redacted(value));
        return *this;
    }

} // namespace veil
