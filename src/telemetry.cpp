#include "veil/telemetry.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace veil
{

    namespace
    {
        // Appends text in double quotes, escaping '"' and backslash
        void append_quoted(std::string &line, std::string_view text)
        {
            line.push_back('"');
            for (char c : text)
            {
                if (c == '"' || c == '\\')
                    line.push_back('\\');
                line.push_back(c);
            }
            line.push_back('"');
        }
    } // namespace

    LogRecord::LogRecord(const TelemetryLogger &owner, std::string_view event)
        : owner_(&owner)
    {
        line_ = "event=";
        append_quoted(line_, event);
    }

    void LogRecord::append(std::string_view name, std::string_view rendered)
    {
        line_.push_back(' ');
        line_.append(name);
        line_.push_back('=');
        append_quoted(line_, rendered);
    }

    LogRecord &LogRecord::classified_as(std::string_view name, const ClassId &class_id, std::string_view text)
    {
        append(name, owner_->dispatcher().redacted_as(class_id, text));
        return *this;
    }

    void LogRecord::emit(spdlog::level::level_enum level) const
    {
        owner_->logger().log(level, "{}", line_);
    }

    TelemetryLogger::TelemetryLogger(std::shared_ptr<const RedactionDispatcher> dispatcher,
                                     std::shared_ptr<spdlog::logger> logger)
        : dispatcher_(std::move(dispatcher)), logger_(logger ? std::move(logger) : spdlog::default_logger())
    {
        if (!dispatcher_)
        {
            throw VeilError::invalid_input("TelemetryLogger requires a dispatcher");
        }
    }

} // namespace veil
