#include <catch2/catch_test_macros.hpp>
#include "veil/data_class.hpp"
#include "veil/dispatcher_builder.hpp"
#include "veil/simple_redactor.hpp"
#include "veil/telemetry.hpp"
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <sstream>
#include <string>

using namespace veil;

namespace
{
    VEIL_DATA_CLASS(FullName, "pii", "full_name");
    VEIL_DATA_CLASS(Email, "pii", "email");

    std::shared_ptr<const RedactionDispatcher> make_dispatcher()
    {
        return std::make_shared<const RedactionDispatcher>(
            DispatcherBuilder()
                .add_class_redactor(FullName<std::string>::class_id(),
                                    std::make_shared<SimpleRedactor>())
                .add_class_redactor(Email<std::string>::class_id(),
                                    std::make_shared<SimpleRedactor>(SimpleRedactor::erase_and_tag()))
                .build());
    }

    std::shared_ptr<spdlog::logger> make_logger(std::ostringstream &out)
    {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
        auto logger = std::make_shared<spdlog::logger>("telemetry_test", sink);
        logger->set_pattern("%v");
        logger->set_level(spdlog::level::trace);
        return logger;
    }
} // namespace

static_assert(!TextRenderable<FullName<std::string>>);

TEST_CASE("Log records redact classified fields", "[telemetry]")
{
    std::ostringstream out;
    TelemetryLogger telemetry(make_dispatcher(), make_logger(out));

    auto record = telemetry.record("login");
    record.field("attempt", 3)
        .classified("user", FullName<std::string>("John Doe"))
        .classified("email", Email<std::string>("john@example.com"));

    REQUIRE(record.to_string() == R"(event="login" attempt="3" user="********" email="<pii.email:>")");

    record.emit();
    REQUIRE(out.str() == record.to_string() + "\n");
    REQUIRE(out.str().find("John Doe") == std::string::npos);
    REQUIRE(out.str().find("john@example.com") == std::string::npos);
}

TEST_CASE("classified_as redacts raw text by class id", "[telemetry]")
{
    std::ostringstream out;
    TelemetryLogger telemetry(make_dispatcher(), make_logger(out));

    auto line = telemetry.record("lookup")
                    .classified_as("name", ClassId("pii", "full_name"), "Jane")
                    .classified_as("other", ClassId("pii", "phone"), "555-0100")
                    .to_string();

    // Unregistered classes fall back to erase
    REQUIRE(line == R"(event="lookup" name="****" other="")");
}

TEST_CASE("Emit respects the logger level", "[telemetry]")
{
    std::ostringstream out;
    auto logger = make_logger(out);
    logger->set_level(spdlog::level::warn);
    TelemetryLogger telemetry(make_dispatcher(), logger);

    telemetry.record("quiet").emit(spdlog::level::info);
    REQUIRE(out.str().empty());

    telemetry.record("loud").emit(spdlog::level::warn);
    REQUIRE(out.str() == "event=\"loud\"\n");
}

TEST_CASE("TelemetryLogger requires a dispatcher", "[telemetry]")
{
    REQUIRE_THROWS_AS(TelemetryLogger(nullptr), VeilError);

    TelemetryLogger with_default_logger(make_dispatcher());
    REQUIRE(&with_default_logger.logger() == spdlog::default_logger_raw());
}

TEST_CASE("Field values cannot forge extra fields", "[telemetry]")
{
    auto dispatcher = std::make_shared<const RedactionDispatcher>(
        DispatcherBuilder()
            .add_class_redactor(FullName<std::string>::class_id(),
                                std::make_shared<SimpleRedactor>(SimpleRedactor::passthrough()))
            .build());
    std::ostringstream out;
    TelemetryLogger telemetry(dispatcher, make_logger(out));

    auto line = telemetry.record("say \"hi\"")
                    .classified("user", FullName<std::string>(R"(x" admin="true)"))
                    .field("path", std::string(R"(C:\tmp)"))
                    .to_string();

    REQUIRE(line == R"(event="say \"hi\"" user="x\" admin=\"true" path="C:\\tmp")");
}
