#include <catch2/catch_test_macros.hpp>

#include <Conduit/Log/Logger.hpp>

#include "Log/CaptureSink.hpp"

#include <string>

using namespace ConduitTests;
using Conduit::Log::Logger;
using Conduit::Log::Severity;

TEST_CASE("Log.Logger.DropsRecordsBelowMinimum")
{
    ScopedLogCapture capture(Severity::Warn);

    CONDUIT_LOG_DEBUG("Test", "hidden {}", 1);
    CONDUIT_LOG_INFO("Test", "hidden {}", 2);
    CONDUIT_LOG_WARN("Test", "shown {}", 3);
    CONDUIT_LOG_ERROR("Test", "shown {}", 4);

    const auto& records = capture.Records();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].severity == Severity::Warn);
    REQUIRE(records[0].message == "shown 3");
    REQUIRE(records[1].severity == Severity::Error);
    REQUIRE(records[1].component == "Test");
}

TEST_CASE("Log.Logger.TraceEnablesEverything")
{
    ScopedLogCapture capture(Severity::Trace);

    CONDUIT_LOG_TRACE("Test", "{}-{}", "a", 'b');
    REQUIRE(capture.Records().size() == 1);
    REQUIRE(capture.Records()[0].message == "a-b");
    REQUIRE(Logger::Instance().IsEnabled(Severity::Trace));
}

TEST_CASE("Log.Logger.OffDisablesEverything")
{
    ScopedLogCapture capture(Severity::Off);

    CONDUIT_LOG_ERROR("Test", "dropped");
    Logger::Instance().Write(Severity::Off, "Test", "dropped");

    REQUIRE(capture.Records().empty());
    REQUIRE_FALSE(Logger::Instance().IsEnabled(Severity::Error));
}

TEST_CASE("Log.Logger.CaptureRestoresSeverity")
{
    auto& logger   = Logger::Instance();
    const auto old = logger.GetMinSeverity();
    {
        ScopedLogCapture capture(Severity::Debug);
        REQUIRE(logger.GetMinSeverity() == Severity::Debug);
    }
    REQUIRE(logger.GetMinSeverity() == old);
}

TEST_CASE("Log.Logger.NullSinkIsIgnored")
{
    ScopedLogCapture capture(Severity::Info);
    Logger::Instance().AddSink(nullptr);

    CONDUIT_LOG_INFO("Test", "still delivered");
    Logger::Instance().Flush();
    REQUIRE(capture.Records().size() == 1);
}

TEST_CASE("Log.Severity.Names")
{
    STATIC_REQUIRE(Conduit::Log::ToString(Severity::Warn) == "WARN");
    STATIC_REQUIRE(Conduit::Log::ToString(Severity::Trace) == "TRACE");
}
