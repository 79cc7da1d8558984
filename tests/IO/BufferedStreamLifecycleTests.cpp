#include <catch2/catch_test_macros.hpp>

#include <Conduit/IO/BufferedStream.hpp>

#include "IO/ScriptedResource.hpp"
#include "Log/CaptureSink.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace ConduitTests;
using Conduit::IO::BufferedStream;
using Conduit::IO::StreamOptions;
using Conduit::IO::StreamState;
using Conduit::IO::TextEncoding;

TEST_CASE("IO.BufferedStream.CreateOpensResource")
{
    auto [resource, log] = MakeScripted({});
    resource->WithHandle(7);

    auto stream = BufferedStream::Create(std::move(resource));
    REQUIRE(stream.has_value());
    REQUIRE(log->opens == 1);
    REQUIRE((*stream)->IsOpen());
    REQUIRE((*stream)->State() == StreamState::Open);
    REQUIRE((*stream)->IsReadable());
    REQUIRE((*stream)->IsWritable());
    REQUIRE_FALSE((*stream)->IsEof());
    REQUIRE((*stream)->FileNo() == 7);
    REQUIRE((*stream)->Tell() == 0);
}

TEST_CASE("IO.BufferedStream.OpenFailurePropagates")
{
    auto [resource, log] = MakeScripted({});
    resource->WithOpenError(StreamError {StreamErrc::SystemError, 13, "permission denied"});

    auto stream = BufferedStream::Create(std::move(resource));
    REQUIRE_FALSE(stream.has_value());
    REQUIRE(stream.error().code == StreamErrc::SystemError);
    REQUIRE(stream.error().native == 13);
}

TEST_CASE("IO.BufferedStream.OpenRejectsBadStates")
{
    BufferedStream stream;
    REQUIRE(stream.State() == StreamState::Unopened);
    REQUIRE(stream.Read().error().code == StreamErrc::NotOpen);
    REQUIRE(stream.Write("x").error().code == StreamErrc::NotOpen);
    REQUIRE(stream.Close().error().code == StreamErrc::NotOpen);
    REQUIRE(stream.State() == StreamState::Unopened);

    REQUIRE(stream.Open(nullptr).error().code == StreamErrc::InvalidArgument);

    REQUIRE(stream.Open(std::make_unique<ScriptedResource>(std::vector<Step> {})).has_value());
    REQUIRE(stream.Open(std::make_unique<ScriptedResource>(std::vector<Step> {})).error().code ==
            StreamErrc::InvalidArgument);

    REQUIRE(stream.Close().has_value());
    REQUIRE(stream.Open(std::make_unique<ScriptedResource>(std::vector<Step> {})).error().code ==
            StreamErrc::NotImplemented);
}

TEST_CASE("IO.BufferedStream.CloseIsIdempotent")
{
    auto [resource, log] = MakeScripted({Chunk("data")});
    resource->WithHandle(3);
    auto stream = BufferedStream::Create(std::move(resource));
    REQUIRE(stream.has_value());

    REQUIRE((*stream)->Close().has_value());
    REQUIRE((*stream)->IsClosed());
    REQUIRE((*stream)->Close().has_value());
    REQUIRE((*stream)->IsClosed());
    REQUIRE((*stream)->IsClosed());
    REQUIRE(log->closes == 1);

    REQUIRE_FALSE((*stream)->IsReadable());
    REQUIRE_FALSE((*stream)->IsWritable());
    REQUIRE_FALSE((*stream)->FileNo().has_value());
    REQUIRE((*stream)->Read().error().code == StreamErrc::ClosedForReading);
    REQUIRE((*stream)->Write("x").error().code == StreamErrc::ClosedForWriting);
}

TEST_CASE("IO.BufferedStream.CloseReportsResourceFailure")
{
    auto [resource, log] = MakeScripted({});
    resource->WithCloseError(StreamError {StreamErrc::SystemError, 5, "flush failed"});
    auto stream = BufferedStream::Create(std::move(resource));
    REQUIRE(stream.has_value());

    auto closed = (*stream)->Close();
    REQUIRE_FALSE(closed.has_value());
    REQUIRE(closed.error().message == "flush failed");
    REQUIRE((*stream)->IsClosed());
    REQUIRE((*stream)->Close().has_value());
}

TEST_CASE("IO.BufferedStream.HalfCloseRead")
{
    auto [resource, log] = MakeScripted({Chunk("data")});
    auto stream          = BufferedStream::Create(std::move(resource));
    REQUIRE(stream.has_value());
    auto& s = **stream;

    REQUIRE(s.CloseRead().has_value());
    REQUIRE_FALSE(s.IsReadable());
    REQUIRE(s.IsWritable());
    REQUIRE_FALSE(s.IsClosed());
    REQUIRE(s.Read().error().code == StreamErrc::ClosedForReading);
    REQUIRE(*s.Write("ok") == 2);

    // Closing the read side again changes nothing.
    REQUIRE(s.CloseRead().has_value());
    REQUIRE_FALSE(s.IsClosed());

    REQUIRE(s.CloseWrite().has_value());
    REQUIRE(s.IsClosed());
    REQUIRE(log->closes == 1);
}

TEST_CASE("IO.BufferedStream.HalfCloseWrite")
{
    auto [resource, log] = MakeScripted({Chunk("data")});
    auto stream          = BufferedStream::Create(std::move(resource));
    REQUIRE(stream.has_value());
    auto& s = **stream;

    REQUIRE(s.CloseWrite().has_value());
    REQUIRE(s.CloseWrite().has_value());
    REQUIRE_FALSE(s.IsWritable());
    REQUIRE(s.Write("x").error().code == StreamErrc::ClosedForWriting);
    REQUIRE(**s.Read() == "data");

    REQUIRE(s.CloseRead().has_value());
    REQUIRE(s.IsClosed());
    REQUIRE(log->closes == 1);
}

TEST_CASE("IO.BufferedStream.DestructionClosesWhenAutoclose")
{
    auto log = std::make_shared<ScriptLog>();
    {
        auto stream = BufferedStream::Create(std::make_unique<ScriptedResource>(std::vector<Step> {}, log));
        REQUIRE(stream.has_value());
        REQUIRE((*stream)->IsAutoclose());
    }
    REQUIRE(log->closes == 1);

    {
        auto stream = BufferedStream::Create(std::make_unique<ScriptedResource>(std::vector<Step> {}, log));
        REQUIRE(stream.has_value());
        (*stream)->SetAutoclose(false);
    }
    REQUIRE(log->closes == 1);
}

TEST_CASE("IO.BufferedStream.DestructionLogsCloseFailure")
{
    ScopedLogCapture capture(Conduit::Log::Severity::Warn);

    {
        auto [resource, log] = MakeScripted({});
        resource->WithCloseError(StreamError {StreamErrc::SystemError, 0, "device gone"});
        auto stream = BufferedStream::Create(std::move(resource));
        REQUIRE(stream.has_value());
    }

    const auto& records = capture.Records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].severity == Conduit::Log::Severity::Error);
    REQUIRE(records[0].component == "IO.BufferedStream");
    REQUIRE(records[0].message.find("device gone") != std::string::npos);
}

TEST_CASE("IO.BufferedStream.UnsupportedOperations")
{
    auto stream = BufferedStream::Create(std::make_unique<ScriptedResource>(std::vector<Step> {}));
    REQUIRE(stream.has_value());
    auto& s = **stream;

    REQUIRE(s.Reopen().error().code == StreamErrc::NotImplemented);
    REQUIRE(s.Stat().error().code == StreamErrc::NotImplemented);
    REQUIRE(s.Ioctl(0x5401).error().code == StreamErrc::NotImplemented);
    REQUIRE(s.Fcntl(1).error().code == StreamErrc::NotImplemented);
    REQUIRE(s.Advise(Conduit::IO::Advice::Sequential, 0, 100).has_value());
}

TEST_CASE("IO.BufferedStream.CompatibilityFlags")
{
    StreamOptions options;
    options.tty         = true;
    options.sync        = true;
    options.closeOnExec = false;
    options.pid         = 4242;

    auto stream = BufferedStream::Create(std::make_unique<ScriptedResource>(std::vector<Step> {}), options);
    REQUIRE(stream.has_value());
    auto& s = **stream;

    REQUIRE(s.IsTty());
    REQUIRE(s.IsAtty());
    REQUIRE(s.IsSync());
    REQUIRE_FALSE(s.IsCloseOnExec());
    REQUIRE(s.Pid() == 4242);

    REQUIRE_FALSE(s.IsBinMode());
    REQUIRE(&s.BinMode() == &s);
    REQUIRE(s.IsBinMode());

    s.SetSync(false);
    s.SetCloseOnExec(true);
    REQUIRE_FALSE(s.IsSync());
    REQUIRE(s.IsCloseOnExec());
    REQUIRE_FALSE(s.FileNo().has_value());
}

TEST_CASE("IO.BufferedStream.ExternalEncodingCanChange")
{
    auto stream = BufferedStream::Create(std::make_unique<ScriptedResource>(std::vector<Step> {Chunk("\xC3\xA9")}));
    REQUIRE(stream.has_value());
    auto& s = **stream;

    REQUIRE(s.ExternalEncoding() == TextEncoding::Utf8);
    REQUIRE(s.SetExternalEncoding("iso-8859-1").has_value());
    REQUIRE(s.ExternalEncoding() == TextEncoding::Latin1);
    REQUIRE(**s.Read() == "\xE9");

    REQUIRE(s.SetExternalEncoding("klingon").error().code == StreamErrc::InvalidArgument);
}

TEST_CASE("IO.BufferedStream.DescribeNamesResource")
{
    auto [resource, log] = MakeScripted({});
    resource->WithHandle(9);
    auto stream = BufferedStream::Create(std::move(resource));
    REQUIRE(stream.has_value());

    const std::string description = (*stream)->Describe();
    REQUIRE(description.find("scripted") != std::string::npos);
    REQUIRE(description.find("fd=9") != std::string::npos);
    REQUIRE(description.find("open") != std::string::npos);
}
