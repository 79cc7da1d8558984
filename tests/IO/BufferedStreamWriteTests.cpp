#include <catch2/catch_test_macros.hpp>

#include <Conduit/IO/BufferedStream.hpp>

#include "IO/ScriptedResource.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace ConduitTests;
using Conduit::IO::BufferedStream;
using Conduit::IO::StreamOptions;

namespace
{
    struct ScriptedStream
    {
        std::unique_ptr<BufferedStream> stream;
        std::shared_ptr<ScriptLog>      log;
    };

    ScriptedStream OpenScripted(StreamOptions options = {})
    {
        auto [resource, log] = MakeScripted({});
        auto stream          = BufferedStream::Create(std::move(resource), std::move(options));
        REQUIRE(stream.has_value());
        return {std::move(*stream), log};
    }
}// namespace

TEST_CASE("IO.BufferedStream.WriteDelegatesToResource")
{
    auto [stream, log] = OpenScripted();

    auto written = stream->Write("payload");
    REQUIRE(written.has_value());
    REQUIRE(*written == 7);
    REQUIRE(*stream->SysWrite("a") == 1);
    REQUIRE(*stream->WriteNonblock("bc") == 2);
    REQUIRE(log->writes == std::vector<std::string> {"payload", "a", "bc"});
    REQUIRE(stream->Tell() == 0);
}

TEST_CASE("IO.BufferedStream.PrintFormatsEachArgument")
{
    auto [stream, log] = OpenScripted();

    REQUIRE(stream->Print("a", 1, 2.5, std::string("z")).has_value());
    REQUIRE(log->writes == std::vector<std::string> {"a12.5z"});
}

TEST_CASE("IO.BufferedStream.PutsAppendsSeparator")
{
    auto [stream, log] = OpenScripted();

    REQUIRE(stream->Puts("x", 3).has_value());
    REQUIRE(stream->Puts().has_value());
    REQUIRE(log->writes == std::vector<std::string> {"x\n3\n", "\n"});
}

TEST_CASE("IO.BufferedStream.PutsUsesConfiguredSeparator")
{
    StreamOptions options;
    options.lineSeparator = "\r\n";
    auto [stream, log]    = OpenScripted(options);

    REQUIRE(stream->Puts("row").has_value());
    REQUIRE(log->writes == std::vector<std::string> {"row\r\n"});
}

TEST_CASE("IO.BufferedStream.PrintfUsesPrintfSyntax")
{
    auto [stream, log] = OpenScripted();

    REQUIRE(stream->Printf("%d-%s-%.2f", 4, "z", 1.5).has_value());
    REQUIRE(log->writes == std::vector<std::string> {"4-z-1.50"});

    auto failed = stream->Printf("%d and %d", 1);
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().code == StreamErrc::InvalidArgument);
    REQUIRE(log->writes.size() == 1);
}

TEST_CASE("IO.BufferedStream.PutCharWritesOneUnit")
{
    auto [stream, log] = OpenScripted();

    REQUIRE(stream->PutChar(static_cast<Conduit::UInt8>('A')).has_value());
    REQUIRE(stream->PutChar(std::string_view("\xC3\xA9!")).has_value());
    REQUIRE(log->writes == std::vector<std::string> {"A", "\xC3\xA9"});
}

TEST_CASE("IO.BufferedStream.WriteAfterCloseWriteFails")
{
    auto [stream, log] = OpenScripted();
    REQUIRE(stream->CloseWrite().has_value());

    REQUIRE(stream->Write("x").error().code == StreamErrc::ClosedForWriting);
    REQUIRE(stream->Print("x").error().code == StreamErrc::ClosedForWriting);
    REQUIRE(stream->Puts("x").error().code == StreamErrc::ClosedForWriting);
    REQUIRE(stream->WriteAt("x", 0).error().code == StreamErrc::ClosedForWriting);
    REQUIRE(log->writes.empty());
}

TEST_CASE("IO.BufferedStream.FlushAndSyncAreNoOps")
{
    auto [stream, log] = OpenScripted();

    REQUIRE(&stream->Flush() == stream.get());
    REQUIRE(stream->Fsync() == 0);
    REQUIRE(stream->Fdatasync() == 0);
}
