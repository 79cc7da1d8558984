#include <catch2/catch_test_macros.hpp>

#include <Conduit/IO/BufferedStream.hpp>
#include <Conduit/IO/MemoryResource.hpp>

#include "IO/ScriptedResource.hpp"

#include <memory>
#include <string>

using namespace ConduitTests;
using Conduit::IO::BufferedStream;
using Conduit::IO::MemoryResource;

namespace
{
    class ForwardOnlyResource final : public Conduit::IO::IStreamResource
    {
    public:
        StreamExpected<std::string> Read() override
        {
            return std::string {};
        }
    };

    struct MemoryStream
    {
        std::unique_ptr<BufferedStream> stream;
        MemoryResource*                 resource;
    };

    MemoryStream OpenMemory(std::string data)
    {
        auto  resource = std::make_unique<MemoryResource>(std::move(data));
        auto* raw      = resource.get();
        auto  stream   = BufferedStream::Create(std::move(resource));
        REQUIRE(stream.has_value());
        return {std::move(*stream), raw};
    }
}// namespace

TEST_CASE("IO.BufferedStream.SeekDiscardsPushedBackBytes")
{
    auto [stream, memory] = OpenMemory("abcdef");

    REQUIRE(**stream->Read(2) == "ab");
    REQUIRE(stream->UngetChar("ZZ").has_value());

    auto landed = stream->Seek(4);
    REQUIRE(landed.has_value());
    REQUIRE(*landed == 4);
    REQUIRE(stream->Tell() == 4);

    REQUIRE(**stream->Read() == "ef");
    REQUIRE(stream->Tell() == 6);
}

TEST_CASE("IO.BufferedStream.SeekClearsEndOfStream")
{
    auto [stream, memory] = OpenMemory("abc");

    REQUIRE(**stream->Read() == "abc");
    REQUIRE(stream->IsEof());

    REQUIRE(stream->Seek(0).has_value());
    REQUIRE_FALSE(stream->IsEof());
    REQUIRE(**stream->Read() == "abc");
}

TEST_CASE("IO.BufferedStream.SeekFromCurrentUsesLogicalPosition")
{
    auto [stream, memory] = OpenMemory("abcdef");

    REQUIRE(**stream->Read(2) == "ab");
    // The resource has already handed out everything; only the stream knows the logical offset.
    REQUIRE(memory->ReadOffset() == 6);

    auto landed = stream->Seek(1, SeekOrigin::Current);
    REQUIRE(landed.has_value());
    REQUIRE(*landed == 3);
    REQUIRE(**stream->Read(1) == "d");
}

TEST_CASE("IO.BufferedStream.SeekFromCurrentInSameWidthEncoding")
{
    Conduit::IO::StreamOptions options;
    options.sourceEncoding   = Conduit::IO::TextEncoding::Utf16LE;
    options.externalEncoding = Conduit::IO::TextEncoding::Utf16LE;

    auto stream = BufferedStream::Create(std::make_unique<MemoryResource>(std::string("A\0B\0C\0", 6)), options);
    REQUIRE(stream.has_value());

    REQUIRE(**(*stream)->Read(2) == std::string("A\0", 2));
    REQUIRE(*(*stream)->Seek(2, SeekOrigin::Current) == 4);
    REQUIRE(**(*stream)->Read(2) == std::string("C\0", 2));
}

TEST_CASE("IO.BufferedStream.SeekFromEnd")
{
    auto [stream, memory] = OpenMemory("abcdef");

    REQUIRE(*stream->SysSeek(-2, SeekOrigin::End) == 4);
    REQUIRE(**stream->Read() == "ef");
}

TEST_CASE("IO.BufferedStream.SeekRejectsNegativeOffsets")
{
    auto [stream, memory] = OpenMemory("abc");

    auto landed = stream->Seek(-1);
    REQUIRE_FALSE(landed.has_value());
    REQUIRE(landed.error().code == StreamErrc::InvalidArgument);
}

TEST_CASE("IO.BufferedStream.SeekWithoutResourceSupport")
{
    auto stream = BufferedStream::Create(std::make_unique<ForwardOnlyResource>());
    REQUIRE(stream.has_value());

    auto landed = (*stream)->Seek(0);
    REQUIRE_FALSE(landed.has_value());
    REQUIRE(landed.error().code == StreamErrc::NotImplemented);
}

TEST_CASE("IO.BufferedStream.SeekOnUnopenedStream")
{
    BufferedStream stream;

    auto landed = stream.Seek(0);
    REQUIRE_FALSE(landed.has_value());
    REQUIRE(landed.error().code == StreamErrc::NotOpen);
}

TEST_CASE("IO.BufferedStream.SetPositionMovesTell")
{
    auto [stream, memory] = OpenMemory("abcdef");

    REQUIRE(*stream->SetPosition(3) == 3);
    REQUIRE(stream->Position() == 3);
    REQUIRE(**stream->Read(2) == "de");
}

TEST_CASE("IO.BufferedStream.RewindResetsLineNumber")
{
    auto [stream, memory] = OpenMemory("one\ntwo\n");

    REQUIRE(*stream->Gets() == "one\n");
    REQUIRE(*stream->Gets() == "two\n");
    REQUIRE(*stream->LineNumber() == 2);

    REQUIRE(stream->Rewind().has_value());
    REQUIRE(*stream->LineNumber() == 0);
    REQUIRE(stream->Tell() == 0);
    REQUIRE(*stream->Gets() == "one\n");
}

TEST_CASE("IO.BufferedStream.ReadAtRestoresPosition")
{
    auto [stream, memory] = OpenMemory("abcdef");

    REQUIRE(**stream->Read(1) == "a");

    std::string target;
    auto        data = stream->ReadAt(3, 2, &target);
    REQUIRE(data.has_value());
    REQUIRE(**data == "cde");
    REQUIRE(target == "cde");
    REQUIRE(stream->Tell() == 1);

    REQUIRE(**stream->Read(1) == "b");
}

TEST_CASE("IO.BufferedStream.WriteAtRestoresPosition")
{
    auto [stream, memory] = OpenMemory("0123456789abcdef");

    REQUIRE(**stream->Read(3) == "012");

    auto written = stream->WriteAt("XY", 10);
    REQUIRE(written.has_value());
    REQUIRE(*written == 2);
    REQUIRE(stream->Tell() == 3);
    REQUIRE(memory->Data() == "0123456789XYcdef");

    REQUIRE(**stream->Read(3) == "345");
}

TEST_CASE("IO.BufferedStream.WriteAtKeepsAppendCursor")
{
    auto [stream, memory] = OpenMemory("");

    REQUIRE(*stream->Write("abc") == 3);
    REQUIRE(*stream->WriteAt("Z", 10) == 1);
    REQUIRE(memory->WriteCursor() == 3);
    REQUIRE(*stream->Write("def") == 3);

    REQUIRE(memory->Data() == std::string("abcdef\0\0\0\0Z", 11));
    REQUIRE(stream->Tell() == 0);
}

TEST_CASE("IO.BufferedStream.ReadAtKeepsAppendCursor")
{
    auto [stream, memory] = OpenMemory("");

    REQUIRE(*stream->Write("abc") == 3);
    REQUIRE(**stream->ReadAt(1, 1) == "b");
    REQUIRE(*stream->Write("def") == 3);

    REQUIRE(memory->Data() == "abcdef");
    REQUIRE(**stream->Read() == "abcdef");
}

TEST_CASE("IO.BufferedStream.PositionalOpsRejectPushBackBeforeStart")
{
    auto [stream, memory] = OpenMemory("abc");

    REQUIRE(stream->Rewind().has_value());
    REQUIRE(stream->UngetChar("Q").has_value());
    REQUIRE(stream->Tell() == -1);

    auto data = stream->ReadAt(2, 0);
    REQUIRE_FALSE(data.has_value());
    REQUIRE(data.error().code == StreamErrc::InvalidArgument);

    auto written = stream->WriteAt("xy", 1);
    REQUIRE_FALSE(written.has_value());
    REQUIRE(written.error().code == StreamErrc::InvalidArgument);
    REQUIRE(memory->Data() == "abc");

    REQUIRE(stream->Tell() == -1);
    REQUIRE(**stream->Read(1) == "Q");
    REQUIRE(**stream->Read() == "abc");
}

TEST_CASE("IO.BufferedStream.WriteThenReadRoundTrip")
{
    auto [stream, memory] = OpenMemory("");

    auto written = stream->Write("hello");
    REQUIRE(written.has_value());
    REQUIRE(*written == 5);
    REQUIRE(stream->Tell() == 0);

    REQUIRE(**stream->Read() == "hello");
}

TEST_CASE("IO.BufferedStream.SeekResetsScriptedResource")
{
    auto resource = std::make_unique<ScriptedResource>(std::vector<Step> {Chunk("stale")});
    resource->WithScriptAfterSeek({Chunk("fresh")});
    auto stream = BufferedStream::Create(std::move(resource));
    REQUIRE(stream.has_value());

    REQUIRE(**(*stream)->Read(2) == "st");
    REQUIRE((*stream)->Seek(100).has_value());
    REQUIRE((*stream)->Tell() == 100);
    REQUIRE(**(*stream)->Read() == "fresh");
}
