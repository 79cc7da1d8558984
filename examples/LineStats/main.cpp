#include <Conduit/Conduit.hpp>

#include <fmt/format.h>

#include <cstdio>
#include <memory>
#include <string>

using namespace Conduit;

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        fmt::print(stderr, "usage: {} <file> [encoding]\n", argv[0]);
        return 2;
    }

    Log::Logger::Instance().SetMinSeverity(Log::Severity::Info);

    IO::StreamOptions options;
    if (argc > 2)
    {
        auto encoding = IO::ParseTextEncoding(argv[2]);
        if (!encoding)
        {
            CONDUIT_LOG_ERROR("LineStats", "unknown encoding {}", argv[2]);
            return 2;
        }
        options.sourceEncoding = *encoding;
        options.encodingErrors = IO::EncodingErrorMode::Replace;
    }

    auto stream = IO::BufferedStream::Create(std::make_unique<IO::FileResource>(argv[1], IO::FileResource::OpenMode::Read),
                                             options);
    if (!stream)
    {
        CONDUIT_LOG_ERROR("LineStats", "{}", stream.error().message);
        return 1;
    }

    UIntSize    lines   = 0;
    UIntSize    bytes   = 0;
    UIntSize    longest = 0;
    std::string longestLine;
    auto        visited = (*stream)->EachLine([&](std::string line) {
        ++lines;
        bytes += line.size();
        if (line.size() > longest)
        {
            longest     = line.size();
            longestLine = std::move(line);
        }
    });
    if (!visited)
    {
        CONDUIT_LOG_ERROR("LineStats", "reading {} failed: {}", argv[1], visited.error().message);
        return 1;
    }

    CONDUIT_LOG_INFO("LineStats", "{}", (*stream)->Describe());
    fmt::print("lines:   {}\nbytes:   {}\nlongest: {}\n", lines, bytes, longest);
    if (!longestLine.empty())
        fmt::print("         {}", longestLine);

    if (auto closed = (*stream)->Close(); !closed)
    {
        CONDUIT_LOG_ERROR("LineStats", "close failed: {}", closed.error().message);
        return 1;
    }
    return 0;
}
