#include <Conduit/IO/BufferedStream.hpp>

#include <Conduit/Exceptions/StreamException.hpp>
#include <Conduit/Log/Logger.hpp>
#include <Conduit/Time/MonotonicClock.hpp>
#include <Conduit/Time/Sleep.hpp>

namespace Conduit::IO
{
    namespace
    {
        constexpr std::string_view LOG_COMPONENT = "IO.BufferedStream";

        [[nodiscard]] std::string_view ToString(StreamState state) noexcept
        {
            switch (state)
            {
                case StreamState::Unopened: return "unopened";
                case StreamState::Open: return "open";
                case StreamState::Closed: return "closed";
            }
            return "unknown";
        }
    }// namespace

    BufferedStream::~BufferedStream()
    {
        if (m_state != StreamState::Open || !m_autoclose)
            return;

        if (auto closed = Close(); !closed)
        {
            CONDUIT_LOG_ERROR(LOG_COMPONENT, "closing {} on destruction failed: {}", m_resource->Name(),
                              closed.error().message);
        }
    }

    StreamExpected<std::unique_ptr<BufferedStream>> BufferedStream::Create(std::unique_ptr<IStreamResource> resource,
                                                                           StreamOptions                    options)
    {
        auto stream = std::make_unique<BufferedStream>();
        if (auto opened = stream->Open(std::move(resource), std::move(options)); !opened)
            return std::unexpected(std::move(opened.error()));
        return stream;
    }

    StreamExpected<void> BufferedStream::Open(std::unique_ptr<IStreamResource> resource, StreamOptions options)
    {
        if (m_state == StreamState::Closed)
            return MakeStreamError(StreamErrc::NotImplemented, "reopening a closed stream is not supported");
        if (m_state == StreamState::Open)
            return MakeStreamError(StreamErrc::InvalidArgument, "stream is already open");
        if (!resource)
            return MakeStreamError(StreamErrc::InvalidArgument, "resource is null");

        auto handle = resource->Open();
        if (!handle)
            return std::unexpected(std::move(handle.error()));

        m_resource   = std::move(resource);
        m_options    = std::move(options);
        m_normalizer = EncodingNormalizer(m_options.sourceEncoding, m_options.externalEncoding,
                                          m_options.encodingErrors);
        m_handle     = *handle;
        ResetReadState();
        m_position   = 0;
        m_lineNumber = 0;

        m_sync        = m_options.sync;
        m_binmode     = m_options.binmode;
        m_tty         = m_options.tty;
        m_autoclose   = m_options.autoclose;
        m_closeOnExec = m_options.closeOnExec;

        m_readable = true;
        m_writable = true;
        m_state    = StreamState::Open;

        CONDUIT_LOG_DEBUG(LOG_COMPONENT, "opened {} ({} -> {})", m_resource->Name(),
                          ToString(m_options.sourceEncoding), ToString(m_options.externalEncoding));
        return {};
    }

    StreamExpected<void> BufferedStream::Close()
    {
        if (m_state == StreamState::Unopened)
            return MakeStreamError(StreamErrc::NotOpen);
        if (m_state == StreamState::Closed)
            return {};

        auto closed = m_resource->Close();

        m_handle.reset();
        m_pushBack.Clear();
        m_readable = false;
        m_writable = false;
        m_state    = StreamState::Closed;

        CONDUIT_LOG_DEBUG(LOG_COMPONENT, "closed {}", m_resource->Name());
        if (!closed)
            return std::unexpected(std::move(closed.error()));
        return {};
    }

    StreamExpected<void> BufferedStream::CloseRead()
    {
        if (m_state == StreamState::Unopened)
            return MakeStreamError(StreamErrc::NotOpen);
        if (!m_readable)
            return {};
        if (!m_writable)
            return Close();

        m_readable = false;
        return {};
    }

    StreamExpected<void> BufferedStream::CloseWrite()
    {
        if (m_state == StreamState::Unopened)
            return MakeStreamError(StreamErrc::NotOpen);
        if (!m_writable)
            return {};
        if (!m_readable)
            return Close();

        m_writable = false;
        return {};
    }

    StreamExpected<void> BufferedStream::RequireReadable() const
    {
        if (m_state == StreamState::Unopened)
            return MakeStreamError(StreamErrc::NotOpen);
        if (!m_readable)
            return MakeStreamError(StreamErrc::ClosedForReading);
        return {};
    }

    StreamExpected<void> BufferedStream::RequireWritable() const
    {
        if (m_state == StreamState::Unopened)
            return MakeStreamError(StreamErrc::NotOpen);
        if (!m_writable)
            return MakeStreamError(StreamErrc::ClosedForWriting);
        return {};
    }

    void BufferedStream::PushBack(std::string_view bytes)
    {
        m_pushBack.Prepend(bytes);
        m_position -= static_cast<Int64>(bytes.size());
    }

    void BufferedStream::ResetReadState() noexcept
    {
        m_pushBack.Clear();
        m_normalizer.Reset();
        m_eof = false;
    }

    StreamExpected<std::optional<std::string>> BufferedStream::NextChunk()
    {
        if (auto readable = RequireReadable(); !readable)
            return std::unexpected(std::move(readable.error()));

        if (!m_pushBack.IsEmpty())
        {
            std::string buffered = m_pushBack.Take();
            m_position += static_cast<Int64>(buffered.size());
            return std::optional<std::string> {std::move(buffered)};
        }

        if (m_eof)
            return std::optional<std::string> {};

        return FetchChunk();
    }

    StreamExpected<std::optional<std::string>> BufferedStream::FetchChunk()
    {
        RetryState retry;
        for (;;)
        {
            auto chunk = m_resource->Read();
            if (!chunk)
            {
                switch (chunk.error().code)
                {
                    case StreamErrc::WouldBlock:
                        if (auto waited = WaitForData(retry); !waited)
                            return std::unexpected(std::move(waited.error()));
                        continue;
                    case StreamErrc::EndOfStream: return FinishStream();
                    default: return std::unexpected(std::move(chunk.error()));
                }
            }

            if (chunk->empty())
                return FinishStream();

            auto normalized = m_normalizer.Normalize(*chunk);
            if (!normalized)
                return std::unexpected(std::move(normalized.error()));
            // Only part of a character arrived; keep reading.
            if (normalized->empty())
                continue;

            m_position += static_cast<Int64>(normalized->size());
            return std::optional<std::string> {std::move(*normalized)};
        }
    }

    StreamExpected<std::optional<std::string>> BufferedStream::FinishStream()
    {
        m_eof = true;

        auto tail = m_normalizer.Finish();
        if (!tail)
            return std::unexpected(std::move(tail.error()));
        if (tail->empty())
            return std::optional<std::string> {};

        m_position += static_cast<Int64>(tail->size());
        return std::optional<std::string> {std::move(*tail)};
    }

    StreamExpected<void> BufferedStream::WaitForData(RetryState& state)
    {
        const RetryPolicy& policy = m_options.retry;
        if (policy.cancellation.IsCancellationRequested())
            return MakeStreamError(StreamErrc::Canceled, "canceled while waiting for data");

        if (policy.maxAttempts != 0 && state.waits >= policy.maxAttempts)
        {
            CONDUIT_LOG_WARN(LOG_COMPONENT, "{}: no data after {} attempts, giving up", m_resource->Name(),
                             state.waits);
            return MakeStreamError(StreamErrc::TimedOut);
        }

        const Time::TimePoint now = Time::MonotonicClock::Now();
        if (!state.start)
            state.start = now;

        Units::Milliseconds delay = policy.backoff;
        if (policy.maxWait)
        {
            const Units::Milliseconds waited = now.Since(*state.start);
            if (waited >= *policy.maxWait)
            {
                CONDUIT_LOG_WARN(LOG_COMPONENT, "{}: no data after {} ms, giving up", m_resource->Name(),
                                 waited.GetValue());
                return MakeStreamError(StreamErrc::TimedOut);
            }

            const Units::Milliseconds remaining = *policy.maxWait - waited;
            if (remaining < delay)
                delay = remaining;
        }

        CONDUIT_LOG_TRACE(LOG_COMPONENT, "{}: no data yet, waiting {} ms (wait {})", m_resource->Name(),
                          delay.GetValue(), state.waits + 1);
        Time::SleepFor(delay);
        ++state.waits;

        if (policy.cancellation.IsCancellationRequested())
            return MakeStreamError(StreamErrc::Canceled, "canceled while waiting for data");
        return {};
    }

    StreamExpected<std::optional<std::string>> BufferedStream::Read(std::optional<UIntSize> length,
                                                                    std::string*            target)
    {
        if (auto readable = RequireReadable(); !readable)
            return std::unexpected(std::move(readable.error()));

        if (length && *length == 0)
        {
            if (IsEof())
                return std::optional<std::string> {};
            return std::optional<std::string> {std::string {}};
        }

        std::string result;
        while (!length || result.size() < *length)
        {
            if (length && !m_pushBack.IsEmpty())
            {
                std::string buffered = m_pushBack.TakeFront(*length - result.size());
                m_position += static_cast<Int64>(buffered.size());
                result += buffered;
                continue;
            }

            auto chunk = NextChunk();
            if (!chunk)
            {
                PushBack(result);
                return std::unexpected(std::move(chunk.error()));
            }
            if (!chunk->has_value())
                break;

            std::string& data = **chunk;
            if (length && result.size() + data.size() > *length)
            {
                const UIntSize wanted = *length - result.size();
                PushBack(std::string_view(data).substr(wanted));
                data.resize(wanted);
            }

            if (result.empty())
                result = std::move(data);
            else
                result += data;
        }

        if (result.empty())
            return std::optional<std::string> {};

        if (target)
            target->append(result);
        return std::optional<std::string> {std::move(result)};
    }

    StreamExpected<std::optional<UInt8>> BufferedStream::GetByte()
    {
        auto byte = Read(1);
        if (!byte)
            return std::unexpected(std::move(byte.error()));
        if (!byte->has_value())
            return std::optional<UInt8> {};
        return std::optional<UInt8> {static_cast<UInt8>((**byte)[0])};
    }

    StreamExpected<std::optional<std::string>> BufferedStream::GetChar()
    {
        const TextEncoding encoding = m_options.externalEncoding;

        auto head = Read(CodeUnitSize(encoding));
        if (!head)
            return std::unexpected(std::move(head.error()));
        if (!head->has_value())
            return std::optional<std::string> {};

        std::string    unit     = std::move(**head);
        const UIntSize expected = CharacterLength(encoding, unit);
        if (expected > unit.size())
        {
            auto rest = Read(expected - unit.size());
            if (!rest)
            {
                PushBack(unit);
                return std::unexpected(std::move(rest.error()));
            }
            if (rest->has_value())
                unit += **rest;
        }

        const UIntSize boundary = CharacterBoundary(encoding, unit);
        if (boundary < unit.size())
        {
            PushBack(std::string_view(unit).substr(boundary));
            unit.resize(boundary);
        }
        return std::optional<std::string> {std::move(unit)};
    }

    StreamExpected<UInt8> BufferedStream::ReadByte()
    {
        auto byte = GetByte();
        if (!byte)
            return std::unexpected(std::move(byte.error()));
        if (!byte->has_value())
            return MakeStreamError(StreamErrc::UnexpectedEndOfStream);
        return **byte;
    }

    StreamExpected<std::string> BufferedStream::ReadChar()
    {
        auto character = GetChar();
        if (!character)
            return std::unexpected(std::move(character.error()));
        if (!character->has_value())
            return MakeStreamError(StreamErrc::UnexpectedEndOfStream);
        return std::move(**character);
    }

    StreamExpected<void> BufferedStream::UngetByte(UInt8 byte)
    {
        if (auto readable = RequireReadable(); !readable)
            return readable;
        const char value = static_cast<char>(byte);
        PushBack(std::string_view(&value, 1));
        return {};
    }

    StreamExpected<void> BufferedStream::UngetChar(std::string_view text)
    {
        if (auto readable = RequireReadable(); !readable)
            return readable;
        PushBack(text);
        return {};
    }

    StreamExpected<std::string> BufferedStream::Gets()
    {
        const std::string separator = m_options.lineSeparator;
        return Gets(std::string_view(separator));
    }

    StreamExpected<std::string> BufferedStream::Gets(std::optional<std::string_view> separator)
    {
        if (auto readable = RequireReadable(); !readable)
            return std::unexpected(std::move(readable.error()));

        ++m_lineNumber;

        if (!separator || separator->empty())
        {
            auto remainder = Read();
            if (!remainder)
                return std::unexpected(std::move(remainder.error()));
            if (!remainder->has_value())
                return MakeStreamError(StreamErrc::UnexpectedEndOfStream);
            return std::move(**remainder);
        }

        std::string line;
        while (!line.ends_with(*separator))
        {
            auto character = GetChar();
            if (!character)
            {
                PushBack(line);
                return std::unexpected(std::move(character.error()));
            }
            if (!character->has_value())
                break;
            line += **character;
        }

        if (line.empty())
            return MakeStreamError(StreamErrc::UnexpectedEndOfStream);
        return line;
    }

    StreamExpected<std::vector<std::string>> BufferedStream::ReadLines()
    {
        const std::string separator = m_options.lineSeparator;
        return ReadLines(std::string_view(separator));
    }

    StreamExpected<std::vector<std::string>> BufferedStream::ReadLines(std::optional<std::string_view> separator)
    {
        std::vector<std::string> lines;
        auto                     collected = EachLine(separator, [&lines](std::string line) {
            lines.push_back(std::move(line));
        });
        if (!collected)
            return std::unexpected(std::move(collected.error()));
        return lines;
    }

    StreamExpected<Int64> BufferedStream::LineNumber() const
    {
        if (!m_readable)
            return MakeStreamError(StreamErrc::ClosedForReading, "not opened for reading");
        return m_lineNumber;
    }

    StreamExpected<void> BufferedStream::SetLineNumber(Int64 number)
    {
        if (!m_readable)
            return MakeStreamError(StreamErrc::ClosedForReading, "not opened for reading");
        m_lineNumber = number;
        return {};
    }

    StreamExpected<std::optional<Char32>> BufferedStream::NextCodepoint()
    {
        auto character = GetChar();
        if (!character)
            return std::unexpected(std::move(character.error()));
        if (!character->has_value())
            return std::optional<Char32> {};

        const TextEncoding encoding = m_options.externalEncoding;
        const std::string& unit     = **character;
        if (encoding == TextEncoding::Binary)
            return std::optional<Char32> {static_cast<UInt8>(unit[0])};

        const DecodeResult decoded = DecodeCharacter(encoding, unit);
        if (decoded.status != DecodeStatus::Ok || decoded.length != unit.size())
        {
            return MakeStreamError(StreamErrc::InvalidByteSequence,
                                   fmt::format("invalid byte sequence in {}", IO::ToString(encoding)));
        }
        return std::optional<Char32> {decoded.codepoint};
    }

    Async::Generator<std::string> BufferedStream::EachChunk()
    {
        for (;;)
        {
            auto chunk = NextChunk();
            if (!chunk)
                throw Exceptions::StreamException(std::move(chunk.error()));
            if (!chunk->has_value())
                co_return;
            co_yield std::move(**chunk);
        }
    }

    Async::Generator<UInt8> BufferedStream::EachByte()
    {
        for (;;)
        {
            auto byte = GetByte();
            if (!byte)
                throw Exceptions::StreamException(std::move(byte.error()));
            if (!byte->has_value())
                co_return;
            co_yield **byte;
        }
    }

    Async::Generator<std::string> BufferedStream::EachChar()
    {
        for (;;)
        {
            auto character = GetChar();
            if (!character)
                throw Exceptions::StreamException(std::move(character.error()));
            if (!character->has_value())
                co_return;
            co_yield std::move(**character);
        }
    }

    Async::Generator<Char32> BufferedStream::EachCodepoint()
    {
        for (;;)
        {
            auto codepoint = NextCodepoint();
            if (!codepoint)
                throw Exceptions::StreamException(std::move(codepoint.error()));
            if (!codepoint->has_value())
                co_return;
            co_yield **codepoint;
        }
    }

    Async::Generator<std::string> BufferedStream::EachLine()
    {
        return EachLine(std::optional<std::string> {m_options.lineSeparator});
    }

    Async::Generator<std::string> BufferedStream::EachLine(std::optional<std::string> separator)
    {
        for (;;)
        {
            auto line = separator ? Gets(std::string_view(*separator)) : Gets(std::nullopt);
            if (!line)
            {
                if (line.error().code == StreamErrc::UnexpectedEndOfStream)
                    co_return;
                throw Exceptions::StreamException(std::move(line.error()));
            }
            co_yield std::move(*line);
        }
    }

    StreamExpected<UIntSize> BufferedStream::Write(std::string_view data)
    {
        if (auto writable = RequireWritable(); !writable)
            return std::unexpected(std::move(writable.error()));
        return m_resource->Write(data);
    }

    StreamExpected<void> BufferedStream::WriteAll(std::string_view data)
    {
        auto written = Write(data);
        if (!written)
            return std::unexpected(std::move(written.error()));
        return {};
    }

    StreamExpected<void> BufferedStream::PutChar(UInt8 byte)
    {
        const char value = static_cast<char>(byte);
        return WriteAll(std::string_view(&value, 1));
    }

    StreamExpected<void> BufferedStream::PutChar(std::string_view text)
    {
        if (text.empty())
            return WriteAll(text);
        return WriteAll(text.substr(0, CharacterBoundary(m_options.externalEncoding, text)));
    }

    StreamExpected<Int64> BufferedStream::Seek(Int64 offset, SeekOrigin origin)
    {
        if (m_state != StreamState::Open)
            return MakeStreamError(StreamErrc::NotOpen);

        if (origin == SeekOrigin::Current)
        {
            offset += m_position;
            origin = SeekOrigin::Begin;
        }
        if (origin == SeekOrigin::Begin && offset < 0)
            return MakeStreamError(StreamErrc::InvalidArgument, fmt::format("negative seek offset {}", offset));

        auto landed = m_resource->Seek(offset, origin);
        if (!landed)
            return std::unexpected(std::move(landed.error()));

        ResetReadState();
        m_position = *landed;
        return *landed;
    }

    StreamExpected<void> BufferedStream::Rewind()
    {
        auto rewound = Seek(0, SeekOrigin::Begin);
        if (!rewound)
            return std::unexpected(std::move(rewound.error()));
        m_lineNumber = 0;
        return {};
    }

    StreamExpected<BufferedStream::PositionalState> BufferedStream::BeginPositional(Int64 offset)
    {
        if (m_state != StreamState::Open)
            return MakeStreamError(StreamErrc::NotOpen);
        if (m_position < 0)
        {
            return MakeStreamError(StreamErrc::InvalidArgument,
                                   fmt::format("pushed-back data extends {} bytes before offset 0", -m_position));
        }

        PositionalState state {m_position, m_resource->WriteCursor()};
        if (auto moved = Seek(offset, SeekOrigin::Begin); !moved)
            return std::unexpected(std::move(moved.error()));
        return state;
    }

    StreamExpected<void> BufferedStream::EndPositional(const PositionalState& state)
    {
        if (auto restored = Seek(state.position, SeekOrigin::Begin); !restored)
            return std::unexpected(std::move(restored.error()));
        if (state.writeCursor)
            return m_resource->SetWriteCursor(*state.writeCursor);
        return {};
    }

    StreamExpected<std::optional<std::string>> BufferedStream::ReadAt(std::optional<UIntSize> length, Int64 offset,
                                                                      std::string* target)
    {
        auto state = BeginPositional(offset);
        if (!state)
            return std::unexpected(std::move(state.error()));

        auto data     = Read(length, target);
        auto restored = EndPositional(*state);
        if (!data)
            return data;
        if (!restored)
            return std::unexpected(std::move(restored.error()));
        return data;
    }

    StreamExpected<UIntSize> BufferedStream::WriteAt(std::string_view data, Int64 offset)
    {
        if (auto writable = RequireWritable(); !writable)
            return std::unexpected(std::move(writable.error()));

        auto state = BeginPositional(offset);
        if (!state)
            return std::unexpected(std::move(state.error()));

        auto written  = Write(data);
        auto restored = EndPositional(*state);
        if (!written)
            return written;
        if (!restored)
            return std::unexpected(std::move(restored.error()));
        return written;
    }

    StreamExpected<void> BufferedStream::Reopen()
    {
        return MakeStreamError(StreamErrc::NotImplemented, "BufferedStream::Reopen is not implemented");
    }

    StreamExpected<void> BufferedStream::Stat() const
    {
        return MakeStreamError(StreamErrc::NotImplemented, "BufferedStream::Stat is not implemented");
    }

    StreamExpected<int> BufferedStream::Ioctl(unsigned long request, Int64 argument)
    {
        static_cast<void>(request);
        static_cast<void>(argument);
        return MakeStreamError(StreamErrc::NotImplemented, "BufferedStream::Ioctl is not implemented");
    }

    StreamExpected<int> BufferedStream::Fcntl(int command, Int64 argument)
    {
        static_cast<void>(command);
        static_cast<void>(argument);
        return MakeStreamError(StreamErrc::NotImplemented, "BufferedStream::Fcntl is not implemented");
    }

    StreamExpected<void> BufferedStream::Advise(Advice advice, Int64 offset, Int64 length) noexcept
    {
        static_cast<void>(advice);
        static_cast<void>(offset);
        static_cast<void>(length);
        return {};
    }

    BufferedStream& BufferedStream::BinMode() noexcept
    {
        m_binmode = true;
        return *this;
    }

    void BufferedStream::SetExternalEncoding(TextEncoding encoding)
    {
        m_options.externalEncoding = encoding;
        m_normalizer = EncodingNormalizer(m_options.sourceEncoding, encoding, m_options.encodingErrors);
    }

    StreamExpected<void> BufferedStream::SetExternalEncoding(std::string_view name)
    {
        const auto encoding = ParseTextEncoding(name);
        if (!encoding)
            return MakeStreamError(StreamErrc::InvalidArgument, fmt::format("unknown encoding name \"{}\"", name));
        SetExternalEncoding(*encoding);
        return {};
    }

    std::string BufferedStream::Describe() const
    {
        const std::string_view name = m_resource ? m_resource->Name() : std::string_view {"none"};
        if (m_handle)
            return fmt::format("#<BufferedStream {} fd={} pos={} {}>", name, *m_handle, m_position, ToString(m_state));
        return fmt::format("#<BufferedStream {} pos={} {}>", name, m_position, ToString(m_state));
    }
}// namespace Conduit::IO
