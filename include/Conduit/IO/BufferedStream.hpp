/// @file BufferedStream.hpp
/// @brief Rich stream interface layered over a minimal IStreamResource.
#pragma once

#include <Conduit/Async/Generator.hpp>
#include <Conduit/Defines.hpp>
#include <Conduit/IO/EncodingNormalizer.hpp>
#include <Conduit/IO/IStreamResource.hpp>
#include <Conduit/IO/PushBackBuffer.hpp>
#include <Conduit/IO/SeekOrigin.hpp>
#include <Conduit/IO/StreamError.hpp>
#include <Conduit/IO/StreamOptions.hpp>
#include <Conduit/Primitives.hpp>
#include <Conduit/Time/TimePoint.hpp>

#include <fmt/format.h>
#include <fmt/printf.h>

#include <concepts>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace Conduit::IO
{
    enum class StreamState : UInt8
    {
        Unopened,
        Open,
        Closed,
    };

    /// @brief Access pattern hints accepted by Advise(). They have no effect.
    enum class Advice : UInt8
    {
        Normal,
        Sequential,
        Random,
        WillNeed,
        DontNeed,
        NoReuse,
    };

    namespace detail
    {
        /// Invoke an iteration callback. Callbacks returning bool stop the iteration by returning false.
        template<typename Fn, typename T>
        bool InvokeContinue(Fn& fn, T&& value)
        {
            if constexpr (std::same_as<std::invoke_result_t<Fn&, T&&>, bool>)
            {
                return std::invoke(fn, std::forward<T>(value));
            }
            else
            {
                std::invoke(fn, std::forward<T>(value));
                return true;
            }
        }
    }// namespace detail

    /// @brief Buffered, position-tracking stream over an injected resource.
    ///
    /// The stream owns the resource and turns its chunked Read() into bounded reads, characters, lines
    /// and lazy sequences. Data that was read too far is kept in a push-back buffer in front of the next
    /// resource chunk, so a consumer may stop at any point without losing bytes.
    ///
    /// Position is the number of bytes logically consumed. It drops when bytes are pushed back and may
    /// therefore become negative if more is pushed back than was ever read.
    ///
    /// Generators returned by the Each* functions refer to the stream; the stream must outlive them.
    /// The stream is neither copyable nor movable for that reason.
    class CONDUIT_BASE_API BufferedStream final
    {
    public:
        BufferedStream() noexcept = default;
        ~BufferedStream();

        BufferedStream(const BufferedStream&)            = delete;
        BufferedStream& operator=(const BufferedStream&) = delete;
        BufferedStream(BufferedStream&&)                 = delete;
        BufferedStream& operator=(BufferedStream&&)      = delete;

        /// @brief Create a stream and open it over @p resource.
        [[nodiscard]] static StreamExpected<std::unique_ptr<BufferedStream>> Create(
                std::unique_ptr<IStreamResource> resource, StreamOptions options = {});

        /// @brief Open the stream over @p resource. Reset position, line number and end-of-stream.
        ///
        /// Fails with InvalidArgument if the stream is already open or @p resource is null, and with
        /// NotImplemented if the stream was closed; a closed stream cannot be reopened.
        StreamExpected<void> Open(std::unique_ptr<IStreamResource> resource, StreamOptions options = {});

        /// @brief Close the resource and disable reading and writing. Closing twice is not an error;
        ///        closing a stream that was never opened fails with NotOpen.
        StreamExpected<void> Close();
        /// @brief Disable reading. Closes the whole stream if writing is already disabled.
        StreamExpected<void> CloseRead();
        /// @brief Disable writing. Closes the whole stream if reading is already disabled.
        StreamExpected<void> CloseWrite();

        [[nodiscard]] StreamState State() const noexcept { return m_state; }
        [[nodiscard]] bool        IsOpen() const noexcept { return m_state == StreamState::Open; }
        [[nodiscard]] bool        IsClosed() const noexcept { return m_state == StreamState::Closed; }
        [[nodiscard]] bool        IsReadable() const noexcept { return m_readable; }
        [[nodiscard]] bool        IsWritable() const noexcept { return m_writable; }

        /// @brief True once the resource has ended and every pushed-back byte has been read.
        [[nodiscard]] bool IsEof() const noexcept { return m_eof && m_pushBack.IsEmpty(); }

        // Reading ---------------------------------------------------------------------------------

        /// @brief Read up to @p length bytes, or everything that remains when @p length is empty.
        ///
        /// The bytes read are returned and, when @p target is given, also appended to it. An empty
        /// optional means nothing was read because the stream is at its end. If the resource fails part
        /// way, the bytes already gathered are pushed back before the error is returned.
        StreamExpected<std::optional<std::string>> Read(std::optional<UIntSize> length = std::nullopt,
                                                        std::string*            target = nullptr);

        StreamExpected<std::optional<std::string>> ReadPartial(UIntSize maxLength, std::string* target = nullptr)
        {
            return Read(maxLength, target);
        }

        StreamExpected<std::optional<std::string>> SysRead(std::optional<UIntSize> length = std::nullopt,
                                                           std::string*            target = nullptr)
        {
            return Read(length, target);
        }

        StreamExpected<std::optional<std::string>> ReadNonblock(UIntSize maxLength, std::string* target = nullptr)
        {
            return Read(maxLength, target);
        }

        /// @brief Next chunk: the whole push-back buffer if it holds anything, else the next resource chunk.
        StreamExpected<std::optional<std::string>> NextChunk();

        StreamExpected<std::optional<UInt8>> GetByte();
        /// @brief Next character in the external encoding. Malformed units are returned as they are.
        StreamExpected<std::optional<std::string>> GetChar();

        /// @brief Like GetByte() but fails with UnexpectedEndOfStream at the end.
        StreamExpected<UInt8> ReadByte();
        /// @brief Like GetChar() but fails with UnexpectedEndOfStream at the end.
        StreamExpected<std::string> ReadChar();

        /// @brief Push @p byte back so that it is the next byte read.
        StreamExpected<void> UngetByte(UInt8 byte);
        /// @brief Push @p text back so that it is read next.
        StreamExpected<void> UngetChar(std::string_view text);

        /// @brief Read one line terminated by the configured line separator.
        StreamExpected<std::string> Gets();

        /// @brief Read up to and including @p separator.
        ///
        /// An empty optional or an empty separator reads the remainder of the stream. The final line may
        /// lack the separator. Fails with UnexpectedEndOfStream when nothing is left. Every call counts
        /// towards LineNumber(), including the one that hits the end.
        StreamExpected<std::string> Gets(std::optional<std::string_view> separator);

        StreamExpected<std::string> ReadLine() { return Gets(); }
        StreamExpected<std::string> ReadLine(std::optional<std::string_view> separator) { return Gets(separator); }

        /// @brief Read every remaining line.
        StreamExpected<std::vector<std::string>> ReadLines();
        StreamExpected<std::vector<std::string>> ReadLines(std::optional<std::string_view> separator);

        [[nodiscard]] StreamExpected<Int64> LineNumber() const;
        StreamExpected<void>                SetLineNumber(Int64 number);

        // Lazy iteration ----------------------------------------------------------------------------
        //
        // Generators throw Exceptions::StreamException when the stream fails and end silently at the
        // end of the stream. Callback forms return the error instead.

        Async::Generator<std::string> EachChunk();
        Async::Generator<UInt8>       EachByte();
        Async::Generator<std::string> EachChar();
        Async::Generator<Char32>      EachCodepoint();
        Async::Generator<std::string> EachLine();
        Async::Generator<std::string> EachLine(std::optional<std::string> separator);

        template<typename Fn>
            requires std::invocable<Fn&, std::string>
        StreamExpected<void> EachChunk(Fn&& fn)
        {
            for (;;)
            {
                auto chunk = NextChunk();
                if (!chunk)
                    return std::unexpected(std::move(chunk.error()));
                if (!chunk->has_value())
                    return {};
                if (!detail::InvokeContinue(fn, std::move(**chunk)))
                    return {};
            }
        }

        template<typename Fn>
            requires std::invocable<Fn&, UInt8>
        StreamExpected<void> EachByte(Fn&& fn)
        {
            for (;;)
            {
                auto byte = GetByte();
                if (!byte)
                    return std::unexpected(std::move(byte.error()));
                if (!byte->has_value())
                    return {};
                if (!detail::InvokeContinue(fn, **byte))
                    return {};
            }
        }

        template<typename Fn>
            requires std::invocable<Fn&, std::string>
        StreamExpected<void> EachChar(Fn&& fn)
        {
            for (;;)
            {
                auto character = GetChar();
                if (!character)
                    return std::unexpected(std::move(character.error()));
                if (!character->has_value())
                    return {};
                if (!detail::InvokeContinue(fn, std::move(**character)))
                    return {};
            }
        }

        template<typename Fn>
            requires std::invocable<Fn&, Char32>
        StreamExpected<void> EachCodepoint(Fn&& fn)
        {
            for (;;)
            {
                auto codepoint = NextCodepoint();
                if (!codepoint)
                    return std::unexpected(std::move(codepoint.error()));
                if (!codepoint->has_value())
                    return {};
                if (!detail::InvokeContinue(fn, **codepoint))
                    return {};
            }
        }

        template<typename Fn>
            requires std::invocable<Fn&, std::string>
        StreamExpected<void> EachLine(Fn&& fn)
        {
            return EachLine(std::optional<std::string_view> {m_options.lineSeparator}, std::forward<Fn>(fn));
        }

        template<typename Fn>
            requires std::invocable<Fn&, std::string>
        StreamExpected<void> EachLine(std::optional<std::string_view> separator, Fn&& fn)
        {
            // Copy the separator; it may refer into m_options.
            const std::optional<std::string> ownedSeparator =
                    separator ? std::optional<std::string> {std::string(*separator)} : std::nullopt;
            for (;;)
            {
                auto line = ownedSeparator ? Gets(std::string_view(*ownedSeparator)) : Gets(std::nullopt);
                if (!line)
                {
                    if (line.error().code == StreamErrc::UnexpectedEndOfStream)
                        return {};
                    return std::unexpected(std::move(line.error()));
                }
                if (!detail::InvokeContinue(fn, std::move(*line)))
                    return {};
            }
        }

        // Writing -----------------------------------------------------------------------------------

        /// @brief Write @p data to the resource. Returns the number of bytes it accepted.
        ///
        /// Writing does not move the read position.
        StreamExpected<UIntSize> Write(std::string_view data);
        StreamExpected<UIntSize> SysWrite(std::string_view data) { return Write(data); }
        StreamExpected<UIntSize> WriteNonblock(std::string_view data) { return Write(data); }

        StreamExpected<void> PutChar(UInt8 byte);
        /// @brief Write the first character of @p text.
        StreamExpected<void> PutChar(std::string_view text);

        /// @brief Write each argument formatted with "{}".
        template<typename... Args>
        StreamExpected<void> Print(const Args&... args)
        {
            std::string text;
            (fmt::format_to(std::back_inserter(text), "{}", args), ...);
            return WriteAll(text);
        }

        /// @brief Write each argument followed by the line separator. No arguments write one separator.
        template<typename... Args>
        StreamExpected<void> Puts(const Args&... args)
        {
            std::string text;
            if constexpr (sizeof...(Args) == 0)
            {
                text = m_options.lineSeparator;
            }
            else
            {
                ((fmt::format_to(std::back_inserter(text), "{}", args), text.append(m_options.lineSeparator)), ...);
            }
            return WriteAll(text);
        }

        /// @brief Write printf-style formatted text. A malformed format fails with InvalidArgument.
        template<typename... Args>
        StreamExpected<void> Printf(std::string_view format, const Args&... args)
        {
            std::string text;
            try
            {
                text = fmt::sprintf(format, args...);
            }
            catch (const fmt::format_error& error)
            {
                return MakeStreamError(StreamErrc::InvalidArgument, error.what());
            }
            return WriteAll(text);
        }

        BufferedStream& Flush() noexcept { return *this; }
        [[nodiscard]] int Fsync() noexcept { return 0; }
        [[nodiscard]] int Fdatasync() noexcept { return 0; }

        // Random access -----------------------------------------------------------------------------

        /// @brief Reposition the resource and drop buffered read state.
        ///
        /// Current is resolved against the logical position before the resource sees it. Returns the new
        /// absolute offset. The logical position counts bytes after encoding normalization while the
        /// resource seeks in source bytes, so a relative seek lands exactly only when the source and
        /// external encodings have the same byte widths.
        StreamExpected<Int64> Seek(Int64 offset, SeekOrigin origin = SeekOrigin::Begin);
        StreamExpected<Int64> SysSeek(Int64 offset, SeekOrigin origin = SeekOrigin::Begin)
        {
            return Seek(offset, origin);
        }
        StreamExpected<Int64> SetPosition(Int64 position) { return Seek(position, SeekOrigin::Begin); }

        [[nodiscard]] Int64 Tell() const noexcept { return m_position; }
        [[nodiscard]] Int64 Position() const noexcept { return m_position; }

        /// @brief Seek to the start and reset the line number.
        StreamExpected<void> Rewind();

        /// @brief Read at @p offset and restore the current position afterwards.
        ///
        /// The resource write cursor is restored as well. Fails with InvalidArgument, before any I/O,
        /// while pushed-back data extends the position below 0.
        StreamExpected<std::optional<std::string>> ReadAt(std::optional<UIntSize> length, Int64 offset,
                                                          std::string* target = nullptr);
        /// @brief Write at @p offset and restore the current position and write cursor afterwards.
        StreamExpected<UIntSize> WriteAt(std::string_view data, Int64 offset);

        // Unsupported -------------------------------------------------------------------------------

        StreamExpected<void> Reopen();
        StreamExpected<void> Stat() const;
        StreamExpected<int>  Ioctl(unsigned long request, Int64 argument = 0);
        StreamExpected<int>  Fcntl(int command, Int64 argument = 0);

        // Compatibility flags -----------------------------------------------------------------------

        StreamExpected<void> Advise(Advice advice, Int64 offset = 0, Int64 length = 0) noexcept;

        BufferedStream&    BinMode() noexcept;
        [[nodiscard]] bool IsBinMode() const noexcept { return m_binmode; }
        [[nodiscard]] bool IsTty() const noexcept { return m_tty; }
        [[nodiscard]] bool IsAtty() const noexcept { return m_tty; }

        void               SetAutoclose(bool enabled) noexcept { m_autoclose = enabled; }
        [[nodiscard]] bool IsAutoclose() const noexcept { return m_autoclose; }
        void               SetCloseOnExec(bool enabled) noexcept { m_closeOnExec = enabled; }
        [[nodiscard]] bool IsCloseOnExec() const noexcept { return m_closeOnExec; }
        void               SetSync(bool enabled) noexcept { m_sync = enabled; }
        [[nodiscard]] bool IsSync() const noexcept { return m_sync; }

        [[nodiscard]] std::optional<Int64>          Pid() const noexcept { return m_options.pid; }
        [[nodiscard]] std::optional<ResourceHandle> FileNo() const noexcept { return m_handle; }

        [[nodiscard]] TextEncoding ExternalEncoding() const noexcept { return m_options.externalEncoding; }
        /// @brief Change the encoding consumers see. Already buffered bytes are not converted again.
        void SetExternalEncoding(TextEncoding encoding);
        /// @brief Change the external encoding by name. Unknown names fail with InvalidArgument.
        StreamExpected<void> SetExternalEncoding(std::string_view name);

        [[nodiscard]] const StreamOptions& Options() const noexcept { return m_options; }

        /// @brief Short description: resource name, handle, position and state.
        [[nodiscard]] std::string Describe() const;

        [[nodiscard]] IStreamResource*       Resource() noexcept { return m_resource.get(); }
        [[nodiscard]] const IStreamResource* Resource() const noexcept { return m_resource.get(); }

    private:
        struct RetryState final
        {
            UInt32                         waits {0};
            std::optional<Time::TimePoint> start {};
        };

        struct PositionalState final
        {
            Int64                position {0};
            std::optional<Int64> writeCursor {};
        };

        [[nodiscard]] StreamExpected<void> RequireReadable() const;
        [[nodiscard]] StreamExpected<void> RequireWritable() const;

        StreamExpected<std::optional<std::string>> FetchChunk();
        StreamExpected<std::optional<std::string>> FinishStream();
        StreamExpected<void>                       WaitForData(RetryState& state);
        StreamExpected<std::optional<Char32>>      NextCodepoint();
        StreamExpected<void>                       WriteAll(std::string_view data);
        StreamExpected<PositionalState>            BeginPositional(Int64 offset);
        StreamExpected<void>                       EndPositional(const PositionalState& state);

        void PushBack(std::string_view bytes);
        void ResetReadState() noexcept;

        std::unique_ptr<IStreamResource> m_resource {};
        StreamOptions                    m_options {};
        EncodingNormalizer               m_normalizer {};
        PushBackBuffer                   m_pushBack {};
        std::optional<ResourceHandle>    m_handle {};

        StreamState m_state {StreamState::Unopened};
        Int64       m_position {0};
        Int64       m_lineNumber {0};
        bool        m_eof {false};
        bool        m_readable {false};
        bool        m_writable {false};

        bool m_sync {false};
        bool m_binmode {false};
        bool m_tty {false};
        bool m_autoclose {true};
        bool m_closeOnExec {true};
    };
}// namespace Conduit::IO
