/// @file StreamError.hpp
/// @brief Error codes and payload for buffered stream and resource operations.
#pragma once

#include <Conduit/Primitives.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace Conduit::IO
{
    /// @brief Stream error codes.
    enum class StreamErrc : UInt8
    {
        Ok,
        /// Primitive read has nothing available yet. Absorbed by the retry loop.
        WouldBlock,
        /// Primitive read signals that the stream has ended.
        EndOfStream,
        ClosedForReading,
        ClosedForWriting,
        UnexpectedEndOfStream,
        NotImplemented,
        NotOpen,
        InvalidArgument,
        InvalidByteSequence,
        UndefinedConversion,
        TimedOut,
        Canceled,
        SystemError,
    };

    /// @brief Structured error with optional native OS code and message.
    struct StreamError final
    {
        StreamErrc  code {StreamErrc::Ok};
        int         native {0};
        std::string message {};

        [[nodiscard]] bool IsOk() const noexcept { return code == StreamErrc::Ok; }
    };

    template<typename T>
    using StreamExpected = std::expected<T, StreamError>;

    [[nodiscard]] constexpr std::string_view ToString(StreamErrc code) noexcept
    {
        switch (code)
        {
            case StreamErrc::Ok: return "ok";
            case StreamErrc::WouldBlock: return "no data available yet";
            case StreamErrc::EndOfStream: return "end of stream";
            case StreamErrc::ClosedForReading: return "closed for reading";
            case StreamErrc::ClosedForWriting: return "closed for writing";
            case StreamErrc::UnexpectedEndOfStream: return "end of file reached";
            case StreamErrc::NotImplemented: return "not implemented";
            case StreamErrc::NotOpen: return "stream not open";
            case StreamErrc::InvalidArgument: return "invalid argument";
            case StreamErrc::InvalidByteSequence: return "invalid byte sequence";
            case StreamErrc::UndefinedConversion: return "undefined conversion";
            case StreamErrc::TimedOut: return "timed out waiting for data";
            case StreamErrc::Canceled: return "canceled";
            case StreamErrc::SystemError: return "system error";
        }
        return "unknown";
    }

    /// @brief Build an unexpected StreamError; the message defaults to the code description.
    [[nodiscard]] inline std::unexpected<StreamError> MakeStreamError(StreamErrc code,
                                                                      std::string message = {},
                                                                      int native = 0)
    {
        if (message.empty())
            message = std::string(ToString(code));
        return std::unexpected(StreamError {code, native, std::move(message)});
    }

    [[nodiscard]] inline std::error_code ToErrorCode(const StreamError& error) noexcept
    {
        if (error.native != 0)
        {
            return std::error_code(error.native, std::system_category());
        }

        switch (error.code)
        {
            case StreamErrc::WouldBlock: return std::make_error_code(std::errc::resource_unavailable_try_again);
            case StreamErrc::ClosedForReading:
            case StreamErrc::ClosedForWriting:
            case StreamErrc::NotOpen: return std::make_error_code(std::errc::bad_file_descriptor);
            case StreamErrc::NotImplemented: return std::make_error_code(std::errc::function_not_supported);
            case StreamErrc::InvalidArgument: return std::make_error_code(std::errc::invalid_argument);
            case StreamErrc::InvalidByteSequence:
            case StreamErrc::UndefinedConversion: return std::make_error_code(std::errc::illegal_byte_sequence);
            case StreamErrc::TimedOut: return std::make_error_code(std::errc::timed_out);
            case StreamErrc::Canceled: return std::make_error_code(std::errc::operation_canceled);
            case StreamErrc::EndOfStream:
            case StreamErrc::UnexpectedEndOfStream:
            case StreamErrc::SystemError: return std::make_error_code(std::errc::io_error);
            case StreamErrc::Ok: return {};
        }

        return std::make_error_code(std::errc::io_error);
    }
}// namespace Conduit::IO
