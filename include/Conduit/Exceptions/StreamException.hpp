#pragma once

/// @file StreamException.hpp
/// @brief Declares the StreamException class.

#include <Conduit/Exceptions/Exception.hpp>
#include <Conduit/IO/StreamError.hpp>

#include <utility>

namespace Conduit::Exceptions
{
    /// @class StreamException
    /// @brief Carries an IO::StreamError out of a context that cannot return one.
    ///
    /// @details
    /// Lazy sequences produced by IO::BufferedStream are coroutines and cannot return
    /// `StreamExpected`. A failure while producing the next element (a closed stream, a primitive
    /// read error, an invalid byte sequence) is thrown as a `StreamException` when the consumer
    /// advances the sequence. End of stream is never reported this way; it simply ends the sequence.
    class StreamException : public Exception
    {
    public:
        explicit StreamException(IO::StreamError error)
            : Exception(error.message.empty() ? std::string(IO::ToString(error.code)) : error.message)
            , m_error(std::move(error))
        {
        }

        /// @brief The error that stopped the sequence.
        [[nodiscard]] const IO::StreamError& Error() const noexcept { return m_error; }

        [[nodiscard]] IO::StreamErrc Code() const noexcept { return m_error.code; }

    private:
        IO::StreamError m_error;
    };
}// namespace Conduit::Exceptions
