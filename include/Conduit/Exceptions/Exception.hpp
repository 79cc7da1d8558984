#pragma once

#include <stdexcept>
#include <string>

namespace Conduit::Exceptions
{
    /// @class Exception
    /// @brief Base class for all exceptions thrown by Conduit.
    class Exception : public std::runtime_error
    {
    public:
        explicit Exception(const char* message)
            : std::runtime_error(message)
        {
        }

        explicit Exception(const std::string& message)
            : std::runtime_error(message)
        {
        }

        ~Exception() noexcept override = default;

        /// @brief Returns the exception message.
        [[nodiscard]] const char* GetMessage() const noexcept { return this->what(); }
    };
}// namespace Conduit::Exceptions
