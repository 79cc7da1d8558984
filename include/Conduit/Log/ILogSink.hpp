/// @file ILogSink.hpp
/// @brief Destination for formatted log records.
#pragma once

#include <Conduit/Log/Severity.hpp>

#include <source_location>
#include <string_view>

namespace Conduit::Log
{
    /// @brief A fully formatted log message. Views are valid only for the duration of ILogSink::Write.
    struct LogRecord final
    {
        Severity             severity {Severity::Info};
        std::string_view     component {};
        std::string_view     message {};
        std::source_location location {};
    };

    /// @brief Log output interface. Calls are serialized by the Logger.
    class ILogSink
    {
    public:
        virtual ~ILogSink() = default;

        virtual void Write(const LogRecord& record) = 0;
        virtual void Flush() {}
    };
}// namespace Conduit::Log
