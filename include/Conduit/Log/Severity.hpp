/// @file Severity.hpp
/// @brief Log severity levels.
#pragma once

#include <Conduit/Primitives.hpp>

#include <string_view>

namespace Conduit::Log
{
    enum class Severity : UInt8
    {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Off,
    };

    [[nodiscard]] constexpr std::string_view ToString(Severity severity) noexcept
    {
        switch (severity)
        {
            case Severity::Trace: return "TRACE";
            case Severity::Debug: return "DEBUG";
            case Severity::Info: return "INFO";
            case Severity::Warn: return "WARN";
            case Severity::Error: return "ERROR";
            case Severity::Off: return "OFF";
        }
        return "UNKNOWN";
    }
}// namespace Conduit::Log
