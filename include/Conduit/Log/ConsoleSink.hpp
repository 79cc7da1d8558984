/// @file ConsoleSink.hpp
/// @brief Log sink writing one line per record to stderr.
#pragma once

#include <Conduit/Defines.hpp>
#include <Conduit/Log/ILogSink.hpp>

namespace Conduit::Log
{
    class CONDUIT_BASE_API ConsoleSink final : public ILogSink
    {
    public:
        explicit ConsoleSink(bool includeLocation = false) noexcept
            : m_includeLocation(includeLocation)
        {
        }

        void Write(const LogRecord& record) override;
        void Flush() override;

    private:
        bool m_includeLocation {false};
    };
}// namespace Conduit::Log
