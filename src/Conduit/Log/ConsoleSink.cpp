#include <Conduit/Log/ConsoleSink.hpp>

#include <fmt/format.h>

#include <cstdio>

namespace Conduit::Log
{
    void ConsoleSink::Write(const LogRecord& record)
    {
        if (m_includeLocation)
        {
            fmt::print(stderr, "[{}] [{}] {} ({}:{})\n",
                       ToString(record.severity),
                       record.component,
                       record.message,
                       record.location.file_name(),
                       record.location.line());
            return;
        }
        fmt::print(stderr, "[{}] [{}] {}\n", ToString(record.severity), record.component, record.message);
    }

    void ConsoleSink::Flush()
    {
        std::fflush(stderr);
    }
}// namespace Conduit::Log
