#include <Conduit/Log/ConsoleSink.hpp>
#include <Conduit/Log/Logger.hpp>

namespace Conduit::Log
{
    Logger::Logger()
    {
        m_sinks.push_back(std::make_unique<ConsoleSink>());
    }

    Logger& Logger::Instance()
    {
        static Logger instance;
        return instance;
    }

    void Logger::AddSink(std::unique_ptr<ILogSink> sink)
    {
        if (!sink)
            return;
        std::lock_guard guard(m_mutex);
        m_sinks.push_back(std::move(sink));
    }

    void Logger::ClearSinks()
    {
        std::lock_guard guard(m_mutex);
        m_sinks.clear();
    }

    void Logger::Flush()
    {
        std::lock_guard guard(m_mutex);
        for (auto& sink: m_sinks)
            sink->Flush();
    }

    void Logger::Write(Severity severity, std::string_view component, std::string_view message,
                       std::source_location location)
    {
        if (!IsEnabled(severity))
            return;

        const LogRecord record {severity, component, message, location};

        std::lock_guard guard(m_mutex);
        for (auto& sink: m_sinks)
            sink->Write(record);
    }
}// namespace Conduit::Log
