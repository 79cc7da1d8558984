/// @file Logger.hpp
/// @brief Process-wide logger with severity filtering and pluggable sinks.
#pragma once

#include <Conduit/Defines.hpp>
#include <Conduit/Log/ILogSink.hpp>
#include <Conduit/Log/Severity.hpp>

#include <fmt/format.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <source_location>
#include <string_view>
#include <utility>
#include <vector>

namespace Conduit::Log
{
    /// @brief Routes log records to the registered sinks.
    ///
    /// The instance starts with a ConsoleSink and a minimum severity of Warn. Records below the
    /// minimum severity are dropped before formatting.
    class CONDUIT_BASE_API Logger final
    {
    public:
        Logger(const Logger&)            = delete;
        Logger& operator=(const Logger&) = delete;

        [[nodiscard]] static Logger& Instance();

        void SetMinSeverity(Severity severity) noexcept
        {
            m_minSeverity.store(severity, std::memory_order_relaxed);
        }

        [[nodiscard]] Severity GetMinSeverity() const noexcept
        {
            return m_minSeverity.load(std::memory_order_relaxed);
        }

        [[nodiscard]] bool IsEnabled(Severity severity) const noexcept
        {
            return severity != Severity::Off && severity >= GetMinSeverity();
        }

        void AddSink(std::unique_ptr<ILogSink> sink);
        void ClearSinks();
        void Flush();

        void Write(Severity severity, std::string_view component, std::string_view message,
                   std::source_location location = std::source_location::current());

        template<typename... Args>
        void Log(Severity severity, std::string_view component, std::source_location location,
                 fmt::format_string<Args...> format, Args&&... args)
        {
            if (!IsEnabled(severity))
                return;
            const auto message = fmt::format(format, std::forward<Args>(args)...);
            Write(severity, component, message, location);
        }

    private:
        Logger();
        ~Logger() = default;

        std::atomic<Severity>                  m_minSeverity {Severity::Warn};
        std::mutex                             m_mutex {};
        std::vector<std::unique_ptr<ILogSink>> m_sinks {};
    };
}// namespace Conduit::Log

#define CONDUIT_LOG(severity, component, ...) \
    ::Conduit::Log::Logger::Instance().Log((severity), (component), std::source_location::current(), __VA_ARGS__)

#define CONDUIT_LOG_TRACE(component, ...) CONDUIT_LOG(::Conduit::Log::Severity::Trace, component, __VA_ARGS__)
#define CONDUIT_LOG_DEBUG(component, ...) CONDUIT_LOG(::Conduit::Log::Severity::Debug, component, __VA_ARGS__)
#define CONDUIT_LOG_INFO(component, ...)  CONDUIT_LOG(::Conduit::Log::Severity::Info, component, __VA_ARGS__)
#define CONDUIT_LOG_WARN(component, ...)  CONDUIT_LOG(::Conduit::Log::Severity::Warn, component, __VA_ARGS__)
#define CONDUIT_LOG_ERROR(component, ...) CONDUIT_LOG(::Conduit::Log::Severity::Error, component, __VA_ARGS__)
