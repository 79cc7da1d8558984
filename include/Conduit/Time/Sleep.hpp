/// @file Sleep.hpp
/// @brief Blocking sleep on the calling thread, expressed in Conduit::Units.
#pragma once

#include <Conduit/Primitives.hpp>
#include <Conduit/Units.hpp>

#if defined(_WIN32)
extern "C"
{
    __declspec(dllimport) void __stdcall Sleep(unsigned long dwMilliseconds);
}
#else
#include <cerrno>
#include <time.h>
#endif

namespace Conduit::Time
{
    template<typename TUnit>
        requires Units::QuantityOf<Units::TIME, TUnit>
    [[nodiscard]] inline UInt64 ToNanosecondsCeil(const TUnit& duration) noexcept
    {
        const auto ns = Units::UnitCast<Units::Nanoseconds>(duration).GetValue();
        if (ns <= 0.0)
        {
            return 0;
        }
        const auto truncated = static_cast<UInt64>(ns);
        return (static_cast<F64>(truncated) < ns) ? (truncated + 1ull) : truncated;
    }

    template<typename TUnit>
        requires Units::QuantityOf<Units::TIME, TUnit>
    inline void SleepFor(const TUnit& duration) noexcept
    {
        const UInt64 ns = ToNanosecondsCeil(duration);
        if (ns == 0)
        {
            return;
        }

#if defined(_WIN32)
        // Sleep() has millisecond granularity; round up.
        const UInt64 ms = (ns + 999'999ull) / 1'000'000ull;
        ::Sleep(static_cast<unsigned long>(ms));
#else
        timespec req {};
        req.tv_sec  = static_cast<time_t>(ns / 1'000'000'000ull);
        req.tv_nsec = static_cast<long>(ns % 1'000'000'000ull);
        timespec rem {};
        // Resume after signal interruption until the full interval has elapsed.
        while (::nanosleep(&req, &rem) != 0 && errno == EINTR)
        {
            req = rem;
        }
#endif
    }
}// namespace Conduit::Time
