/// @file TimePoint.hpp
/// @brief Monotonic time point for retry deadlines (nanosecond ticks).
#pragma once

#include <Conduit/Primitives.hpp>
#include <Conduit/Units.hpp>

namespace Conduit::Time
{
    /// @brief Opaque monotonic time point expressed as nanoseconds since an unspecified epoch.
    struct TimePoint final
    {
        constexpr TimePoint() noexcept = default;

        static constexpr TimePoint FromNanoseconds(UInt64 nanoseconds) noexcept
        {
            return TimePoint(nanoseconds);
        }

        [[nodiscard]] constexpr UInt64 ToNanoseconds() const noexcept
        {
            return m_nanoseconds;
        }

        /// @brief Time point @p duration after this one.
        template<typename TUnit>
            requires Units::QuantityOf<Units::TIME, TUnit>
        [[nodiscard]] constexpr TimePoint After(const TUnit& duration) const noexcept
        {
            const auto ns = Units::UnitCast<Units::Nanoseconds>(duration).GetValue();
            return TimePoint(m_nanoseconds + (ns > 0.0 ? static_cast<UInt64>(ns) : 0ull));
        }

        /// @brief Elapsed time from @p earlier to this point, zero when @p earlier is later.
        [[nodiscard]] constexpr Units::Milliseconds Since(TimePoint earlier) const noexcept
        {
            if (earlier.m_nanoseconds >= m_nanoseconds)
                return Units::Milliseconds {0.0};
            return Units::Milliseconds {static_cast<F64>(m_nanoseconds - earlier.m_nanoseconds) / 1'000'000.0};
        }

        friend constexpr bool operator==(TimePoint a, TimePoint b) noexcept
        {
            return a.m_nanoseconds == b.m_nanoseconds;
        }
        friend constexpr bool operator<(TimePoint a, TimePoint b) noexcept
        {
            return a.m_nanoseconds < b.m_nanoseconds;
        }
        friend constexpr bool operator>=(TimePoint a, TimePoint b) noexcept
        {
            return a.m_nanoseconds >= b.m_nanoseconds;
        }

    private:
        constexpr explicit TimePoint(UInt64 nanoseconds) noexcept
            : m_nanoseconds(nanoseconds)
        {
        }

        UInt64 m_nanoseconds {0};
    };
}// namespace Conduit::Time
