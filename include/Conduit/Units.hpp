/// @file Units.hpp
/// @brief Strongly typed time quantities used for retry backoff and deadlines.
#pragma once

#include <Conduit/Primitives.hpp>

#include <array>
#include <concepts>

namespace Conduit::Units
{
    /// @brief Exponents of the SI base quantities (L, M, T, I, Θ, N, J).
    struct QuantityExponents
    {
        static constexpr UIntSize NUM_EXPONENTS = 7;
        std::array<Int32, NUM_EXPONENTS> exponents {};

        constexpr bool operator==(const QuantityExponents& other) const noexcept = default;
    };

    constexpr QuantityExponents TIME {0, 0, 1, 0, 0, 0, 0};

    template<typename U>
    concept UnitType = requires {
        typename U::ValueType;
        { U::Exponents } -> std::convertible_to<QuantityExponents>;
    };

    /// @brief Concept: a unit measuring the quantity @p E.
    template<QuantityExponents E, typename U>
    concept QuantityOf = UnitType<U> && (U::Exponents == E);

    template<Int64 Num, Int64 Den = 1>
    struct RatioPolicy
    {
        template<typename ValueT>
        static constexpr ValueT ToBase(ValueT value) noexcept
        {
            return value * static_cast<ValueT>(Num) / static_cast<ValueT>(Den);
        }
        template<typename ValueT>
        static constexpr ValueT FromBase(ValueT base) noexcept
        {
            return base * static_cast<ValueT>(Den) / static_cast<ValueT>(Num);
        }
    };

    template<QuantityExponents Q, typename ValueT = F64, typename Policy = RatioPolicy<1, 1>>
    class Unit
    {
    public:
        using ValueType                              = ValueT;
        static constexpr QuantityExponents Exponents = Q;
        using ConversionPolicy                       = Policy;

        constexpr explicit Unit(ValueT value) noexcept
            : m_value(value)
        {
        }

        [[nodiscard]] constexpr ValueT GetValue() const noexcept { return m_value; }

        constexpr Unit operator+(const Unit& other) const noexcept { return Unit(m_value + other.m_value); }
        constexpr Unit operator-(const Unit& other) const noexcept { return Unit(m_value - other.m_value); }
        constexpr Unit operator*(ValueT scalar) const noexcept { return Unit(m_value * scalar); }

        constexpr bool operator==(const Unit& other) const noexcept { return m_value == other.m_value; }
        constexpr bool operator<(const Unit& other) const noexcept { return m_value < other.m_value; }
        constexpr bool operator<=(const Unit& other) const noexcept { return m_value <= other.m_value; }
        constexpr bool operator>(const Unit& other) const noexcept { return m_value > other.m_value; }
        constexpr bool operator>=(const Unit& other) const noexcept { return m_value >= other.m_value; }

        [[nodiscard]] constexpr ValueT ToBase() const noexcept { return Policy::ToBase(m_value); }

    private:
        ValueT m_value;
    };

    /// @brief Convert between units of the same quantity.
    template<typename ToUnit, typename FromUnit>
        requires(ToUnit::Exponents == FromUnit::Exponents)
    constexpr ToUnit UnitCast(const FromUnit& from) noexcept
    {
        using FromValueT = typename FromUnit::ValueType;
        using ToValueT   = typename ToUnit::ValueType;

        const FromValueT base = FromUnit::ConversionPolicy::ToBase(from.GetValue());
        return ToUnit(static_cast<ToValueT>(ToUnit::ConversionPolicy::FromBase(base)));
    }

    using Seconds      = Unit<TIME, F64, RatioPolicy<1, 1>>;
    using Milliseconds = Unit<TIME, F64, RatioPolicy<1, 1000>>;
    using Microseconds = Unit<TIME, F64, RatioPolicy<1, 1000000>>;
    using Nanoseconds  = Unit<TIME, F64, RatioPolicy<1, 1000000000>>;
}// namespace Conduit::Units
