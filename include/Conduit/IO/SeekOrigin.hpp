/// @file SeekOrigin.hpp
/// @brief Reference point for a seek offset.
#pragma once

#include <Conduit/Primitives.hpp>

#include <string_view>

namespace Conduit::IO
{
    enum class SeekOrigin : UInt8
    {
        Begin,
        Current,
        End,
        /// Next offset at or after the given one that holds data.
        Data,
        /// Next hole at or after the given offset.
        Hole,
    };

    [[nodiscard]] constexpr std::string_view ToString(SeekOrigin origin) noexcept
    {
        switch (origin)
        {
            case SeekOrigin::Begin: return "Begin";
            case SeekOrigin::Current: return "Current";
            case SeekOrigin::End: return "End";
            case SeekOrigin::Data: return "Data";
            case SeekOrigin::Hole: return "Hole";
        }
        return "Unknown";
    }
}// namespace Conduit::IO
