/// @file RetryPolicy.hpp
/// @brief How long a stream waits for a resource that has no data yet.
#pragma once

#include <Conduit/Async/Cancellation.hpp>
#include <Conduit/Primitives.hpp>
#include <Conduit/Units.hpp>

#include <optional>

namespace Conduit::IO
{
    /// @brief Polling policy applied when a resource reports WouldBlock.
    ///
    /// The stream sleeps @c backoff between attempts. It gives up with TimedOut once the total wait
    /// reaches @c maxWait or the number of waits reaches @c maxAttempts, and with Canceled as soon as
    /// @c cancellation is signalled.
    struct RetryPolicy final
    {
        Units::Milliseconds                backoff {1000.0};
        std::optional<Units::Milliseconds> maxWait {Units::Milliseconds {30'000.0}};
        /// Maximum number of waits; 0 means no limit.
        UInt32                   maxAttempts {0};
        Async::CancellationToken cancellation {};

        /// @brief Wait forever (unless canceled).
        [[nodiscard]] static RetryPolicy Unbounded(Units::Milliseconds backoff = Units::Milliseconds {1000.0})
        {
            RetryPolicy policy;
            policy.backoff = backoff;
            policy.maxWait.reset();
            return policy;
        }

        [[nodiscard]] bool IsBounded() const noexcept
        {
            return maxWait.has_value() || maxAttempts != 0;
        }
    };
}// namespace Conduit::IO
