/// @file Cancellation.hpp
/// @brief Cooperative cancellation flag shared between a source and its tokens.
#pragma once

#include <atomic>
#include <memory>
#include <utility>

namespace Conduit::Async
{
    namespace detail
    {
        struct CancellationState final
        {
            std::atomic<bool> canceled {false};
        };
    }// namespace detail

    /// @brief Read side of a cancellation flag. A default-constructed token is never canceled.
    class CancellationToken
    {
    public:
        CancellationToken() = default;
        explicit CancellationToken(std::shared_ptr<const detail::CancellationState> state) noexcept
            : m_state(std::move(state))
        {
        }

        [[nodiscard]] bool IsCancellationRequested() const noexcept
        {
            return m_state && m_state->canceled.load(std::memory_order_acquire);
        }

        [[nodiscard]] bool CanBeCanceled() const noexcept
        {
            return m_state != nullptr;
        }

        [[nodiscard]] explicit operator bool() const noexcept
        {
            return IsCancellationRequested();
        }

    private:
        std::shared_ptr<const detail::CancellationState> m_state {};
    };

    /// @brief Owner of a cancellation flag. Cancel() may be called from any thread.
    class CancellationSource
    {
    public:
        CancellationSource()
            : m_state(std::make_shared<detail::CancellationState>())
        {
        }

        void Cancel() noexcept
        {
            m_state->canceled.store(true, std::memory_order_release);
        }

        [[nodiscard]] CancellationToken GetToken() const noexcept
        {
            return CancellationToken(m_state);
        }

        [[nodiscard]] bool IsCancellationRequested() const noexcept
        {
            return m_state->canceled.load(std::memory_order_acquire);
        }

    private:
        std::shared_ptr<detail::CancellationState> m_state;
    };
}// namespace Conduit::Async
