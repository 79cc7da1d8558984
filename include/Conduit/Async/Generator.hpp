/// @file Generator.hpp
/// @brief Synchronous pull generator (stackless coroutine) based on `co_yield`.
#pragma once

#include <coroutine>
#include <cstddef>
#include <exception>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>

namespace Conduit::Async
{
    /// @brief A lazily evaluated, single-pass sequence produced by a coroutine via `co_yield`.
    ///
    /// The producer body does not run until `begin()` is called. Exceptions thrown by the producer are
    /// rethrown to the consumer from `begin()` or `operator++`. Destroying the generator destroys the
    /// suspended coroutine frame, running the destructors of the producer's live locals.
    template<typename T>
    class Generator final
    {
    public:
        struct promise_type final
        {
            std::optional<T>   current {};
            std::exception_ptr error {};

            Generator get_return_object() noexcept
            {
                return Generator(std::coroutine_handle<promise_type>::from_promise(*this));
            }

            std::suspend_always initial_suspend() noexcept { return {}; }
            std::suspend_always final_suspend() noexcept { return {}; }

            std::suspend_always yield_value(T value) noexcept(std::is_nothrow_move_constructible_v<T>)
            {
                current = std::move(value);
                return {};
            }

            void return_void() noexcept {}

            void unhandled_exception() noexcept
            {
                error = std::current_exception();
            }
        };

        using handle_type = std::coroutine_handle<promise_type>;

        Generator() noexcept = default;

        explicit Generator(handle_type handle) noexcept
            : m_handle(handle)
        {
        }

        Generator(Generator&& other) noexcept
            : m_handle(std::exchange(other.m_handle, {}))
        {
        }

        Generator& operator=(Generator&& other) noexcept
        {
            if (this != &other)
            {
                Reset();
                m_handle = std::exchange(other.m_handle, {});
            }
            return *this;
        }

        Generator(const Generator&)            = delete;
        Generator& operator=(const Generator&) = delete;

        ~Generator()
        {
            Reset();
        }

        class Iterator final
        {
        public:
            using iterator_concept = std::input_iterator_tag;
            using value_type       = T;
            using difference_type  = std::ptrdiff_t;
            using reference        = const T&;

            Iterator() noexcept = default;

            explicit Iterator(handle_type handle) noexcept
                : m_handle(handle)
            {
            }

            reference operator*() const
            {
                return *m_handle.promise().current;
            }

            Iterator& operator++()
            {
                if (!m_handle || m_handle.done())
                {
                    return *this;
                }

                m_handle.promise().current.reset();
                m_handle.resume();
                RethrowIfFailed(m_handle);
                return *this;
            }

            void operator++(int)
            {
                ++*this;
            }

            friend bool operator==(const Iterator& it, std::default_sentinel_t) noexcept
            {
                return !it.m_handle || it.m_handle.done();
            }

        private:
            handle_type m_handle {};
        };

        /// @brief Start (or continue) the sequence. A generator is single-pass.
        [[nodiscard]] Iterator begin()
        {
            if (!m_handle)
            {
                return Iterator {};
            }

            if (!m_handle.done() && !m_handle.promise().current.has_value())
            {
                m_handle.resume();
            }
            RethrowIfFailed(m_handle);

            if (m_handle.done())
            {
                return Iterator {};
            }
            return Iterator {m_handle};
        }

        [[nodiscard]] std::default_sentinel_t end() const noexcept
        {
            return {};
        }

        [[nodiscard]] bool IsValid() const noexcept
        {
            return static_cast<bool>(m_handle);
        }

    private:
        static void RethrowIfFailed(handle_type handle)
        {
            auto& promise = handle.promise();
            if (promise.error)
            {
                std::rethrow_exception(std::exchange(promise.error, {}));
            }
        }

        void Reset() noexcept
        {
            if (m_handle)
            {
                m_handle.destroy();
                m_handle = {};
            }
        }

        handle_type m_handle {};
    };
}// namespace Conduit::Async
