/// @file PushBackBuffer.hpp
/// @brief Single contiguous segment of bytes returned to the front of a stream.
#pragma once

#include <Conduit/Primitives.hpp>

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace Conduit::IO
{
    /// @brief Bytes that logically precede the next chunk the resource will produce.
    ///
    /// Storage is a string plus a head offset. Taking from the front only moves the head, and a
    /// later Prepend() that fits reuses the freed space in front of it, so the common
    /// read-split-push-back pattern never reallocates.
    class PushBackBuffer final
    {
    public:
        /// @brief Insert @p bytes in front of the current contents.
        void Prepend(std::string_view bytes)
        {
            if (bytes.empty())
                return;

            if (bytes.size() <= m_head)
            {
                m_head -= bytes.size();
                std::copy(bytes.begin(), bytes.end(), m_storage.begin() + static_cast<std::ptrdiff_t>(m_head));
                return;
            }

            std::string rebuilt;
            rebuilt.reserve(bytes.size() + Size());
            rebuilt.append(bytes);
            rebuilt.append(View());
            m_storage = std::move(rebuilt);
            m_head    = 0;
        }

        /// @brief Remove and return the whole segment.
        [[nodiscard]] std::string Take()
        {
            std::string result = (m_head == 0) ? std::move(m_storage) : m_storage.substr(m_head);
            Clear();
            return result;
        }

        /// @brief Remove and return at most @p count bytes from the front.
        [[nodiscard]] std::string TakeFront(UIntSize count)
        {
            if (count >= Size())
                return Take();

            std::string result = m_storage.substr(m_head, count);
            m_head += count;
            return result;
        }

        void Clear() noexcept
        {
            m_storage.clear();
            m_head = 0;
        }

        [[nodiscard]] bool IsEmpty() const noexcept
        {
            return m_head >= m_storage.size();
        }

        [[nodiscard]] UIntSize Size() const noexcept
        {
            return m_storage.size() - m_head;
        }

        [[nodiscard]] std::string_view View() const noexcept
        {
            return std::string_view(m_storage).substr(m_head);
        }

    private:
        std::string m_storage {};
        UIntSize    m_head {0};
    };
}// namespace Conduit::IO
