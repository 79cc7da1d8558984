/// @file MemoryResource.hpp
/// @brief In-memory seekable resource.
#pragma once

#include <Conduit/IO/IStreamResource.hpp>
#include <Conduit/IO/StreamError.hpp>
#include <Conduit/Primitives.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace Conduit::IO
{
    /// @brief Resource backed by a string, handed out in chunks of at most @c chunkSize bytes.
    ///
    /// Reads and writes use separate cursors, so appending to a resource does not disturb what is
    /// being read from it. A seek moves both cursors. Writing past the end pads with zero bytes.
    class MemoryResource final : public IStreamResource
    {
    public:
        static constexpr UIntSize DEFAULT_CHUNK_SIZE = 4096;

        explicit MemoryResource(std::string data = {}, UIntSize chunkSize = DEFAULT_CHUNK_SIZE)
            : m_data(std::move(data)), m_chunkSize(chunkSize > 0 ? chunkSize : 1)
        {
        }

        StreamExpected<std::string> Read() override
        {
            if (m_readOffset >= m_data.size())
                return std::string {};

            const UIntSize count = std::min(m_chunkSize, m_data.size() - m_readOffset);
            std::string    chunk = m_data.substr(m_readOffset, count);
            m_readOffset += count;
            return chunk;
        }

        StreamExpected<UIntSize> Write(std::string_view data) override
        {
            if (m_writeOffset > m_data.size())
                m_data.resize(m_writeOffset, '\0');

            const UIntSize overlap = std::min(data.size(), m_data.size() - m_writeOffset);
            m_data.replace(m_writeOffset, overlap, data);
            m_writeOffset += data.size();
            return data.size();
        }

        StreamExpected<Int64> Seek(Int64 offset, SeekOrigin origin) override
        {
            const auto size   = static_cast<Int64>(m_data.size());
            Int64      target = 0;
            switch (origin)
            {
                case SeekOrigin::Begin: target = offset; break;
                case SeekOrigin::Current: target = static_cast<Int64>(m_readOffset) + offset; break;
                case SeekOrigin::End: target = size + offset; break;
                case SeekOrigin::Data:
                    if (offset >= size)
                        return MakeStreamError(StreamErrc::InvalidArgument, "no data at or after offset");
                    target = offset;
                    break;
                case SeekOrigin::Hole:
                    if (offset > size)
                        return MakeStreamError(StreamErrc::InvalidArgument, "offset past end of data");
                    target = size;
                    break;
            }

            if (target < 0)
                return MakeStreamError(StreamErrc::InvalidArgument, "seek before start of data");

            m_readOffset  = static_cast<UIntSize>(target);
            m_writeOffset = static_cast<UIntSize>(target);
            return target;
        }

        [[nodiscard]] std::optional<Int64> WriteCursor() const noexcept override
        {
            return static_cast<Int64>(m_writeOffset);
        }

        StreamExpected<void> SetWriteCursor(Int64 offset) override
        {
            if (offset < 0)
                return MakeStreamError(StreamErrc::InvalidArgument, "write cursor before start of data");
            m_writeOffset = static_cast<UIntSize>(offset);
            return {};
        }

        StreamExpected<void> Close() override
        {
            m_closed = true;
            return {};
        }

        [[nodiscard]] std::string_view Name() const noexcept override { return "memory"; }

        [[nodiscard]] const std::string& Data() const noexcept { return m_data; }
        [[nodiscard]] UIntSize           ReadOffset() const noexcept { return m_readOffset; }
        [[nodiscard]] bool               IsClosed() const noexcept { return m_closed; }

        void SetChunkSize(UIntSize chunkSize) noexcept { m_chunkSize = chunkSize > 0 ? chunkSize : 1; }

    private:
        std::string m_data {};
        UIntSize    m_chunkSize {DEFAULT_CHUNK_SIZE};
        UIntSize    m_readOffset {0};
        UIntSize    m_writeOffset {0};
        bool        m_closed {false};
    };
}// namespace Conduit::IO
