/// @file IStreamResource.hpp
/// @brief Primitive contract a resource implements to be consumed through a BufferedStream.
#pragma once

#include <Conduit/Defines.hpp>
#include <Conduit/IO/SeekOrigin.hpp>
#include <Conduit/IO/StreamError.hpp>
#include <Conduit/Primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace Conduit::IO
{
    /// @brief Opaque handle a resource may hand back from Open(), e.g. a file descriptor.
    using ResourceHandle = Int64;

    /// @brief Minimal resource interface. Only Read() is mandatory.
    ///
    /// Read() reports its three outcomes as:
    /// - a non-empty string: the next chunk of data,
    /// - an empty string: a short read, the resource has ended,
    /// - StreamErrc::WouldBlock: no data is available yet, try again later,
    /// - StreamErrc::EndOfStream: the resource has ended.
    /// Any other error is passed through to the caller unchanged.
    ///
    /// Read() must not depend on any stream state; buffering and retries are the stream's job.
    class CONDUIT_BASE_API IStreamResource
    {
    public:
        virtual ~IStreamResource() = default;

        /// @brief Acquire the underlying handle. Called once when the stream opens.
        virtual StreamExpected<std::optional<ResourceHandle>> Open()
        {
            return std::optional<ResourceHandle> {};
        }

        virtual StreamExpected<std::string> Read() = 0;

        /// @brief Write @p data and return the number of bytes accepted.
        virtual StreamExpected<UIntSize> Write(std::string_view data)
        {
            static_cast<void>(data);
            return UIntSize {0};
        }

        /// @brief Reposition the resource and return the resulting absolute offset.
        virtual StreamExpected<Int64> Seek(Int64 offset, SeekOrigin origin)
        {
            static_cast<void>(offset);
            static_cast<void>(origin);
            return MakeStreamError(StreamErrc::NotImplemented, "resource does not support seeking");
        }

        /// @brief Offset where the next Write() lands, for resources whose write cursor is separate
        ///        from the read cursor. Nullopt when writes follow Seek() only.
        [[nodiscard]] virtual std::optional<Int64> WriteCursor() const noexcept
        {
            return std::nullopt;
        }

        /// @brief Move only the write cursor. Called to restore a value obtained from WriteCursor().
        virtual StreamExpected<void> SetWriteCursor(Int64 offset)
        {
            static_cast<void>(offset);
            return MakeStreamError(StreamErrc::NotImplemented, "resource has no separate write cursor");
        }

        virtual StreamExpected<void> Close()
        {
            return {};
        }

        /// @brief Short human-readable name used in diagnostics.
        [[nodiscard]] virtual std::string_view Name() const noexcept
        {
            return "resource";
        }
    };
}// namespace Conduit::IO
