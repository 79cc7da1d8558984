/// @file FileResource.hpp
/// @brief Resource over a platform file handle.
#pragma once

#include <Conduit/Defines.hpp>
#include <Conduit/IO/IStreamResource.hpp>
#include <Conduit/IO/StreamError.hpp>
#include <Conduit/Primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace Conduit::IO
{
    /// @brief File resource using positional reads and writes.
    ///
    /// The file is opened by Open(), which the stream calls once. Reads and writes keep their own
    /// offsets; Seek() sets both, SetWriteCursor() only the write offset.
    class CONDUIT_BASE_API FileResource final : public IStreamResource
    {
    public:
        enum class OpenMode : UInt8
        {
            Read,
            /// Create or truncate.
            Write,
            /// Create if missing, keep contents.
            ReadWrite,
        };

        static constexpr UIntSize DEFAULT_CHUNK_SIZE = 64 * 1024;

        FileResource(std::string path, OpenMode mode, UIntSize chunkSize = DEFAULT_CHUNK_SIZE);
        FileResource(const FileResource&)            = delete;
        FileResource& operator=(const FileResource&) = delete;
        ~FileResource() override;

        StreamExpected<std::optional<ResourceHandle>> Open() override;
        StreamExpected<std::string>                   Read() override;
        StreamExpected<UIntSize>                      Write(std::string_view data) override;
        StreamExpected<Int64>                         Seek(Int64 offset, SeekOrigin origin) override;
        StreamExpected<void>                          SetWriteCursor(Int64 offset) override;
        StreamExpected<void>                          Close() override;

        [[nodiscard]] std::optional<Int64> WriteCursor() const noexcept override
        {
            return static_cast<Int64>(m_writeOffset);
        }

        [[nodiscard]] std::string_view Name() const noexcept override { return m_path; }

        [[nodiscard]] bool               IsOpen() const noexcept;
        [[nodiscard]] const std::string& Path() const noexcept { return m_path; }
        [[nodiscard]] StreamExpected<UIntSize> Size() const;

    private:
        std::string m_path;
        OpenMode    m_mode;
        UIntSize    m_chunkSize;
        UIntSize    m_readOffset {0};
        UIntSize    m_writeOffset {0};
#if defined(_WIN32)
        void* m_handle {nullptr};
#else
        int m_handle {-1};
#endif
    };
}// namespace Conduit::IO
