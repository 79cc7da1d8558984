#include <Conduit/IO/FileResource.hpp>

#include <fmt/format.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <utility>

#if defined(_WIN32)
#define NOMINMAX
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace Conduit::IO
{
    namespace
    {
        [[nodiscard]] std::unexpected<StreamError> MakeSystemError(std::string_view operation, std::string_view path,
                                                                   int code)
        {
#if defined(_WIN32)
            return MakeStreamError(StreamErrc::SystemError, fmt::format("{} failed for {}: error {}", operation, path, code),
                                   code);
#else
            return MakeStreamError(StreamErrc::SystemError,
                                   fmt::format("{} failed for {}: {}", operation, path, std::strerror(code)), code);
#endif
        }

        [[nodiscard]] std::unexpected<StreamError> MakeNotOpenError(std::string_view path)
        {
            return MakeStreamError(StreamErrc::NotOpen, fmt::format("{} is not open", path));
        }
    }// namespace

    FileResource::FileResource(std::string path, OpenMode mode, UIntSize chunkSize)
        : m_path(std::move(path)), m_mode(mode), m_chunkSize(chunkSize > 0 ? chunkSize : DEFAULT_CHUNK_SIZE)
    {
    }

    FileResource::~FileResource()
    {
        if (!IsOpen())
            return;
#if defined(_WIN32)
        CloseHandle(static_cast<HANDLE>(m_handle));
#else
        ::close(m_handle);
#endif
    }

    bool FileResource::IsOpen() const noexcept
    {
#if defined(_WIN32)
        return m_handle != nullptr;
#else
        return m_handle >= 0;
#endif
    }

    StreamExpected<std::optional<ResourceHandle>> FileResource::Open()
    {
        if (IsOpen())
            return MakeStreamError(StreamErrc::InvalidArgument, fmt::format("{} is already open", m_path));

        m_readOffset  = 0;
        m_writeOffset = 0;
#if defined(_WIN32)
        DWORD access   = 0;
        DWORD creation = OPEN_EXISTING;
        switch (m_mode)
        {
            case OpenMode::Read:
                access   = GENERIC_READ;
                creation = OPEN_EXISTING;
                break;
            case OpenMode::Write:
                access   = GENERIC_WRITE;
                creation = CREATE_ALWAYS;
                break;
            case OpenMode::ReadWrite:
                access   = GENERIC_READ | GENERIC_WRITE;
                creation = OPEN_ALWAYS;
                break;
        }
        HANDLE handle = CreateFileA(m_path.c_str(), access, FILE_SHARE_READ, nullptr, creation, FILE_ATTRIBUTE_NORMAL,
                                    nullptr);
        if (handle == INVALID_HANDLE_VALUE)
            return MakeSystemError("CreateFileA", m_path, static_cast<int>(GetLastError()));
        m_handle = handle;
        return std::optional<ResourceHandle> {static_cast<ResourceHandle>(reinterpret_cast<std::intptr_t>(handle))};
#else
        int flags = 0;
        switch (m_mode)
        {
            case OpenMode::Read:
                flags = O_RDONLY;
                break;
            case OpenMode::Write:
                flags = O_WRONLY | O_CREAT | O_TRUNC;
                break;
            case OpenMode::ReadWrite:
                flags = O_RDWR | O_CREAT;
                break;
        }
        const int fd = ::open(m_path.c_str(), flags | O_CLOEXEC, 0644);
        if (fd < 0)
            return MakeSystemError("open", m_path, errno);
        m_handle = fd;
        return std::optional<ResourceHandle> {static_cast<ResourceHandle>(fd)};
#endif
    }

    StreamExpected<std::string> FileResource::Read()
    {
        if (!IsOpen())
            return MakeNotOpenError(m_path);

        std::string chunk(m_chunkSize, '\0');
#if defined(_WIN32)
        OVERLAPPED overlapped {};
        overlapped.Offset     = static_cast<DWORD>(m_readOffset & 0xFFFFFFFFull);
        overlapped.OffsetHigh = static_cast<DWORD>(static_cast<UInt64>(m_readOffset) >> 32);
        DWORD bytesRead       = 0;
        if (!ReadFile(static_cast<HANDLE>(m_handle), chunk.data(), static_cast<DWORD>(chunk.size()), &bytesRead,
                      &overlapped))
        {
            const DWORD error = GetLastError();
            if (error != ERROR_HANDLE_EOF)
                return MakeSystemError("ReadFile", m_path, static_cast<int>(error));
        }
        const auto count = static_cast<UIntSize>(bytesRead);
#else
        ssize_t result = -1;
        do
        {
            result = ::pread(m_handle, chunk.data(), chunk.size(), static_cast<off_t>(m_readOffset));
        } while (result < 0 && errno == EINTR);

        if (result < 0)
        {
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                return MakeStreamError(StreamErrc::WouldBlock);
            return MakeSystemError("pread", m_path, errno);
        }
        const auto count = static_cast<UIntSize>(result);
#endif
        chunk.resize(count);
        m_readOffset += count;
        return chunk;
    }

    StreamExpected<UIntSize> FileResource::Write(std::string_view data)
    {
        if (!IsOpen())
            return MakeNotOpenError(m_path);

        UIntSize written = 0;
        while (written < data.size())
        {
            const char*    source    = data.data() + written;
            const UIntSize remaining = data.size() - written;
#if defined(_WIN32)
            OVERLAPPED overlapped {};
            overlapped.Offset     = static_cast<DWORD>(m_writeOffset & 0xFFFFFFFFull);
            overlapped.OffsetHigh = static_cast<DWORD>(static_cast<UInt64>(m_writeOffset) >> 32);
            DWORD count           = 0;
            if (!WriteFile(static_cast<HANDLE>(m_handle), source, static_cast<DWORD>(remaining), &count, &overlapped))
                return MakeSystemError("WriteFile", m_path, static_cast<int>(GetLastError()));
#else
            const ssize_t count = ::pwrite(m_handle, source, remaining, static_cast<off_t>(m_writeOffset));
            if (count < 0)
            {
                if (errno == EINTR)
                    continue;
                return MakeSystemError("pwrite", m_path, errno);
            }
#endif
            if (count == 0)
                break;
            written += static_cast<UIntSize>(count);
            m_writeOffset += static_cast<UIntSize>(count);
        }
        return written;
    }

    StreamExpected<UIntSize> FileResource::Size() const
    {
        if (!IsOpen())
            return MakeNotOpenError(m_path);
#if defined(_WIN32)
        LARGE_INTEGER size;
        if (!GetFileSizeEx(static_cast<HANDLE>(m_handle), &size))
            return MakeSystemError("GetFileSizeEx", m_path, static_cast<int>(GetLastError()));
        return static_cast<UIntSize>(size.QuadPart);
#else
        struct stat st;
        if (::fstat(m_handle, &st) != 0)
            return MakeSystemError("fstat", m_path, errno);
        return static_cast<UIntSize>(st.st_size);
#endif
    }

    StreamExpected<Int64> FileResource::Seek(Int64 offset, SeekOrigin origin)
    {
        if (!IsOpen())
            return MakeNotOpenError(m_path);

        Int64 target = 0;
        switch (origin)
        {
            case SeekOrigin::Begin: target = offset; break;
            case SeekOrigin::Current: target = static_cast<Int64>(m_readOffset) + offset; break;
            case SeekOrigin::End:
            {
                auto size = Size();
                if (!size)
                    return std::unexpected(std::move(size.error()));
                target = static_cast<Int64>(*size) + offset;
                break;
            }
            case SeekOrigin::Data:
            case SeekOrigin::Hole:
            {
#if defined(_WIN32) || !defined(SEEK_DATA)
                return MakeStreamError(StreamErrc::NotImplemented, "data and hole seeking are not supported");
#else
                const off_t found =
                        ::lseek(m_handle, static_cast<off_t>(offset), origin == SeekOrigin::Data ? SEEK_DATA : SEEK_HOLE);
                if (found == static_cast<off_t>(-1))
                    return MakeSystemError("lseek", m_path, errno);
                target = static_cast<Int64>(found);
                break;
#endif
            }
        }

        if (target < 0)
            return MakeStreamError(StreamErrc::InvalidArgument, fmt::format("negative offset {} in {}", target, m_path));

        m_readOffset  = static_cast<UIntSize>(target);
        m_writeOffset = static_cast<UIntSize>(target);
        return target;
    }

    StreamExpected<void> FileResource::SetWriteCursor(Int64 offset)
    {
        if (!IsOpen())
            return MakeNotOpenError(m_path);
        if (offset < 0)
            return MakeStreamError(StreamErrc::InvalidArgument, fmt::format("negative offset {} in {}", offset, m_path));
        m_writeOffset = static_cast<UIntSize>(offset);
        return {};
    }

    StreamExpected<void> FileResource::Close()
    {
        if (!IsOpen())
            return {};
#if defined(_WIN32)
        const BOOL closed = CloseHandle(static_cast<HANDLE>(m_handle));
        m_handle          = nullptr;
        if (!closed)
            return MakeSystemError("CloseHandle", m_path, static_cast<int>(GetLastError()));
#else
        const int result = ::close(m_handle);
        m_handle         = -1;
        if (result != 0)
            return MakeSystemError("close", m_path, errno);
#endif
        return {};
    }
}// namespace Conduit::IO
