/// @file EncodingNormalizer.hpp
/// @brief Incremental conversion of resource chunks from a source encoding to the stream's external encoding.
#pragma once

#include <Conduit/Defines.hpp>
#include <Conduit/IO/StreamError.hpp>
#include <Conduit/IO/TextEncoding.hpp>
#include <Conduit/Primitives.hpp>

#include <string>
#include <string_view>

namespace Conduit::IO
{
    enum class EncodingErrorMode : UInt8
    {
        /// Malformed or unrepresentable input fails the read.
        Strict,
        /// Malformed or unrepresentable input becomes the target's replacement character.
        Replace,
    };

    /// @brief Converts a chunked byte stream between encodings.
    ///
    /// Characters split across chunk boundaries are held back until the rest arrives. When source and
    /// target are equal, or either is Binary, chunks pass through untouched.
    class CONDUIT_BASE_API EncodingNormalizer final
    {
    public:
        EncodingNormalizer() noexcept = default;

        EncodingNormalizer(TextEncoding source, TextEncoding target,
                           EncodingErrorMode mode = EncodingErrorMode::Strict) noexcept
            : m_source(source), m_target(target), m_mode(mode)
        {
        }

        [[nodiscard]] bool IsPassThrough() const noexcept
        {
            return m_source == m_target || m_source == TextEncoding::Binary || m_target == TextEncoding::Binary;
        }

        /// @brief Convert @p chunk. The result may be empty when the whole chunk is a partial character.
        [[nodiscard]] StreamExpected<std::string> Normalize(std::string_view chunk);

        /// @brief Flush at end of stream. A held-back partial character is an error in Strict mode.
        [[nodiscard]] StreamExpected<std::string> Finish();

        void Reset() noexcept { m_pending.clear(); }

        [[nodiscard]] bool HasPending() const noexcept { return !m_pending.empty(); }

        [[nodiscard]] TextEncoding      Source() const noexcept { return m_source; }
        [[nodiscard]] TextEncoding      Target() const noexcept { return m_target; }
        [[nodiscard]] EncodingErrorMode Mode() const noexcept { return m_mode; }

    private:
        void AppendReplacement(std::string& out) const;

        TextEncoding      m_source {TextEncoding::Utf8};
        TextEncoding      m_target {TextEncoding::Utf8};
        EncodingErrorMode m_mode {EncodingErrorMode::Strict};
        std::string       m_pending {};
    };
}// namespace Conduit::IO
