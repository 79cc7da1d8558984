/// @file TextEncoding.hpp
/// @brief Text encodings understood by the stream normalizer and character splitter.
#pragma once

#include <Conduit/Defines.hpp>
#include <Conduit/Primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace Conduit::IO
{
    enum class TextEncoding : UInt8
    {
        /// Raw bytes. No conversion, every byte is one character.
        Binary,
        Ascii,
        Latin1,
        Utf8,
        Utf16LE,
        Utf16BE,
        Utf32LE,
        Utf32BE,
    };

    enum class DecodeStatus : UInt8
    {
        Ok,
        /// The bytes are a valid prefix of a character but end early.
        Incomplete,
        Invalid,
    };

    /// @brief Result of decoding the first character of a byte sequence.
    ///
    /// For Ok, @c length is the size of the character. For Invalid, @c length is the number of bytes
    /// to skip past the malformed unit. For Incomplete, @c length is the number of bytes examined.
    struct DecodeResult final
    {
        DecodeStatus status {DecodeStatus::Invalid};
        Char32       codepoint {0};
        UIntSize     length {0};
    };

    /// @brief Canonical name, e.g. "UTF-8" or "ASCII-8BIT".
    [[nodiscard]] CONDUIT_BASE_API std::string_view ToString(TextEncoding encoding) noexcept;

    /// @brief Parse an encoding name. Case, '-' and '_' are ignored; common aliases are accepted.
    [[nodiscard]] CONDUIT_BASE_API std::optional<TextEncoding> ParseTextEncoding(std::string_view name) noexcept;

    [[nodiscard]] constexpr bool IsUnicode(TextEncoding encoding) noexcept
    {
        return encoding == TextEncoding::Utf8 || encoding == TextEncoding::Utf16LE ||
               encoding == TextEncoding::Utf16BE || encoding == TextEncoding::Utf32LE ||
               encoding == TextEncoding::Utf32BE;
    }

    /// @brief Size in bytes of one code unit: the minimum length of any character.
    [[nodiscard]] constexpr UIntSize CodeUnitSize(TextEncoding encoding) noexcept
    {
        switch (encoding)
        {
            case TextEncoding::Utf16LE:
            case TextEncoding::Utf16BE: return 2;
            case TextEncoding::Utf32LE:
            case TextEncoding::Utf32BE: return 4;
            default: return 1;
        }
    }

    /// @brief Character substituted for malformed or unrepresentable input in Replace mode.
    [[nodiscard]] constexpr Char32 ReplacementCharacter(TextEncoding encoding) noexcept
    {
        return IsUnicode(encoding) ? Char32 {0xFFFD} : Char32 {'?'};
    }

    /// @brief Expected length of the character whose leading bytes are @p lead.
    ///
    /// Only the first code unit is examined. Invalid leads report one code unit. When @p lead is
    /// shorter than one code unit the code unit size is returned.
    [[nodiscard]] CONDUIT_BASE_API UIntSize CharacterLength(TextEncoding encoding, std::string_view lead) noexcept;

    /// @brief Decode the first character of @p bytes.
    [[nodiscard]] CONDUIT_BASE_API DecodeResult DecodeCharacter(TextEncoding encoding, std::string_view bytes) noexcept;

    /// @brief Length of the first character unit in @p bytes as it should be delivered to a consumer.
    ///
    /// A valid character yields its length, a truncated one yields all of @p bytes, and a malformed
    /// one yields the malformed unit alone so that the following bytes start a new character.
    [[nodiscard]] CONDUIT_BASE_API UIntSize CharacterBoundary(TextEncoding encoding, std::string_view bytes) noexcept;

    /// @brief Append @p codepoint encoded in @p encoding to @p out.
    /// @return false when the encoding cannot represent the codepoint; @p out is unchanged.
    CONDUIT_BASE_API bool EncodeCodepoint(TextEncoding encoding, Char32 codepoint, std::string& out);
}// namespace Conduit::IO
