#include <Conduit/IO/TextEncoding.hpp>

#include <array>
#include <utility>

namespace Conduit::IO
{
    namespace
    {
        [[nodiscard]] constexpr UInt8 ByteAt(std::string_view bytes, UIntSize index) noexcept
        {
            return static_cast<UInt8>(bytes[index]);
        }

        [[nodiscard]] constexpr bool IsBigEndian(TextEncoding encoding) noexcept
        {
            return encoding == TextEncoding::Utf16BE || encoding == TextEncoding::Utf32BE;
        }

        [[nodiscard]] constexpr bool IsSurrogate(Char32 codepoint) noexcept
        {
            return codepoint >= 0xD800 && codepoint <= 0xDFFF;
        }

        [[nodiscard]] constexpr UInt32 ReadUnit16(std::string_view bytes, UIntSize offset, bool bigEndian) noexcept
        {
            const UInt32 b0 = ByteAt(bytes, offset);
            const UInt32 b1 = ByteAt(bytes, offset + 1);
            return bigEndian ? ((b0 << 8) | b1) : ((b1 << 8) | b0);
        }

        [[nodiscard]] constexpr UInt32 ReadUnit32(std::string_view bytes, bool bigEndian) noexcept
        {
            UInt32 value = 0;
            for (UIntSize i = 0; i < 4; ++i)
            {
                const UInt32 b = ByteAt(bytes, bigEndian ? i : 3 - i);
                value          = (value << 8) | b;
            }
            return value;
        }

        void AppendUnit16(std::string& out, UInt32 unit, bool bigEndian)
        {
            const char hi = static_cast<char>((unit >> 8) & 0xFF);
            const char lo = static_cast<char>(unit & 0xFF);
            if (bigEndian)
            {
                out.push_back(hi);
                out.push_back(lo);
            }
            else
            {
                out.push_back(lo);
                out.push_back(hi);
            }
        }

        DecodeResult DecodeUtf8(std::string_view bytes) noexcept
        {
            const UInt8 lead = ByteAt(bytes, 0);
            if (lead < 0x80)
                return {DecodeStatus::Ok, lead, 1};

            UIntSize need      = 0;
            Char32   codepoint = 0;
            if (lead >= 0xC2 && lead <= 0xDF)
            {
                need      = 2;
                codepoint = lead & 0x1F;
            }
            else if (lead >= 0xE0 && lead <= 0xEF)
            {
                need      = 3;
                codepoint = lead & 0x0F;
            }
            else if (lead >= 0xF0 && lead <= 0xF4)
            {
                need      = 4;
                codepoint = lead & 0x07;
            }
            else
            {
                return {DecodeStatus::Invalid, 0, 1};
            }

            for (UIntSize i = 1; i < need; ++i)
            {
                if (i >= bytes.size())
                    return {DecodeStatus::Incomplete, 0, bytes.size()};

                const UInt8 b = ByteAt(bytes, i);
                // The second byte range is narrower for leads that could encode overlongs,
                // surrogates or codepoints past U+10FFFF.
                UInt8 low  = 0x80;
                UInt8 high = 0xBF;
                if (i == 1)
                {
                    if (lead == 0xE0)
                        low = 0xA0;
                    else if (lead == 0xED)
                        high = 0x9F;
                    else if (lead == 0xF0)
                        low = 0x90;
                    else if (lead == 0xF4)
                        high = 0x8F;
                }
                if (b < low || b > high)
                    return {DecodeStatus::Invalid, 0, i};

                codepoint = (codepoint << 6) | (b & 0x3F);
            }
            return {DecodeStatus::Ok, codepoint, need};
        }

        DecodeResult DecodeUtf16(std::string_view bytes, bool bigEndian) noexcept
        {
            if (bytes.size() < 2)
                return {DecodeStatus::Incomplete, 0, bytes.size()};

            const UInt32 first = ReadUnit16(bytes, 0, bigEndian);
            if (first >= 0xDC00 && first <= 0xDFFF)
                return {DecodeStatus::Invalid, 0, 2};
            if (first < 0xD800 || first > 0xDBFF)
                return {DecodeStatus::Ok, first, 2};

            if (bytes.size() < 4)
                return {DecodeStatus::Incomplete, 0, bytes.size()};

            const UInt32 second = ReadUnit16(bytes, 2, bigEndian);
            if (second < 0xDC00 || second > 0xDFFF)
                return {DecodeStatus::Invalid, 0, 2};

            return {DecodeStatus::Ok, 0x10000 + ((first - 0xD800) << 10) + (second - 0xDC00), 4};
        }

        DecodeResult DecodeUtf32(std::string_view bytes, bool bigEndian) noexcept
        {
            if (bytes.size() < 4)
                return {DecodeStatus::Incomplete, 0, bytes.size()};

            const Char32 codepoint = ReadUnit32(bytes, bigEndian);
            if (codepoint > 0x10FFFF || IsSurrogate(codepoint))
                return {DecodeStatus::Invalid, 0, 4};
            return {DecodeStatus::Ok, codepoint, 4};
        }

        struct EncodingName final
        {
            std::string_view name;
            TextEncoding     encoding;
        };

        // Keys are lowercase with '-', '_' and spaces removed.
        constexpr std::array<EncodingName, 13> ENCODING_NAMES {{
                {"binary", TextEncoding::Binary},
                {"ascii8bit", TextEncoding::Binary},
                {"ascii", TextEncoding::Ascii},
                {"usascii", TextEncoding::Ascii},
                {"latin1", TextEncoding::Latin1},
                {"iso88591", TextEncoding::Latin1},
                {"utf8", TextEncoding::Utf8},
                {"utf16le", TextEncoding::Utf16LE},
                {"utf16be", TextEncoding::Utf16BE},
                {"utf32le", TextEncoding::Utf32LE},
                {"utf32be", TextEncoding::Utf32BE},
                {"ucs2le", TextEncoding::Utf16LE},
                {"ucs4le", TextEncoding::Utf32LE},
        }};
    }// namespace

    std::string_view ToString(TextEncoding encoding) noexcept
    {
        switch (encoding)
        {
            case TextEncoding::Binary: return "ASCII-8BIT";
            case TextEncoding::Ascii: return "US-ASCII";
            case TextEncoding::Latin1: return "ISO-8859-1";
            case TextEncoding::Utf8: return "UTF-8";
            case TextEncoding::Utf16LE: return "UTF-16LE";
            case TextEncoding::Utf16BE: return "UTF-16BE";
            case TextEncoding::Utf32LE: return "UTF-32LE";
            case TextEncoding::Utf32BE: return "UTF-32BE";
        }
        return "UNKNOWN";
    }

    std::optional<TextEncoding> ParseTextEncoding(std::string_view name) noexcept
    {
        std::array<char, 16> key {};
        UIntSize             length = 0;
        for (const char c: name)
        {
            if (c == '-' || c == '_' || c == ' ')
                continue;
            if (length == key.size())
                return std::nullopt;
            key[length++] = (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
        }

        const std::string_view normalized(key.data(), length);
        for (const auto& entry: ENCODING_NAMES)
        {
            if (entry.name == normalized)
                return entry.encoding;
        }
        return std::nullopt;
    }

    UIntSize CharacterLength(TextEncoding encoding, std::string_view lead) noexcept
    {
        switch (encoding)
        {
            case TextEncoding::Utf8:
            {
                if (lead.empty())
                    return 1;
                const UInt8 b = ByteAt(lead, 0);
                if (b >= 0xC2 && b <= 0xDF)
                    return 2;
                if (b >= 0xE0 && b <= 0xEF)
                    return 3;
                if (b >= 0xF0 && b <= 0xF4)
                    return 4;
                return 1;
            }
            case TextEncoding::Utf16LE:
            case TextEncoding::Utf16BE:
            {
                if (lead.size() < 2)
                    return 2;
                const UInt32 unit = ReadUnit16(lead, 0, IsBigEndian(encoding));
                return (unit >= 0xD800 && unit <= 0xDBFF) ? 4 : 2;
            }
            case TextEncoding::Utf32LE:
            case TextEncoding::Utf32BE: return 4;
            default: return 1;
        }
    }

    DecodeResult DecodeCharacter(TextEncoding encoding, std::string_view bytes) noexcept
    {
        if (bytes.empty())
            return {DecodeStatus::Incomplete, 0, 0};

        switch (encoding)
        {
            case TextEncoding::Binary:
            case TextEncoding::Latin1: return {DecodeStatus::Ok, ByteAt(bytes, 0), 1};
            case TextEncoding::Ascii:
            {
                const UInt8 b = ByteAt(bytes, 0);
                if (b < 0x80)
                    return {DecodeStatus::Ok, b, 1};
                return {DecodeStatus::Invalid, 0, 1};
            }
            case TextEncoding::Utf8: return DecodeUtf8(bytes);
            case TextEncoding::Utf16LE:
            case TextEncoding::Utf16BE: return DecodeUtf16(bytes, IsBigEndian(encoding));
            case TextEncoding::Utf32LE:
            case TextEncoding::Utf32BE: return DecodeUtf32(bytes, IsBigEndian(encoding));
        }
        return {DecodeStatus::Invalid, 0, 1};
    }

    UIntSize CharacterBoundary(TextEncoding encoding, std::string_view bytes) noexcept
    {
        const DecodeResult result = DecodeCharacter(encoding, bytes);
        switch (result.status)
        {
            case DecodeStatus::Ok: return result.length;
            case DecodeStatus::Incomplete: return bytes.size();
            case DecodeStatus::Invalid: return result.length > 0 ? result.length : 1;
        }
        return 1;
    }

    bool EncodeCodepoint(TextEncoding encoding, Char32 codepoint, std::string& out)
    {
        switch (encoding)
        {
            case TextEncoding::Binary:
            case TextEncoding::Latin1:
                if (codepoint > 0xFF)
                    return false;
                out.push_back(static_cast<char>(codepoint));
                return true;
            case TextEncoding::Ascii:
                if (codepoint > 0x7F)
                    return false;
                out.push_back(static_cast<char>(codepoint));
                return true;
            case TextEncoding::Utf8:
                if (codepoint > 0x10FFFF || IsSurrogate(codepoint))
                    return false;
                if (codepoint <= 0x7F)
                {
                    out.push_back(static_cast<char>(codepoint));
                }
                else if (codepoint <= 0x7FF)
                {
                    out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
                    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
                }
                else if (codepoint <= 0xFFFF)
                {
                    out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
                    out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
                }
                else
                {
                    out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
                    out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
                    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
                }
                return true;
            case TextEncoding::Utf16LE:
            case TextEncoding::Utf16BE:
            {
                if (codepoint > 0x10FFFF || IsSurrogate(codepoint))
                    return false;
                const bool bigEndian = IsBigEndian(encoding);
                if (codepoint < 0x10000)
                {
                    AppendUnit16(out, codepoint, bigEndian);
                    return true;
                }
                const UInt32 offset = codepoint - 0x10000;
                AppendUnit16(out, 0xD800 + (offset >> 10), bigEndian);
                AppendUnit16(out, 0xDC00 + (offset & 0x3FF), bigEndian);
                return true;
            }
            case TextEncoding::Utf32LE:
            case TextEncoding::Utf32BE:
            {
                if (codepoint > 0x10FFFF || IsSurrogate(codepoint))
                    return false;
                const bool bigEndian = IsBigEndian(encoding);
                for (UIntSize i = 0; i < 4; ++i)
                {
                    const UIntSize shift = bigEndian ? (24 - 8 * i) : (8 * i);
                    out.push_back(static_cast<char>((codepoint >> shift) & 0xFF));
                }
                return true;
            }
        }
        return false;
    }
}// namespace Conduit::IO
