#include <Conduit/IO/EncodingNormalizer.hpp>

#include <Conduit/Log/Logger.hpp>

#include <fmt/format.h>

#include <utility>

namespace Conduit::IO
{
    namespace
    {
        std::string DescribeBytes(std::string_view bytes)
        {
            std::string text;
            for (const char c: bytes)
                text += fmt::format("\\x{:02X}", static_cast<UInt8>(c));
            return text;
        }
    }// namespace

    void EncodingNormalizer::AppendReplacement(std::string& out) const
    {
        if (!EncodeCodepoint(m_target, ReplacementCharacter(m_target), out))
            out.push_back('?');
    }

    StreamExpected<std::string> EncodingNormalizer::Normalize(std::string_view chunk)
    {
        if (IsPassThrough())
            return std::string(chunk);

        std::string input = std::move(m_pending);
        m_pending.clear();
        input.append(chunk);

        std::string      out;
        std::string_view rest(input);
        while (!rest.empty())
        {
            const DecodeResult decoded = DecodeCharacter(m_source, rest);
            if (decoded.status == DecodeStatus::Incomplete)
            {
                m_pending.assign(rest);
                break;
            }

            const UIntSize consumed = decoded.length > 0 ? decoded.length : 1;
            if (decoded.status == DecodeStatus::Invalid)
            {
                if (m_mode == EncodingErrorMode::Strict)
                {
                    return MakeStreamError(StreamErrc::InvalidByteSequence,
                                           fmt::format("\"{}\" on {}", DescribeBytes(rest.substr(0, consumed)),
                                                       ToString(m_source)));
                }
                CONDUIT_LOG_DEBUG("IO.EncodingNormalizer", "replacing invalid \"{}\" on {}",
                                  DescribeBytes(rest.substr(0, consumed)), ToString(m_source));
                AppendReplacement(out);
            }
            else if (!EncodeCodepoint(m_target, decoded.codepoint, out))
            {
                if (m_mode == EncodingErrorMode::Strict)
                {
                    return MakeStreamError(StreamErrc::UndefinedConversion,
                                           fmt::format("U+{:04X} from {} to {}", static_cast<UInt32>(decoded.codepoint),
                                                       ToString(m_source), ToString(m_target)));
                }
                CONDUIT_LOG_DEBUG("IO.EncodingNormalizer", "replacing U+{:04X}, not representable in {}",
                                  static_cast<UInt32>(decoded.codepoint), ToString(m_target));
                AppendReplacement(out);
            }
            rest.remove_prefix(consumed);
        }
        return out;
    }

    StreamExpected<std::string> EncodingNormalizer::Finish()
    {
        if (m_pending.empty())
            return std::string {};

        const std::string pending = std::move(m_pending);
        m_pending.clear();
        if (m_mode == EncodingErrorMode::Strict)
        {
            return MakeStreamError(StreamErrc::InvalidByteSequence,
                                   fmt::format("incomplete \"{}\" on {}", DescribeBytes(pending), ToString(m_source)));
        }

        std::string out;
        AppendReplacement(out);
        return out;
    }
}// namespace Conduit::IO
