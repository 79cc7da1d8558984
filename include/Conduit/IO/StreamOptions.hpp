/// @file StreamOptions.hpp
/// @brief Construction-time configuration for a BufferedStream.
#pragma once

#include <Conduit/IO/EncodingNormalizer.hpp>
#include <Conduit/IO/RetryPolicy.hpp>
#include <Conduit/IO/TextEncoding.hpp>
#include <Conduit/Primitives.hpp>

#include <optional>
#include <string>

namespace Conduit::IO
{
    struct StreamOptions final
    {
        /// Encoding consumers see.
        TextEncoding externalEncoding {TextEncoding::Utf8};
        /// Encoding of the bytes the resource produces.
        TextEncoding      sourceEncoding {TextEncoding::Utf8};
        EncodingErrorMode encodingErrors {EncodingErrorMode::Strict};
        /// Default separator for Gets/ReadLine/EachLine and the terminator appended by Puts.
        std::string lineSeparator {"\n"};
        RetryPolicy retry {};

        bool                 sync {false};
        bool                 binmode {false};
        bool                 tty {false};
        bool                 autoclose {true};
        bool                 closeOnExec {true};
        std::optional<Int64> pid {};
    };
}// namespace Conduit::IO
