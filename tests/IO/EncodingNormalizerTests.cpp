#include <catch2/catch_test_macros.hpp>

#include <Conduit/IO/EncodingNormalizer.hpp>

#include "Log/CaptureSink.hpp"

#include <string>

using namespace Conduit::IO;

TEST_CASE("IO.EncodingNormalizer.PassThrough")
{
    EncodingNormalizer same(TextEncoding::Utf8, TextEncoding::Utf8);
    REQUIRE(same.IsPassThrough());
    REQUIRE(*same.Normalize("\xFF\xFE") == "\xFF\xFE");

    EncodingNormalizer binary(TextEncoding::Binary, TextEncoding::Utf16LE);
    REQUIRE(binary.IsPassThrough());
    REQUIRE(*binary.Normalize("\xC3") == "\xC3");
    REQUIRE_FALSE(binary.HasPending());
}

TEST_CASE("IO.EncodingNormalizer.Latin1ToUtf8")
{
    EncodingNormalizer normalizer(TextEncoding::Latin1, TextEncoding::Utf8);
    REQUIRE_FALSE(normalizer.IsPassThrough());
    REQUIRE(*normalizer.Normalize("na\xEFve") == "na\xC3\xAFve");
    REQUIRE(normalizer.Finish()->empty());
}

TEST_CASE("IO.EncodingNormalizer.HoldsBackSplitCharacters")
{
    EncodingNormalizer normalizer(TextEncoding::Utf8, TextEncoding::Utf16BE);

    auto first = normalizer.Normalize("a\xE2\x82");
    REQUIRE(first.has_value());
    REQUIRE(*first == std::string("\x00\x61", 2));
    REQUIRE(normalizer.HasPending());

    auto second = normalizer.Normalize("\xAC");
    REQUIRE(*second == std::string("\x20\xAC", 2));
    REQUIRE_FALSE(normalizer.HasPending());
}

TEST_CASE("IO.EncodingNormalizer.StrictReportsInvalidBytes")
{
    EncodingNormalizer normalizer(TextEncoding::Utf8, TextEncoding::Latin1);

    auto failed = normalizer.Normalize("ok\xFF");
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().code == StreamErrc::InvalidByteSequence);
    REQUIRE(failed.error().message == "\"\\xFF\" on UTF-8");
}

TEST_CASE("IO.EncodingNormalizer.StrictReportsUndefinedConversion")
{
    EncodingNormalizer normalizer(TextEncoding::Utf8, TextEncoding::Latin1);

    auto failed = normalizer.Normalize("\xE2\x82\xAC");
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().code == StreamErrc::UndefinedConversion);
    REQUIRE(failed.error().message == "U+20AC from UTF-8 to ISO-8859-1");
}

TEST_CASE("IO.EncodingNormalizer.StrictFinishRejectsTruncatedTail")
{
    EncodingNormalizer normalizer(TextEncoding::Utf8, TextEncoding::Latin1);
    REQUIRE(normalizer.Normalize("\xC3")->empty());

    auto tail = normalizer.Finish();
    REQUIRE_FALSE(tail.has_value());
    REQUIRE(tail.error().message == "incomplete \"\\xC3\" on UTF-8");
    REQUIRE_FALSE(normalizer.HasPending());
}

TEST_CASE("IO.EncodingNormalizer.ReplaceModeSubstitutes")
{
    ConduitTests::ScopedLogCapture capture(Conduit::Log::Severity::Debug);

    EncodingNormalizer toLatin1(TextEncoding::Utf8, TextEncoding::Latin1, EncodingErrorMode::Replace);
    REQUIRE(*toLatin1.Normalize("\xFF\xE2\x82\xAC!") == "??!");

    EncodingNormalizer toUtf8(TextEncoding::Ascii, TextEncoding::Utf8, EncodingErrorMode::Replace);
    REQUIRE(*toUtf8.Normalize("a\x80") == "a\xEF\xBF\xBD");

    REQUIRE(capture.Records().size() == 3);
    REQUIRE(capture.Records()[0].component == "IO.EncodingNormalizer");
}

TEST_CASE("IO.EncodingNormalizer.ResetDropsPendingBytes")
{
    EncodingNormalizer normalizer(TextEncoding::Utf16LE, TextEncoding::Utf8);
    REQUIRE(normalizer.Normalize("h")->empty());
    REQUIRE(normalizer.HasPending());

    normalizer.Reset();
    REQUIRE_FALSE(normalizer.HasPending());
    REQUIRE(normalizer.Finish()->empty());
    REQUIRE(normalizer.Source() == TextEncoding::Utf16LE);
    REQUIRE(normalizer.Target() == TextEncoding::Utf8);
    REQUIRE(normalizer.Mode() == EncodingErrorMode::Strict);
}
