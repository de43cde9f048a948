#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "polyglot/core/KeyEncoder.hpp"

#include <string>
#include <vector>

using polyglot::core::KeyEncoder;

namespace {

const std::vector<std::string> kSamples{
    "",
    "plain",
    "line one\nline two",
    "windows\r\nbreak",
    "lonely\rreturn",
    "tilde ~ and ~~ and ~r",
    "list\xC2\xA7separator",
    "[CRLF] literal token",
    "[SECT] and [\xC2\xA7] and [",
    "[[] nested [LF] brackets [",
    "trailing ~",
    "Citt\xC3\xA0 \xE6\x97\xA5\xE6\x9C\xAC \xF0\x9F\x98\x80",
};

} // namespace

TEST_CASE("makeKey produces eight upper-case hex digits of CRC32 over UTF-16") {
    CHECK(KeyEncoder::makeKey("") == "00000000");
    CHECK(KeyEncoder::makeKey("OK") == "F1BE01B9");
    CHECK(KeyEncoder::makeKey("Hello") == "1A4F710F");
    CHECK(KeyEncoder::makeKey("a") == "3D3F4819");
}

TEST_CASE("makeKey hashes non-ASCII text by its UTF-16 code units") {
    CHECK(KeyEncoder::makeKey("Citt\xC3\xA0") == "7333E4B5");
    CHECK(KeyEncoder::makeKey("\xE6\x97\xA5\xE6\x9C\xAC") == "641EF888");
    CHECK(KeyEncoder::makeKey("\xF0\x9F\x98\x80") == "C1F4643B");
}

TEST_CASE("makeKey is deterministic") {
    for (const auto &sample : kSamples) {
        CHECK(KeyEncoder::makeKey(sample) == KeyEncoder::makeKey(sample));
        CHECK(KeyEncoder::makeKey(sample).size() == 8);
    }
    CHECK(KeyEncoder::crc32("Hello") == 0x1A4F710Fu);
}

TEST_CASE("escape replaces line breaks and the list separator") {
    CHECK(KeyEncoder::escape("a\r\nb") == "a[CRLF]b");
    CHECK(KeyEncoder::escape("a\nb") == "a[LF]b");
    CHECK(KeyEncoder::escape("a\rb") == "a[CR]b");
    CHECK(KeyEncoder::escape("a\xC2\xA7"
                             "b") == "a[SECT]b");
    CHECK(KeyEncoder::escape("[LF]") == "[[]LF]");
    CHECK(KeyEncoder::escape("[note]") == "[note]");
}

TEST_CASE("unescape reverses escape") {
    for (const auto &sample : kSamples) {
        CHECK(KeyEncoder::unescape(KeyEncoder::escape(sample)) == sample);
    }
}

TEST_CASE("joinMultiline keeps values on a single line") {
    CHECK(KeyEncoder::joinMultiline("one\ntwo") == "one~~two");
    CHECK(KeyEncoder::joinMultiline("one\r\ntwo") == "one~r~~two");
    CHECK(KeyEncoder::joinMultiline("a~b") == "a~-b");

    for (const auto &sample : kSamples) {
        const auto joined = KeyEncoder::joinMultiline(sample);
        CHECK(joined.find('\n') == std::string::npos);
        CHECK(joined.find('\r') == std::string::npos);
        CHECK(KeyEncoder::restoreMultiline(joined) == sample);
    }
}

TEST_CASE("restoreMultiline copies unknown placeholders literally") {
    CHECK(KeyEncoder::restoreMultiline("a~xb") == "a~xb");
    CHECK(KeyEncoder::restoreMultiline("end~") == "end~");
}

TEST_CASE("normalizeKey escapes assignment and comment characters") {
    CHECK(KeyEncoder::normalizeKey("a=b") == "a[EQUAL]b");
    CHECK(KeyEncoder::normalizeKey("a;b") == "a[SEMICOLON]b");
    CHECK(KeyEncoder::normalizeKey("it's") == "it''s");
    CHECK(KeyEncoder::denormalizeKey(KeyEncoder::normalizeKey("x=1;y='2'")) == "x=1;y='2'");
}
