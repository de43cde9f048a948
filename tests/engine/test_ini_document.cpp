#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "polyglot/engine/IniDocument.hpp"
#include "support/TempDirectory.hpp"

#include <stdexcept>

using polyglot::engine::IniDocument;

TEST_CASE("IniDocument parses sections, skips comments and keeps values verbatim") {
    const auto document = IniDocument::parse("\xEF\xBB\xBF; header comment\r\n"
                                             "[Form1.Button1]\r\n"
                                             "Caption=OK\r\n"
                                             "# another comment\r\n"
                                             "Hint= with = sign \r\n"
                                             "orphan line\r\n"
                                             "\r\n"
                                             "[strings]\n"
                                             "1A4F710F=Bonjour\n");

    REQUIRE(document.sections().size() == 2);
    CHECK(document.sections()[0] == "Form1.Button1");
    CHECK(document.readString("form1.button1", "caption") == "OK");
    CHECK(document.readString("Form1.Button1", "Hint") == " with = sign ");
    CHECK(document.sectionValues("STRINGS").size() == 1);
    CHECK_FALSE(document.read("Form1.Button1", "orphan line").has_value());
}

TEST_CASE("IniDocument ignores entries before the first section") {
    const auto document = IniDocument::parse("Key=Value\n[Section]\nOther=1\n");
    REQUIRE(document.sections().size() == 1);
    CHECK(document.sectionValues("Section").size() == 1);
}

TEST_CASE("IniDocument write replaces existing keys and keeps order") {
    IniDocument document;
    document.write("Language", "Id", "fr");
    document.write("Language", "Name", "French");
    document.write("language", "ID", "fr-FR");

    CHECK(document.toString() == "[Language]\nId=fr-FR\nName=French\n");
}

TEST_CASE("IniDocument reads booleans with a fallback") {
    const auto document = IniDocument::parse("[Language]\nA=1\nB=yes\nC=False\nD=maybe\n");
    CHECK(document.readBool("Language", "A", false));
    CHECK(document.readBool("Language", "B", false));
    CHECK_FALSE(document.readBool("Language", "C", true));
    CHECK(document.readBool("Language", "D", true));
    CHECK_FALSE(document.readBool("Language", "Missing", false));
}

TEST_CASE("IniDocument round trips through a file") {
    polyglot::testing::TempDirectory directory("polyglot_ini_document");
    const auto file = directory.path() / "doc.lng";

    IniDocument document;
    document.write("A", "One", "1");
    document.write("B", "Two", "2");
    document.saveToFile(file);

    const auto reloaded = IniDocument::fromFile(file);
    CHECK(reloaded.toString() == document.toString());
    CHECK_THROWS_WITH_AS(IniDocument::fromFile(directory.path() / "missing.lng"),
                         doctest::Contains("Unable to open"), std::runtime_error);
}
