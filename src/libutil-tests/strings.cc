#include <gtest/gtest.h>

#include "lbrun/util/strings.hh"

namespace lbrun {

/* ----------------------------------------------------------------------------
 * concatStringsSep
 * --------------------------------------------------------------------------*/

TEST(concatStringsSep, empty)
{
    Strings strings;

    ASSERT_EQ(concatStringsSep(",", strings), "");
}

TEST(concatStringsSep, justOne)
{
    Strings strings;
    strings.push_back("this");

    ASSERT_EQ(concatStringsSep(",", strings), "this");
}

TEST(concatStringsSep, emptyStrings)
{
    Strings strings;
    strings.push_back("");
    strings.push_back("");

    ASSERT_EQ(concatStringsSep(",", strings), ",");
}

TEST(concatStringsSep, buildsCommaSeparatedString)
{
    Strings strings;
    strings.push_back("this");
    strings.push_back("is");
    strings.push_back("great");

    ASSERT_EQ(concatStringsSep(",", strings), "this,is,great");
}

TEST(concatMapStringsSep, appliesFunction)
{
    std::vector<std::string> exts{"iso", "zsync"};

    ASSERT_EQ(concatMapStringsSep(" ", exts, [](const std::string & s) { return "*." + s; }), "*.iso *.zsync");
}

/* ----------------------------------------------------------------------------
 * tokenizeString
 * --------------------------------------------------------------------------*/

TEST(tokenizeString, empty)
{
    Strings expected = {};

    ASSERT_EQ(tokenizeString<Strings>(""), expected);
}

TEST(tokenizeString, oneSep)
{
    Strings expected = {};

    ASSERT_EQ(tokenizeString<Strings>(" "), expected);
}

TEST(tokenizeString, tokenizeSpacesWithDefaults)
{
    auto s = "foo bar baz";
    Strings expected = {"foo", "bar", "baz"};

    ASSERT_EQ(tokenizeString<Strings>(s), expected);
}

TEST(tokenizeString, tokenizeMixedWhitespace)
{
    auto s = "  foo\tbar\n\n baz\r\n";
    std::vector<std::string> expected = {"foo", "bar", "baz"};

    ASSERT_EQ(tokenizeString<std::vector<std::string>>(s), expected);
}

TEST(tokenizeString, tokenizeSepEmpty)
{
    auto s = "foo,,baz";
    Strings expected = {"foo", "baz"};

    ASSERT_EQ(tokenizeString<Strings>(s, ","), expected);
}

/* ----------------------------------------------------------------------------
 * trim
 * --------------------------------------------------------------------------*/

TEST(trim, removesSurroundingWhitespace)
{
    ASSERT_EQ(trim("  foo bar \n"), "foo bar");
    ASSERT_EQ(trim("\t\n"), "");
    ASSERT_EQ(trim(""), "");
    ASSERT_EQ(trim("--x--", "-"), "x");
}

/* ----------------------------------------------------------------------------
 * shellEscape
 * --------------------------------------------------------------------------*/

TEST(shellEscape, emptyString)
{
    ASSERT_EQ(shellEscape(""), "''");
}

TEST(shellEscape, plainWord)
{
    ASSERT_EQ(shellEscape("minimal"), "'minimal'");
}

TEST(shellEscape, metacharactersAreQuoted)
{
    ASSERT_EQ(shellEscape("https://example.org/lb.git; rm -rf /"), "'https://example.org/lb.git; rm -rf /'");
    ASSERT_EQ(shellEscape("$HOME `id`"), "'$HOME `id`'");
}

TEST(shellEscape, singleQuotes)
{
    ASSERT_EQ(shellEscape("I didn't know"), "'I didn'\\''t know'");
}

/* ----------------------------------------------------------------------------
 * stripIndentation
 * --------------------------------------------------------------------------*/

TEST(stripIndentation, singleLine)
{
    ASSERT_EQ(stripIndentation("description"), "description\n");
}

TEST(stripIndentation, commonIndentIsRemoved)
{
    ASSERT_EQ(stripIndentation("    foo\n      bar\n"), "foo\n  bar\n");
}

} // namespace lbrun
