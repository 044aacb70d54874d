#include <gtest/gtest.h>

#include "ociauth/util/strings.hh"

namespace ociauth {

/* ----------------------------------------------------------------------------
 * tokenizeString
 * --------------------------------------------------------------------------*/

TEST(tokenizeString, empty)
{
    EXPECT_EQ(tokenizeString<Strings>(""), Strings{});
    EXPECT_EQ(tokenizeString<Strings>(" \t\n"), Strings{});
}

TEST(tokenizeString, collapsesSeparators)
{
    EXPECT_EQ(tokenizeString<Strings>("  one two\t\nthree "), (Strings{"one", "two", "three"}));
    EXPECT_EQ(tokenizeString<std::vector<std::string>>("a//b/", "/"), (std::vector<std::string>{"a", "b"}));
}

/* ----------------------------------------------------------------------------
 * splitString
 * --------------------------------------------------------------------------*/

TEST(splitString, keepsEmptyFields)
{
    EXPECT_EQ(splitString<std::vector<std::string>>("", "/"), (std::vector<std::string>{""}));
    EXPECT_EQ(splitString<std::vector<std::string>>("a//b/", "/"), (std::vector<std::string>{"a", "", "b", ""}));
    EXPECT_EQ(splitString<Strings>("foo/bar", "/"), (Strings{"foo", "bar"}));
}

/* ----------------------------------------------------------------------------
 * concatStringsSep
 * --------------------------------------------------------------------------*/

TEST(concatStringsSep, basic)
{
    EXPECT_EQ(concatStringsSep(", ", Strings{}), "");
    EXPECT_EQ(concatStringsSep(", ", Strings{"a"}), "a");
    EXPECT_EQ(concatStringsSep(", ", std::vector<std::string>{"a", "", "c"}), "a, , c");
}

/* ----------------------------------------------------------------------------
 * splitPrefixTo
 * --------------------------------------------------------------------------*/

TEST(splitPrefixTo, splitsAtFirstSeparator)
{
    auto r = splitPrefixTo("user:pass:word", ':');
    ASSERT_TRUE(r);
    EXPECT_EQ(r->first, "user");
    EXPECT_EQ(r->second, "pass:word");
}

TEST(splitPrefixTo, emptyParts)
{
    auto r = splitPrefixTo(":", ':');
    ASSERT_TRUE(r);
    EXPECT_EQ(r->first, "");
    EXPECT_EQ(r->second, "");
}

TEST(splitPrefixTo, noSeparator)
{
    EXPECT_EQ(splitPrefixTo("nocolon", ':'), std::nullopt);
}

/* ----------------------------------------------------------------------------
 * chomp, trim
 * --------------------------------------------------------------------------*/

TEST(chomp, trailingWhitespaceOnly)
{
    EXPECT_EQ(chomp("  foo \n\t"), "  foo");
    EXPECT_EQ(chomp("\n\n"), "");
}

TEST(trim, bothEnds)
{
    EXPECT_EQ(trim("  foo bar \n"), "foo bar");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim("xxfooxx", "x"), "foo");
}

/* ----------------------------------------------------------------------------
 * hasPrefix, hasSuffix, toLower
 * --------------------------------------------------------------------------*/

TEST(hasPrefix, works)
{
    EXPECT_TRUE(hasPrefix("https://example.com", "https://"));
    EXPECT_TRUE(hasPrefix("foo", ""));
    EXPECT_FALSE(hasPrefix("fo", "foo"));
}

TEST(hasSuffix, works)
{
    EXPECT_TRUE(hasSuffix("config.json", ".json"));
    EXPECT_TRUE(hasSuffix("foo", ""));
    EXPECT_FALSE(hasSuffix("on", "json"));
}

TEST(toLower, works)
{
    EXPECT_EQ(toLower("Credentials Not FOUND"), "credentials not found");
}

} // namespace ociauth
