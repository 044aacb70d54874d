#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "ociauth/auth/repository-address.hh"
#include "ociauth/util/tests/gmock-matchers.hh"

namespace ociauth {

TEST(parseRepositoryAddressPrefix, domainOnly)
{
    EXPECT_EQ(parseRepositoryAddressPrefix("example.com"), (RepositoryAddress{.registryDomain = "example.com"}));
    EXPECT_EQ(
        parseRepositoryAddressPrefix("localhost:5000"), (RepositoryAddress{.registryDomain = "localhost:5000"}));
}

TEST(parseRepositoryAddressPrefix, domainAndPath)
{
    EXPECT_EQ(
        parseRepositoryAddressPrefix("example.com/foo/bar-baz"),
        (RepositoryAddress{.registryDomain = "example.com", .repositoryPath = "foo/bar-baz"}));
    EXPECT_EQ(
        parseRepositoryAddressPrefix("registry.example.com:443/a.b/c__d/e--f"),
        (RepositoryAddress{.registryDomain = "registry.example.com:443", .repositoryPath = "a.b/c__d/e--f"}));
}

TEST(parseRepositoryAddressPrefix, rejectsTagsAndDigests)
{
    EXPECT_THAT(
        []() { parseRepositoryAddressPrefix("example.com/foo:latest"); },
        ::testing::ThrowsMessage<BadRepositoryAddress>(testing::HasSubstrIgnoreANSI("must not include a tag or digest")));
    EXPECT_THAT(
        []() { parseRepositoryAddressPrefix("example.com/foo@sha256:abcd"); },
        ::testing::ThrowsMessage<BadRepositoryAddress>(testing::HasSubstrIgnoreANSI("must not include a tag or digest")));
}

TEST(parseRepositoryAddressPrefix, rejectsInvalidSyntax)
{
    EXPECT_THROW(parseRepositoryAddressPrefix(""), BadRepositoryAddress);
    EXPECT_THROW(parseRepositoryAddressPrefix("/foo"), BadRepositoryAddress);
    EXPECT_THROW(parseRepositoryAddressPrefix("example.com/"), BadRepositoryAddress);
    EXPECT_THROW(parseRepositoryAddressPrefix("example.com//foo"), BadRepositoryAddress);
    EXPECT_THROW(parseRepositoryAddressPrefix("example.com/Foo"), BadRepositoryAddress);
    EXPECT_THROW(parseRepositoryAddressPrefix("example.com/-foo"), BadRepositoryAddress);
    EXPECT_THROW(parseRepositoryAddressPrefix("exa_mple.com/foo"), BadRepositoryAddress);
    EXPECT_THROW(parseRepositoryAddressPrefix("example.com:http/foo"), BadRepositoryAddress);

    EXPECT_THAT(
        []() { parseRepositoryAddressPrefix("example.com/in$valid"); },
        ::testing::ThrowsMessage<BadRepositoryAddress>(
            testing::HasSubstrIgnoreANSI("invalid repository \"example.com/in$valid\"")));
}

TEST(parseRepositoryAddress, requiresPath)
{
    EXPECT_EQ(
        parseRepositoryAddress("example.com/foo"),
        (RepositoryAddress{.registryDomain = "example.com", .repositoryPath = "foo"}));
    EXPECT_THROW(parseRepositoryAddress("example.com"), BadRepositoryAddress);
}

TEST(RepositoryAddress, to_string)
{
    EXPECT_EQ(parseRepositoryAddressPrefix("example.com").to_string(), "example.com");
    EXPECT_EQ(parseRepositoryAddressPrefix("example.com/a/b").to_string(), "example.com/a/b");
}

} // namespace ociauth
