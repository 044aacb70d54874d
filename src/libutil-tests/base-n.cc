#include <gtest/gtest.h>

#include "ociauth/util/base-n.hh"
#include "ociauth/util/error.hh"

namespace ociauth {

static std::string encodeString(std::string_view s)
{
    return base64::encode(std::as_bytes(std::span<const char>{s.data(), s.size()}));
}

TEST(base64Encode, emptyString)
{
    EXPECT_EQ(encodeString(""), "");
}

TEST(base64Encode, padding)
{
    EXPECT_EQ(encodeString("f"), "Zg==");
    EXPECT_EQ(encodeString("fo"), "Zm8=");
    EXPECT_EQ(encodeString("foo"), "Zm9v");
    EXPECT_EQ(encodeString("alice:secret"), "YWxpY2U6c2VjcmV0");
}

TEST(base64Encode, encodedLength)
{
    for (std::string s : {"", "a", "ab", "abc", "abcd", "abcde"})
        EXPECT_EQ(encodeString(s).size(), base64::encodedLength(s.size())) << s;
}

TEST(base64Decode, basic)
{
    EXPECT_EQ(base64::decode("YWxpY2U6c2VjcmV0"), "alice:secret");
    EXPECT_EQ(base64::decode("Zm8="), "fo");
}

TEST(base64Decode, missingPadding)
{
    EXPECT_EQ(base64::decode("Zm8"), "fo");
    EXPECT_EQ(base64::decode("Zg"), "f");
}

TEST(base64Decode, ignoresNewlines)
{
    EXPECT_EQ(base64::decode("Zm9v\nYmFy\n"), "foobar");
}

TEST(base64Decode, invalidCharacter)
{
    EXPECT_THROW(base64::decode("Zm9v!"), FormatError);
    EXPECT_THROW(base64::decode("not base64"), FormatError);
}

} // namespace ociauth
