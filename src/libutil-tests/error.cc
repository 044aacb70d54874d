#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "ociauth/util/error.hh"
#include "ociauth/util/tests/gmock-matchers.hh"

namespace ociauth {

using testing::stripANSI;

TEST(BaseError, whatHasPrefix)
{
    Error e("file %s is broken", "foo");
    EXPECT_EQ(stripANSI(e.what()), "error: file foo is broken");
    EXPECT_EQ(stripANSI(e.message()), "file foo is broken");
}

TEST(BaseError, addPrefix)
{
    Error e("unexpected token");
    e.addPrefix("parsing %s: ", "/etc/config.json");
    EXPECT_EQ(stripANSI(e.message()), "parsing /etc/config.json: unexpected token");
    EXPECT_EQ(stripANSI(e.what()), "error: parsing /etc/config.json: unexpected token");
}

TEST(SysError, carriesErrno)
{
    SysError e(ENOENT, "opening file '%s'", "/nonexistent");
    EXPECT_EQ(e.errNo, ENOENT);
    EXPECT_THAT(e.message(), testing::HasSubstrIgnoreANSI("opening file '/nonexistent': No such file or directory"));
}

TEST(JoinedError, oneLinePerError)
{
    std::vector<std::exception_ptr> errors;
    appendError(errors, Error("first problem"));
    appendError(errors, std::runtime_error("second problem"));

    JoinedError e(errors);
    EXPECT_EQ(e.getErrors().size(), 2u);
    EXPECT_EQ(stripANSI(e.message()), "first problem\nsecond problem");
}

TEST(JoinedError, contains)
{
    std::vector<std::exception_ptr> inner;
    appendError(inner, FormatError("bad format"));
    appendError(inner, Error("other"));

    std::vector<std::exception_ptr> outer;
    appendError(outer, UsageError("bad usage"));
    appendError(outer, JoinedError(inner));

    JoinedError e(outer);
    EXPECT_TRUE(e.contains<UsageError>());
    EXPECT_TRUE(e.contains<FormatError>());
    EXPECT_FALSE(e.contains<SysError>());
}

TEST(throwJoinedErrors, nothingToThrow)
{
    EXPECT_NO_THROW(throwJoinedErrors({}));
}

TEST(throwJoinedErrors, singleErrorKeepsItsType)
{
    std::vector<std::exception_ptr> errors;
    appendError(errors, SysError(EACCES, "reading '%s'", "/root/secret"));
    EXPECT_THROW(throwJoinedErrors(errors), SysError);
}

TEST(throwJoinedErrors, severalErrorsAreJoined)
{
    std::vector<std::exception_ptr> errors;
    appendError(errors, Error("a"));
    appendError(errors, Error("b"));
    EXPECT_THAT(
        [&]() { throwJoinedErrors(errors); },
        ::testing::ThrowsMessage<JoinedError>(testing::HasSubstrIgnoreANSI("a\nb")));
}

TEST(exceptionMessage, withoutPrefix)
{
    EXPECT_EQ(stripANSI(exceptionMessage(std::make_exception_ptr(Error("boom")))), "boom");
    EXPECT_EQ(exceptionMessage(std::make_exception_ptr(std::logic_error("plain"))), "plain");
}

} // namespace ociauth
