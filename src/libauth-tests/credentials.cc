#include <gtest/gtest.h>

#include <sstream>

#include "ociauth/auth/credentials.hh"
#include "ociauth/auth/credentials-source.hh"
#include "ociauth/auth/errors.hh"
#include "ociauth/auth/tests/fake-environments.hh"

namespace ociauth {

using ::testing::Return;
using ::testing::Throw;

static std::string printed(const auto & x)
{
    std::ostringstream str;
    str << x;
    return str.str();
}

TEST(Credentials, basicAuthToRegistryAuth)
{
    auto creds = Credentials::basicAuth("bob", "secret");
    EXPECT_EQ(creds.toRegistryAuth(), (RegistryAuth{.username = "bob", .password = "secret"}));
}

TEST(Credentials, oauthToRegistryAuth)
{
    auto creds = Credentials::oauth("access", "refresh");
    EXPECT_EQ(creds.toRegistryAuth(), (RegistryAuth{.accessToken = "access", .refreshToken = "refresh"}));
}

TEST(Credentials, printingHidesSecrets)
{
    auto basic = printed(Credentials::basicAuth("bob", "hunter2"));
    EXPECT_NE(basic.find("bob"), std::string::npos);
    EXPECT_EQ(basic.find("hunter2"), std::string::npos);

    auto oauth = printed(Credentials::oauth("at-secret", "rt-secret"));
    EXPECT_EQ(oauth.find("at-secret"), std::string::npos);
    EXPECT_EQ(oauth.find("rt-secret"), std::string::npos);
}

TEST(Credentials, kindsAreDistinct)
{
    EXPECT_NE(Credentials::basicAuth("a", "b"), Credentials::oauth("a", "b"));
    EXPECT_EQ(Credentials::basicAuth("a", "b"), Credentials::basicAuth("a", "b"));
}

TEST(CredentialsSource, staticSourceNeedsNoLookup)
{
    MockCredentialsLookupEnvironment env;
    EXPECT_CALL(env, queryDockerCredentialHelper).Times(0);

    CredentialsSource source = StaticCredentialsSource{
        .credentials = Credentials::oauth("access", "refresh"),
        .specificity = CredentialsSpecificity::repository(2),
    };

    EXPECT_EQ(source.specificity(), CredentialsSpecificity::repository(2));
    EXPECT_EQ(source.credentials(env), Credentials::oauth("access", "refresh"));
}

TEST(CredentialsSource, helperSourceQueriesHelper)
{
    MockCredentialsLookupEnvironment env;
    EXPECT_CALL(env, queryDockerCredentialHelper("osxkeychain", "https://example.com"))
        .WillOnce(Return(DockerCredentialHelperGetResult{
            .serverURL = "https://example.com",
            .username = "from-helper",
            .secret = "helper-secret",
        }));

    CredentialsSource source = DockerCredentialHelperCredentialsSource{
        .helperName = "osxkeychain",
        .serverURL = "https://example.com",
        .specificity = CredentialsSpecificity::domain(),
    };

    EXPECT_EQ(source.specificity(), CredentialsSpecificity::domain());
    EXPECT_EQ(source.credentials(env), Credentials::basicAuth("from-helper", "helper-secret"));
}

TEST(CredentialsSource, helperNotFoundPropagates)
{
    MockCredentialsLookupEnvironment env;
    EXPECT_CALL(env, queryDockerCredentialHelper)
        .WillOnce(Throw(CredentialsNotFoundError("nothing for %s", "https://example.com")));

    CredentialsSource source = DockerCredentialHelperCredentialsSource{
        .helperName = "pass",
        .serverURL = "https://example.com",
        .specificity = CredentialsSpecificity::global(),
    };

    try {
        source.credentials(env);
        FAIL() << "expected an exception";
    } catch (Error & e) {
        EXPECT_TRUE(isCredentialsNotFoundError(e));
    }
}

TEST(CredentialsSource, describeHidesSecrets)
{
    CredentialsSource source = StaticCredentialsSource{
        .credentials = Credentials::basicAuth("bob", "hunter2"),
        .specificity = CredentialsSpecificity::domain(),
    };
    auto s = printed(source);
    EXPECT_EQ(s.find("hunter2"), std::string::npos);
    EXPECT_NE(s.find("domain"), std::string::npos);
}

TEST(isCredentialsNotFoundError, seesThroughJoinedErrors)
{
    EXPECT_TRUE(isCredentialsNotFoundError(CredentialsNotFoundError("nope")));
    EXPECT_FALSE(isCredentialsNotFoundError(Error("broken")));
    EXPECT_FALSE(isCredentialsNotFoundError(std::exception_ptr()));

    JoinedError joined({
        std::make_exception_ptr(Error("broken")),
        std::make_exception_ptr(CredentialsNotFoundError("nope")),
    });
    EXPECT_TRUE(isCredentialsNotFoundError(joined));
    EXPECT_TRUE(isCredentialsNotFoundError(std::make_exception_ptr(joined)));

    JoinedError nested({std::make_exception_ptr(joined)});
    EXPECT_TRUE(isCredentialsNotFoundError(nested));

    JoinedError unrelated({std::make_exception_ptr(Error("a")), std::make_exception_ptr(Error("b"))});
    EXPECT_FALSE(isCredentialsNotFoundError(unrelated));
}

} // namespace ociauth
