#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <filesystem>
#include <fstream>

#include <unistd.h>

#include "ociauth/auth/errors.hh"
#include "ociauth/auth/lookup-environment.hh"
#include "ociauth/auth/tests/fake-environments.hh"
#include "ociauth/util/environment-variables.hh"
#include "ociauth/util/tests/gmock-matchers.hh"

namespace ociauth {

using ::testing::Return;
using ::testing::Throw;

TEST(validDockerCredentialHelperName, validation)
{
    EXPECT_TRUE(validDockerCredentialHelperName("osxkeychain"));
    EXPECT_TRUE(validDockerCredentialHelperName("ecr-login"));
    EXPECT_FALSE(validDockerCredentialHelperName(""));
    EXPECT_FALSE(validDockerCredentialHelperName("../evil"));
    EXPECT_FALSE(validDockerCredentialHelperName("a/b"));
    EXPECT_FALSE(validDockerCredentialHelperName("a\\b"));
}

TEST(parseDockerCredentialHelperOutput, complete)
{
    EXPECT_EQ(
        parseDockerCredentialHelperOutput(
            "h", "https://example.com", R"({"ServerURL": "https://other.example.com", "Username": "u", "Secret": "s"})"),
        (DockerCredentialHelperGetResult{.serverURL = "https://other.example.com", .username = "u", .secret = "s"}));
}

TEST(parseDockerCredentialHelperOutput, serverURLDefaultsToRequest)
{
    EXPECT_EQ(
        parseDockerCredentialHelperOutput("h", "https://example.com", R"({"Username": "u", "Secret": "s"})"),
        (DockerCredentialHelperGetResult{.serverURL = "https://example.com", .username = "u", .secret = "s"}));
}

TEST(parseDockerCredentialHelperOutput, malformed)
{
    EXPECT_THROW(parseDockerCredentialHelperOutput("h", "https://example.com", "nope"), CredentialHelperError);
    EXPECT_THROW(parseDockerCredentialHelperOutput("h", "https://example.com", "[]"), CredentialHelperError);
    EXPECT_THROW(
        parseDockerCredentialHelperOutput("h", "https://example.com", R"({"Username": "u"})"), CredentialHelperError);
    EXPECT_THAT(
        []() { parseDockerCredentialHelperOutput("h", "https://example.com", R"({"Username": 1, "Secret": "s"})"); },
        ::testing::ThrowsMessage<CredentialHelperError>(
            testing::HasSubstrIgnoreANSI("Docker credential helper 'h' for 'https://example.com'")));
}

/* ----------------------------------------------------------------------------
 * CachingCredentialsLookupEnvironment
 * --------------------------------------------------------------------------*/

class CachingCredentialsLookupEnvironmentTest : public ::testing::Test
{
protected:
    std::shared_ptr<MockCredentialsLookupEnvironment> mock = std::make_shared<MockCredentialsLookupEnvironment>();
    CachingCredentialsLookupEnvironment::Clock::time_point currentTime;

    CachingCredentialsLookupEnvironment makeCache(std::chrono::seconds ttl)
    {
        return CachingCredentialsLookupEnvironment(mock, ttl, [this]() { return currentTime; });
    }

    const DockerCredentialHelperGetResult result{
        .serverURL = "https://example.com",
        .username = "u",
        .secret = "s",
    };
};

TEST_F(CachingCredentialsLookupEnvironmentTest, remembersResults)
{
    EXPECT_CALL(*mock, queryDockerCredentialHelper("h", "https://example.com")).Times(1).WillOnce(Return(result));

    auto cache = makeCache(std::chrono::minutes(5));
    EXPECT_EQ(cache.queryDockerCredentialHelper("h", "https://example.com"), result);
    currentTime += std::chrono::minutes(4);
    EXPECT_EQ(cache.queryDockerCredentialHelper("h", "https://example.com"), result);
}

TEST_F(CachingCredentialsLookupEnvironmentTest, keysOnHelperAndServer)
{
    EXPECT_CALL(*mock, queryDockerCredentialHelper).Times(3).WillRepeatedly(Return(result));

    auto cache = makeCache(std::chrono::minutes(5));
    cache.queryDockerCredentialHelper("h", "https://example.com");
    cache.queryDockerCredentialHelper("h", "https://example.net");
    cache.queryDockerCredentialHelper("other", "https://example.com");
    cache.queryDockerCredentialHelper("h", "https://example.com");
}

TEST_F(CachingCredentialsLookupEnvironmentTest, expires)
{
    EXPECT_CALL(*mock, queryDockerCredentialHelper).Times(2).WillRepeatedly(Return(result));

    auto cache = makeCache(std::chrono::minutes(5));
    cache.queryDockerCredentialHelper("h", "https://example.com");
    currentTime += std::chrono::minutes(5);
    cache.queryDockerCredentialHelper("h", "https://example.com");
}

TEST_F(CachingCredentialsLookupEnvironmentTest, dropsExpiredEntries)
{
    EXPECT_CALL(*mock, queryDockerCredentialHelper).Times(4).WillRepeatedly(Return(result));

    auto cache = makeCache(std::chrono::minutes(5));
    cache.queryDockerCredentialHelper("h", "https://example.com");
    cache.queryDockerCredentialHelper("h", "https://example.net");
    EXPECT_EQ(cache.size(), 2u);

    currentTime += std::chrono::minutes(3);
    cache.queryDockerCredentialHelper("h", "https://example.org");
    EXPECT_EQ(cache.size(), 3u);

    /* The first two have expired, the third hasn't. */
    currentTime += std::chrono::minutes(3);
    cache.queryDockerCredentialHelper("other", "https://example.com");
    EXPECT_EQ(cache.size(), 2u);
}

TEST_F(CachingCredentialsLookupEnvironmentTest, remembersNotFound)
{
    EXPECT_CALL(*mock, queryDockerCredentialHelper)
        .Times(1)
        .WillOnce(Throw(CredentialsNotFoundError("nothing for %s", "https://example.com")));

    auto cache = makeCache(std::chrono::minutes(5));
    EXPECT_THROW(cache.queryDockerCredentialHelper("h", "https://example.com"), CredentialsNotFoundError);
    EXPECT_THROW(cache.queryDockerCredentialHelper("h", "https://example.com"), CredentialsNotFoundError);
}

TEST_F(CachingCredentialsLookupEnvironmentTest, zeroTTLDisablesCaching)
{
    EXPECT_CALL(*mock, queryDockerCredentialHelper).Times(2).WillRepeatedly(Return(result));

    auto cache = makeCache(std::chrono::seconds(0));
    cache.queryDockerCredentialHelper("h", "https://example.com");
    cache.queryDockerCredentialHelper("h", "https://example.com");
}

/* ----------------------------------------------------------------------------
 * ExecCredentialsLookupEnvironment, against a helper script on PATH
 * --------------------------------------------------------------------------*/

class ExecCredentialsLookupEnvironmentTest : public ::testing::Test
{
protected:
    std::filesystem::path binDir;
    std::optional<std::string> oldPath;

    void SetUp() override
    {
        binDir = std::filesystem::temp_directory_path()
                 / ("ociauth-tests-" + std::to_string(getpid()) + "-"
                    + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(binDir);

        auto script = binDir / "docker-credential-ociauth-test";
        {
            std::ofstream out(script);
            out << R"(#!/bin/sh
read url
case "$url" in
    https://example.com)
        echo '{"ServerURL":"https://example.com","Username":"bob","Secret":"s3cret"}' ;;
    https://nourl.example.com)
        echo '{"Username":"alice","Secret":"pw"}' ;;
    https://garbage.example.com)
        echo 'this is not JSON' ;;
    https://broken.example.com)
        echo 'something went wrong'
        exit 2 ;;
    *)
        echo 'credentials not found in native keychain'
        exit 1 ;;
esac
)";
        }
        std::filesystem::permissions(
            script,
            std::filesystem::perms::owner_all | std::filesystem::perms::group_read | std::filesystem::perms::group_exec);

        oldPath = getEnv("PATH");
        setEnv("PATH", (binDir.string() + ":" + oldPath.value_or("/usr/bin:/bin")).c_str());
    }

    void TearDown() override
    {
        if (oldPath)
            setEnv("PATH", oldPath->c_str());
        std::filesystem::remove_all(binDir);
    }

    ExecCredentialsLookupEnvironment env;
};

TEST_F(ExecCredentialsLookupEnvironmentTest, success)
{
    EXPECT_EQ(
        env.queryDockerCredentialHelper("ociauth-test", "https://example.com"),
        (DockerCredentialHelperGetResult{.serverURL = "https://example.com", .username = "bob", .secret = "s3cret"}));
    EXPECT_EQ(
        env.queryDockerCredentialHelper("ociauth-test", "https://nourl.example.com"),
        (DockerCredentialHelperGetResult{.serverURL = "https://nourl.example.com", .username = "alice", .secret = "pw"}));
}

TEST_F(ExecCredentialsLookupEnvironmentTest, notFound)
{
    try {
        env.queryDockerCredentialHelper("ociauth-test", "https://unknown.example.com");
        FAIL() << "expected an exception";
    } catch (Error & e) {
        EXPECT_TRUE(isCredentialsNotFoundError(e));
    }
}

TEST_F(ExecCredentialsLookupEnvironmentTest, failure)
{
    EXPECT_THAT(
        [&]() { env.queryDockerCredentialHelper("ociauth-test", "https://broken.example.com"); },
        ::testing::ThrowsMessage<CredentialHelperError>(testing::HasSubstrIgnoreANSI("something went wrong")));
    EXPECT_THROW(
        env.queryDockerCredentialHelper("ociauth-test", "https://garbage.example.com"), CredentialHelperError);
}

TEST_F(ExecCredentialsLookupEnvironmentTest, missingHelper)
{
    EXPECT_THAT(
        [&]() { env.queryDockerCredentialHelper("ociauth-does-not-exist", "https://example.com"); },
        ::testing::ThrowsMessage<CredentialHelperError>(testing::HasSubstrIgnoreANSI("is it installed")));
}

TEST_F(ExecCredentialsLookupEnvironmentTest, invalidName)
{
    EXPECT_THROW(env.queryDockerCredentialHelper("../ociauth-test", "https://example.com"), CredentialHelperError);
}

} // namespace ociauth
