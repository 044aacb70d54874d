#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "ociauth/auth/credentials-config.hh"
#include "ociauth/auth/errors.hh"
#include "ociauth/util/tests/gmock-matchers.hh"

namespace ociauth {

/**
 * A layer that offers a fixed list of candidates regardless of the
 * repository asked about.
 */
class FixedCredentialsConfig : public CredentialsConfig
{
    std::string location;
    std::vector<CredentialsSourceCandidate> candidates;

public:
    FixedCredentialsConfig(std::string location, std::vector<CredentialsSourceCandidate> candidates)
        : location(std::move(location))
        , candidates(std::move(candidates))
    {
    }

    void credentialsSourcesForRepository(std::string_view, std::string_view, const CredentialsSourceSink & sink) const override
    {
        for (auto & candidate : candidates)
            if (!sink(candidate))
                return;
    }

    std::string locationForUI() const override
    {
        return location;
    }
};

static CredentialsSourceCandidate staticCandidate(std::string username, CredentialsSpecificity specificity)
{
    return {.source = StaticCredentialsSource{
                .credentials = Credentials::basicAuth(std::move(username), "password"),
                .specificity = specificity,
            }};
}

template<typename E>
static CredentialsSourceCandidate errorCandidate(E && e)
{
    return {.error = std::make_exception_ptr(std::forward<E>(e))};
}

static std::string usernameOf(const CredentialsSource & source)
{
    auto & s = std::get<StaticCredentialsSource>(source.raw());
    return std::get<BasicAuthCredentials>(s.credentials.raw()).username;
}

TEST(CredentialsConfigs, noLayersMeansNotFound)
{
    CredentialsConfigs configs;
    try {
        configs.credentialsSourceForRepository("example.com", "foo/bar");
        FAIL() << "expected an exception";
    } catch (Error & e) {
        EXPECT_TRUE(isCredentialsNotFoundError(e));
        EXPECT_THAT(e.what(), testing::HasSubstrIgnoreANSI("no credentials configured for 'example.com/foo/bar'"));
    }
}

TEST(CredentialsConfigs, firstDeclaredWinsTies)
{
    CredentialsConfigs configs({
        make_ref<FixedCredentialsConfig>(
            "first", std::vector{staticCandidate("first-user", CredentialsSpecificity::domain())}),
        make_ref<FixedCredentialsConfig>(
            "second", std::vector{staticCandidate("second-user", CredentialsSpecificity::domain())}),
    });

    auto result = configs.credentialsSourceForRepository("example.com", "");
    EXPECT_EQ(usernameOf(result.source), "first-user");
    EXPECT_EQ(result.location, "first");
    EXPECT_FALSE(result.errors);
}

TEST(CredentialsConfigs, firstDeclaredWinsTiesWithinLayer)
{
    CredentialsConfigs configs({
        make_ref<FixedCredentialsConfig>(
            "only",
            std::vector{
                staticCandidate("a", CredentialsSpecificity::repository(1)),
                staticCandidate("b", CredentialsSpecificity::repository(1)),
            }),
    });

    EXPECT_EQ(usernameOf(configs.credentialsSourceForRepository("example.com", "foo").source), "a");
}

TEST(CredentialsConfigs, moreSpecificWinsRegardlessOfOrder)
{
    CredentialsConfigs configs({
        make_ref<FixedCredentialsConfig>(
            "general", std::vector{staticCandidate("general-user", CredentialsSpecificity::global())}),
        make_ref<FixedCredentialsConfig>(
            "specific", std::vector{staticCandidate("specific-user", CredentialsSpecificity::repository(2))}),
        make_ref<FixedCredentialsConfig>(
            "domain", std::vector{staticCandidate("domain-user", CredentialsSpecificity::domain())}),
    });

    auto result = configs.credentialsSourceForRepository("example.com", "foo/bar");
    EXPECT_EQ(usernameOf(result.source), "specific-user");
    EXPECT_EQ(result.source.specificity(), CredentialsSpecificity::repository(2));
}

TEST(CredentialsConfigs, notFoundCandidatesAreIgnored)
{
    CredentialsConfigs configs({
        make_ref<FixedCredentialsConfig>(
            "quiet",
            std::vector{
                errorCandidate(CredentialsNotFoundError("nothing here")),
                staticCandidate("user", CredentialsSpecificity::global()),
            }),
    });

    auto result = configs.credentialsSourceForRepository("example.com", "");
    EXPECT_EQ(usernameOf(result.source), "user");
    EXPECT_FALSE(result.errors);
}

TEST(CredentialsConfigs, otherErrorsAccompanyTheResult)
{
    CredentialsConfigs configs({
        make_ref<FixedCredentialsConfig>("broken", std::vector{errorCandidate(Error("malformed entry"))}),
        make_ref<FixedCredentialsConfig>(
            "good", std::vector{staticCandidate("user", CredentialsSpecificity::domain())}),
        make_ref<FixedCredentialsConfig>("also broken", std::vector{errorCandidate(Error("another problem"))}),
    });

    auto result = configs.credentialsSourceForRepository("example.com", "");
    EXPECT_EQ(usernameOf(result.source), "user");
    ASSERT_TRUE(result.errors);

    try {
        std::rethrow_exception(result.errors);
    } catch (JoinedError & e) {
        EXPECT_EQ(e.getErrors().size(), 2u);
        EXPECT_THAT(e.what(), testing::HasSubstrIgnoreANSI("broken: malformed entry"));
        EXPECT_THAT(e.what(), testing::HasSubstrIgnoreANSI("also broken: another problem"));
        EXPECT_FALSE(isCredentialsNotFoundError(e));
    }
}

TEST(CredentialsConfigs, errorsWithoutResultStillCountAsNotFound)
{
    CredentialsConfigs configs({
        make_ref<FixedCredentialsConfig>("broken", std::vector{errorCandidate(Error("malformed entry"))}),
    });

    try {
        configs.credentialsSourceForRepository("example.com", "");
        FAIL() << "expected an exception";
    } catch (JoinedError & e) {
        EXPECT_TRUE(isCredentialsNotFoundError(e));
        EXPECT_THAT(e.what(), testing::HasSubstrIgnoreANSI("broken: malformed entry"));
    }
}

TEST(CredentialsConfigs, noneSpecificityNeverWins)
{
    CredentialsConfigs configs({
        make_ref<FixedCredentialsConfig>(
            "odd", std::vector{staticCandidate("user", CredentialsSpecificity::none())}),
    });

    try {
        configs.credentialsSourceForRepository("example.com", "");
        FAIL() << "expected an exception";
    } catch (Error & e) {
        EXPECT_TRUE(isCredentialsNotFoundError(e));
    }
}

TEST(CredentialsConfigs, allConfigsKeepsOrder)
{
    CredentialsConfigs configs({
        make_ref<FixedCredentialsConfig>("one", std::vector<CredentialsSourceCandidate>{}),
        make_ref<GlobalDockerCredentialHelperCredentialsConfig>("two", "helper"),
    });

    ASSERT_EQ(configs.allConfigs().size(), 2u);
    EXPECT_EQ(configs.allConfigs()[0]->locationForUI(), "one");
    EXPECT_EQ(configs.allConfigs()[1]->locationForUI(), "two");
}

TEST(GlobalDockerCredentialHelperCredentialsConfig, matchesEverythingGlobally)
{
    GlobalDockerCredentialHelperCredentialsConfig config("oci_default_credentials block", "fake");

    std::vector<CredentialsSourceCandidate> candidates;
    config.credentialsSourcesForRepository("example.net", "foo/bar", [&](CredentialsSourceCandidate c) {
        candidates.push_back(std::move(c));
        return true;
    });

    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(
        *candidates[0].source,
        (CredentialsSource{DockerCredentialHelperCredentialsSource{
            .helperName = "fake",
            .serverURL = "https://example.net",
            .specificity = CredentialsSpecificity::global(),
        }}));
    EXPECT_EQ(config.locationForUI(), "oci_default_credentials block");
}

} // namespace ociauth
