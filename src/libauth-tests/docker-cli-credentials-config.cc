#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cerrno>
#include <span>

#include "ociauth/auth/docker-cli-credentials-config.hh"
#include "ociauth/auth/errors.hh"
#include "ociauth/auth/tests/fake-environments.hh"
#include "ociauth/util/base-n.hh"
#include "ociauth/util/tests/gmock-matchers.hh"

namespace ociauth {

static std::string base64Of(std::string_view s)
{
    return base64::encode(std::as_bytes(std::span<const char>(s.data(), s.size())));
}

/* ----------------------------------------------------------------------------
 * containersAuthPropertyNameMatch
 * --------------------------------------------------------------------------*/

struct PropertyNameMatchCase
{
    std::string authsPropertyName;
    std::string registryDomain;
    std::string repositoryPath;
    CredentialsSpecificity expected;
};

class ContainersAuthPropertyNameMatchTest : public ::testing::TestWithParam<PropertyNameMatchCase>
{};

TEST_P(ContainersAuthPropertyNameMatchTest, matches)
{
    auto & c = GetParam();
    EXPECT_EQ(containersAuthPropertyNameMatch(c.authsPropertyName, c.registryDomain, c.repositoryPath), c.expected)
        << c.authsPropertyName << " against " << c.registryDomain << "/" << c.repositoryPath;
}

INSTANTIATE_TEST_SUITE_P(
    ContainersAuthPropertyNameMatch,
    ContainersAuthPropertyNameMatchTest,
    ::testing::Values(
        PropertyNameMatchCase{"example.net", "example.net", "foo", CredentialsSpecificity::domain()},
        PropertyNameMatchCase{"example.net", "example.net", "", CredentialsSpecificity::domain()},
        PropertyNameMatchCase{"example.net/foo", "example.net", "foo", CredentialsSpecificity::repository(1)},
        // prefix match
        PropertyNameMatchCase{"example.net/foo", "example.net", "foo/bar", CredentialsSpecificity::repository(1)},
        PropertyNameMatchCase{"example.net/foo/bar", "example.net", "foo", CredentialsSpecificity::none()},
        PropertyNameMatchCase{"example.net/foo/bar", "example.net", "foo/bar", CredentialsSpecificity::repository(2)},
        PropertyNameMatchCase{"example.net/foo/bar", "example.net", "foo/bar/baz", CredentialsSpecificity::repository(2)},
        PropertyNameMatchCase{"example.net/foo/not-bar", "example.net", "foo/bar", CredentialsSpecificity::none()},
        PropertyNameMatchCase{"example.net/not-foo", "example.net", "foo/bar", CredentialsSpecificity::none()},
        PropertyNameMatchCase{"example.net/foo", "example.net", "", CredentialsSpecificity::none()},
        PropertyNameMatchCase{"example.net/fo", "example.net", "foo", CredentialsSpecificity::none()},
        PropertyNameMatchCase{"example.com", "example.net", "foo", CredentialsSpecificity::none()},
        PropertyNameMatchCase{"example.net:5000", "example.net", "foo", CredentialsSpecificity::none()},
        PropertyNameMatchCase{"example.net:5000/foo", "example.net:5000", "foo", CredentialsSpecificity::repository(1)},
        PropertyNameMatchCase{"", "example.net", "foo", CredentialsSpecificity::none()},
        // unparsable property names are ignored rather than being errors
        PropertyNameMatchCase{"example.net/Foo", "example.net", "Foo", CredentialsSpecificity::none()},
        PropertyNameMatchCase{"example.net/foo:latest", "example.net", "foo", CredentialsSpecificity::none()},
        PropertyNameMatchCase{"example.net//foo", "example.net", "foo", CredentialsSpecificity::none()}));

/* ----------------------------------------------------------------------------
 * dockerCLIStyleAuthFileSearchLocations
 * --------------------------------------------------------------------------*/

struct SearchLocationsCase
{
    std::string description;
    std::string osName;
    Path homePath;
    StringMap envVars;
    Paths expected;
};

class DockerCLIStyleAuthFileSearchLocationsTest : public ::testing::TestWithParam<SearchLocationsCase>
{};

TEST_P(DockerCLIStyleAuthFileSearchLocationsTest, locations)
{
    auto & c = GetParam();
    FakeConfigDiscoveryEnvironment env;
    env.osName = c.osName;
    env.homePath = c.homePath;
    env.envVars = c.envVars;
    EXPECT_EQ(dockerCLIStyleAuthFileSearchLocations(env), c.expected) << c.description;
}

INSTANTIATE_TEST_SUITE_P(
    DockerCLIStyleAuthFileSearchLocations,
    DockerCLIStyleAuthFileSearchLocationsTest,
    ::testing::Values(
        SearchLocationsCase{
            .description = "linux with empty environment",
            .osName = "linux",
            .homePath = "/home/example",
            .expected =
                {
                    "/home/example/.config/containers/auth.json",
                    "/home/example/.docker/config.json",
                    "/home/example/.dockercfg",
                },
        },
        SearchLocationsCase{
            .description = "linux with XDG base directory variables",
            .osName = "linux",
            .homePath = "/home/example",
            .envVars =
                {
                    {"XDG_RUNTIME_DIR", "/var/run/12"},
                    {"XDG_CONFIG_HOME", "/home/example/.contrarian-config"},
                },
            .expected =
                {
                    "/var/run/12/containers/auth.json",
                    "/home/example/.contrarian-config/containers/auth.json",
                    "/home/example/.docker/config.json",
                    "/home/example/.dockercfg",
                },
        },
        SearchLocationsCase{
            .description = "linux, as in the documentation",
            .osName = "linux",
            .homePath = "/home/u",
            .envVars =
                {
                    {"XDG_RUNTIME_DIR", "/run/x"},
                    {"XDG_CONFIG_HOME", "/home/u/xdg"},
                },
            .expected =
                {
                    "/run/x/containers/auth.json",
                    "/home/u/xdg/containers/auth.json",
                    "/home/u/.docker/config.json",
                    "/home/u/.dockercfg",
                },
        },
        SearchLocationsCase{
            .description = "windows with empty environment",
            .osName = "windows",
            .homePath = "c:/Users/Example",
            .expected =
                {
                    "c:/Users/Example/.config/containers/auth.json",
                    // repeated because XDG_CONFIG_HOME defaults to the same place
                    "c:/Users/Example/.config/containers/auth.json",
                    "c:/Users/Example/.docker/config.json",
                    "c:/Users/Example/.dockercfg",
                },
        },
        SearchLocationsCase{
            .description = "windows with XDG base directory variables",
            .osName = "windows",
            .homePath = "c:/Users/Example",
            .envVars =
                {
                    {"XDG_RUNTIME_DIR", "c:/Temp/whatever"},
                    {"XDG_CONFIG_HOME", "c:/Users/Example/xdg-config"},
                },
            .expected =
                {
                    "c:/Users/Example/.config/containers/auth.json",
                    "c:/Users/Example/xdg-config/containers/auth.json",
                    "c:/Users/Example/.docker/config.json",
                    "c:/Users/Example/.dockercfg",
                },
        },
        SearchLocationsCase{
            .description = "darwin with empty environment",
            .osName = "darwin",
            .homePath = "/Users/example",
            .expected =
                {
                    "/Users/example/.config/containers/auth.json",
                    "/Users/example/.config/containers/auth.json",
                    "/Users/example/.docker/config.json",
                    "/Users/example/.dockercfg",
                },
        },
        SearchLocationsCase{
            .description = "darwin with XDG base directory variables",
            .osName = "darwin",
            .homePath = "/Users/example",
            .envVars =
                {
                    {"XDG_RUNTIME_DIR", "/System/temp/whatever"},
                    {"XDG_CONFIG_HOME", "/Users/example/xdg-config"},
                },
            .expected =
                {
                    "/Users/example/.config/containers/auth.json",
                    "/Users/example/xdg-config/containers/auth.json",
                    "/Users/example/.docker/config.json",
                    "/Users/example/.dockercfg",
                },
        },
        SearchLocationsCase{
            .description = "other OS with empty environment",
            .osName = "anythingelse",
            .homePath = "/home/example",
            .expected =
                {
                    "/home/example/.config/containers/auth.json",
                    "/home/example/.docker/config.json",
                    "/home/example/.dockercfg",
                },
        },
        SearchLocationsCase{
            .description = "other OS ignores XDG_RUNTIME_DIR",
            .osName = "anythingelse",
            .homePath = "/home/example",
            .envVars =
                {
                    {"XDG_RUNTIME_DIR", "/var/run/12"},
                    {"XDG_CONFIG_HOME", "/home/example/.contrarian-config"},
                },
            .expected =
                {
                    "/home/example/.contrarian-config/containers/auth.json",
                    "/home/example/.docker/config.json",
                    "/home/example/.dockercfg",
                },
        }));

/* ----------------------------------------------------------------------------
 * Resolving against Docker CLI-style files
 * --------------------------------------------------------------------------*/

class DockerCLIStyleAuthTest : public ::testing::Test
{
protected:
    FakeConfigDiscoveryEnvironment configEnv;
    FakeCredentialsLookupEnvironment lookupEnv;
    CredentialsConfigs allCreds;

    void SetUp() override
    {
        configEnv.files["/fake/docker-config-1.json"] = R"({
            "credsStore": "global-helper-1",
            "credHelpers": {
                "example.com": "exampledotcom-helper-1"
            },
            "auths": {
                "example.net": {
                    "auth": ")" + base64Of("exampledotnet-user:exampledotnet-password")
                                                       + R"("
                }
            }
        })";

        configEnv.files["/fake/docker-config-2.json"] = R"({
            "credsStore": "global-helper-2",
            "credHelpers": {
                "example.com": "exampledotcom-helper-2"
            },
            "auths": {
                "example.com": {
                    "auth": ")" + base64Of("exampledotcom-user:exampledotcom-password")
                                                       + R"("
                },
                "example.com/foo": {
                    "auth": ")" + base64Of("exampledotcom-foo-user:exampledotcom-foo-password")
                                                       + R"("
                },
                "example.com/empty": {},
                "example.net/foo": {
                    "auth": ")" + base64Of("exampledotnet-foo-user:exampledotnet-foo-password")
                                                       + R"("
                },
                "example.net/foo/bar": {
                    "auth": ")" + base64Of("exampledotnet-foo-bar-user:exampledotnet-foo-bar-password")
                                                       + R"("
                },
                "example.net/baz": {
                    "auth": ")" + base64Of("exampledotnet-baz-user:exampledotnet-baz-password")
                                                       + R"("
                },
                "example.net/nocolon": {
                    "auth": ")" + base64Of("just-a-username")
                                                       + R"("
                },
                "empty.example.org": {},
                "null.example.org": null,
                "emptystr.example.org": {"auth": ""}
            }
        })";

        allCreds = CredentialsConfigs(
            fixedDockerCLIStyleCredentialsConfigs({"/fake/docker-config-1.json", "/fake/docker-config-2.json"}, configEnv));

        lookupEnv.helperResults = {
            {"exampledotcom-helper-1",
             {
                 {"https://example.com", {.username = "from-exampledotcom-helper-1", .secret = "exampledotcom-helper-1-password"}},
             }},
            {"global-helper-1",
             {
                 {"https://globalcredshelper.example.com", {.username = "from-global-helper-1", .secret = "global-helper-1-password"}},
                 {"https://empty.example.org", {.username = "from-global-helper-1", .secret = "empty.example.org secret"}},
                 {"https://null.example.org", {.username = "from-global-helper-1", .secret = "null.example.org secret"}},
                 {"https://emptystr.example.org", {.username = "from-global-helper-1", .secret = "emptystr.example.org secret"}},
             }},
        };
    }

    void expectResolves(
        std::string_view domain,
        std::string_view path,
        CredentialsSpecificity wantSpecificity,
        std::optional<Credentials> wantCreds)
    {
        SCOPED_TRACE(std::string(domain) + "/" + std::string(path));
        auto result = allCreds.credentialsSourceForRepository(domain, path);
        EXPECT_FALSE(result.errors);
        EXPECT_EQ(result.source.specificity(), wantSpecificity);
        try {
            auto creds = result.source.credentials(lookupEnv);
            ASSERT_TRUE(wantCreds) << "unexpectedly found " << creds;
            EXPECT_EQ(creds, *wantCreds);
        } catch (CredentialsNotFoundError &) {
            EXPECT_FALSE(wantCreds);
        }
    }
};

TEST_F(DockerCLIStyleAuthTest, globalHelperWithoutCredentials)
{
    expectResolves("unconfigured.example.com", "doot", CredentialsSpecificity::global(), std::nullopt);
}

TEST_F(DockerCLIStyleAuthTest, globalHelperFromFirstFile)
{
    expectResolves(
        "globalcredshelper.example.com",
        "doot",
        CredentialsSpecificity::global(),
        Credentials::basicAuth("from-global-helper-1", "global-helper-1-password"));
}

TEST_F(DockerCLIStyleAuthTest, firstDeclaredDomainHelperWins)
{
    /* The helper from the first file beats the domain-level "auths"
       entry of the second. */
    expectResolves(
        "example.com",
        "not-explicitly-configured",
        CredentialsSpecificity::domain(),
        Credentials::basicAuth("from-exampledotcom-helper-1", "exampledotcom-helper-1-password"));
    EXPECT_EQ(lookupEnv.queries.size(), 1u);
    EXPECT_EQ(lookupEnv.queries[0].first, "exampledotcom-helper-1");
}

TEST_F(DockerCLIStyleAuthTest, pathOverrideBeatsDomainHelper)
{
    expectResolves(
        "example.com",
        "foo",
        CredentialsSpecificity::repository(1),
        Credentials::basicAuth("exampledotcom-foo-user", "exampledotcom-foo-password"));
    EXPECT_TRUE(lookupEnv.queries.empty());
}

TEST_F(DockerCLIStyleAuthTest, entryWithoutAuthIsIgnored)
{
    expectResolves(
        "example.com",
        "empty",
        CredentialsSpecificity::domain(),
        Credentials::basicAuth("from-exampledotcom-helper-1", "exampledotcom-helper-1-password"));
}

TEST(DockerCLIStyleCredentialsConfig, nullOrEmptyCredHelpersAreIgnored)
{
    FakeConfigDiscoveryEnvironment env;
    env.files["/home/example/.docker/config.json"] = R"({
        "auths": { "example.com/foo": { "auth": ")" + base64Of("bob:secret") + R"(" } },
        "credHelpers": { "x.io": null, "y.io": "" },
        "credsStore": "desktop"
    })";

    auto configs = findDockerCLIStyleCredentialsConfigs(env);
    ASSERT_EQ(configs.size(), 1u);
    CredentialsConfigs allCreds(configs);

    auto result = allCreds.credentialsSourceForRepository("example.com", "foo/bar");
    EXPECT_FALSE(result.errors);
    EXPECT_EQ(
        result.source,
        CredentialsSource(StaticCredentialsSource{
            .credentials = Credentials::basicAuth("bob", "secret"),
            .specificity = CredentialsSpecificity::repository(1),
        }));

    /* No domain-level helper for the null or empty entries, so the
       global one applies. */
    for (auto domain : {"x.io", "y.io"}) {
        auto global = allCreds.credentialsSourceForRepository(domain, "foo");
        EXPECT_EQ(
            global.source,
            CredentialsSource(DockerCredentialHelperCredentialsSource{
                .helperName = "desktop",
                .serverURL = std::string("https://") + domain,
                .specificity = CredentialsSpecificity::global(),
            }));
    }
}

TEST_F(DockerCLIStyleAuthTest, domainAuth)
{
    expectResolves(
        "example.net",
        "not-explicitly-configured",
        CredentialsSpecificity::domain(),
        Credentials::basicAuth("exampledotnet-user", "exampledotnet-password"));
}

TEST_F(DockerCLIStyleAuthTest, pathPrefixes)
{
    expectResolves(
        "example.net",
        "foo",
        CredentialsSpecificity::repository(1),
        Credentials::basicAuth("exampledotnet-foo-user", "exampledotnet-foo-password"));
    expectResolves(
        "example.net",
        "foo/doot",
        CredentialsSpecificity::repository(1),
        Credentials::basicAuth("exampledotnet-foo-user", "exampledotnet-foo-password"));
    expectResolves(
        "example.net",
        "foo/bar",
        CredentialsSpecificity::repository(2),
        Credentials::basicAuth("exampledotnet-foo-bar-user", "exampledotnet-foo-bar-password"));
    expectResolves(
        "example.net",
        "baz",
        CredentialsSpecificity::repository(1),
        Credentials::basicAuth("exampledotnet-baz-user", "exampledotnet-baz-password"));
}

TEST_F(DockerCLIStyleAuthTest, authWithoutColonIsSkipped)
{
    expectResolves(
        "example.net",
        "nocolon",
        CredentialsSpecificity::domain(),
        Credentials::basicAuth("exampledotnet-user", "exampledotnet-password"));
}

TEST_F(DockerCLIStyleAuthTest, emptyEntriesFallBackToGlobalHelper)
{
    expectResolves(
        "empty.example.org",
        "blah",
        CredentialsSpecificity::global(),
        Credentials::basicAuth("from-global-helper-1", "empty.example.org secret"));
    expectResolves(
        "null.example.org",
        "blah",
        CredentialsSpecificity::global(),
        Credentials::basicAuth("from-global-helper-1", "null.example.org secret"));
    expectResolves(
        "emptystr.example.org",
        "blah",
        CredentialsSpecificity::global(),
        Credentials::basicAuth("from-global-helper-1", "emptystr.example.org secret"));
}

TEST(DockerCLIStyleCredentialsConfig, roundTrip)
{
    DockerCLIStyleCredentialsConfig config(
        R"({"auths": {"example.com/foo": {"auth": ")" + base64Of("bob:secret") + R"("}}})", "/fake/config.json");

    std::vector<CredentialsSourceCandidate> candidates;
    config.credentialsSourcesForRepository("example.com", "foo/extra", [&](CredentialsSourceCandidate c) {
        candidates.push_back(std::move(c));
        return true;
    });

    ASSERT_EQ(candidates.size(), 1u);
    ASSERT_TRUE(candidates[0].source);
    EXPECT_EQ(
        *candidates[0].source,
        (CredentialsSource{StaticCredentialsSource{
            .credentials = Credentials::basicAuth("bob", "secret"),
            .specificity = CredentialsSpecificity::repository(1),
        }}));
    EXPECT_EQ(config.locationForUI(), "/fake/config.json");
}

TEST(DockerCLIStyleCredentialsConfig, passwordMayContainColons)
{
    DockerCLIStyleCredentialsConfig config(
        R"({"auths": {"example.com": {"auth": ")" + base64Of("bob:se:cret") + R"("}}})", "/fake/config.json");

    std::optional<CredentialsSource> found;
    config.credentialsSourcesForRepository("example.com", "", [&](CredentialsSourceCandidate c) {
        found = c.source;
        return true;
    });

    ASSERT_TRUE(found);
    MockCredentialsLookupEnvironment env;
    EXPECT_EQ(found->credentials(env), Credentials::basicAuth("bob", "se:cret"));
}

TEST(DockerCLIStyleCredentialsConfig, allCandidateKindsOffered)
{
    DockerCLIStyleCredentialsConfig config(
        R"({
            "auths": {"example.com/foo": {"auth": ")"
            + base64Of("u:p") + R"("}},
            "credHelpers": {"example.com": "domain-helper"},
            "credsStore": "global-helper"
        })",
        "/fake/config.json");

    std::vector<CredentialsSpecificity> specificities;
    config.credentialsSourcesForRepository("example.com", "foo", [&](CredentialsSourceCandidate c) {
        specificities.push_back(c.source->specificity());
        return true;
    });

    EXPECT_EQ(
        specificities,
        (std::vector<CredentialsSpecificity>{
            CredentialsSpecificity::repository(1),
            CredentialsSpecificity::domain(),
            CredentialsSpecificity::global(),
        }));
}

TEST(DockerCLIStyleCredentialsConfig, stopsWhenAsked)
{
    DockerCLIStyleCredentialsConfig config(
        R"({"credHelpers": {"example.com": "domain-helper"}, "credsStore": "global-helper"})", "/fake/config.json");

    int calls = 0;
    config.credentialsSourcesForRepository("example.com", "", [&](CredentialsSourceCandidate) {
        calls++;
        return false;
    });
    EXPECT_EQ(calls, 1);
}

TEST(DockerCLIStyleCredentialsConfig, rejectsInvalidJSON)
{
    EXPECT_THROW(DockerCLIStyleCredentialsConfig("{", "/fake/config.json"), Error);
    EXPECT_THROW(DockerCLIStyleCredentialsConfig("[]", "/fake/config.json"), Error);
    EXPECT_THROW(DockerCLIStyleCredentialsConfig(R"({"auths": []})", "/fake/config.json"), Error);
    EXPECT_THROW(DockerCLIStyleCredentialsConfig(R"({"credsStore": 12})", "/fake/config.json"), Error);
}

/* ----------------------------------------------------------------------------
 * Discovery error policies
 * --------------------------------------------------------------------------*/

TEST(findDockerCLIStyleCredentialsConfigs, skipsMissingFilesAndDuplicates)
{
    FakeConfigDiscoveryEnvironment env;
    env.osName = "darwin";
    env.homePath = "/Users/example";
    env.files["/Users/example/.config/containers/auth.json"] = R"({"credsStore": "a"})";
    env.files["/Users/example/.dockercfg"] = R"({"credsStore": "b"})";

    auto configs = findDockerCLIStyleCredentialsConfigs(env);

    ASSERT_EQ(configs.size(), 2u);
    EXPECT_EQ(configs[0]->locationForUI(), "/Users/example/.config/containers/auth.json");
    EXPECT_EQ(configs[1]->locationForUI(), "/Users/example/.dockercfg");
}

TEST(findDockerCLIStyleCredentialsConfigs, reportsOtherProblems)
{
    FakeConfigDiscoveryEnvironment env;
    env.files["/home/example/.docker/config.json"] = "not json";
    env.unreadable.insert("/home/example/.dockercfg");

    EXPECT_THAT(
        [&]() { findDockerCLIStyleCredentialsConfigs(env); },
        ::testing::ThrowsMessage<JoinedError>(::testing::AllOf(
            testing::HasSubstrIgnoreANSI("parsing /home/example/.docker/config.json: invalid JSON syntax"),
            testing::HasSubstrIgnoreANSI("reading /home/example/.dockercfg: "))));
}

TEST(fixedDockerCLIStyleCredentialsConfigs, missingFileIsAnError)
{
    FakeConfigDiscoveryEnvironment env;
    env.files["/present.json"] = "{}";

    try {
        fixedDockerCLIStyleCredentialsConfigs({"/present.json", "/absent.json"}, env);
        FAIL() << "expected an exception";
    } catch (SysError & e) {
        EXPECT_EQ(e.errNo, ENOENT);
        EXPECT_THAT(e.what(), testing::HasSubstrIgnoreANSI("reading /absent.json: "));
    }
}

TEST(fixedDockerCLIStyleCredentialsConfigs, keepsGivenOrder)
{
    FakeConfigDiscoveryEnvironment env;
    env.files["/b.json"] = "{}";
    env.files["/a.json"] = "{}";

    auto configs = fixedDockerCLIStyleCredentialsConfigs({"/b.json", "/a.json"}, env);
    ASSERT_EQ(configs.size(), 2u);
    EXPECT_EQ(configs[0]->locationForUI(), "/b.json");
    EXPECT_EQ(configs[1]->locationForUI(), "/a.json");
}

TEST(fixedDockerCLIStyleCredentialsConfigs, emptyListFindsNothing)
{
    FakeConfigDiscoveryEnvironment env;
    EXPECT_TRUE(fixedDockerCLIStyleCredentialsConfigs({}, env).empty());
}

} // namespace ociauth
