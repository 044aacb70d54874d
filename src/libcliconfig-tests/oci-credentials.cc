#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <filesystem>
#include <fstream>
#include <span>

#include <unistd.h>

#include "ociauth/auth/errors.hh"
#include "ociauth/auth/repository-address.hh"
#include "ociauth/auth/tests/fake-environments.hh"
#include "ociauth/cliconfig/oci-credentials.hh"
#include "ociauth/util/base-n.hh"
#include "ociauth/util/tests/gmock-matchers.hh"

namespace ociauth {

static const Path configFile = "/etc/ociauth/config.json";

/* ----------------------------------------------------------------------------
 * oci_default_credentials
 * --------------------------------------------------------------------------*/

TEST(parseCLIConfig, noBlocks)
{
    auto config = parseCLIConfig(R"({ "provider_installation": { "direct": {} } })", configFile);
    EXPECT_TRUE(config.ociDefaultCredentials.empty());
    EXPECT_TRUE(config.ociRepositoryCredentials.empty());
}

TEST(parseCLIConfig, notAnObject)
{
    EXPECT_THAT(
        []() { parseCLIConfig("[]", configFile); },
        ::testing::ThrowsMessage<Error>(testing::HasSubstrIgnoreANSI("must contain a JSON object")));
    EXPECT_THAT(
        []() { parseCLIConfig("{ oops", configFile); },
        ::testing::ThrowsMessage<Error>(testing::HasSubstrIgnoreANSI("is not valid JSON")));
}

TEST(parseCLIConfig, defaultCredentials)
{
    auto config = parseCLIConfig(
        R"({
            "oci_default_credentials": {
                "discover_ambient_credentials": true,
                "docker_style_config_files": ["/foo/bar/auth.json"],
                "docker_credentials_helper": "osxkeychain"
            }
        })",
        configFile);

    ASSERT_EQ(config.ociDefaultCredentials.size(), 1u);
    EXPECT_EQ(
        config.ociDefaultCredentials[0],
        (OCIDefaultCredentials{
            .discoverAmbientCredentials = true,
            .dockerStyleConfigFiles = Paths{"/foo/bar/auth.json"},
            .defaultDockerCredentialHelper = "osxkeychain",
            .declaredAt = "/etc/ociauth/config.json:/oci_default_credentials",
        }));
}

TEST(parseCLIConfig, defaultCredentialsAsBlockArray)
{
    auto config = parseCLIConfig(
        R"({ "oci_default_credentials": [ { "docker_credentials_helper": "osxkeychain" } ] })", configFile);

    ASSERT_EQ(config.ociDefaultCredentials.size(), 1u);
    EXPECT_EQ(config.ociDefaultCredentials[0].defaultDockerCredentialHelper, "osxkeychain");
    EXPECT_EQ(config.ociDefaultCredentials[0].declaredAt, "/etc/ociauth/config.json:/oci_default_credentials/0");
}

TEST(parseCLIConfig, defaultCredentialsDefaults)
{
    auto config = parseCLIConfig(R"({ "oci_default_credentials": {} })", configFile);

    ASSERT_EQ(config.ociDefaultCredentials.size(), 1u);
    auto & got = config.ociDefaultCredentials[0];
    EXPECT_TRUE(got.discoverAmbientCredentials);
    EXPECT_EQ(got.dockerStyleConfigFiles, std::nullopt);
    EXPECT_EQ(got.defaultDockerCredentialHelper, "");
}

TEST(parseCLIConfig, defaultCredentialsNoDockerFiles)
{
    auto config = parseCLIConfig(R"({ "oci_default_credentials": { "docker_style_config_files": [] } })", configFile);

    ASSERT_EQ(config.ociDefaultCredentials.size(), 1u);
    /* Empty, but set: "no files" rather than "search". */
    EXPECT_EQ(config.ociDefaultCredentials[0].dockerStyleConfigFiles, Paths{});
}

TEST(parseCLIConfig, relativeDockerFilesFollowTheConfigFile)
{
    auto config = parseCLIConfig(
        R"({ "oci_default_credentials": { "docker_style_config_files": ["auth.json", "../other/./auth.json"] } })",
        configFile);

    ASSERT_EQ(config.ociDefaultCredentials.size(), 1u);
    EXPECT_EQ(
        config.ociDefaultCredentials[0].dockerStyleConfigFiles,
        (Paths{"/etc/ociauth/auth.json", "/etc/other/auth.json"}));
}

TEST(defaultOCIDefaultCredentials, values)
{
    auto & defaults = defaultOCIDefaultCredentials();
    EXPECT_TRUE(defaults.discoverAmbientCredentials);
    EXPECT_EQ(defaults.dockerStyleConfigFiles, std::nullopt);
    EXPECT_EQ(defaults.defaultDockerCredentialHelper, "");
    EXPECT_EQ(&defaults, &defaultOCIDefaultCredentials());
}

struct InvalidConfigCase
{
    std::string description;
    std::string contents;
    std::string expectedError;
};

class InvalidCLIConfigTest : public ::testing::TestWithParam<InvalidConfigCase>
{};

TEST_P(InvalidCLIConfigTest, rejected)
{
    auto & c = GetParam();
    EXPECT_THAT(
        [&]() { parseCLIConfig(c.contents, configFile); },
        ::testing::ThrowsMessage<CLIConfigError>(testing::HasSubstrIgnoreANSI(c.expectedError)));
}

INSTANTIATE_TEST_SUITE_P(
    parseCLIConfig,
    InvalidCLIConfigTest,
    ::testing::Values(
        InvalidConfigCase{
            "defaultInconsistent",
            R"({ "oci_default_credentials": { "discover_ambient_credentials": false, "docker_style_config_files": [] } })",
            "disables discovery of ambient credentials, but also sets docker_style_config_files",
        },
        InvalidConfigCase{
            "defaultBadHelper",
            R"({ "oci_default_credentials": { "docker_credentials_helper": "not/valid" } })",
            R"(specifies the invalid Docker credential helper name "not/valid")",
        },
        InvalidConfigCase{
            "defaultEmptyHelper",
            R"({ "oci_default_credentials": { "docker_credentials_helper": "" } })",
            R"(specifies the invalid Docker credential helper name "")",
        },
        InvalidConfigCase{
            "defaultWrongType",
            R"({ "oci_default_credentials": { "discover_ambient_credentials": "yes" } })",
            "Invalid oci_default_credentials block at /etc/ociauth/config.json:/oci_default_credentials",
        },
        InvalidConfigCase{
            "defaultUnknownArgument",
            R"({ "oci_default_credentials": { "discover": true } })",
            R"(unsupported argument "discover")",
        },
        InvalidConfigCase{
            "defaultNotAnObject",
            R"({ "oci_default_credentials": true })",
            "must be represented by a JSON object",
        },
        InvalidConfigCase{
            "empty",
            R"({ "oci_credentials": { "example.com": {} } })",
            "must set either username+password, access_token+refresh_token, or docker_credentials_helper",
        },
        InvalidConfigCase{
            "mixedStyles",
            R"({ "oci_credentials": { "example.com": { "username": "u", "password": "p", "access_token": "a", "refresh_token": "r" } } })",
            "must set only one group out of username+password, access_token+refresh_token, or docker_credentials_helper",
        },
        InvalidConfigCase{
            "basicNoPassword",
            R"({ "oci_credentials": { "example.com": { "username": "u" } } })",
            "must set both username and password together when using static credentials",
        },
        InvalidConfigCase{
            "basicNoUsername",
            R"({ "oci_credentials": { "example.com": { "password": "p" } } })",
            "must set both username and password together when using static credentials",
        },
        InvalidConfigCase{
            "oauthNoAccess",
            R"({ "oci_credentials": { "example.com": { "refresh_token": "r" } } })",
            "must set both access_token and refresh_token together when using OAuth-style credentials",
        },
        InvalidConfigCase{
            "oauthNoRefresh",
            R"({ "oci_credentials": { "example.com": { "access_token": "a" } } })",
            "must set both access_token and refresh_token together when using OAuth-style credentials",
        },
        InvalidConfigCase{
            "credhelperBadSyntax",
            R"({ "oci_credentials": { "example.com": { "docker_credentials_helper": "not/valid" } } })",
            R"(specifies the invalid Docker credential helper name "not/valid")",
        },
        InvalidConfigCase{
            "credhelperRepoPath",
            R"({ "oci_credentials": { "example.com/foo": { "docker_credentials_helper": "osxkeychain" } } })",
            "cannot set docker_credentials_helper with a repository path",
        },
        InvalidConfigCase{
            "badLabel",
            R"({ "oci_credentials": { "example.com/Foo": { "username": "u", "password": "p" } } })",
            "has an invalid block label",
        },
        InvalidConfigCase{
            "labelWithTag",
            R"({ "oci_credentials": { "example.com/foo:latest": { "username": "u", "password": "p" } } })",
            "must not include a tag or digest",
        },
        InvalidConfigCase{
            "noLabel",
            R"({ "oci_credentials": [ { "username": "u", "password": "p" } ] })",
            "must have one label, giving an OCI repository address prefix",
        },
        InvalidConfigCase{
            "unknownArgument",
            R"({ "oci_credentials": { "example.com": { "username": "u", "passwd": "p" } } })",
            R"(unsupported argument "passwd")",
        },
        InvalidConfigCase{
            "wrongType",
            R"({ "oci_credentials": { "example.com": { "username": "u", "password": 1234 } } })",
            "Invalid oci_credentials block at /etc/ociauth/config.json:/oci_credentials/example.com",
        }),
    [](const ::testing::TestParamInfo<InvalidConfigCase> & info) { return info.param.description; });

TEST(parseCLIConfig, reportsEveryProblem)
{
    try {
        parseCLIConfig(
            R"({
                "oci_default_credentials": { "docker_credentials_helper": "" },
                "oci_credentials": {
                    "example.com": {},
                    "example.net": { "username": "u", "password": "p" },
                    "example.org": { "access_token": "a" }
                }
            })",
            configFile);
        FAIL() << "expected a CLIConfigError";
    } catch (CLIConfigError & e) {
        ASSERT_EQ(e.getProblems().size(), 3u);
        EXPECT_THAT(e.getProblems().front(), ::testing::StartsWith("Invalid oci_default_credentials block: "));
        EXPECT_THAT(e.getProblems().back(), ::testing::StartsWith("Invalid oci_credentials block: "));
        EXPECT_THAT(e.getProblems().back(), ::testing::HasSubstr("/oci_credentials/example.org"));
    }
}

/* ----------------------------------------------------------------------------
 * oci_credentials
 * --------------------------------------------------------------------------*/

TEST(parseCLIConfig, repositoryCredentialsKinds)
{
    auto config = parseCLIConfig(
        R"({
            "oci_credentials": {
                "example.net": { "username": "baz", "password": "beep" },
                "example.com": { "username": "foo", "password": "bar" },
                "example.com/oauth": { "access_token": "foo", "refresh_token": "bar" },
                "example.org": { "docker_credentials_helper": "osxkeychain" }
            }
        })",
        configFile);

    EXPECT_EQ(
        config.ociRepositoryCredentials,
        (std::vector<OCIRepositoryCredentials>{
            {
                .repositoryPrefix = "example.com",
                .username = "foo",
                .password = "bar",
                .declaredAt = "/etc/ociauth/config.json:/oci_credentials/example.com",
            },
            {
                .repositoryPrefix = "example.com/oauth",
                .accessToken = "foo",
                .refreshToken = "bar",
                .declaredAt = "/etc/ociauth/config.json:/oci_credentials/example.com~1oauth",
            },
            {
                .repositoryPrefix = "example.net",
                .username = "baz",
                .password = "beep",
                .declaredAt = "/etc/ociauth/config.json:/oci_credentials/example.net",
            },
            {
                .repositoryPrefix = "example.org",
                .dockerCredentialHelper = "osxkeychain",
                .declaredAt = "/etc/ociauth/config.json:/oci_credentials/example.org",
            },
        }));
}

TEST(parseCLIConfig, nullArgumentsAreUnset)
{
    auto config = parseCLIConfig(
        R"({ "oci_credentials": { "example.com": { "username": "u", "password": "p", "access_token": null } } })",
        configFile);

    ASSERT_EQ(config.ociRepositoryCredentials.size(), 1u);
    EXPECT_EQ(config.ociRepositoryCredentials[0].username, "u");
    EXPECT_EQ(config.ociRepositoryCredentials[0].accessToken, "");
}

/* ----------------------------------------------------------------------------
 * Validation across files
 * --------------------------------------------------------------------------*/

TEST(CLIConfig, duplicateDefaultCredentials)
{
    auto config = parseCLIConfig(
        R"({ "oci_default_credentials": [ { "docker_credentials_helper": "a" }, { "docker_credentials_helper": "b" } ] })",
        configFile);
    EXPECT_EQ(config.ociDefaultCredentials.size(), 2u);

    EXPECT_THAT(
        [&]() { config.validate(); },
        ::testing::ThrowsMessage<CLIConfigError>(
            testing::HasSubstrIgnoreANSI("No more than one oci_default_credentials block may be specified")));
}

TEST(CLIConfig, duplicateRepositoryCredentialsAcrossFiles)
{
    auto config = parseCLIConfig(
        R"({ "oci_credentials": { "example.com": { "username": "u", "password": "p" } } })", "/etc/ociauth/a.json");
    config.merge(parseCLIConfig(
        R"({ "oci_credentials": { "example.com": { "docker_credentials_helper": "osxkeychain" } } })",
        "/etc/ociauth/b.json"));

    ASSERT_EQ(config.ociRepositoryCredentials.size(), 2u);
    EXPECT_EQ(config.ociRepositoryCredentials[1].declaredAt, "/etc/ociauth/b.json:/oci_credentials/example.com");

    try {
        config.validate();
        FAIL() << "expected a CLIConfigError";
    } catch (CLIConfigError & e) {
        ASSERT_EQ(e.getProblems().size(), 1u);
        EXPECT_THAT(e.getProblems().front(), ::testing::HasSubstr(R"(Duplicate oci_credentials block for "example.com")"));
        EXPECT_THAT(e.getProblems().front(), ::testing::HasSubstr("/etc/ociauth/a.json"));
        EXPECT_THAT(e.getProblems().front(), ::testing::HasSubstr("/etc/ociauth/b.json"));
    }
}

TEST(CLIConfig, duplicateRepositoryCredentialsWithinFile)
{
    auto config = parseCLIConfig(
        R"({ "oci_credentials": { "example.com": [ { "username": "u", "password": "p" }, { "username": "v", "password": "q" } ] } })",
        configFile);

    EXPECT_THAT(
        [&]() { config.validate(); },
        ::testing::ThrowsMessage<CLIConfigError>(
            testing::HasSubstrIgnoreANSI(R"(Duplicate oci_credentials block for "example.com")")));
}

TEST(CLIConfig, distinctPrefixesAreFine)
{
    auto config = parseCLIConfig(
        R"({
            "oci_default_credentials": { "docker_credentials_helper": "osxkeychain" },
            "oci_credentials": {
                "example.com": { "username": "u", "password": "p" },
                "example.com/foo": { "username": "v", "password": "q" }
            }
        })",
        configFile);
    EXPECT_NO_THROW(config.validate());
}

class LoadCLIConfigTest : public ::testing::Test
{
protected:
    std::filesystem::path dir;

    void SetUp() override
    {
        dir = std::filesystem::temp_directory_path()
              / ("ociauth-cliconfig-tests-" + std::to_string(getpid()) + "-"
                 + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir);
    }

    void TearDown() override
    {
        std::filesystem::remove_all(dir);
    }

    Path write(const std::string & name, const std::string & contents)
    {
        auto path = dir / name;
        std::ofstream(path) << contents;
        return path.string();
    }
};

TEST_F(LoadCLIConfigTest, mergesFilesInOrder)
{
    auto a = write("a.json", R"({ "oci_credentials": { "example.com": { "username": "u", "password": "p" } } })");
    auto b = write(
        "b.json",
        R"({ "oci_default_credentials": { "docker_style_config_files": ["auth.json"] },
             "oci_credentials": { "example.net": { "username": "v", "password": "q" } } })");

    auto config = loadCLIConfig({a, b});
    ASSERT_EQ(config.ociRepositoryCredentials.size(), 2u);
    EXPECT_EQ(config.ociRepositoryCredentials[0].repositoryPrefix, "example.com");
    EXPECT_EQ(config.ociRepositoryCredentials[1].repositoryPrefix, "example.net");
    ASSERT_EQ(config.ociDefaultCredentials.size(), 1u);
    EXPECT_EQ(config.ociDefaultCredentials[0].dockerStyleConfigFiles, Paths{(dir / "auth.json").string()});
}

TEST_F(LoadCLIConfigTest, validatesAcrossFiles)
{
    auto a = write("a.json", R"({ "oci_default_credentials": {} })");
    auto b = write("b.json", R"({ "oci_default_credentials": {} })");

    EXPECT_THROW(loadCLIConfig({a, b}), CLIConfigError);
}

TEST_F(LoadCLIConfigTest, collectsProblemsFromAllFiles)
{
    auto a = write("a.json", R"({ "oci_credentials": { "example.com": {} } })");
    auto b = write("b.json", R"({ "oci_credentials": { "example.net": { "username": "u" } } })");

    try {
        loadCLIConfig({a, b});
        FAIL() << "expected a CLIConfigError";
    } catch (CLIConfigError & e) {
        EXPECT_EQ(e.getProblems().size(), 2u);
    }
}

TEST_F(LoadCLIConfigTest, missingFile)
{
    try {
        loadCLIConfig({(dir / "absent.json").string()});
        FAIL() << "expected a SysError";
    } catch (SysError & e) {
        EXPECT_EQ(e.errNo, ENOENT);
    }
}

/* ----------------------------------------------------------------------------
 * OCIRepositoryCredentialsConfig
 * --------------------------------------------------------------------------*/

static std::vector<CredentialsSourceCandidate>
collect(const CredentialsConfig & config, std::string_view registryDomain, std::string_view repositoryPath)
{
    std::vector<CredentialsSourceCandidate> candidates;
    config.credentialsSourcesForRepository(registryDomain, repositoryPath, [&](CredentialsSourceCandidate c) {
        candidates.push_back(std::move(c));
        return true;
    });
    return candidates;
}

TEST(OCIRepositoryCredentialsConfig, locationForUI)
{
    OCIRepositoryCredentialsConfig config({.repositoryPrefix = "example.com/foo", .username = "u", .password = "p"});
    EXPECT_EQ(config.locationForUI(), R"(explicit oci_credentials "example.com/foo" block)");
}

TEST(OCIRepositoryCredentialsConfig, offersOneSourceWhenMatching)
{
    OCIRepositoryCredentialsConfig config({.repositoryPrefix = "example.com/foo", .username = "u", .password = "p"});

    EXPECT_TRUE(collect(config, "example.com", "bar").empty());
    EXPECT_TRUE(collect(config, "example.net", "foo").empty());

    auto candidates = collect(config, "example.com", "foo/bar");
    ASSERT_EQ(candidates.size(), 1u);
    ASSERT_TRUE(candidates[0].source);
    EXPECT_EQ(
        *candidates[0].source,
        CredentialsSource(StaticCredentialsSource{
            .credentials = Credentials::basicAuth("u", "p"),
            .specificity = CredentialsSpecificity::repository(1),
        }));
}

TEST(OCIRepositoryCredentialsConfig, oauth)
{
    OCIRepositoryCredentialsConfig config({.repositoryPrefix = "example.com", .accessToken = "a", .refreshToken = "r"});

    auto candidates = collect(config, "example.com", "foo");
    ASSERT_EQ(candidates.size(), 1u);
    ASSERT_TRUE(candidates[0].source);
    EXPECT_EQ(
        *candidates[0].source,
        CredentialsSource(StaticCredentialsSource{
            .credentials = Credentials::oauth("a", "r"),
            .specificity = CredentialsSpecificity::domain(),
        }));
}

TEST(OCIRepositoryCredentialsConfig, credentialHelperAsksForTheRegistry)
{
    OCIRepositoryCredentialsConfig config({.repositoryPrefix = "example.com:5000", .dockerCredentialHelper = "pass"});

    auto candidates = collect(config, "example.com:5000", "foo");
    ASSERT_EQ(candidates.size(), 1u);
    ASSERT_TRUE(candidates[0].source);
    EXPECT_EQ(
        *candidates[0].source,
        CredentialsSource(DockerCredentialHelperCredentialsSource{
            .helperName = "pass",
            .serverURL = "https://example.com:5000",
            .specificity = CredentialsSpecificity::domain(),
        }));
}

TEST(OCIRepositoryCredentialsConfig, noCredentialsIsAnError)
{
    OCIRepositoryCredentialsConfig config({.repositoryPrefix = "example.com"});

    auto candidates = collect(config, "example.com", "foo");
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_FALSE(candidates[0].source);
    ASSERT_TRUE(candidates[0].error);
    EXPECT_FALSE(isCredentialsNotFoundError(candidates[0].error));
    EXPECT_THAT(exceptionMessage(candidates[0].error), testing::HasSubstrIgnoreANSI("no supported credentials arguments"));
}

/* ----------------------------------------------------------------------------
 * ociCredentialsPolicy
 * --------------------------------------------------------------------------*/

static std::string base64Of(std::string_view s)
{
    return base64::encode(std::as_bytes(std::span<const char>(s.data(), s.size())));
}

/**
 * Knows only the "fake" credential helper, which only has credentials
 * for the registry currently being resolved.
 */
struct FakeHelperLookupEnvironment : CredentialsLookupEnvironment
{
    std::string registryDomain;

    DockerCredentialHelperGetResult
    queryDockerCredentialHelper(const std::string & helperName, const std::string & serverURL) override
    {
        if (helperName != "fake")
            throw CredentialsNotFoundError("only the 'fake' credential helper is available here, not '%s'", helperName);
        if (serverURL != "https://" + registryDomain)
            throw CredentialsNotFoundError("the fake credential helper only has credentials for '%s'", registryDomain);
        return {.serverURL = serverURL, .username = "from-cred-helper", .secret = "for " + serverURL};
    }
};

class OCICredentialsPolicyTest : public ::testing::Test
{
protected:
    static inline const Path fixture = "/fixture";

    FakeConfigDiscoveryEnvironment env;

    OCICredentialsPolicyTest()
    {
        env.homePath = fixture + "/home";
    }

    CredentialsConfigs policyFor(const std::string & contents)
    {
        auto config = parseCLIConfig(contents, fixture + "/ociauth.json");
        config.validate();
        return ociCredentialsPolicy(config, env);
    }

    void withXDGConfigHome()
    {
        env.envVars["XDG_CONFIG_HOME"] = fixture + "/xdgconfig";
    }

    void withXDGRuntimeDir()
    {
        env.envVars["XDG_RUNTIME_DIR"] = fixture + "/xdgrun";
    }

    void addFile(const std::string & relPath, const std::string & contents)
    {
        env.files[fixture + "/" + relPath] = contents;
    }

    /**
     * The layer locations, with the fixture directory stripped off
     * those that are file names.
     */
    static Strings locationsOf(const CredentialsConfigs & policy)
    {
        Strings locations;
        for (auto & config : policy.allConfigs()) {
            auto location = config->locationForUI();
            if (location.starts_with(fixture + "/"))
                location = location.substr(fixture.size() + 1);
            locations.push_back(location);
        }
        return locations;
    }

    static void expectCredentials(
        const CredentialsConfigs & policy,
        std::string_view address,
        CredentialsSpecificity wantSpecificity,
        const Credentials & wantCredentials)
    {
        SCOPED_TRACE(std::string(address));
        auto parsed = parseRepositoryAddressPrefix(address);
        auto result = policy.credentialsSourceForRepository(parsed.registryDomain, parsed.repositoryPath);
        EXPECT_EQ(result.source.specificity(), wantSpecificity);

        FakeHelperLookupEnvironment lookup;
        lookup.registryDomain = parsed.registryDomain;
        EXPECT_EQ(result.source.credentials(lookup), wantCredentials);
    }

    static void expectNoCredentials(const CredentialsConfigs & policy, std::string_view address)
    {
        SCOPED_TRACE(std::string(address));
        auto parsed = parseRepositoryAddressPrefix(address);
        try {
            policy.credentialsSourceForRepository(parsed.registryDomain, parsed.repositoryPath);
            ADD_FAILURE() << "found credentials unexpectedly";
        } catch (Error & e) {
            EXPECT_TRUE(isCredentialsNotFoundError(e)) << e.what();
        }
    }
};

TEST_F(OCICredentialsPolicyTest, emptyLinux)
{
    auto policy = policyFor("{}");

    EXPECT_EQ(locationsOf(policy), Strings{});
    expectNoCredentials(policy, "example.com");
    expectNoCredentials(policy, "example.com/foo/bar");
}

TEST_F(OCICredentialsPolicyTest, mixedDarwin)
{
    env.osName = "darwin";
    addFile(
        "home/.config/containers/auth.json",
        R"({
            "auths": {
                "example.com": { "auth": ")"
            + base64Of("ambient-user:ambient-password-superseded") + R"(" },
                "example.com/bar": { "auth": ")"
            + base64Of("ambient-example.com-user:ambient-password") + R"(" }
            },
            "credsStore": "superseded-by-explicit-config"
        })");

    auto policy = policyFor(R"({
        "oci_default_credentials": { "docker_credentials_helper": "fake" },
        "oci_credentials": {
            "example.com": { "username": "example.com user", "password": "example.com password" },
            "example.com/foo": { "username": "example.com/foo user", "password": "example.com/foo password" }
        }
    })");

    EXPECT_EQ(
        locationsOf(policy),
        (Strings{
            R"(explicit oci_credentials "example.com" block)",
            R"(explicit oci_credentials "example.com/foo" block)",
            "oci_default_credentials block",
            "home/.config/containers/auth.json",
        }));

    /* Nothing more specific, so the default helper wins over the
       ambient credsStore. */
    expectCredentials(
        policy,
        "example.org",
        CredentialsSpecificity::global(),
        Credentials::basicAuth("from-cred-helper", "for https://example.org"));
    /* Explicit configuration wins over the conflicting ambient entry. */
    expectCredentials(
        policy,
        "example.com",
        CredentialsSpecificity::domain(),
        Credentials::basicAuth("example.com user", "example.com password"));
    expectCredentials(
        policy,
        "example.com/foo",
        CredentialsSpecificity::repository(1),
        Credentials::basicAuth("example.com/foo user", "example.com/foo password"));
    expectCredentials(
        policy,
        "example.com/bar",
        CredentialsSpecificity::repository(1),
        Credentials::basicAuth("ambient-example.com-user", "ambient-password"));
    expectCredentials(
        policy,
        "example.com/not-foo",
        CredentialsSpecificity::domain(),
        Credentials::basicAuth("example.com user", "example.com password"));
    expectCredentials(
        policy,
        "example.com/not-bar",
        CredentialsSpecificity::domain(),
        Credentials::basicAuth("example.com user", "example.com password"));
}

TEST_F(OCICredentialsPolicyTest, explicitSpecificityLinux)
{
    auto policy = policyFor(R"({
        "oci_credentials": {
            "example.com": { "username": "example.com user", "password": "example.com password" },
            "example.com/foo": { "username": "example.com/foo user", "password": "example.com/foo password" },
            "example.com/foo/bar": { "username": "example.com/foo/bar user", "password": "example.com/foo/bar password" },
            "example.net": { "docker_credentials_helper": "fake" },
            "example.net/foo": { "access_token": "example.net/foo access", "refresh_token": "example.net/foo refresh" }
        }
    })");

    EXPECT_EQ(
        locationsOf(policy),
        (Strings{
            R"(explicit oci_credentials "example.com" block)",
            R"(explicit oci_credentials "example.com/foo" block)",
            R"(explicit oci_credentials "example.com/foo/bar" block)",
            R"(explicit oci_credentials "example.net" block)",
            R"(explicit oci_credentials "example.net/foo" block)",
        }));

    expectNoCredentials(policy, "example.org");
    expectCredentials(
        policy,
        "example.com",
        CredentialsSpecificity::domain(),
        Credentials::basicAuth("example.com user", "example.com password"));
    expectCredentials(
        policy,
        "example.com/foo",
        CredentialsSpecificity::repository(1),
        Credentials::basicAuth("example.com/foo user", "example.com/foo password"));
    expectCredentials(
        policy,
        "example.com/foo/bar",
        CredentialsSpecificity::repository(2),
        Credentials::basicAuth("example.com/foo/bar user", "example.com/foo/bar password"));
    expectCredentials(
        policy,
        "example.com/foo/not-bar",
        CredentialsSpecificity::repository(1),
        Credentials::basicAuth("example.com/foo user", "example.com/foo password"));
    expectCredentials(
        policy,
        "example.com/not-foo/not-bar",
        CredentialsSpecificity::domain(),
        Credentials::basicAuth("example.com user", "example.com password"));
    expectCredentials(
        policy,
        "example.net",
        CredentialsSpecificity::domain(),
        Credentials::basicAuth("from-cred-helper", "for https://example.net"));
    expectCredentials(
        policy,
        "example.net/foo",
        CredentialsSpecificity::repository(1),
        Credentials::oauth("example.net/foo access", "example.net/foo refresh"));
    expectCredentials(
        policy,
        "example.net/not-foo",
        CredentialsSpecificity::domain(),
        Credentials::basicAuth("from-cred-helper", "for https://example.net"));
}

TEST_F(OCICredentialsPolicyTest, explicitGlobalCredentialHelperLinux)
{
    auto policy = policyFor(R"({ "oci_default_credentials": { "docker_credentials_helper": "fake" } })");

    EXPECT_EQ(locationsOf(policy), Strings{"oci_default_credentials block"});
    expectCredentials(
        policy,
        "example.com/foo/bar",
        CredentialsSpecificity::global(),
        Credentials::basicAuth("from-cred-helper", "for https://example.com"));
    expectCredentials(
        policy,
        "example.net",
        CredentialsSpecificity::global(),
        Credentials::basicAuth("from-cred-helper", "for https://example.net"));
}

TEST_F(OCICredentialsPolicyTest, ambientTotallyDisabledLinux)
{
    withXDGConfigHome();
    addFile("xdgconfig/containers/auth.json", R"({ "credsStore": "fake" })");
    addFile("home/.docker/config.json", R"({ "credsStore": "fake" })");

    auto policy = policyFor(R"({ "oci_default_credentials": { "discover_ambient_credentials": false } })");

    EXPECT_EQ(locationsOf(policy), Strings{});
    expectNoCredentials(policy, "example.net");
}

TEST_F(OCICredentialsPolicyTest, ambientExplicitPathLinux)
{
    addFile("explicitly-named.json", R"({ "credsStore": "fake" })");
    addFile("home/.docker/config.json", R"({ "credsStore": "not-the-fake-one" })");

    auto policy = policyFor(R"({ "oci_default_credentials": { "docker_style_config_files": ["explicitly-named.json"] } })");

    EXPECT_EQ(locationsOf(policy), Strings{"explicitly-named.json"});
    expectCredentials(
        policy,
        "example.net",
        CredentialsSpecificity::global(),
        Credentials::basicAuth("from-cred-helper", "for https://example.net"));
}

TEST_F(OCICredentialsPolicyTest, ambientNoDockerFiles)
{
    addFile("home/.docker/config.json", R"({ "credsStore": "fake" })");

    auto policy = policyFor(R"({ "oci_default_credentials": { "docker_style_config_files": [] } })");

    EXPECT_EQ(locationsOf(policy), Strings{});
}

TEST_F(OCICredentialsPolicyTest, ambientExplicitPathMissing)
{
    try {
        policyFor(R"({ "oci_default_credentials": { "docker_style_config_files": ["/fixture/missing.json"] } })");
        FAIL() << "expected an error";
    } catch (Error & e) {
        EXPECT_THAT(
            e.what(),
            testing::HasSubstrIgnoreANSI(
                "discovering ambient OCI registry credentials: failed to read Docker-style config files: reading /fixture/missing.json: "));
    }
}

TEST_F(OCICredentialsPolicyTest, ambientDiscoveryProblemsAreNotFatal)
{
    addFile("home/.docker/config.json", "this is not JSON");
    addFile("home/.dockercfg", R"({ "credsStore": "fake" })");

    auto policy = policyFor(R"({
        "oci_credentials": { "example.com": { "username": "u", "password": "p" } }
    })");

    /* Ambient configuration is dropped entirely, but the explicit
       configuration still works. */
    EXPECT_EQ(locationsOf(policy), Strings{R"(explicit oci_credentials "example.com" block)"});
    expectCredentials(policy, "example.com", CredentialsSpecificity::domain(), Credentials::basicAuth("u", "p"));
    expectNoCredentials(policy, "example.net");
}

struct AmbientCredentialHelperCase
{
    std::string name;
    std::string osName;
    bool xdgConfigHome;
    bool xdgRuntimeDir;

    /**
     * Relative to the fixture directory. The first one names the "fake"
     * helper; the others name helpers that don't exist.
     */
    std::vector<std::string> files;

    Strings expectedLocations;
};

class AmbientCredentialHelperTest : public OCICredentialsPolicyTest,
                                    public ::testing::WithParamInterface<AmbientCredentialHelperCase>
{};

TEST_P(AmbientCredentialHelperTest, findsFilesInPrecedenceOrder)
{
    auto & c = GetParam();
    env.osName = c.osName;
    if (c.xdgConfigHome)
        withXDGConfigHome();
    if (c.xdgRuntimeDir)
        withXDGRuntimeDir();
    for (size_t i = 0; i < c.files.size(); ++i)
        addFile(c.files[i], fmt(R"({ "credsStore": "%s" })", i == 0 ? "fake" : "not-fake-" + std::to_string(i)));

    auto policy = policyFor("{}");

    EXPECT_EQ(locationsOf(policy), c.expectedLocations);
    expectCredentials(
        policy,
        "example.net",
        CredentialsSpecificity::global(),
        Credentials::basicAuth("from-cred-helper", "for https://example.net"));
}

INSTANTIATE_TEST_SUITE_P(
    ociCredentialsPolicy,
    AmbientCredentialHelperTest,
    ::testing::Values(
        AmbientCredentialHelperCase{
            .name = "xdgconfigLinux",
            .osName = "linux",
            .xdgConfigHome = true,
            .xdgRuntimeDir = false,
            .files = {"xdgconfig/containers/auth.json"},
            .expectedLocations = {"xdgconfig/containers/auth.json"},
        },
        AmbientCredentialHelperCase{
            .name = "xdgrunLinux",
            .osName = "linux",
            .xdgConfigHome = false,
            .xdgRuntimeDir = true,
            .files = {"xdgrun/containers/auth.json"},
            .expectedLocations = {"xdgrun/containers/auth.json"},
        },
        AmbientCredentialHelperCase{
            .name = "xdgdefaultLinux",
            .osName = "linux",
            .xdgConfigHome = false,
            .xdgRuntimeDir = false,
            .files = {"home/.config/containers/auth.json"},
            .expectedLocations = {"home/.config/containers/auth.json"},
        },
        AmbientCredentialHelperCase{
            .name = "dockerLinux",
            .osName = "linux",
            .xdgConfigHome = false,
            .xdgRuntimeDir = false,
            .files = {"home/.docker/config.json"},
            .expectedLocations = {"home/.docker/config.json"},
        },
        AmbientCredentialHelperCase{
            .name = "dockerlegacyLinux",
            .osName = "linux",
            .xdgConfigHome = false,
            .xdgRuntimeDir = false,
            .files = {"home/.dockercfg"},
            .expectedLocations = {"home/.dockercfg"},
        },
        AmbientCredentialHelperCase{
            .name = "variousLinux",
            .osName = "linux",
            .xdgConfigHome = true,
            .xdgRuntimeDir = true,
            /* home/.config/containers/auth.json is not searched when
               XDG_CONFIG_HOME is set. */
            .files =
                {"xdgrun/containers/auth.json",
                 "home/.config/containers/auth.json",
                 "xdgconfig/containers/auth.json",
                 "home/.docker/config.json",
                 "home/.dockercfg"},
            .expectedLocations =
                {"xdgrun/containers/auth.json",
                 "xdgconfig/containers/auth.json",
                 "home/.docker/config.json",
                 "home/.dockercfg"},
        },
        AmbientCredentialHelperCase{
            .name = "variousWindows",
            .osName = "windows",
            .xdgConfigHome = true,
            .xdgRuntimeDir = true,
            .files =
                {"home/.config/containers/auth.json",
                 "xdgrun/containers/auth.json",
                 "xdgconfig/containers/auth.json",
                 "home/.docker/config.json",
                 "home/.dockercfg"},
            .expectedLocations =
                {"home/.config/containers/auth.json",
                 "xdgconfig/containers/auth.json",
                 "home/.docker/config.json",
                 "home/.dockercfg"},
        },
        AmbientCredentialHelperCase{
            .name = "variousDarwin",
            .osName = "darwin",
            .xdgConfigHome = true,
            .xdgRuntimeDir = true,
            .files =
                {"home/.config/containers/auth.json",
                 "xdgrun/containers/auth.json",
                 "xdgconfig/containers/auth.json",
                 "home/.docker/config.json",
                 "home/.dockercfg"},
            .expectedLocations =
                {"home/.config/containers/auth.json",
                 "xdgconfig/containers/auth.json",
                 "home/.docker/config.json",
                 "home/.dockercfg"},
        }),
    [](const ::testing::TestParamInfo<AmbientCredentialHelperCase> & info) { return info.param.name; });

} // namespace ociauth
