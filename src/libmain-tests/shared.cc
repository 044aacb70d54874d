#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "ociauth/main/shared.hh"
#include "ociauth/util/exit.hh"
#include "ociauth/util/logging.hh"
#include "ociauth/util/tests/gmock-matchers.hh"

#include <stdexcept>

namespace ociauth {

class ParseCmdLineTest : public ::testing::Test
{
    Verbosity savedVerbosity = verbosity;

protected:
    Strings flags;
    Strings positional;
    Strings configFiles;

    void TearDown() override
    {
        verbosity = savedVerbosity;
    }

    void parse(const Strings & args)
    {
        parseCmdLine("ociauth", args, [&](Strings::iterator & arg, const Strings::iterator & end) {
            if (*arg == "--config")
                configFiles.push_back(getArg(*arg, arg, end));
            else if (*arg == "-s" || *arg == "--show-secrets")
                flags.push_back(*arg);
            else if (arg->starts_with("-") && *arg != "-")
                return false;
            else
                positional.push_back(*arg);
            return true;
        });
    }
};

TEST_F(ParseCmdLineTest, positionalAndOptions)
{
    parse({"lookup", "--config", "/etc/a.json", "example.com/foo", "--show-secrets"});
    EXPECT_EQ(positional, (Strings{"lookup", "example.com/foo"}));
    EXPECT_EQ(configFiles, Strings{"/etc/a.json"});
    EXPECT_EQ(flags, Strings{"--show-secrets"});
}

TEST_F(ParseCmdLineTest, optionWithEquals)
{
    parse({"--config=/etc/a.json", "--config", "/etc/b.json"});
    EXPECT_EQ(configFiles, (Strings{"/etc/a.json", "/etc/b.json"}));
}

TEST_F(ParseCmdLineTest, compoundShortFlags)
{
    verbosity = lvlInfo;
    parse({"-vvs"});
    EXPECT_EQ(verbosity, lvlChatty);
    EXPECT_EQ(flags, Strings{"-s"});
}

TEST_F(ParseCmdLineTest, loggingFlags)
{
    verbosity = lvlInfo;
    parse({"--quiet", "--quiet"});
    EXPECT_EQ(verbosity, lvlWarn);

    parse({"--quiet", "--quiet", "--quiet"});
    EXPECT_EQ(verbosity, lvlError);

    parse({"--debug"});
    EXPECT_EQ(verbosity, lvlDebug);

    for (int i = 0; i < 5; ++i)
        parse({"--verbose"});
    EXPECT_EQ(verbosity, lvlVomit);
}

TEST_F(ParseCmdLineTest, dashDash)
{
    verbosity = lvlInfo;
    Strings seen;
    parseCmdLine("ociauth", {"-v", "--", "--verbose", "-x"}, [&](Strings::iterator & arg, const Strings::iterator & end) {
        seen.push_back(*arg);
        return true;
    });
    EXPECT_EQ(seen, (Strings{"--verbose", "-x"}));
    EXPECT_EQ(verbosity, lvlTalkative);
}

TEST_F(ParseCmdLineTest, rejectsUnknownFlags)
{
    EXPECT_THAT(
        [&]() { parse({"--frobnicate"}); },
        ::testing::ThrowsMessage<UsageError>(testing::HasSubstrIgnoreANSI("unrecognised flag '--frobnicate'")));
}

TEST_F(ParseCmdLineTest, missingOptionValue)
{
    EXPECT_THAT(
        [&]() { parse({"--config"}); },
        ::testing::ThrowsMessage<UsageError>(testing::HasSubstrIgnoreANSI("'--config' requires an argument")));
}

TEST(handleExceptions, exitStatus)
{
    EXPECT_EQ(handleExceptions("ociauth", []() {}), 0);
    EXPECT_EQ(handleExceptions("ociauth", []() { throw Exit(3); }), 3);

    EXPECT_EQ(handleExceptions("ociauth", []() { throw Error("failed"); }), 1);
    EXPECT_EQ(handleExceptions("ociauth", []() { throw UsageError("bad usage"); }), 1);
    EXPECT_EQ(
        handleExceptions(
            "ociauth",
            []() {
                Error e("failed");
                e.withExitStatus(4);
                throw e;
            }),
        4);
    EXPECT_EQ(handleExceptions("ociauth", []() { throw std::runtime_error("oops"); }), 1);
}

} // namespace ociauth
