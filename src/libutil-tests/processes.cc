#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <sys/wait.h>

#include "ociauth/util/processes.hh"
#include "ociauth/util/tests/gmock-matchers.hh"

namespace ociauth {

TEST(runProgram, passesInputAndCapturesOutput)
{
    auto [status, output] = runProgram(
        RunOptions{
            .program = "cat",
            .input = "https://example.com",
        });
    EXPECT_TRUE(statusOk(status));
    EXPECT_EQ(output, "https://example.com");
}

TEST(runProgram, passesArguments)
{
    EXPECT_EQ(runProgram("echo", true, {"get", "it"}), "get it\n");
}

TEST(runProgram, reportsExitStatus)
{
    auto [status, output] = runProgram(
        RunOptions{
            .program = "sh",
            .args = {"-c", "echo oops; exit 3"},
        });
    EXPECT_FALSE(statusOk(status));
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 3);
    EXPECT_EQ(output, "oops\n");
    EXPECT_EQ(statusToString(status), "failed with exit code 3");
}

TEST(runProgram, programMayIgnoreItsInput)
{
    auto [status, output] = runProgram(
        RunOptions{
            .program = "true",
            .input = std::string(1 << 20, 'x'),
        });
    EXPECT_TRUE(statusOk(status));
    EXPECT_EQ(output, "");
}

TEST(runProgram, missingProgram)
{
    auto [status, output] = runProgram(RunOptions{.program = "ociauth-no-such-program"});
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 127);
}

TEST(runProgram, throwsExecError)
{
    try {
        runProgram("false", true, {});
        FAIL() << "expected an ExecError";
    } catch (ExecError & e) {
        EXPECT_FALSE(statusOk(e.status));
        EXPECT_THAT(e.message(), testing::HasSubstrIgnoreANSI("program 'false' failed with exit code 1"));
    }
}

TEST(runProgram, customEnvironment)
{
    auto [status, output] = runProgram(
        RunOptions{
            .program = "/bin/sh",
            .lookupPath = false,
            .args = {"-c", "echo \"$GREETING\""},
            .environment = StringMap{{"GREETING", "hello"}},
        });
    EXPECT_TRUE(statusOk(status));
    EXPECT_EQ(output, "hello\n");
}

} // namespace ociauth
