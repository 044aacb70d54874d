#include <gtest/gtest.h>

#include <filesystem>
#include <climits>
#include <fstream>

#include <unistd.h>

#include "ociauth/util/error.hh"
#include "ociauth/util/file-system.hh"

namespace ociauth {

/* ----------------------------------------------------------------------------
 * absPath
 * --------------------------------------------------------------------------*/

TEST(absPath, doesntChangeRoot)
{
    ASSERT_EQ(absPath("/"), "/");
}

TEST(absPath, turnsEmptyPathIntoCWD)
{
    char cwd[PATH_MAX + 1];
    ASSERT_NE(getcwd(cwd, PATH_MAX), nullptr);
    ASSERT_EQ(absPath(""), cwd);
}

TEST(absPath, relativeToGivenDirectory)
{
    ASSERT_EQ(absPath("auth.json", "/etc/containers"), "/etc/containers/auth.json");
    ASSERT_EQ(absPath("../docker/config.json", "/etc/containers"), "/etc/docker/config.json");
    ASSERT_EQ(absPath("/abs/config.json", "/ignored"), "/abs/config.json");
}

/* ----------------------------------------------------------------------------
 * canonPath
 * --------------------------------------------------------------------------*/

TEST(canonPath, removesDotsAndSlashes)
{
    ASSERT_EQ(canonPath("/a//b/./c/"), "/a/b/c");
    ASSERT_EQ(canonPath("/a/b/../c"), "/a/c");
    ASSERT_EQ(canonPath("/../.."), "/");
}

TEST(canonPath, requiresAbsolutePath)
{
    ASSERT_THROW(canonPath("relative"), Error);
}

/* ----------------------------------------------------------------------------
 * dirOf, baseNameOf, joinPath
 * --------------------------------------------------------------------------*/

TEST(dirOf, works)
{
    ASSERT_EQ(dirOf("/etc/ociauth.json"), "/etc");
    ASSERT_EQ(dirOf("/ociauth.json"), "/");
    ASSERT_EQ(dirOf("ociauth.json"), ".");
}

TEST(baseNameOf, works)
{
    ASSERT_EQ(baseNameOf("/etc/ociauth.json"), "ociauth.json");
    ASSERT_EQ(baseNameOf("/dir/"), "dir");
    ASSERT_EQ(baseNameOf(""), "");
}

TEST(joinPath, works)
{
    ASSERT_EQ(joinPath("/home/example", ".docker/config.json"), "/home/example/.docker/config.json");
    ASSERT_EQ(joinPath("/", ".dockercfg"), "/.dockercfg");
    ASSERT_EQ(joinPath("", "auth.json"), "auth.json");
}

/* ----------------------------------------------------------------------------
 * readFile, pathExists
 * --------------------------------------------------------------------------*/

TEST(readFile, missingFileIsENOENT)
{
    try {
        readFile("/ociauth-tests/definitely/not/here");
        FAIL() << "expected a SysError";
    } catch (SysError & e) {
        EXPECT_EQ(e.errNo, ENOENT);
    }
}

TEST(readFile, readsContents)
{
    auto path = (std::filesystem::temp_directory_path() / ("ociauth-readfile-" + std::to_string(getpid()))).string();
    {
        std::ofstream out(path);
        out << "{\"auths\": {}}\n";
    }
    EXPECT_TRUE(pathExists(path));
    EXPECT_EQ(readFile(path), "{\"auths\": {}}\n");
    std::filesystem::remove(path);
    EXPECT_FALSE(pathExists(path));
}

} // namespace ociauth
