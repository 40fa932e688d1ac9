#include <gtest/gtest.h>
#include "shell/Error.hpp"
#include "shell/ValueResolver.hpp"
#include "TestCommands.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace hs::shell;
using namespace hs::test;

class ValueResolverTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("hubsh-resolver-test-" + std::to_string(::getpid()));
        fs::create_directories(dir);
    }

    void TearDown() override { fs::remove_all(dir); }
};

TEST_F(ValueResolverTest, PlainValuesPassThrough) {
    const CurlValueResolver resolver;
    EXPECT_EQ(resolver.resolve("acme"), "acme");
    EXPECT_EQ(resolver.resolve(""), "");
    EXPECT_EQ(resolver.resolve("ftp://example.test"), "ftp://example.test");
}

TEST_F(ValueResolverTest, Prefixes) {
    EXPECT_TRUE(ValueResolver::isUrl("http://x"));
    EXPECT_TRUE(ValueResolver::isUrl("https://x"));
    EXPECT_FALSE(ValueResolver::isUrl("file:///x"));
    EXPECT_TRUE(ValueResolver::isFileUri("file:///x"));
    EXPECT_FALSE(ValueResolver::isFileUri("/x"));
}

TEST_F(ValueResolverTest, ReadsLocalFileAndTrimsTrailingWhitespace) {
    const auto p = dir / "value.txt";
    std::ofstream(p) << "  leading kept\nsecond line\n\n\t ";

    const CurlValueResolver resolver;
    EXPECT_EQ(resolver.resolve("file://" + p.string()), "  leading kept\nsecond line");
}

TEST_F(ValueResolverTest, MissingFileIsIoError) {
    const CurlValueResolver resolver;
    try {
        (void)resolver.resolve("file://" + (dir / "absent.txt").string());
        FAIL() << "expected IoError";
    } catch (const ShellError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IoError);
    }
}

TEST_F(ValueResolverTest, DirectoryIsIoError) {
    const CurlValueResolver resolver;
    try {
        (void)resolver.resolve("file://" + dir.string());
        FAIL() << "expected IoError";
    } catch (const ShellError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IoError);
    }
}

TEST_F(ValueResolverTest, DisabledResolverPassesEverythingThrough) {
    hs::config::RemoteConfig cnf;
    cnf.enabled = false;
    const CurlValueResolver resolver(cnf);
    EXPECT_EQ(resolver.resolve("file:///definitely/not/here"), "file:///definitely/not/here");
    EXPECT_EQ(resolver.resolve("http://example.test"), "http://example.test");
}

TEST_F(ValueResolverTest, UnreachableUrlIsHttpError) {
    hs::config::RemoteConfig cnf;
    cnf.timeout_seconds = 2;
    const CurlValueResolver resolver(cnf);
    try {
        // Port 9 on loopback: nothing listens there
        (void)resolver.resolve("http://127.0.0.1:9/");
        FAIL() << "expected HttpError";
    } catch (const ShellError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::HttpError);
    }
}

TEST_F(ValueResolverTest, UrlBodyIsTrimmed) {
    FakeResolver resolver;
    resolver.urls["https://example.test/v"] = "value \r\n";
    EXPECT_EQ(resolver.resolve("https://example.test/v"), "value");
}
