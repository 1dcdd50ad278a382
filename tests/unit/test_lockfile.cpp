#include <gtest/gtest.h>
#include "client/lockfile.hpp"
#include <filesystem>
#include <fstream>

using namespace draftlink;
using namespace draftlink::client;

TEST(LockfileTest, ParsesFiveFields) {
    auto result = parse_lockfile("LeagueClient:1234:50123:s3cr3t:https");

    ASSERT_TRUE(result.is_ok());
    const auto& info = result.value();
    EXPECT_EQ(info.scheme, "https");
    EXPECT_EQ(info.host, "127.0.0.1");
    EXPECT_EQ(info.port, "50123");
    EXPECT_EQ(info.username, "riot");
    EXPECT_EQ(info.secret, "s3cr3t");
    EXPECT_EQ(info.target, "/");
}

TEST(LockfileTest, IgnoresTrailingWhitespaceAndExtraFields) {
    auto result = parse_lockfile("LeagueClient:1234:50123:s3cr3t:https:extra\r\n");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().scheme, "https");
    EXPECT_EQ(result.value().secret, "s3cr3t");
}

TEST(LockfileTest, TooFewFieldsIsAnError) {
    auto result = parse_lockfile("LeagueClient:1234:50123");

    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("3 fields"), std::string::npos);
}

TEST(LockfileTest, EmptyContentIsAnError) {
    EXPECT_TRUE(parse_lockfile("").is_err());
}

TEST(LockfileTest, ReadsFromDisk) {
    auto path = std::filesystem::temp_directory_path() / "draftlink_lockfile_test";
    {
        std::ofstream out(path);
        out << "LeagueClient:99:61000:abc:https";
    }

    auto result = read_lockfile(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().port, "61000");
    EXPECT_EQ(result.value().secret, "abc");
}

TEST(LockfileTest, MissingFileIsAnError) {
    auto result = read_lockfile("/nonexistent/draftlink/lockfile");

    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("cannot open"), std::string::npos);
}
