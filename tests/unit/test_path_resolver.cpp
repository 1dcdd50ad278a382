#include <gtest/gtest.h>
#include "client/path_resolver.hpp"
#include <filesystem>
#include <fstream>

using namespace draftlink;
using namespace draftlink::client;

namespace fs = std::filesystem;

class PathResolverTest : public ::testing::Test {
protected:
    fs::path install_dir;

    void SetUp() override {
        install_dir = fs::temp_directory_path() /
            (std::string("draftlink_install_") +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(install_dir);
        fs::create_directories(install_dir);
    }

    void TearDown() override {
        fs::remove_all(install_dir);
    }

    void make_client_layout() {
        std::ofstream(install_dir / std::string(PathResolver::client_executable_name())) << "bin";
        fs::create_directories(install_dir / "Config");
    }

    static PathResolver resolver_with(std::vector<ProcessInfo> processes,
                                      std::string kernel = "6.1.0-generic") {
        return PathResolver(
            "leagueclientux",
            [processes] { return processes; },
            kernel
        );
    }
};

TEST_F(PathResolverTest, ValidateRejectsEmptyDirectory) {
    EXPECT_FALSE(PathResolver::validate(install_dir));
    EXPECT_FALSE(PathResolver::validate(fs::path{}));
}

TEST_F(PathResolverTest, ValidateRequiresConfigDirectory) {
    std::ofstream(install_dir / std::string(PathResolver::client_executable_name())) << "bin";
    EXPECT_FALSE(PathResolver::validate(install_dir));
}

TEST_F(PathResolverTest, ValidateAcceptsMarkerlessLayout) {
    make_client_layout();
    EXPECT_TRUE(PathResolver::validate(install_dir));
}

TEST_F(PathResolverTest, ValidateAcceptsRegionalLayouts) {
    make_client_layout();
    fs::create_directories(install_dir / "RADS");
    EXPECT_TRUE(PathResolver::validate(install_dir));

    fs::remove_all(install_dir / "RADS");
    fs::create_directories(install_dir / "TQM");
    EXPECT_TRUE(PathResolver::validate(install_dir));
}

TEST(PathResolverStaticTest, ExtractsPlainInstallDirectory) {
    auto dir = PathResolver::extract_install_directory(
        "/opt/league/LeagueClientUx --install-directory=/games/League of Legends --app-port=1234",
        false
    );
    ASSERT_TRUE(dir.has_value());
    EXPECT_EQ(*dir, "/games/League of Legends");
}

TEST(PathResolverStaticTest, ExtractsPlainInstallDirectoryAtEnd) {
    auto dir = PathResolver::extract_install_directory(
        "LeagueClientUx.exe --install-directory=C:/Riot Games/League of Legends",
        false
    );
    ASSERT_TRUE(dir.has_value());
    EXPECT_EQ(*dir, "C:/Riot Games/League of Legends");
}

TEST(PathResolverStaticTest, ExtractsQuotedInstallDirectory) {
    auto dir = PathResolver::extract_install_directory(
        R"("LeagueClientUx.exe" "--install-directory=C:\Riot Games\League of Legends" "--app-port=1234")",
        true
    );
    ASSERT_TRUE(dir.has_value());
    EXPECT_EQ(*dir, R"(C:\Riot Games\League of Legends)");
}

TEST(PathResolverStaticTest, MissingFlagYieldsNothing) {
    EXPECT_FALSE(PathResolver::extract_install_directory("LeagueClientUx --app-port=1", false).has_value());
    EXPECT_FALSE(PathResolver::extract_install_directory("LeagueClientUx --app-port=1", true).has_value());
}

TEST(PathResolverStaticTest, NormalizeRewritesPathsUnderWsl) {
    EXPECT_EQ(
        PathResolver::normalize_path(R"(C:\Riot Games\League of Legends)", "5.15.90.1-microsoft-standard-WSL2"),
        "/mnt/c/Riot Games/League of Legends"
    );
    EXPECT_EQ(
        PathResolver::normalize_path("D:/Games/League", "4.4.0-19041-Microsoft"),
        "/mnt/d/Games/League"
    );
}

TEST(PathResolverStaticTest, NormalizeLeavesPathsAloneElsewhere) {
    EXPECT_EQ(
        PathResolver::normalize_path(R"(C:\Riot Games)", "6.1.0-generic"),
        R"(C:\Riot Games)"
    );
}

TEST_F(PathResolverTest, ResolvesFromMatchingProcess) {
    auto resolver = resolver_with({
        {.pid = 10, .name = "bash", .cmdline = "bash --install-directory=/wrong"},
        {.pid = 20, .name = "LeagueClientUx", .cmdline = "LeagueClientUx --install-directory=/games/league --app-port=1"},
    });

    auto result = resolver.resolve_from_processes();

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), "/games/league");
}

TEST_F(PathResolverTest, MatchesWrappedProcessThroughArgv0) {
    auto resolver = resolver_with({
        {.pid = 30, .name = "wine64-preload",
         .cmdline = "/opt/riot/LeagueClientUx.exe --install-directory=/games/league"},
    });

    auto result = resolver.resolve_from_processes();

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), "/games/league");
}

TEST_F(PathResolverTest, NormalizesResolvedPathUnderWsl) {
    auto resolver = resolver_with(
        {{.pid = 40, .name = "LeagueClientUx.exe",
          .cmdline = R"(LeagueClientUx.exe --install-directory=C:\Riot Games\League of Legends)"}},
        "5.15.90.1-microsoft-standard-WSL2"
    );

    auto result = resolver.resolve_from_processes();

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), "/mnt/c/Riot Games/League of Legends");
}

TEST_F(PathResolverTest, NoClientProcessIsAnError) {
    auto resolver = resolver_with({{.pid = 1, .name = "init", .cmdline = "/sbin/init"}});

    auto result = resolver.resolve_from_processes();

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), "client process not found");
}
