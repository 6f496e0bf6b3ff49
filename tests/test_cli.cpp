#include <gtest/gtest.h>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "diyanet/cli.h"
#include "canned_site.h"
#include "fake_http_client.h"
#include "temp_dir.h"

using namespace diyanet;
using diyanet::testing::FakeHttpClient;
using diyanet::testing::HttpClientRef;
using diyanet::testing::TempDir;
using namespace diyanet::testing;

class CliTest : public ::testing::Test {
protected:
    CliTest() {
        install_canned_site(http);
        defaults.base_url = BASE;
    }

    // Runs diyanet-times against the canned site with the cache in a fresh directory
    int run(std::vector<std::string> args) {
        args.insert(args.begin(), {"-c", dir.path().string()});
        return run_raw(args);
    }

    int run_raw(const std::vector<std::string>& args) {
        out.str("");
        err.str("");
        auto make_http = [this](const Config& config) -> std::unique_ptr<HttpClient> {
            used_config = config;
            return std::make_unique<HttpClientRef>(http);
        };
        return run_cli(args, defaults, make_http, out, err);
    }

    TempDir dir;
    FakeHttpClient http;
    Config defaults;
    Config used_config;
    std::ostringstream out;
    std::ostringstream err;
};

TEST_F(CliTest, NoNamesListsCountries) {
    EXPECT_EQ(run({}), CLI_EXIT_OK);
    EXPECT_EQ(out.str(), "turkey\nalmanya\n");
}

TEST_F(CliTest, CountryListsItsStates) {
    EXPECT_EQ(run({"TURKEY"}), CLI_EXIT_OK);
    EXPECT_EQ(out.str(), "ANKARA\nISTANBUL\n");
}

TEST_F(CliTest, CountryAndStateListRegions) {
    EXPECT_EQ(run({"turkey", "Istanbul"}), CLI_EXIT_OK);
    EXPECT_EQ(out.str(), "KADIKOY\nUSKUDAR\n");
}

TEST_F(CliTest, FullPathPrintsTimesInScheduleOrder) {
    EXPECT_EQ(run({"turkey", "istanbul", "kadikoy"}), CLI_EXIT_OK);
    EXPECT_EQ(out.str(),
              "Fajr ===> 05:12\n"
              "Sunrise ===> 06:37\n"
              "Dhuhr ===> 12:58\n"
              "Asr ===> 16:21\n"
              "Maghrib ===> 19:09\n"
              "Isha ===> 19:02\n");
}

TEST_F(CliTest, SecondRunIsServedFromCacheFile) {
    ASSERT_EQ(run({"turkey", "istanbul", "kadikoy"}), CLI_EXIT_OK);
    const int requests = http.total_requests();
    std::string first = out.str();

    ASSERT_EQ(run({"turkey", "istanbul", "kadikoy"}), CLI_EXIT_OK);
    EXPECT_EQ(out.str(), first);
    EXPECT_EQ(http.total_requests(), requests);
}

TEST_F(CliTest, UnknownNameExitsWithError) {
    EXPECT_EQ(run({"Atlantis"}), CLI_EXIT_ERROR);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(CliTest, FetchFailureExitsWithError) {
    http.set_failure(HOME_URL, "connection refused");
    EXPECT_EQ(run({}), CLI_EXIT_ERROR);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(CliTest, UnusableCacheDirExitsWithError) {
    std::string file = dir.file("not-a-dir");
    { std::ofstream touch(file); }
    EXPECT_EQ(run_raw({"-c", file}), CLI_EXIT_ERROR);
    EXPECT_EQ(http.total_requests(), 0);
}

TEST_F(CliTest, UsageErrors) {
    EXPECT_EQ(run({"--frobnicate"}), CLI_EXIT_USAGE);
    EXPECT_NE(err.str().find("Usage:"), std::string::npos);

    EXPECT_EQ(run({"a", "b", "c", "d"}), CLI_EXIT_USAGE);
    EXPECT_EQ(run({"-t", "soon"}), CLI_EXIT_USAGE);
    EXPECT_EQ(run({"-t", "-5"}), CLI_EXIT_USAGE);
    EXPECT_EQ(run_raw({"turkey", "--cache-dir"}), CLI_EXIT_USAGE);

    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(http.total_requests(), 0);
}

TEST_F(CliTest, HelpPrintsUsage) {
    EXPECT_EQ(run_raw({"--help"}), CLI_EXIT_OK);
    EXPECT_NE(err.str().find("Usage: diyanet-times"), std::string::npos);
    EXPECT_EQ(http.total_requests(), 0);
}

TEST_F(CliTest, OptionsReachTheHttpClient) {
    const std::string mirror = "https://mirror.example";
    install_canned_site(http, mirror);

    EXPECT_EQ(run({"-b", mirror, "-t", "5"}), CLI_EXIT_OK);
    EXPECT_EQ(used_config.base_url, mirror);
    EXPECT_EQ(used_config.timeout_secs, 5);
    EXPECT_EQ(http.requests(mirror + "/tr-TR/home"), 1);
    EXPECT_EQ(http.requests(HOME_URL), 0);
}

TEST(CliArgumentsTest, ParsesNamesAndFlags) {
    CliOptions options;
    ASSERT_TRUE(parse_cli_arguments({"-vv", "turkey", "--timeout", "0", "istanbul"}, options));
    EXPECT_EQ(options.names, (std::vector<std::string>{"turkey", "istanbul"}));
    EXPECT_EQ(options.config.timeout_secs, 0);
    EXPECT_EQ(options.config.log_level, LogLevel::Debug);
    EXPECT_FALSE(options.show_help);
}

TEST(CliArgumentsTest, SingleVerboseSelectsInfo) {
    CliOptions options;
    ASSERT_TRUE(parse_cli_arguments({"-v"}, options));
    EXPECT_EQ(options.config.log_level, LogLevel::Info);
}
