#include <gtest/gtest.h>
#include <cstdlib>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <utility>
#include <vector>
#include "diyanet/config.h"
#include "diyanet/errors.h"
#include "temp_dir.h"

using namespace diyanet;
using diyanet::testing::TempDir;
namespace fs = std::filesystem;

// Saves the variables touched by these tests and restores them afterwards
class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : {ENV_CACHE_HOME, ENV_XDG_CACHE_HOME, "HOME",
                                 ENV_BASE_URL, ENV_TIMEOUT, ENV_LOG_LEVEL}) {
            const char* value = std::getenv(name);
            saved_.emplace_back(name, value ? std::optional<std::string>(value) : std::nullopt);
            ::unsetenv(name);
        }
    }

    void TearDown() override {
        for (const auto& entry : saved_) {
            if (entry.second) {
                ::setenv(entry.first, entry.second->c_str(), 1);
            } else {
                ::unsetenv(entry.first);
            }
        }
    }

    std::vector<std::pair<const char*, std::optional<std::string>>> saved_;
};

TEST_F(ConfigTest, Defaults) {
    Config config = load_config_from_env();
    EXPECT_EQ(config.base_url, DEFAULT_BASE_URL);
    EXPECT_EQ(config.timeout_secs, DEFAULT_TIMEOUT_SECS);
    EXPECT_EQ(config.log_level, LogLevel::Warning);
    EXPECT_TRUE(config.cache_dir.empty());
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    ::setenv(ENV_BASE_URL, "http://localhost:8080", 1);
    ::setenv(ENV_TIMEOUT, "5", 1);
    ::setenv(ENV_LOG_LEVEL, "debug", 1);

    Config config = load_config_from_env();
    EXPECT_EQ(config.base_url, "http://localhost:8080");
    EXPECT_EQ(config.timeout_secs, 5);
    EXPECT_EQ(config.log_level, LogLevel::Debug);
}

TEST_F(ConfigTest, InvalidValuesAreIgnored) {
    ::setenv(ENV_TIMEOUT, "soon", 1);
    ::setenv(ENV_LOG_LEVEL, "chatty", 1);

    Config config = load_config_from_env();
    EXPECT_EQ(config.timeout_secs, DEFAULT_TIMEOUT_SECS);
    EXPECT_EQ(config.log_level, LogLevel::Warning);

    ::setenv(ENV_TIMEOUT, "-3", 1);
    EXPECT_EQ(load_config_from_env().timeout_secs, DEFAULT_TIMEOUT_SECS);
}

TEST_F(ConfigTest, CacheHomeTakesPriority) {
    TempDir primary;
    TempDir xdg;
    ::setenv(ENV_CACHE_HOME, primary.path().c_str(), 1);
    ::setenv(ENV_XDG_CACHE_HOME, xdg.path().c_str(), 1);

    std::string dir = resolve_cache_dir();
    EXPECT_EQ(fs::path(dir), primary.path() / CACHE_SUBDIR);
    EXPECT_TRUE(fs::is_directory(dir));
    EXPECT_FALSE(fs::exists(xdg.path() / CACHE_SUBDIR));
}

TEST_F(ConfigTest, FallsBackToXdgThenHome) {
    TempDir xdg;
    ::setenv(ENV_XDG_CACHE_HOME, xdg.path().c_str(), 1);
    EXPECT_EQ(fs::path(resolve_cache_dir()), xdg.path() / CACHE_SUBDIR);

    ::unsetenv(ENV_XDG_CACHE_HOME);
    TempDir home;
    fs::create_directories(home.path() / ".cache");
    ::setenv("HOME", home.path().c_str(), 1);
    EXPECT_EQ(fs::path(resolve_cache_dir()), home.path() / ".cache" / CACHE_SUBDIR);
}

TEST_F(ConfigTest, MissingBaseDirectoryIsCacheDirError) {
    TempDir tmp;
    ::setenv(ENV_CACHE_HOME, (tmp.path() / "does-not-exist").c_str(), 1);
    EXPECT_THROW(resolve_cache_dir(), CacheDirError);
    EXPECT_FALSE(fs::exists(tmp.path() / "does-not-exist"));
}

TEST_F(ConfigTest, NoEnvironmentAtAllIsCacheDirError) {
    EXPECT_THROW(resolve_cache_dir(), CacheDirError);
}

TEST_F(ConfigTest, EnsureCacheDirRejectsFiles) {
    TempDir tmp;
    std::string file = tmp.file("plain");
    std::FILE* f = std::fopen(file.c_str(), "w");
    ASSERT_NE(f, nullptr);
    std::fclose(f);

    EXPECT_THROW(ensure_cache_dir(file), CacheDirError);
    EXPECT_NO_THROW(ensure_cache_dir(tmp.file("nested/dir")));
    EXPECT_TRUE(fs::is_directory(tmp.file("nested/dir")));
}

TEST_F(ConfigTest, CacheFilePath) {
    EXPECT_EQ(fs::path(cache_file_path("/var/cache/diyanet")), fs::path("/var/cache/diyanet") / CACHE_FILE_NAME);
}
