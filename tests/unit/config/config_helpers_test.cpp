#include <gtest/gtest.h>

#include <codenexus/config/config_helpers.h>

#include "common/test_helpers.h"

#include <cstdlib>

using namespace codenexus;
using namespace codenexus::config;
using codenexus::tests::TempDir;
using codenexus::tests::write_file;

class ConfigHelpersTest : public ::testing::Test {
protected:
    void SetUp() override { ::unsetenv("CODENEXUS_LOG_LEVEL"); }
    void TearDown() override { ::unsetenv("CODENEXUS_LOG_LEVEL"); }

    TempDir dir_{"codenexus_config_"};
};

TEST_F(ConfigHelpersTest, TrimAndUnquote) {
    std::string s = "  \tvalue \n";
    trim(s);
    EXPECT_EQ(s, "value");
    EXPECT_EQ(unquote("\"quoted\""), "quoted");
    EXPECT_EQ(unquote("'single'"), "single");
    EXPECT_EQ(unquote("bare"), "bare");
}

TEST_F(ConfigHelpersTest, ParsesSectionedValues) {
    auto path = write_file(dir_.path() / "config.toml", R"(# comment
[storage]
data_dir_name = ".meta"   # inline comment
backup_on_write = false

[query]
suggestion_limit = 5
)");

    EXPECT_EQ(parse_config_value(path, "storage", "data_dir_name"), ".meta");
    EXPECT_EQ(parse_config_value(path, "storage", "backup_on_write"), "false");
    EXPECT_EQ(parse_config_value(path, "query", "suggestion_limit"), "5");
    EXPECT_EQ(parse_config_value(path, "query", "data_dir_name"), "");
}

TEST_F(ConfigHelpersTest, MissingFileYieldsDefaults) {
    auto cfg = load_config(dir_.path() / "absent.toml");
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().dataDirName, ".codenexus");
    EXPECT_TRUE(cfg.value().backupOnWrite);
    EXPECT_EQ(cfg.value().logLevel, "info");
    EXPECT_EQ(cfg.value().suggestionLimit, 10u);
    EXPECT_EQ(cfg.value().defaultMaxDepth, 3u);
}

TEST_F(ConfigHelpersTest, LoadsAllSettings) {
    auto path = write_file(dir_.path() / "config.toml", R"([storage]
data_dir_name = ".meta"
backup_on_write = no
[logging]
level = "debug"
[query]
suggestion_limit = 25
[graph]
default_max_depth = 7
)");

    auto cfg = load_config(path);
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().dataDirName, ".meta");
    EXPECT_FALSE(cfg.value().backupOnWrite);
    EXPECT_EQ(cfg.value().logLevel, "debug");
    EXPECT_EQ(cfg.value().suggestionLimit, 25u);
    EXPECT_EQ(cfg.value().defaultMaxDepth, 7u);
}

TEST_F(ConfigHelpersTest, MalformedNumberIsConfigError) {
    auto path = write_file(dir_.path() / "config.toml", "[graph]\ndefault_max_depth = deep\n");
    auto cfg = load_config(path);
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::ConfigError);
}

TEST_F(ConfigHelpersTest, MalformedBooleanIsConfigError) {
    auto path = write_file(dir_.path() / "config.toml", "[storage]\nbackup_on_write = maybe\n");
    auto cfg = load_config(path);
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::ConfigError);
}

TEST_F(ConfigHelpersTest, DataDirNameMustBeSingleComponent) {
    auto path = write_file(dir_.path() / "config.toml", "[storage]\ndata_dir_name = a/b\n");
    auto cfg = load_config(path);
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::ConfigError);
}

TEST_F(ConfigHelpersTest, EnvironmentOverridesLogLevel) {
    auto path = write_file(dir_.path() / "config.toml", "[logging]\nlevel = warn\n");
    ::setenv("CODENEXUS_LOG_LEVEL", "trace", 1);
    auto cfg = load_config(path);
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg.value().logLevel, "trace");
}

TEST_F(ConfigHelpersTest, ConfigPathOverrideWins) {
    EXPECT_EQ(get_config_path("/tmp/custom.toml"), std::filesystem::path("/tmp/custom.toml"));
    EXPECT_EQ(get_config_path().filename(), "config.toml");
}
