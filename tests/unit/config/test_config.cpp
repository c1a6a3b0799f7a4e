#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

#include "depot/config/config.hpp"
#include "test_helpers.hpp"

using namespace depot::test;
using depot::ErrorCode;
using depot::config::Config;

class ConfigTest : public TempDirTest {};

TEST_F(ConfigTest, DefaultsOnly) {
  Config config = Config::defaults();

  EXPECT_EQ(config.naming.max_filename_bytes, 255u);
  EXPECT_EQ(config.naming.default_suffix, "_o");
  EXPECT_EQ(config.naming.legacy_max_attempts, 1000u);
  EXPECT_TRUE(config.dated_directories);
  EXPECT_EQ(config.log_level, "info");
  EXPECT_TRUE(config.log_file.empty());
  EXPECT_FALSE(config.storage_root.empty());
  EXPECT_OK(config.validate());
}

TEST_F(ConfigTest, LoadsAllSections) {
  auto path = createFile("depot.toml", R"(
[naming]
max_filename_bytes = 253
default_suffix = "_orig"
legacy_max_attempts = 50

[storage]
root = "/srv/depot/content"
dated_directories = false

[logging]
level = "debug"
file = "/var/log/depot.log"
)");

  auto result = Config::fromFile(path);
  ASSERT_OK(result);
  EXPECT_EQ(result->naming.max_filename_bytes, 253u);
  EXPECT_EQ(result->naming.default_suffix, "_orig");
  EXPECT_EQ(result->naming.legacy_max_attempts, 50u);
  EXPECT_EQ(result->storage_root.string(), "/srv/depot/content");
  EXPECT_FALSE(result->dated_directories);
  EXPECT_EQ(result->log_level, "debug");
  EXPECT_EQ(result->log_file.string(), "/var/log/depot.log");
  EXPECT_EQ(result->configPath().string(), path.string());
}

TEST_F(ConfigTest, MissingKeysKeepDefaults) {
  auto path = createFile("partial.toml", R"(
[naming]
max_filename_bytes = 200
)");

  auto result = Config::fromFile(path);
  ASSERT_OK(result);
  EXPECT_EQ(result->naming.max_filename_bytes, 200u);
  EXPECT_EQ(result->naming.default_suffix, "_o");
  EXPECT_TRUE(result->dated_directories);
}

TEST_F(ConfigTest, MissingFile) {
  EXPECT_ERROR(Config::fromFile(temp_dir_ / "absent.toml"), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, ParseError) {
  auto path = createFile("broken.toml", "[naming\nmax_filename_bytes = ");
  EXPECT_ERROR(Config::fromFile(path), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, RejectsInvalidNamingValues) {
  auto too_small = createFile("small.toml", "[naming]\nmax_filename_bytes = 20\n");
  EXPECT_ERROR(Config::fromFile(too_small), ErrorCode::kValidationError);

  auto negative = createFile("negative.toml", "[naming]\nmax_filename_bytes = -1\n");
  EXPECT_ERROR(Config::fromFile(negative), ErrorCode::kValidationError);

  auto bad_suffix = createFile("suffix.toml", "[naming]\ndefault_suffix = \"/o\"\n");
  EXPECT_ERROR(Config::fromFile(bad_suffix), ErrorCode::kValidationError);

  auto zero_attempts = createFile("attempts.toml", "[naming]\nlegacy_max_attempts = 0\n");
  EXPECT_ERROR(Config::fromFile(zero_attempts), ErrorCode::kValidationError);
}

TEST_F(ConfigTest, ExplicitPathConstructorFallsBackToDefaults) {
  Config config(temp_dir_ / "absent.toml");
  EXPECT_EQ(config.naming.max_filename_bytes, 255u);
  ASSERT_TRUE(config.loadError().has_value());
  EXPECT_EQ(config.loadError()->code(), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, InvalidFileLeavesDefaultsInPlace) {
  auto path = createFile("invalid.toml", R"([naming]
max_filename_bytes = 20
default_suffix = "_x"

[storage]
dated_directories = false
)");

  Config config(path);
  ASSERT_TRUE(config.loadError().has_value());
  EXPECT_EQ(config.loadError()->code(), ErrorCode::kValidationError);
  EXPECT_EQ(config.naming.max_filename_bytes, 255u);
  EXPECT_EQ(config.naming.default_suffix, "_o");
  EXPECT_TRUE(config.dated_directories);
  EXPECT_OK(config.validate());
}

TEST_F(ConfigTest, FailedLoadKeepsPreviousValues) {
  auto good = createFile("good.toml", "[naming]\nmax_filename_bytes = 200\n");
  auto bad = createFile("bad.toml", "[naming]\nmax_filename_bytes = 200\nlegacy_max_attempts = 0\n");

  Config config = Config::defaults();
  ASSERT_OK(config.load(good));
  EXPECT_ERROR(config.load(bad), ErrorCode::kValidationError);
  EXPECT_EQ(config.naming.max_filename_bytes, 200u);
  EXPECT_EQ(config.naming.legacy_max_attempts, 1000u);
  EXPECT_EQ(config.configPath().string(), good.string());
}

TEST_F(ConfigTest, SaveWritesLoadableFile) {
  Config config = Config::defaults();
  config.naming.max_filename_bytes = 240;
  config.storage_root = temp_dir_ / "content";
  config.dated_directories = false;

  auto path = temp_dir_ / "nested" / "config.toml";
  ASSERT_OK(config.save(path));

  auto reloaded = Config::fromFile(path);
  ASSERT_OK(reloaded);
  EXPECT_EQ(reloaded->naming.max_filename_bytes, 240u);
  EXPECT_EQ(reloaded->storage_root.string(), (temp_dir_ / "content").string());
  EXPECT_FALSE(reloaded->dated_directories);
}

class DefaultConfigTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    if (const char* value = std::getenv("XDG_CONFIG_HOME")) {
      saved_config_home_ = value;
    }
    setenv("XDG_CONFIG_HOME", (temp_dir_ / "config").c_str(), 1);

    previous_logger_ = spdlog::default_logger();
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_output_);
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("capture", sink));
  }

  void TearDown() override {
    spdlog::set_default_logger(previous_logger_);
    if (saved_config_home_) {
      setenv("XDG_CONFIG_HOME", saved_config_home_->c_str(), 1);
    } else {
      unsetenv("XDG_CONFIG_HOME");
    }
    TempDirTest::TearDown();
  }

  std::ostringstream log_output_;
  std::shared_ptr<spdlog::logger> previous_logger_;
  std::optional<std::string> saved_config_home_;
};

TEST_F(DefaultConfigTest, BrokenDefaultFileIsReportedWithoutLogging) {
  createFile("config/depot/config.toml", "[naming]\nmax_filename_bytes = 20\n");
  ASSERT_EQ(Config::defaultConfigPath().string(),
            (temp_dir_ / "config" / "depot" / "config.toml").string());

  Config config;
  ASSERT_TRUE(config.loadError().has_value());
  EXPECT_EQ(config.loadError()->code(), ErrorCode::kValidationError);
  EXPECT_EQ(config.naming.max_filename_bytes, 255u);

  spdlog::default_logger()->flush();
  EXPECT_TRUE(log_output_.str().empty());
}

TEST_F(DefaultConfigTest, MissingDefaultFileIsNotAnError) {
  Config config;
  EXPECT_FALSE(config.loadError().has_value());
  EXPECT_OK(config.validate());
}
