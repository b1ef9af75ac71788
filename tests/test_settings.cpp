#include "utils/Logger.hpp"
#include "utils/Settings.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <iterator>

using namespace sten;

class SettingsTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("sten_settings_" +
            std::string(
                ::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  void write(const fs::path &path, const std::string &content) {
    std::ofstream(path) << content;
  }

  fs::path dir_;
};

TEST_F(SettingsTest, MissingFileGivesDefaults) {
  const Settings settings = Settings::load(dir_ / "absent.json");
  EXPECT_FALSE(settings.brute);
  EXPECT_TRUE(settings.parallel_brute_force);
  EXPECT_TRUE(settings.confirm_overwrite);
  EXPECT_EQ(settings.cipher_key_mask, "*");
  EXPECT_EQ(settings.prng_seed_mask, "*");
  EXPECT_EQ(settings.log_level, "info");
  EXPECT_EQ(settings.log_file, "logs/sten.log");
}

TEST_F(SettingsTest, SaveThenLoadKeepsValues) {
  Settings settings;
  settings.brute = true;
  settings.confirm_overwrite = false;
  settings.cipher_key_mask = "#";
  settings.log_level = "debug";
  settings.log_file = "";

  const fs::path path = dir_ / "nested" / "sten.json";
  settings.save(path);
  ASSERT_TRUE(fs::exists(path));

  const Settings loaded = Settings::load(path);
  EXPECT_TRUE(loaded.brute);
  EXPECT_FALSE(loaded.confirm_overwrite);
  EXPECT_EQ(loaded.cipher_key_mask, "#");
  EXPECT_EQ(loaded.log_level, "debug");
  EXPECT_TRUE(loaded.log_file.empty());
}

TEST_F(SettingsTest, UsesCamelCaseKeys) {
  const json j = Settings{};
  EXPECT_TRUE(j.contains("parallelBruteForce"));
  EXPECT_TRUE(j.contains("confirmOverwrite"));
  EXPECT_TRUE(j.contains("cipherKeyMask"));
  EXPECT_TRUE(j.contains("prngSeedMask"));
}

TEST_F(SettingsTest, AbsentKeysKeepDefaults) {
  write(dir_ / "partial.json", R"({"brute": true})");
  const Settings settings = Settings::load(dir_ / "partial.json");
  EXPECT_TRUE(settings.brute);
  EXPECT_TRUE(settings.confirm_overwrite);
  EXPECT_EQ(settings.log_level, "info");
}

TEST_F(SettingsTest, MalformedFileGivesDefaults) {
  write(dir_ / "broken.json", "{\"brute\": tru");
  EXPECT_FALSE(Settings::load(dir_ / "broken.json").brute);

  write(dir_ / "array.json", "[1, 2, 3]");
  EXPECT_FALSE(Settings::load(dir_ / "array.json").brute);

  write(dir_ / "typed.json", R"({"brute": "yes"})");
  EXPECT_FALSE(Settings::load(dir_ / "typed.json").brute);
}

TEST_F(SettingsTest, LogConfigParsesLevel) {
  Settings settings;
  settings.log_level = "debug";
  EXPECT_EQ(settings.logConfig().level, spdlog::level::debug);
  settings.log_level = "off";
  EXPECT_EQ(settings.logConfig().level, spdlog::level::off);
  settings.log_level = "chatty";
  EXPECT_EQ(settings.logConfig().level, spdlog::level::info);
  EXPECT_EQ(settings.logConfig().file, "logs/sten.log");
}

TEST_F(SettingsTest, MasksSecrets) {
  Settings settings;
  EXPECT_EQ(settings.maskKey("secret"), "******");
  settings.prng_seed_mask = "?";
  EXPECT_EQ(settings.maskSeed("abc"), "???");
  settings.cipher_key_mask = "";
  EXPECT_EQ(settings.maskKey("plain"), "plain");
}

TEST_F(SettingsTest, LoggingWritesToConfiguredFile) {
  LogConfig config;
  config.level = spdlog::level::debug;
  config.console = false;
  config.file = (dir_ / "logs" / "test.log").string();
  initLogging(config);

  auto logger = moduleLogger("SettingsTest");
  EXPECT_EQ(logger, moduleLogger("SettingsTest"));
  logger->info("hello from the test");
  logger->flush();

  std::ifstream log(config.file);
  const std::string content((std::istreambuf_iterator<char>(log)),
                            std::istreambuf_iterator<char>());
  EXPECT_NE(content.find("[SettingsTest]"), std::string::npos);
  EXPECT_NE(content.find("hello from the test"), std::string::npos);

  // Detach from the file before the directory is removed
  config.file.clear();
  config.console = true;
  config.level = spdlog::level::warn;
  initLogging(config);
}
