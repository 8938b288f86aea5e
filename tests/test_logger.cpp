#include "core/config.hpp"
#include "core/logger.hpp"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

class LoggerTest : public ::testing::Test {
protected:
  void SetUp() override {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    test_dir = std::filesystem::temp_directory_path() /
               (std::string("textguard_logger_test_") + info->name());
    std::filesystem::remove_all(test_dir);
    std::filesystem::create_directories(test_dir);
    log_path = (test_dir / "textguard.log").string();
  }

  void TearDown() override {
    // Back to stdout so other suites do not write into the scratch dir
    LogManager::instance().configure(Config::AppConfig().logging);
    std::filesystem::remove_all(test_dir);
  }

  static std::string read_file(const std::string &path) {
    std::ifstream in(path);
    return std::string((std::istreambuf_iterator<char>(in)),
                       std::istreambuf_iterator<char>());
  }

  std::filesystem::path test_dir;
  std::string log_path;
};

TEST_F(LoggerTest, WritesFormattedLinesToLogFile) {
  Config::AppConfig config;
  config.logging.log_file = log_path;
  config.logging.log_levels[LogComponent::DICT_LOADER] = LogLevel::DEBUG;
  LogManager::instance().configure(config.logging);

  LOG(LogLevel::DEBUG, LogComponent::DICT_LOADER, "loaded " << 3 << " words");
  LOG(LogLevel::TRACE, LogComponent::DICT_LOADER, "filtered out");

  std::string contents = read_file(log_path);
  EXPECT_NE(contents.find("[DEBUG] [DICT.LOADER]"), std::string::npos);
  EXPECT_NE(contents.find("loaded 3 words"), std::string::npos);
  EXPECT_EQ(contents.find("filtered out"), std::string::npos);
}

TEST_F(LoggerTest, RotatesFileWhenSizeLimitIsReached) {
  Config::AppConfig config;
  config.logging.log_file = log_path;
  config.logging.log_max_size_bytes = 200;
  config.logging.log_max_backups = 2;
  LogManager::instance().configure(config.logging);

  const std::string line(50, 'x'); // 51 bytes with the newline
  for (int i = 0; i < 20; ++i)
    LogManager::instance().write(line);

  EXPECT_TRUE(std::filesystem::exists(log_path));
  EXPECT_TRUE(std::filesystem::exists(log_path + ".1"));
  EXPECT_TRUE(std::filesystem::exists(log_path + ".2"));
  EXPECT_FALSE(std::filesystem::exists(log_path + ".3"));
  EXPECT_LE(std::filesystem::file_size(log_path), 200u);
  EXPECT_EQ(std::filesystem::file_size(log_path + ".1"), 3u * 51);
}

TEST_F(LoggerTest, ZeroSizeLimitNeverRotates) {
  Config::AppConfig config;
  config.logging.log_file = log_path;
  config.logging.log_max_size_bytes = 0;
  LogManager::instance().configure(config.logging);

  const std::string line(50, 'y');
  for (int i = 0; i < 20; ++i)
    LogManager::instance().write(line);

  EXPECT_FALSE(std::filesystem::exists(log_path + ".1"));
  EXPECT_EQ(std::filesystem::file_size(log_path), 20u * 51);
}
