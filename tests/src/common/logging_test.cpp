#include <spdlog/spdlog.h>
#include <courier/common/logging.hpp>
#include <courier/testing/common.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>

namespace {

std::string read_file(const std::string& path) {
  auto input = std::ifstream{path};
  return std::string{std::istreambuf_iterator<char>{input},
                     std::istreambuf_iterator<char>{}};
}

}  // namespace

TEST(logging, file_sink_receives_messages_at_configured_level) {
  auto previous = spdlog::default_logger();
  auto path = courier::testing::make_db_path("courier_logging") + ".log";

  courier::common::init_logging(courier::common::logging_config{
      .level = "warn", .file = path, .logger_name = "courier_test"});
  spdlog::info("hidden line");
  spdlog::warn("visible line");
  spdlog::default_logger()->flush();

  auto contents = std::string{};
  for (auto attempt = 0; attempt < 50; ++attempt) {
    contents = read_file(path);
    if (contents.find("visible line") != std::string::npos) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
  }
  EXPECT_NE(contents.find("visible line"), std::string::npos);
  EXPECT_NE(contents.find("[courier_test]"), std::string::npos);
  EXPECT_EQ(contents.find("hidden line"), std::string::npos);
  EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::warn);

  spdlog::set_default_logger(previous);
  courier::testing::remove_path(path);
}

TEST(logging, unknown_level_falls_back_to_info) {
  auto previous = spdlog::default_logger();
  courier::common::init_logging(
      courier::common::logging_config{.level = "chatty",
                                      .logger_name = "courier_fallback"});
  EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::info);
  spdlog::set_default_logger(previous);
}
