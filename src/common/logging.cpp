#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <courier/common/logging.hpp>
#include <memory>
#include <vector>

namespace courier::common {

void init_logging(const logging_config& config) {
  if (!spdlog::thread_pool()) {
    spdlog::init_thread_pool(8192, 1);
  }

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (config.file.has_value()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(*config.file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      config.logger_name, std::begin(sinks), std::end(sinks),
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  auto level = spdlog::level::from_str(config.level);
  if (level == spdlog::level::off && config.level != "off") {
    level = spdlog::level::info;
  }
  logger->set_level(level);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::info("Logging initialized at level {}", config.level);
}

}  // namespace courier::common
