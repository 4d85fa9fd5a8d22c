#include <tender/common/logging.hpp>

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace tender::common {

std::optional<spdlog::level::level_enum> try_parse_log_level(
    const std::string_view value) {
  auto level = spdlog::level::from_str(std::string{value});
  // from_str falls back to `off` for unknown names.
  if (level == spdlog::level::off && value != "off") {
    return std::nullopt;
  }
  return level;
}

void configure_logging(spdlog::level::level_enum level,
                       const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "tender", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(level);
}

}  // namespace tender::common
