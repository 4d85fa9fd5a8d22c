#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace tender::common {

/// Map a level name ("trace", "debug", "info", "warn", "error", "critical",
/// "off") to spdlog's level enum.
std::optional<spdlog::level::level_enum> try_parse_log_level(
    const std::string_view value);

/// Install the process-wide async logger: colored stdout plus an optional
/// file sink when `log_file` is non-empty.
void configure_logging(spdlog::level::level_enum level,
                       const std::string& log_file);

}  // namespace tender::common
