#pragma once

#include <csignal>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace tender::common {

/// Log, flush and terminate. Reserved for broken invariants and storage
/// failures that leave the engine unable to guarantee its state.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

/// Formatted form, e.g. `critical("cannot open {}: {}", path, reason)`.
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  auto message = fmt::format(format, std::forward<Args>(args)...);
  critical(std::string_view{message});
}

}  // namespace tender::common
