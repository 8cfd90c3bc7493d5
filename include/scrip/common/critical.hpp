#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace scrip::common {

/// Log, flush and terminate. Reserved for infrastructure faults the engine
/// cannot recover from (storage unavailable, corrupt persisted state,
/// malformed operator input to the command-line tools).
[[noreturn]] inline void critical(const std::string_view message) {
  if (auto logger = spdlog::default_logger(); logger) {
    logger->critical("{}", message);
    logger->flush();
  }
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  critical(std::string_view{fmt::format(format, std::forward<Args>(args)...)});
}

}  // namespace scrip::common
