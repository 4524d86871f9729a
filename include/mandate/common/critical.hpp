#pragma once

#include <csignal>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace mandate::common {

/// Log, flush and terminate. Reserved for broken invariants and unusable
/// storage; rejected redemptions are reported through result_t instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename... Args>
[[noreturn]] void critical(fmt::format_string<Args...> format,
                           Args&&... args) {
  auto message = fmt::format(format, std::forward<Args>(args)...);
  critical(std::string_view{message});
}

}  // namespace mandate::common
