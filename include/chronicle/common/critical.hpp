#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

// Faults the store cannot recover from (unopenable database, undecodable
// row, corrupt key material). Anything a caller can react to is thrown as a
// chronicle::errors::temporal_error instead.
namespace chronicle::common {

[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("chronicle fault: {}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename... Args>
[[noreturn]] void critical(fmt::format_string<Args...> format,
                           Args&&... args) {
  critical(std::string_view{fmt::format(format, std::forward<Args>(args)...)});
}

}  // namespace chronicle::common
