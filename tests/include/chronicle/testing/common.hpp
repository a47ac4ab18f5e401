#pragma once

#include <chronicle/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace chronicle::testing {

inline chronicle::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = chronicle::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline chronicle::schema::value_t text(const std::string_view value) {
  return chronicle::schema::scalar_t{std::string{value}};
}

inline chronicle::schema::value_t number(const int64_t value) {
  return chronicle::schema::scalar_t{value};
}

inline chronicle::schema::value_t null_value() {
  return std::nullopt;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Deterministic time source; tests move it forward explicitly.
struct manual_clock final {
  chronicle::schema::timestamp_milliseconds_t now{1'000};

  chronicle::schema::timestamp_milliseconds_t advance(
      const chronicle::schema::timestamp_milliseconds_t by) {
    now += by;
    return now;
  }
};

}  // namespace chronicle::testing
