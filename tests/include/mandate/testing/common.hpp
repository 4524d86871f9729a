#pragma once

#include <mandate/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace mandate::testing {

inline mandate::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = mandate::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Address whose every byte is `seed`.
inline mandate::schema::address_t make_address(const uint8_t seed) {
  auto out = mandate::schema::address_t{};
  out.fill(seed);
  return out;
}

inline const auto kAlice = make_address(0x11);
inline const auto kBob = make_address(0x22);
inline const auto kCarol = make_address(0x33);
inline const auto kDave = make_address(0x44);
inline const auto kToken = make_address(0x70);
inline const auto kOtherToken = make_address(0x71);
inline const auto kManagerAddress = make_address(0xA0);
inline const auto kOwner = make_address(0xA1);

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

}  // namespace mandate::testing
