#pragma once
#include <mandate/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace mandate::schema::key {

/// Composes store keys from a keyspace prefix and fixed-width parts.
struct builder final {
  mandate::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const address_t& address);
  builder& write(const hash32_t& hash);
  builder& write(const amount_t& amount);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
    return *this;
  }
};

}  // namespace mandate::schema::key
