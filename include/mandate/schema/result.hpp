#pragma once

#include <mandate/schema/error_code.hpp>
#include <mandate/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace mandate::schema {

template <uint16_t Version>
struct result;

template <>
struct result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string codespace;
};

using result_t = result<1>;

inline result_t make_ok(bytes_t data = {}) {
  return result_t{.code = 0, .data = std::move(data)};
}

inline result_t make_error(const error_code code,
                           const std::string_view log,
                           const std::string_view codespace) {
  return result_t{.code = static_cast<uint32_t>(code),
                  .log = std::string{log},
                  .codespace = std::string{codespace}};
}

inline error_code code_of(const result_t& result) {
  return static_cast<error_code>(result.code);
}

}  // namespace mandate::schema
