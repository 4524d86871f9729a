#pragma once

#include <mandate/schema/primitives.hpp>

#include <stdexcept>
#include <string>

// Arithmetic on 256-bit amounts that must never wrap. Failures throw
// arithmetic_error, which the delegation manager turns into an aborted
// redemption.
namespace mandate::common {

class arithmetic_error final : public std::overflow_error {
 public:
  explicit arithmetic_error(const std::string& what)
      : std::overflow_error{what} {}
};

inline mandate::schema::amount_t checked_add(
    const mandate::schema::amount_t& lhs,
    const mandate::schema::amount_t& rhs) {
  auto sum = lhs + rhs;
  if (sum < lhs) {
    throw arithmetic_error{"addition overflow"};
  }
  return sum;
}

inline mandate::schema::amount_t checked_sub(
    const mandate::schema::amount_t& lhs,
    const mandate::schema::amount_t& rhs) {
  if (rhs > lhs) {
    throw arithmetic_error{"subtraction underflow"};
  }
  return lhs - rhs;
}

inline mandate::schema::amount_t checked_mul(
    const mandate::schema::amount_t& lhs,
    const mandate::schema::amount_t& rhs) {
  if (lhs == 0 || rhs == 0) {
    return 0;
  }
  auto product = lhs * rhs;
  if (product / rhs != lhs) {
    throw arithmetic_error{"multiplication overflow"};
  }
  return product;
}

}  // namespace mandate::common
