#include <algorithm>
#include <iterator>
#include <mandate/schema/key/builder.hpp>
#include <mandate/schema/terms.hpp>
#include <ranges>

using namespace mandate::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const mandate::schema::address_t& address) {
  return write(std::span{address.data(), address.size()});
}

builder& builder::write(const mandate::schema::hash32_t& hash) {
  return write(std::span{hash.data(), hash.size()});
}

builder& builder::write(const mandate::schema::amount_t& amount) {
  auto word = mandate::schema::to_word(amount);
  return write(std::span{word.data(), word.size()});
}
