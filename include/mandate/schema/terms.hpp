#pragma once
#include <mandate/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>

// Flat positional layouts used by caveat terms and args. Every field has a
// fixed big-endian width; the enforcer's get_terms_info is the authority on
// the total length.
namespace mandate::schema {

using word_t = std::array<uint8_t, 32>;

inline constexpr std::size_t kAddressWidth = 20;
inline constexpr std::size_t kWordWidth = 32;
inline constexpr std::size_t kUint128Width = 16;
inline constexpr std::size_t kUint64Width = 8;
inline constexpr std::size_t kSelectorWidth = 4;

word_t to_word(const amount_t& value);
amount_t from_word(const bytes_view_t& bytes);
word_t to_word(const address_t& address);

class terms_reader final {
 public:
  explicit terms_reader(const bytes_view_t& bytes) : bytes_{bytes} {}

  std::size_t remaining() const { return bytes_.size() - offset_; }
  bool done() const { return remaining() == 0; }

  // Callers check the total length first; reads past the end terminate.
  address_t read_address();
  amount_t read_uint256();
  uint128_t read_uint128();
  uint64_t read_uint64();
  uint8_t read_uint8();
  selector_t read_selector();
  bytes_view_t read_bytes(std::size_t size);
  bytes_view_t read_rest();

 private:
  bytes_view_t take(std::size_t size);

  bytes_view_t bytes_;
  std::size_t offset_{};
};

class terms_writer final {
 public:
  terms_writer& write_address(const address_t& address);
  terms_writer& write_uint256(const amount_t& value);
  terms_writer& write_uint128(const uint128_t& value);
  terms_writer& write_uint64(uint64_t value);
  terms_writer& write_uint8(uint8_t value);
  terms_writer& write_selector(const selector_t& selector);
  terms_writer& write_bytes(const bytes_view_t& bytes);

  const bytes_t& bytes() const { return bytes_; }
  bytes_t release() { return std::move(bytes_); }

 private:
  bytes_t bytes_;
};

}  // namespace mandate::schema
