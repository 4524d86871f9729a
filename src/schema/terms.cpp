#include <boost/endian/buffers.hpp>
#include <mandate/common/critical.hpp>
#include <mandate/schema/terms.hpp>

#include <algorithm>
#include <cstring>
#include <iterator>
#include <vector>

namespace mandate::schema {

namespace {

template <typename Integer, std::size_t Width>
std::array<uint8_t, Width> to_fixed(const Integer& value) {
  auto digits = std::vector<uint8_t>{};
  boost::multiprecision::export_bits(value, std::back_inserter(digits), 8,
                                     true);
  auto out = std::array<uint8_t, Width>{};
  if (digits.size() > Width) {
    mandate::common::critical("integer does not fit its fixed-width field");
  }
  std::copy(std::begin(digits), std::end(digits),
            std::begin(out) + static_cast<std::ptrdiff_t>(Width - digits.size()));
  return out;
}

template <typename Integer>
Integer from_fixed(const bytes_view_t& bytes) {
  auto value = Integer{};
  boost::multiprecision::import_bits(value, std::begin(bytes), std::end(bytes),
                                     8, true);
  return value;
}

}  // namespace

word_t to_word(const amount_t& value) {
  return to_fixed<amount_t, kWordWidth>(value);
}

amount_t from_word(const bytes_view_t& bytes) {
  return from_fixed<amount_t>(bytes);
}

word_t to_word(const address_t& address) {
  auto word = word_t{};
  std::copy(std::begin(address), std::end(address),
            std::begin(word) + (kWordWidth - kAddressWidth));
  return word;
}

bytes_view_t terms_reader::take(const std::size_t size) {
  if (size > remaining()) {
    mandate::common::critical("terms_reader read past the end of the terms");
  }
  auto out = bytes_.subspan(offset_, size);
  offset_ += size;
  return out;
}

address_t terms_reader::read_address() {
  auto bytes = take(kAddressWidth);
  auto address = address_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(address));
  return address;
}

amount_t terms_reader::read_uint256() {
  return from_fixed<amount_t>(take(kWordWidth));
}

uint128_t terms_reader::read_uint128() {
  return from_fixed<uint128_t>(take(kUint128Width));
}

uint64_t terms_reader::read_uint64() {
  auto bytes = take(kUint64Width);
  auto buffer = boost::endian::big_uint64_buf_t{};
  std::memcpy(&buffer, bytes.data(), kUint64Width);
  return buffer.value();
}

uint8_t terms_reader::read_uint8() {
  return take(1)[0];
}

selector_t terms_reader::read_selector() {
  auto bytes = take(kSelectorWidth);
  auto selector = selector_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(selector));
  return selector;
}

bytes_view_t terms_reader::read_bytes(const std::size_t size) {
  return take(size);
}

bytes_view_t terms_reader::read_rest() {
  return take(remaining());
}

terms_writer& terms_writer::write_address(const address_t& address) {
  bytes_.insert(std::end(bytes_), std::begin(address), std::end(address));
  return *this;
}

terms_writer& terms_writer::write_uint256(const amount_t& value) {
  auto word = to_fixed<amount_t, kWordWidth>(value);
  bytes_.insert(std::end(bytes_), std::begin(word), std::end(word));
  return *this;
}

terms_writer& terms_writer::write_uint128(const uint128_t& value) {
  auto fixed = to_fixed<uint128_t, kUint128Width>(value);
  bytes_.insert(std::end(bytes_), std::begin(fixed), std::end(fixed));
  return *this;
}

terms_writer& terms_writer::write_uint64(const uint64_t value) {
  auto buffer = boost::endian::big_uint64_buf_t{value};
  bytes_.insert(std::end(bytes_), buffer.data(), buffer.data() + kUint64Width);
  return *this;
}

terms_writer& terms_writer::write_uint8(const uint8_t value) {
  bytes_.push_back(value);
  return *this;
}

terms_writer& terms_writer::write_selector(const selector_t& selector) {
  bytes_.insert(std::end(bytes_), std::begin(selector), std::end(selector));
  return *this;
}

terms_writer& terms_writer::write_bytes(const bytes_view_t& bytes) {
  bytes_.insert(std::end(bytes_), std::begin(bytes), std::end(bytes));
  return *this;
}

}  // namespace mandate::schema
