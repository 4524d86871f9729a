#include <mandate/blake3/hash.hpp>
#include <mandate/schema/call_data.hpp>

#include <algorithm>
#include <iterator>

namespace mandate::schema {

selector_t make_selector(const std::string_view signature) {
  auto digest = mandate::blake3::hash(signature);
  auto selector = selector_t{};
  std::copy_n(std::begin(digest), selector.size(), std::begin(selector));
  return selector;
}

const selector_t& transfer_selector() {
  static const auto selector = make_selector("transfer(address,uint256)");
  return selector;
}

bytes_t encode_call(const selector_t& selector,
                    const std::vector<word_t>& words) {
  auto out = bytes_t{};
  out.reserve(kSelectorWidth + (words.size() * kWordWidth));
  out.insert(std::end(out), std::begin(selector), std::end(selector));
  for (const auto& word : words) {
    out.insert(std::end(out), std::begin(word), std::end(word));
  }
  return out;
}

bytes_t encode_transfer(const address_t& recipient, const amount_t& amount) {
  return encode_call(transfer_selector(),
                     {to_word(recipient), to_word(amount)});
}

std::optional<selector_t> selector_of(const bytes_view_t& payload) {
  if (payload.size() < kSelectorWidth) {
    return std::nullopt;
  }
  auto selector = selector_t{};
  std::copy_n(std::begin(payload), selector.size(), std::begin(selector));
  return selector;
}

std::optional<transfer_call_t> decode_transfer(const bytes_view_t& payload) {
  if (payload.size() != kTransferCallLength) {
    return std::nullopt;
  }
  auto reader = terms_reader{payload};
  if (reader.read_selector() != transfer_selector()) {
    return std::nullopt;
  }
  auto recipient_word = reader.read_bytes(kWordWidth);
  auto call = transfer_call_t{};
  std::copy(std::begin(recipient_word) + (kWordWidth - kAddressWidth),
            std::end(recipient_word), std::begin(call.recipient));
  call.amount = reader.read_uint256();
  return call;
}

}  // namespace mandate::schema
