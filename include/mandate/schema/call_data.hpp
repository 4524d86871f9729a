#pragma once
#include <mandate/schema/primitives.hpp>
#include <mandate/schema/terms.hpp>

#include <optional>
#include <string_view>
#include <vector>

// Call payload layout understood by enforcers that inspect token transfers:
// a 4-byte method selector followed by 32-byte big-endian words. Addresses
// are right-aligned in their word.
namespace mandate::schema {

inline constexpr std::size_t kTransferCallLength =
    kSelectorWidth + (2 * kWordWidth);

struct transfer_call_t final {
  address_t recipient{};
  amount_t amount{};
};

/// First four bytes of the BLAKE3 hash of a method signature.
selector_t make_selector(std::string_view signature);

/// Selector of `transfer(address,uint256)`.
const selector_t& transfer_selector();

bytes_t encode_call(const selector_t& selector,
                    const std::vector<word_t>& words);
bytes_t encode_transfer(const address_t& recipient, const amount_t& amount);

std::optional<selector_t> selector_of(const bytes_view_t& payload);

/// Decode a transfer call; std::nullopt unless the payload is exactly a
/// transfer selector plus two words.
std::optional<transfer_call_t> decode_transfer(const bytes_view_t& payload);

}  // namespace mandate::schema
