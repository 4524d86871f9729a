#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>

#include <optional>
#include <string_view>

// Helpers shared by the spend-cap, streaming and periodic enforcers.
namespace mandate::enforcer {

/// Amount moved by a `transfer(address,uint256)` call to `token`.
/// Sets `error` and returns std::nullopt when the execution is anything else,
/// including a transfer that also carries native value.
std::optional<mandate::schema::amount_t> token_transfer_amount_of(
    std::string_view enforcer,
    const mandate::schema::execution_t& execution,
    const mandate::schema::address_t& token,
    mandate::schema::result_t& error);

mandate::schema::amount_t load_amount(const mandate::state::store& store,
                                      const mandate::schema::bytes_view_t& key);

/// Add `amount` to the accumulator at `key` unless that would take it past
/// `ceiling`; the accumulator is left untouched on failure.
mandate::schema::result_t spend_within(
    hook_context_t& context,
    std::string_view enforcer,
    const mandate::schema::bytes_view_t& key,
    const mandate::schema::amount_t& amount,
    const mandate::schema::amount_t& ceiling);

}  // namespace mandate::enforcer
