#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>
#include <mandate/schema/delegation.hpp>

#include <optional>
#include <string_view>

// Nested payments collected by the payment and swap offer enforcers.
namespace mandate::enforcer {

/// Decode the permission context a redeemer passes as caveat args.
std::optional<mandate::schema::permission_context_t> decode_allowance(
    std::string_view enforcer,
    const mandate::schema::bytes_view_t& args,
    mandate::schema::result_t& error);

/// Terms of an args_equality_check caveat that binds an allowance to one
/// delegation and redeemer: SCALE(delegation hash, redeemer).
mandate::schema::bytes_t encode_payment_binding(
    const mandate::schema::hash32_t& delegation_hash,
    const mandate::schema::address_t& redeemer);

/// Set the args of every args_equality_check caveat in `allowance`.
void bind_allowance(const registry& enforcers,
                    mandate::schema::permission_context_t& allowance,
                    const mandate::schema::bytes_t& binding);

/// Redeem `allowance` as `redeemer` for `execution` and require `recipient`'s
/// balance of `asset` to grow by at least `amount`.
mandate::schema::result_t collect_payment(
    hook_context_t& context,
    std::string_view enforcer,
    const mandate::schema::address_t& redeemer,
    const mandate::schema::permission_context_t& allowance,
    const mandate::schema::address_t& asset,
    const mandate::schema::address_t& recipient,
    const mandate::schema::amount_t& amount,
    const mandate::schema::execution_t& execution);

}  // namespace mandate::enforcer
