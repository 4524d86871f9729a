#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>

#include <cstdint>
#include <optional>

// Aggregating balance-delta tracker shared by the balance change and
// multi-operation enforcers.
//
// The first before_all use of a key snapshots the balance; later uses of the
// same key only add to the expectation and to `pending`. Each after_all use
// decrements `pending` and the last one checks the net change against the
// snapshot and deletes the entry.
//
// Keys do not include the delegation hash: K sibling delegations that each
// expect an increase of X on the same recipient are satisfied by one payment
// of K * X in total, and equally by a single transfer large enough to cover
// the aggregate. Callers that need per-delegation accounting must give the
// siblings distinct recipients.
namespace mandate::enforcer {

struct balance_tracker_t final {
  mandate::schema::amount_t balance_before{};
  mandate::schema::amount_t expected_increase{};
  mandate::schema::amount_t expected_decrease{};
  uint64_t pending{};
};

std::optional<balance_tracker_t> load_tracker(
    const mandate::state::store& store,
    const mandate::schema::bytes_view_t& key);

mandate::schema::result_t track_expected_change(
    hook_context_t& context,
    std::string_view enforcer,
    const mandate::schema::bytes_view_t& key,
    const mandate::schema::amount_t& current_balance,
    bool is_decrease,
    const mandate::schema::amount_t& amount);

mandate::schema::result_t validate_expected_change(
    hook_context_t& context,
    std::string_view enforcer,
    const mandate::schema::bytes_view_t& key,
    const mandate::schema::amount_t& current_balance);

}  // namespace mandate::enforcer
