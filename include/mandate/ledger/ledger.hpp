#pragma once
#include <mandate/schema/primitives.hpp>
#include <mandate/schema/result.hpp>

namespace mandate::ledger {

/// Balance book observed by balance-delta enforcers and moved by executions.
///
/// Assets are addressed by contract address; `kNativeAsset` is the native
/// value carried by executions. Multi-token assets further split balances by
/// token id, and fungible assets use token id 0.
class ledger {
 public:
  virtual ~ledger() = default;

  virtual mandate::schema::amount_t balance_of(
      const mandate::schema::address_t& asset,
      const mandate::schema::amount_t& token_id,
      const mandate::schema::address_t& principal) const = 0;

  virtual mandate::schema::result_t transfer(
      const mandate::schema::address_t& asset,
      const mandate::schema::amount_t& token_id,
      const mandate::schema::address_t& from,
      const mandate::schema::address_t& to,
      const mandate::schema::amount_t& amount) = 0;

  mandate::schema::amount_t balance_of(
      const mandate::schema::address_t& asset,
      const mandate::schema::address_t& principal) const {
    return balance_of(asset, mandate::schema::amount_t{0}, principal);
  }

  mandate::schema::result_t transfer(const mandate::schema::address_t& asset,
                                     const mandate::schema::address_t& from,
                                     const mandate::schema::address_t& to,
                                     const mandate::schema::amount_t& amount) {
    return transfer(asset, mandate::schema::amount_t{0}, from, to, amount);
  }
};

}  // namespace mandate::ledger
