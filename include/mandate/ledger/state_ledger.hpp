#pragma once
#include <mandate/ledger/ledger.hpp>
#include <mandate/state/store.hpp>

namespace mandate::ledger {

/// Ledger whose balances live in the journaled state store, so transfers made
/// by a failed redemption roll back with the rest of its writes.
class state_ledger final : public ledger {
 public:
  explicit state_ledger(mandate::state::store& store);

  using ledger::balance_of;
  using ledger::transfer;

  mandate::schema::amount_t balance_of(
      const mandate::schema::address_t& asset,
      const mandate::schema::amount_t& token_id,
      const mandate::schema::address_t& principal) const override;

  mandate::schema::result_t transfer(
      const mandate::schema::address_t& asset,
      const mandate::schema::amount_t& token_id,
      const mandate::schema::address_t& from,
      const mandate::schema::address_t& to,
      const mandate::schema::amount_t& amount) override;

  /// Credit `amount` out of thin air. Used by hosts to fund accounts.
  void mint(const mandate::schema::address_t& asset,
            const mandate::schema::amount_t& token_id,
            const mandate::schema::address_t& to,
            const mandate::schema::amount_t& amount);

  void mint(const mandate::schema::address_t& asset,
            const mandate::schema::address_t& to,
            const mandate::schema::amount_t& amount) {
    mint(asset, mandate::schema::amount_t{0}, to, amount);
  }

 private:
  mandate::state::store& store_;
};

}  // namespace mandate::ledger
