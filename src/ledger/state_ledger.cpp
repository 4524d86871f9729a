#include <mandate/common/checked_math.hpp>
#include <mandate/ledger/state_ledger.hpp>
#include <mandate/schema/key/builder.hpp>

#include <spdlog/spdlog.h>

namespace mandate::ledger {

namespace {

inline constexpr auto kCodespace = std::string_view{"mandate.ledger"};

mandate::schema::bytes_t make_balance_key(
    const mandate::schema::address_t& asset,
    const mandate::schema::amount_t& token_id,
    const mandate::schema::address_t& principal) {
  auto key = mandate::schema::key::builder{};
  key.write(mandate::state::kKeyspacePrefix)
      .write(std::string_view{"LEDGER|"})
      .write(asset)
      .write(token_id)
      .write(principal);
  return key.data;
}

}  // namespace

state_ledger::state_ledger(mandate::state::store& store) : store_{store} {}

mandate::schema::amount_t state_ledger::balance_of(
    const mandate::schema::address_t& asset,
    const mandate::schema::amount_t& token_id,
    const mandate::schema::address_t& principal) const {
  auto key = make_balance_key(asset, token_id, principal);
  return store_.get<mandate::schema::amount_t>(key).value_or(0);
}

mandate::schema::result_t state_ledger::transfer(
    const mandate::schema::address_t& asset,
    const mandate::schema::amount_t& token_id,
    const mandate::schema::address_t& from,
    const mandate::schema::address_t& to,
    const mandate::schema::amount_t& amount) {
  auto from_balance = balance_of(asset, token_id, from);
  if (from_balance < amount) {
    spdlog::debug("Ledger transfer rejected: balance {} below amount {}",
                  from_balance.str(), amount.str());
    return mandate::schema::make_error(
        mandate::schema::error_code::execution_failed,
        "ledger:insufficient-balance", kCodespace);
  }
  if (from == to || amount == 0) {
    return mandate::schema::make_ok();
  }
  auto to_balance = balance_of(asset, token_id, to);
  auto credited = mandate::common::checked_add(to_balance, amount);
  store_.put(make_balance_key(asset, token_id, from),
             mandate::schema::amount_t{from_balance - amount});
  store_.put(make_balance_key(asset, token_id, to), credited);
  return mandate::schema::make_ok();
}

void state_ledger::mint(const mandate::schema::address_t& asset,
                        const mandate::schema::amount_t& token_id,
                        const mandate::schema::address_t& to,
                        const mandate::schema::amount_t& amount) {
  auto balance = balance_of(asset, token_id, to);
  store_.put(make_balance_key(asset, token_id, to),
             mandate::common::checked_add(balance, amount));
}

}  // namespace mandate::ledger
