#pragma once

#include <mandate/execution/execution_sink.hpp>
#include <mandate/ledger/ledger.hpp>

#include <functional>
#include <map>
#include <set>

namespace mandate::execution {

using contract_handler_t = std::function<mandate::schema::result_t(
    const mandate::schema::address_t& account,
    const mandate::schema::execution_t& execution)>;

/// Execution sink backed by a ledger.
///
/// Native value moves first. A payload sent to a registered token contract is
/// decoded as `transfer(address,uint256)` and moves that token; a payload
/// sent to a registered contract handler is dispatched to it; any other
/// payload is accepted without effect.
class ledger_sink : public execution_sink {
 public:
  explicit ledger_sink(mandate::ledger::ledger& ledger);

  mandate::schema::result_t execute(
      const mandate::schema::address_t& account,
      const mandate::schema::execution_t& execution) override;

  void register_token(const mandate::schema::address_t& token);
  void register_contract(const mandate::schema::address_t& contract,
                         contract_handler_t handler);

  mandate::ledger::ledger& ledger() { return ledger_; }

 private:
  mandate::ledger::ledger& ledger_;
  std::set<mandate::schema::address_t> tokens_;
  std::map<mandate::schema::address_t, contract_handler_t> contracts_;
};

}  // namespace mandate::execution
