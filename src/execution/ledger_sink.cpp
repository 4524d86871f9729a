#include <mandate/execution/ledger_sink.hpp>
#include <mandate/schema/call_data.hpp>

#include <spdlog/spdlog.h>

namespace mandate::execution {

namespace {

inline constexpr auto kCodespace = std::string_view{"mandate.execution"};

}  // namespace

ledger_sink::ledger_sink(mandate::ledger::ledger& ledger) : ledger_{ledger} {}

void ledger_sink::register_token(const mandate::schema::address_t& token) {
  tokens_.insert(token);
}

void ledger_sink::register_contract(const mandate::schema::address_t& contract,
                                    contract_handler_t handler) {
  contracts_[contract] = std::move(handler);
}

mandate::schema::result_t ledger_sink::execute(
    const mandate::schema::address_t& account,
    const mandate::schema::execution_t& execution) {
  if (execution.value > 0) {
    auto moved = ledger_.transfer(mandate::schema::kNativeAsset, account,
                                  execution.target, execution.value);
    if (moved.code != 0) {
      return moved;
    }
  }
  if (execution.payload.empty()) {
    return mandate::schema::make_ok();
  }

  if (tokens_.contains(execution.target)) {
    auto call = mandate::schema::decode_transfer(execution.payload);
    if (!call) {
      return mandate::schema::make_error(
          mandate::schema::error_code::execution_failed,
          "token:unsupported-call", kCodespace);
    }
    return ledger_.transfer(execution.target, account, call->recipient,
                            call->amount);
  }

  auto contract = contracts_.find(execution.target);
  if (contract != std::end(contracts_)) {
    return contract->second(account, execution);
  }

  spdlog::trace("Execution to {} has no registered contract",
                mandate::schema::to_hex(execution.target));
  return mandate::schema::make_ok();
}

}  // namespace mandate::execution
