#include <mandate/execution/executor.hpp>

#include <spdlog/spdlog.h>

#include <variant>

namespace mandate::execution {

namespace {

inline constexpr auto kCodespace = std::string_view{"mandate.execution"};

}  // namespace

mandate::schema::result_t execute(
    execution_sink& sink,
    mandate::state::store& store,
    const mandate::schema::address_t& account,
    const mandate::schema::execution_mode_t& mode,
    const mandate::schema::execution_payload_t& payload,
    std::vector<mandate::schema::bytes_t>& return_data) {
  auto shape_matches =
      mode.call_type == mandate::schema::call_type_t::single
          ? std::holds_alternative<mandate::schema::execution_t>(payload)
          : std::holds_alternative<mandate::schema::execution_batch_t>(payload);
  if (!shape_matches) {
    spdlog::debug("Payload shape does not match mode {}",
                  mandate::schema::to_string(mode));
    return mandate::schema::make_error(
        mandate::schema::error_code::invalid_call_type,
        "execution:invalid-call-type", kCodespace);
  }

  auto executions = mandate::schema::executions_of(payload);
  return_data.clear();
  return_data.reserve(executions.size());
  for (auto index = std::size_t{}; index < executions.size(); ++index) {
    auto checkpoint = store.checkpoint();
    auto result = sink.execute(account, executions[index]);
    if (result.code == 0) {
      return_data.push_back(std::move(result.data));
      continue;
    }
    if (mode.exec_type == mandate::schema::exec_type_t::default_) {
      spdlog::debug("Execution {} failed: {}", index, result.log);
      return result;
    }
    spdlog::debug("Execution {} failed in try mode, suppressed: {}", index,
                  result.log);
    store.rollback(checkpoint);
    return_data.emplace_back();
  }
  return mandate::schema::make_ok();
}

}  // namespace mandate::execution
