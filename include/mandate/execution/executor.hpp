#pragma once

#include <mandate/execution/execution_sink.hpp>
#include <mandate/schema/execution.hpp>
#include <mandate/schema/execution_mode.hpp>
#include <mandate/state/store.hpp>

#include <vector>

namespace mandate::execution {

/// Run a payload for `account` under `mode`.
///
/// The payload shape must match the call type. With the default exec type the
/// first failing execution is returned as-is and the caller owns rollback.
/// With the try exec type a failing execution is rolled back on its own and
/// the remaining executions still run. `return_data` receives one entry per
/// execution, empty for suppressed failures.
mandate::schema::result_t execute(
    execution_sink& sink,
    mandate::state::store& store,
    const mandate::schema::address_t& account,
    const mandate::schema::execution_mode_t& mode,
    const mandate::schema::execution_payload_t& payload,
    std::vector<mandate::schema::bytes_t>& return_data);

}  // namespace mandate::execution
