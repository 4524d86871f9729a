#include <mandate/enforcer/allowed_calldata_enforcer.hpp>
#include <mandate/schema/terms.hpp>

#include <algorithm>
#include <limits>

namespace mandate::enforcer {

std::optional<allowed_calldata_enforcer::terms_t>
allowed_calldata_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  if (terms.size() <= mandate::schema::kWordWidth) {
    error = invalid_terms_length(kName);
    return std::nullopt;
  }
  auto reader = mandate::schema::terms_reader{terms};
  auto start = reader.read_uint256();
  if (start > std::numeric_limits<uint32_t>::max()) {
    error = enforcer_error(kName, mandate::schema::error_code::invalid_terms,
                           "invalid-start-index");
    return std::nullopt;
  }
  return terms_t{.start = static_cast<std::size_t>(start),
                 .value = mandate::schema::make_bytes(reader.read_rest())};
}

mandate::schema::bytes_t allowed_calldata_enforcer::encode_terms(
    const terms_t& terms) {
  auto writer = mandate::schema::terms_writer{};
  writer.write_uint256(terms.start).write_bytes(terms.value);
  return writer.release();
}

mandate::schema::result_t allowed_calldata_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::result_t allowed_calldata_enforcer::before_hook(
    hook_context_t&,
    const hook_call_t& call) {
  auto guard = require_single_default(kName, call.mode);
  if (guard.code != 0) {
    return guard;
  }
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }

  const auto& payload = single_execution(call).payload;
  if (terms->start > payload.size() ||
      payload.size() - terms->start < terms->value.size() ||
      !std::equal(std::begin(terms->value), std::end(terms->value),
                  std::begin(payload) +
                      static_cast<std::ptrdiff_t>(terms->start))) {
    return enforcer_error(kName, mandate::schema::error_code::invalid_calldata,
                          "invalid-calldata");
  }
  return mandate::schema::make_ok();
}

}  // namespace mandate::enforcer
