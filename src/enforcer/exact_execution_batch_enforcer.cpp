#include <mandate/enforcer/exact_execution_batch_enforcer.hpp>

namespace mandate::enforcer {

std::optional<exact_execution_batch_enforcer::terms_t>
exact_execution_batch_enforcer::get_terms_info(
    const mandate::schema::bytes_view_t& terms,
    mandate::schema::result_t& error) {
  auto decoded = decode_exact<terms_t>(terms);
  if (!decoded) {
    error = invalid_terms_length(kName);
  }
  return decoded;
}

mandate::schema::bytes_t exact_execution_batch_enforcer::encode_terms(
    const terms_t& terms) {
  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  return encoder.encode(terms);
}

mandate::schema::result_t exact_execution_batch_enforcer::check_terms(
    const mandate::schema::bytes_view_t& terms) const {
  auto error = mandate::schema::make_ok();
  get_terms_info(terms, error);
  return error;
}

mandate::schema::result_t exact_execution_batch_enforcer::before_hook(
    hook_context_t&,
    const hook_call_t& call) {
  auto guard = require_batch_default(kName, call.mode);
  if (guard.code != 0) {
    return guard;
  }
  auto error = mandate::schema::make_ok();
  auto terms = get_terms_info(call.terms, error);
  if (!terms) {
    return error;
  }

  const auto& batch = batch_execution(call);
  if (batch.size() != terms->size()) {
    return enforcer_error(kName,
                          mandate::schema::error_code::invalid_batch_size,
                          "invalid-batch-size");
  }
  for (auto index = std::size_t{}; index < batch.size(); ++index) {
    if (batch[index] != (*terms)[index]) {
      return enforcer_error(kName,
                            mandate::schema::error_code::invalid_execution,
                            "invalid-execution");
    }
  }
  return mandate::schema::make_ok();
}

}  // namespace mandate::enforcer
