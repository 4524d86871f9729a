#pragma once

#include <mandate/schema/delegation.hpp>
#include <mandate/schema/execution.hpp>
#include <mandate/schema/execution_mode.hpp>
#include <mandate/schema/result.hpp>

#include <vector>

namespace mandate::enforcer {

/// Entry point enforcers use to redeem nested delegations while one of their
/// hooks is running.
class redemption_service {
 public:
  virtual ~redemption_service() = default;

  virtual mandate::schema::result_t redeem_delegations(
      const mandate::schema::address_t& redeemer,
      const std::vector<mandate::schema::permission_context_t>& contexts,
      const std::vector<mandate::schema::execution_mode_t>& modes,
      const std::vector<mandate::schema::execution_payload_t>& payloads) = 0;

  /// Identity of the redemption engine; the `caller` seen by enforcers.
  virtual const mandate::schema::address_t& address() const = 0;
};

}  // namespace mandate::enforcer
