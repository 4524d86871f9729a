#pragma once
#include <mandate/schema/caveat.hpp>
#include <mandate/schema/primitives.hpp>

#include <vector>

// Schema type: delegation.
// Redemption workflow: a signed grant of authority from delegator to
// delegate. `authority` is kRootAuthority or the hash of the parent grant;
// the effective permission is the intersection of every caveat on the chain.
namespace mandate::schema {

template <uint16_t Version>
struct delegation;

template <>
struct delegation<1> final {
  uint16_t version{1};
  address_t delegate{};
  address_t delegator{};
  hash32_t authority{kRootAuthority};
  std::vector<caveat_t> caveats;
  amount_t salt{};
  bytes_t signature;

  bool operator==(const delegation<1>&) const = default;
};

using delegation_t = delegation<1>;

/// Delegation chain submitted for one redemption, leaf first: index 0 is
/// delegated to the redeemer, the last entry carries the root authority.
using permission_context_t = std::vector<delegation_t>;

/// Content hash of a delegation. Caveat args and the signature are excluded,
/// so the hash is stable from signing through redemption.
hash32_t hash_delegation(const delegation_t& delegation);

/// Digest the delegator signs: binds the delegation hash to one manager.
hash32_t make_signing_digest(const address_t& manager,
                             const hash32_t& delegation_hash);

}  // namespace mandate::schema
