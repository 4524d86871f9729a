#pragma once
#include <mandate/schema/primitives.hpp>

#include <vector>

// Schema type: caveat.
// Redemption workflow: a policy check attached to a delegation. `terms` are
// covered by the delegator's signature; `args` are supplied by the redeemer
// and are never trusted to relax the policy.
namespace mandate::schema {

template <uint16_t Version>
struct caveat;

template <>
struct caveat<1> final {
  uint16_t version{1};
  address_t enforcer{};
  bytes_t terms;
  bytes_t args;

  bool operator==(const caveat<1>&) const = default;
};

using caveat_t = caveat<1>;

}  // namespace mandate::schema
