#include <mandate/blake3/hash.hpp>
#include <mandate/schema/delegation.hpp>
#include <mandate/schema/encoding/scale/encoder.hpp>

#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace mandate::schema {

namespace {

inline constexpr auto kDelegationDomain =
    std::string_view{"mandate.delegation.v1"};
inline constexpr auto kSigningDomain =
    std::string_view{"mandate.delegation.sign"};

}  // namespace

hash32_t hash_delegation(const delegation_t& delegation) {
  auto committed_caveats = std::vector<std::tuple<address_t, bytes_t>>{};
  committed_caveats.reserve(delegation.caveats.size());
  for (const auto& caveat : delegation.caveats) {
    committed_caveats.emplace_back(caveat.enforcer, caveat.terms);
  }

  auto encoder = encoding::scale_encoder_t{};
  auto material = encoder.encode(std::tuple{
      std::string{kDelegationDomain}, delegation.version, delegation.delegate,
      delegation.delegator, delegation.authority, committed_caveats,
      delegation.salt});
  return mandate::blake3::hash(bytes_view_t{material.data(), material.size()});
}

hash32_t make_signing_digest(const address_t& manager,
                             const hash32_t& delegation_hash) {
  auto encoder = encoding::scale_encoder_t{};
  auto material = encoder.encode(
      std::tuple{std::string{kSigningDomain}, manager, delegation_hash});
  return mandate::blake3::hash(bytes_view_t{material.data(), material.size()});
}

}  // namespace mandate::schema
