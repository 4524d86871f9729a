#pragma once

#include <mandate/schema/primitives.hpp>

#include <cstdint>

namespace mandate::crypto {

/// Leading byte of a packed delegation signature.
enum class key_type : uint8_t {
  ed25519 = 0,
  secp256k1 = 1,
};

inline constexpr std::size_t kEd25519PublicKeySize = 32;
inline constexpr std::size_t kSecp256k1PublicKeySize = 33;
inline constexpr std::size_t kCompactSignatureSize = 64;

bool available();

/// Principal address owned by a public key: the trailing 20 bytes of its
/// BLAKE3 hash.
mandate::schema::address_t principal_from_public_key(
    const mandate::schema::bytes_view_t& public_key);

/// Pack `type || public key || signature` as carried in delegation_t.
mandate::schema::bytes_t pack_signature(
    key_type type,
    const mandate::schema::bytes_view_t& public_key,
    const mandate::schema::bytes_view_t& signature);

/// Verify a packed signature over `message` and check that the embedded
/// public key belongs to `principal`.
bool verify_signature(const mandate::schema::bytes_view_t& message,
                      const mandate::schema::address_t& principal,
                      const mandate::schema::bytes_view_t& signature);

}  // namespace mandate::crypto
