#pragma once

#include <mandate/crypto/verify.hpp>
#include <mandate/schema/delegation.hpp>
#include <openssl/evp.h>

#include <array>
#include <memory>
#include <optional>

namespace mandate::testing {

/// Ed25519 key pair producing packed delegation signatures.
class ed25519_signer final {
 public:
  static std::optional<ed25519_signer> generate() {
    auto ctx = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
      return std::nullopt;
    }
    auto* raw = static_cast<EVP_PKEY*>(nullptr);
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
      return std::nullopt;
    }
    auto signer = ed25519_signer{raw};
    auto size = signer.public_key_.size();
    if (EVP_PKEY_get_raw_public_key(raw, signer.public_key_.data(), &size) !=
            1 ||
        size != signer.public_key_.size()) {
      return std::nullopt;
    }
    return signer;
  }

  mandate::schema::address_t address() const {
    return mandate::crypto::principal_from_public_key(public_key_);
  }

  mandate::schema::bytes_t sign(
      const mandate::schema::bytes_view_t& message) const {
    auto ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>{
        EVP_MD_CTX_new(), EVP_MD_CTX_free};
    auto signature = std::array<uint8_t, 64>{};
    auto size = signature.size();
    if (!ctx ||
        EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) !=
            1 ||
        EVP_DigestSign(ctx.get(), signature.data(), &size, message.data(),
                       message.size()) != 1) {
      return {};
    }
    return mandate::crypto::pack_signature(mandate::crypto::key_type::ed25519,
                                           public_key_, signature);
  }

  /// Sign `delegation` for the manager at `manager`.
  void sign(mandate::schema::delegation_t& delegation,
            const mandate::schema::address_t& manager) const {
    auto digest = mandate::schema::make_signing_digest(
        manager, mandate::schema::hash_delegation(delegation));
    delegation.signature = sign(digest);
  }

 private:
  explicit ed25519_signer(EVP_PKEY* key) : key_{key, EVP_PKEY_free} {}

  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_;
  std::array<uint8_t, 32> public_key_{};
};

}  // namespace mandate::testing
