#include <mandate/blake3/hash.hpp>
#include <mandate/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <memory>
#include <vector>

namespace mandate::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

bool openssl_has_secp256k1() {
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

bool verify_ed25519(const mandate::schema::bytes_view_t& message,
                    const mandate::schema::bytes_view_t& public_key,
                    const mandate::schema::bytes_view_t& signature) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(),
                                  public_key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

bool verify_secp256k1(const mandate::schema::bytes_view_t& message,
                      const mandate::schema::bytes_view_t& public_key,
                      const mandate::schema::bytes_view_t& compact_signature) {
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx) {
    return false;
  }

  if (EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return false;
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(public_key.data()),
                     public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return false;
  }
  auto pkey = evp_pkey_ptr{raw_pkey, EVP_PKEY_free};

  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return false;
  }

  auto r =
      bignum_ptr{BN_bin2bn(compact_signature.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact_signature.data() + 32, 32, nullptr),
                      BN_free};
  if (!r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.release(), s.release()) != 1) {
    return false;
  }

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return false;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr);

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                           pkey.get()) == 1) {
    ok = EVP_DigestVerify(ctx.get(), der.data(), der.size(), message.data(),
                          message.size()) == 1;
  }
  return ok;
}

}  // namespace

bool available() {
  static const auto available_now =
      openssl_has_ed25519() && openssl_has_secp256k1();
  return available_now;
}

mandate::schema::address_t principal_from_public_key(
    const mandate::schema::bytes_view_t& public_key) {
  auto digest = mandate::blake3::hash(public_key);
  auto principal = mandate::schema::address_t{};
  std::copy(std::end(digest) - static_cast<std::ptrdiff_t>(principal.size()),
            std::end(digest), std::begin(principal));
  return principal;
}

mandate::schema::bytes_t pack_signature(
    const key_type type,
    const mandate::schema::bytes_view_t& public_key,
    const mandate::schema::bytes_view_t& signature) {
  auto packed = mandate::schema::bytes_t{};
  packed.reserve(1 + public_key.size() + signature.size());
  packed.push_back(static_cast<uint8_t>(type));
  packed.insert(std::end(packed), std::begin(public_key), std::end(public_key));
  packed.insert(std::end(packed), std::begin(signature), std::end(signature));
  return packed;
}

bool verify_signature(const mandate::schema::bytes_view_t& message,
                      const mandate::schema::address_t& principal,
                      const mandate::schema::bytes_view_t& signature) {
  if (signature.empty()) {
    return false;
  }
  auto body = signature.subspan(1);
  switch (static_cast<key_type>(signature[0])) {
    case key_type::ed25519: {
      if (body.size() != kEd25519PublicKeySize + kCompactSignatureSize) {
        return false;
      }
      auto public_key = body.first(kEd25519PublicKeySize);
      if (principal_from_public_key(public_key) != principal) {
        return false;
      }
      return verify_ed25519(message, public_key,
                            body.subspan(kEd25519PublicKeySize));
    }
    case key_type::secp256k1: {
      if (body.size() != kSecp256k1PublicKeySize + kCompactSignatureSize) {
        return false;
      }
      auto public_key = body.first(kSecp256k1PublicKeySize);
      if (principal_from_public_key(public_key) != principal) {
        return false;
      }
      return verify_secp256k1(message, public_key,
                              body.subspan(kSecp256k1PublicKeySize));
    }
  }
  return false;
}

}  // namespace mandate::crypto
