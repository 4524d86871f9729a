#pragma once
#include <mandate/common/critical.hpp>
#include <mandate/schema/encoding/encoder.hpp>
#include <mandate/schema/encoding/scale/caveat.hpp>
#include <mandate/schema/encoding/scale/delegation.hpp>
#include <mandate/schema/encoding/scale/execution.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace mandate::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  mandate::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, mandate::schema::bytes_t& out);

  template <typename T>
  T decode(const mandate::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const mandate::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
mandate::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    mandate::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        mandate::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const mandate::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    mandate::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

// Redeemer supplied bytes (caveat args, wrapped terms) always go through
// try_decode: malformed input is a policy failure, never a crash.
template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const mandate::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace mandate::schema::encoding
