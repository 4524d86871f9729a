#pragma once
#include <mandate/schema/primitives.hpp>
#include <optional>
#include <span>

namespace mandate::schema::encoding {

// The codec is a build time choice: callers name the library tag once
// (see scale/encoder.hpp) and everything else goes through this facade.
template <typename Library>
struct encoder {
  template <typename T>
  mandate::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, mandate::schema::bytes_t& out);

  template <typename T>
  T decode(const mandate::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const mandate::schema::bytes_view_t& bytes);
};

}  // namespace mandate::schema::encoding
