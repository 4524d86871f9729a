#pragma once
#include <blake3.h>
#include <mandate/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace mandate::blake3 {

/// Streaming BLAKE3. Feeding the same bytes in any number of pieces yields
/// the same digest as hashing them at once.
class hasher final {
 public:
  hasher();

  hasher& update(const mandate::schema::bytes_view_t& bytes);
  hasher& update(const std::string_view& str);

  mandate::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

mandate::schema::hash32_t hash(const std::string_view& str);
mandate::schema::hash32_t hash(const mandate::schema::bytes_view_t& bytes);

}  // namespace mandate::blake3
