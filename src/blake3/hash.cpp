#include <mandate/blake3/hash.hpp>

namespace mandate::blake3 {

hasher::hasher() {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const mandate::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

mandate::schema::hash32_t hasher::finalize() const {
  auto output = mandate::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

mandate::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

mandate::schema::hash32_t hash(const mandate::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace mandate::blake3
