#pragma once
#include <mandate/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace mandate::storage {

using key_value_entry_t =
    std::pair<mandate::schema::bytes_t, mandate::schema::bytes_t>;

/// Last state checkpoint persisted by the storage backend.
struct committed_state final {
  uint64_t sequence{};
  mandate::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const mandate::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const mandate::schema::bytes_view_t& key,
           const T& value);

  /// Load the most recent committed checkpoint.
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint.
  void save_committed_state(const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const mandate::schema::bytes_view_t& prefix) const;

  /// Atomically replace all entries under prefix with provided entries.
  void replace_by_prefix(const mandate::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace mandate::storage
