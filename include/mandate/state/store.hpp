#pragma once
#include <mandate/common/critical.hpp>
#include <mandate/schema/encoding/scale/encoder.hpp>
#include <mandate/schema/primitives.hpp>
#include <mandate/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace mandate::state {

/// Every key written to the store lives under this prefix so the whole
/// keyspace can be persisted with one prefix replacement.
inline constexpr auto kKeyspacePrefix = std::string_view{"MANDATE|"};

using checkpoint_t = std::size_t;

/// Ordered key/value state with an undo journal.
///
/// Redemptions take a checkpoint before they mutate anything and either keep
/// their writes or roll back to it. Nested redemptions take nested
/// checkpoints on the same journal, so an inner rollback never discards the
/// outer call's writes and an outer rollback discards everything since its
/// own checkpoint, inner successes included. `commit()` drops the journal
/// once the outermost call has succeeded.
class store final {
 public:
  checkpoint_t checkpoint() const { return journal_.size(); }
  void rollback(checkpoint_t checkpoint);
  void commit();
  bool in_transaction() const { return !journal_.empty(); }

  std::optional<mandate::schema::bytes_t> get_raw(
      const mandate::schema::bytes_view_t& key) const;
  void put_raw(const mandate::schema::bytes_view_t& key,
               mandate::schema::bytes_t value);
  bool contains(const mandate::schema::bytes_view_t& key) const;
  void erase(const mandate::schema::bytes_view_t& key);

  template <typename T>
  std::optional<T> get(const mandate::schema::bytes_view_t& key) const;

  template <typename T>
  void put(const mandate::schema::bytes_view_t& key, const T& value);

  std::vector<mandate::storage::key_value_entry_t> list_by_prefix(
      const mandate::schema::bytes_view_t& prefix) const;

  std::size_t size() const { return entries_.size(); }

  /// BLAKE3 over the SCALE encoding of every entry in key order.
  mandate::schema::hash32_t state_root() const;

  /// Persist the committed keyspace and checkpoint `{sequence, state_root}`.
  void save_to(
      const mandate::storage::storage<mandate::storage::rocksdb_storage_tag>&
          storage,
      uint64_t sequence) const;

  /// Replace the in-memory keyspace with the persisted one. Returns the
  /// persisted sequence, or std::nullopt when nothing was ever saved.
  std::optional<uint64_t> load_from(
      const mandate::storage::storage<mandate::storage::rocksdb_storage_tag>&
          storage);

 private:
  struct journal_entry final {
    mandate::schema::bytes_t key;
    std::optional<mandate::schema::bytes_t> previous;
  };

  void record(const mandate::schema::bytes_t& key);

  std::map<mandate::schema::bytes_t, mandate::schema::bytes_t> entries_;
  std::vector<journal_entry> journal_;
};

template <typename T>
std::optional<T> store::get(const mandate::schema::bytes_view_t& key) const {
  auto raw = get_raw(key);
  if (!raw) {
    return std::nullopt;
  }
  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  return encoder.decode<T>(mandate::schema::bytes_view_t{*raw});
}

template <typename T>
void store::put(const mandate::schema::bytes_view_t& key, const T& value) {
  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  put_raw(key, encoder.encode(value));
}

}  // namespace mandate::state
