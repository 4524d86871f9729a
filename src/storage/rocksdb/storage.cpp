#include <mandate/common/critical.hpp>
#include <mandate/schema/encoding/scale/encoder.hpp>
#include <mandate/storage/rocksdb/storage.hpp>

#include <rocksdb/iterator.h>
#include <rocksdb/write_batch.h>

#include <functional>
#include <tuple>

namespace mandate::storage {

namespace {

// Lives outside the `MANDATE|` keyspace so prefix replacement never drops it.
inline constexpr auto kCheckpointKey = std::string_view{"SYS|MANDATE|CHECKPOINT"};

void require_open(const std::unique_ptr<ROCKSDB_NAMESPACE::DB>& database) {
  if (!database) {
    mandate::common::critical("RocksDB database is not initialized");
  }
}

// Visits every key under `prefix` in key order.
void scan_prefix(
    ROCKSDB_NAMESPACE::DB& database,
    const mandate::schema::bytes_view_t& prefix,
    const std::function<void(const ROCKSDB_NAMESPACE::Slice&,
                             const ROCKSDB_NAMESPACE::Slice&)>& visit) {
  auto start = detail::to_slice(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database.NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(start);
       iterator->Valid() && iterator->key().starts_with(start);
       iterator->Next()) {
    visit(iterator->key(), iterator->value());
  }
  if (!iterator->status().ok()) {
    mandate::common::critical("RocksDB prefix scan failed: {}",
                              iterator->status().ToString());
  }
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Cannot open redemption state at {}: {}", path,
                  status.ToString());
    mandate::common::critical("Failed to open RocksDB");
  }
  spdlog::debug("Opened redemption state at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  require_open(database);
  auto raw = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              std::string{kCheckpointKey}, &raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    mandate::common::critical("failed to load committed state: {}",
                              status.ToString());
  }

  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, mandate::schema::hash32_t>>(
          mandate::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(raw.data()), raw.size()});
  if (!decoded) {
    mandate::common::critical("failed to decode committed state");
  }
  auto [sequence, state_root] = *decoded;
  return committed_state{.sequence = sequence, .state_root = state_root};
}

void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  require_open(database);
  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.sequence, state.state_root});
  auto status =
      database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                    std::string{kCheckpointKey},
                    detail::to_slice(mandate::schema::bytes_view_t{encoded}));
  if (!status.ok()) {
    spdlog::error("Cannot write checkpoint {}: {}", state.sequence,
                  status.ToString());
    mandate::common::critical("failed to persist committed state");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const mandate::schema::bytes_view_t& prefix) const {
  require_open(database);
  auto entries = std::vector<key_value_entry_t>{};
  scan_prefix(*database, prefix,
              [&](const ROCKSDB_NAMESPACE::Slice& key,
                  const ROCKSDB_NAMESPACE::Slice& value) {
                entries.emplace_back(detail::to_bytes(key),
                                     detail::to_bytes(value));
              });
  return entries;
}

void storage<rocksdb_storage_tag>::replace_by_prefix(
    const mandate::schema::bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries) const {
  require_open(database);
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  auto removed = std::size_t{};
  scan_prefix(*database, prefix,
              [&](const ROCKSDB_NAMESPACE::Slice& key,
                  const ROCKSDB_NAMESPACE::Slice&) {
                if (!batch.Delete(key).ok()) {
                  mandate::common::critical(
                      "failed deleting key during prefix replacement");
                }
                ++removed;
              });
  for (const auto& [key, value] : entries) {
    if (!batch.Put(detail::to_slice(mandate::schema::bytes_view_t{key}),
                   detail::to_slice(mandate::schema::bytes_view_t{value}))
             .ok()) {
      mandate::common::critical("failed writing key during prefix replacement");
    }
  }

  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    mandate::common::critical("failed to commit prefix replacement: {}",
                              status.ToString());
  }
  spdlog::debug("Replaced {} key(s) with {} under prefix", removed,
                entries.size());
}

}  // namespace mandate::storage
