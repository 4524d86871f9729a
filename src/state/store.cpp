#include <mandate/blake3/hash.hpp>
#include <mandate/state/store.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <tuple>

namespace mandate::state {

namespace {

mandate::schema::bytes_view_t keyspace_prefix() {
  return mandate::schema::make_bytes_view(kKeyspacePrefix);
}

bool has_keyspace_prefix(const mandate::schema::bytes_view_t& key) {
  auto prefix = keyspace_prefix();
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key));
}

}  // namespace

void store::record(const mandate::schema::bytes_t& key) {
  auto it = entries_.find(key);
  if (it == std::end(entries_)) {
    journal_.push_back(journal_entry{.key = key, .previous = std::nullopt});
  } else {
    journal_.push_back(journal_entry{.key = key, .previous = it->second});
  }
}

void store::rollback(const checkpoint_t checkpoint) {
  if (checkpoint > journal_.size()) {
    mandate::common::critical("rollback past the end of the state journal");
  }
  while (journal_.size() > checkpoint) {
    auto& entry = journal_.back();
    if (entry.previous) {
      entries_[entry.key] = std::move(*entry.previous);
    } else {
      entries_.erase(entry.key);
    }
    journal_.pop_back();
  }
}

void store::commit() {
  journal_.clear();
}

std::optional<mandate::schema::bytes_t> store::get_raw(
    const mandate::schema::bytes_view_t& key) const {
  auto it = entries_.find(mandate::schema::make_bytes(key));
  if (it == std::end(entries_)) {
    return std::nullopt;
  }
  return it->second;
}

void store::put_raw(const mandate::schema::bytes_view_t& key,
                    mandate::schema::bytes_t value) {
  if (!has_keyspace_prefix(key)) {
    mandate::common::critical("state key outside of the mandate keyspace");
  }
  auto owned = mandate::schema::make_bytes(key);
  record(owned);
  entries_[std::move(owned)] = std::move(value);
}

bool store::contains(const mandate::schema::bytes_view_t& key) const {
  return entries_.contains(mandate::schema::make_bytes(key));
}

void store::erase(const mandate::schema::bytes_view_t& key) {
  auto owned = mandate::schema::make_bytes(key);
  if (!entries_.contains(owned)) {
    return;
  }
  record(owned);
  entries_.erase(owned);
}

std::vector<mandate::storage::key_value_entry_t> store::list_by_prefix(
    const mandate::schema::bytes_view_t& prefix) const {
  auto entries = std::vector<mandate::storage::key_value_entry_t>{};
  auto owned = mandate::schema::make_bytes(prefix);
  for (auto it = entries_.lower_bound(owned); it != std::end(entries_); ++it) {
    if (it->first.size() < owned.size() ||
        !std::equal(std::begin(owned), std::end(owned),
                    std::begin(it->first))) {
      break;
    }
    entries.push_back(*it);
  }
  return entries;
}

mandate::schema::hash32_t store::state_root() const {
  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  auto digest = mandate::blake3::hasher{};
  digest.update(mandate::schema::bytes_view_t{
      encoder.encode(std::string{"mandate.state.v1"})});
  for (const auto& [key, value] : entries_) {
    digest.update(
        mandate::schema::bytes_view_t{encoder.encode(std::tuple{key, value})});
  }
  return digest.finalize();
}

void store::save_to(
    const mandate::storage::storage<mandate::storage::rocksdb_storage_tag>&
        storage,
    const uint64_t sequence) const {
  if (in_transaction()) {
    mandate::common::critical("cannot persist state with an open journal");
  }
  auto entries = std::vector<mandate::storage::key_value_entry_t>{
      std::begin(entries_), std::end(entries_)};
  storage.replace_by_prefix(keyspace_prefix(), entries);
  storage.save_committed_state(mandate::storage::committed_state{
      .sequence = sequence, .state_root = state_root()});
  spdlog::debug("Persisted {} state entries at sequence {}", entries.size(),
                sequence);
}

std::optional<uint64_t> store::load_from(
    const mandate::storage::storage<mandate::storage::rocksdb_storage_tag>&
        storage) {
  auto committed = storage.load_committed_state();
  if (!committed) {
    return std::nullopt;
  }
  auto loaded = std::map<mandate::schema::bytes_t, mandate::schema::bytes_t>{};
  for (auto& [key, value] : storage.list_by_prefix(keyspace_prefix())) {
    loaded.emplace(std::move(key), std::move(value));
  }
  entries_ = std::move(loaded);
  journal_.clear();
  if (state_root() != committed->state_root) {
    mandate::common::critical("persisted state does not match its state root");
  }
  spdlog::debug("Loaded {} state entries at sequence {}", entries_.size(),
                committed->sequence);
  return committed->sequence;
}

}  // namespace mandate::state
