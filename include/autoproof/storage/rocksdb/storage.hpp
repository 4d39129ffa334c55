#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <autoproof/common/critical.hpp>
#include <autoproof/schema/encoding/scale/encoder.hpp>
#include <autoproof/storage/storage.hpp>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>
#include <tuple>
#include <vector>

namespace autoproof::storage {

namespace detail {

using encoder_t = autoproof::schema::encoding::encoder<
    autoproof::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedHeightKey =
    std::string_view{"SYS|APP|COMMITTED_HEIGHT"};

using committed_row_t =
    std::tuple<int64_t, autoproof::schema::hash32_t,
               autoproof::schema::timestamp_milliseconds_t>;

inline autoproof::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return autoproof::schema::bytes_t{
      reinterpret_cast<const uint8_t*>(slice.data()),
      reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const autoproof::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const autoproof::schema::bytes_view_t& key) const;

  bool exists(const autoproof::schema::bytes_view_t& key) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const autoproof::schema::bytes_view_t& prefix) const;
  std::vector<uint64_t> count_by_prefixes(
      const std::vector<autoproof::schema::bytes_t>& prefixes) const;
  void commit(const write_batch& batch) const;
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const autoproof::schema::bytes_view_t& key) const {
  if (!database) {
    autoproof::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      autoproof::common::critical("Failed to get value from RocksDB");
    }
  }
  return {encoder.template decode<T>(autoproof::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

inline bool storage<rocksdb_storage_tag>::exists(
    const autoproof::schema::bytes_view_t& key) const {
  if (!database) {
    autoproof::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return false;
  }
  if (!status.ok()) {
    spdlog::error("Failed to probe key in RocksDB: {}", status.ToString());
    autoproof::common::critical("Failed to probe key in RocksDB");
  }
  return true;
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const autoproof::schema::bytes_view_t& prefix) const {
  if (!database) {
    autoproof::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = detail::to_slice(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_slice);
       iterator->Valid() && iterator->key().starts_with(prefix_slice);
       iterator->Next()) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("Failed to scan RocksDB prefix: {}",
                  iterator->status().ToString());
    autoproof::common::critical("Failed to scan RocksDB prefix");
  }
  return entries;
}

inline std::vector<uint64_t> storage<rocksdb_storage_tag>::count_by_prefixes(
    const std::vector<autoproof::schema::bytes_t>& prefixes) const {
  if (!database) {
    autoproof::common::critical("RocksDB database is not initialized");
  }

  auto counts = std::vector<uint64_t>{};
  counts.reserve(prefixes.size());
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  read_options.snapshot = database->GetSnapshot();
  for (const auto& prefix : prefixes) {
    auto prefix_slice = detail::to_slice(prefix);
    auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
        database->NewIterator(read_options)};
    auto count = uint64_t{};
    for (iterator->Seek(prefix_slice);
         iterator->Valid() && iterator->key().starts_with(prefix_slice);
         iterator->Next()) {
      ++count;
    }
    if (!iterator->status().ok()) {
      spdlog::error("Failed to count RocksDB prefix: {}",
                    iterator->status().ToString());
      iterator.reset();
      database->ReleaseSnapshot(read_options.snapshot);
      autoproof::common::critical("Failed to count RocksDB prefix");
    }
    counts.push_back(count);
  }
  database->ReleaseSnapshot(read_options.snapshot);
  return counts;
}

inline void storage<rocksdb_storage_tag>::commit(
    const write_batch& batch) const {
  if (!database) {
    autoproof::common::critical("RocksDB database is not initialized");
  }

  auto rocksdb_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : batch.deletes) {
    auto delete_status = rocksdb_batch.Delete(detail::to_slice(key));
    if (!delete_status.ok()) {
      autoproof::common::critical("failed staging key deletion");
    }
  }
  for (const auto& [key, value] : batch.puts) {
    auto put_status =
        rocksdb_batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      autoproof::common::critical("failed staging key write");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &rocksdb_batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}", write_status.ToString());
    autoproof::common::critical("failed to commit write batch");
  }
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    autoproof::common::critical("RocksDB database is not initialized");
  }
  auto state = committed_state{};

  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedHeightKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    autoproof::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<detail::committed_row_t>(
          autoproof::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    autoproof::common::critical("failed to decode committed state");
  }
  state.height = std::get<0>(decoded.value());
  state.state_root = std::get<1>(decoded.value());
  state.block_time_ms = std::get<2>(decoded.value());

  return state;
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  if (!database) {
    autoproof::common::critical("RocksDB database is not initialized");
  }
  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(
      std::tuple{state.height, state.state_root, state.block_time_ms});
  auto state_status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{},
      std::string{detail::kCommittedHeightKey},
      std::string{reinterpret_cast<const char*>(encoded.data()),
                  encoded.size()});
  if (!state_status.ok()) {
    autoproof::common::critical("failed to persist committed height");
  }
}

}  // namespace autoproof::storage
