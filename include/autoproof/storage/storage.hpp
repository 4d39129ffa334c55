#pragma once
#include <autoproof/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace autoproof::storage {

using key_value_entry_t =
    std::pair<autoproof::schema::bytes_t, autoproof::schema::bytes_t>;

/// Last committed checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  autoproof::schema::hash32_t state_root;
  /// Latest block time applied; logical time never runs behind it.
  autoproof::schema::timestamp_milliseconds_t block_time_ms{};
};

/// Staged rows of one atomic mutation.  Nothing reaches the backend until the
/// whole batch is committed.
struct write_batch final {
  std::vector<key_value_entry_t> puts;
  std::vector<autoproof::schema::bytes_t> deletes;

  /// Encode and stage value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder, autoproof::schema::bytes_t key, const T& value) {
    puts.emplace_back(std::move(key), encoder.encode(value));
  }

  /// Stage removal of key.
  void erase(autoproof::schema::bytes_t key) {
    deletes.push_back(std::move(key));
  }

  bool empty() const { return puts.empty() && deletes.empty(); }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const autoproof::schema::bytes_view_t& key) const;

  /// Return whether a value is stored at key.
  bool exists(const autoproof::schema::bytes_view_t& key) const;

  /// Return raw entries whose key starts with prefix, in key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const autoproof::schema::bytes_view_t& prefix) const;

  /// Count rows under each prefix, all read from one consistent snapshot.
  std::vector<uint64_t> count_by_prefixes(
      const std::vector<autoproof::schema::bytes_t>& prefixes) const;

  /// Apply every staged put and delete atomically.
  void commit(const write_batch& batch) const;

  /// Load the most recent committed checkpoint.
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint.
  void save_committed_state(const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace autoproof::storage
