#pragma once

#include <autoproof/registry/registry.hpp>
#include <autoproof/schema/app_info.hpp>
#include <autoproof/schema/block_result.hpp>
#include <autoproof/schema/commit_result.hpp>
#include <autoproof/schema/encoding/encoder.hpp>
#include <autoproof/schema/primitives.hpp>
#include <autoproof/schema/query_result.hpp>
#include <autoproof/schema/transaction.hpp>
#include <autoproof/schema/transaction_error_code.hpp>
#include <autoproof/schema/transaction_event.hpp>
#include <autoproof/schema/transaction_event_attribute.hpp>
#include <autoproof/schema/transaction_result.hpp>
#include <autoproof/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <string_view>
#include <vector>

namespace autoproof::execution {

/// Deterministic host-facing driver of the part registry.
///
/// The engine decodes transactions delivered by the host, runs them in order
/// against the registry using the block time as logical clock, folds the
/// successful ones into a state root and exposes a path-routed query surface.
class engine final {
 public:
  /// Construct the engine over encoder/storage backends.
  ///
  /// On an empty store this writes the chain id and the genesis registry
  /// state.  Reopening a store that belongs to another chain id is fatal.
  explicit engine(
      autoproof::schema::encoding::encoder<
          autoproof::schema::encoding::scale_encoder_tag>& encoder,
      autoproof::storage::storage<autoproof::storage::rocksdb_storage_tag>&
          storage,
      const autoproof::schema::hash32_t& chain_id,
      const autoproof::schema::principal_t& genesis_admin);

  /// Admission check: decode, version and chain id only; no state mutation.
  autoproof::schema::transaction_result_t check_transaction(
      const autoproof::schema::bytes_view_t& raw_tx) const;

  /// Execute a block and compute its candidate state_root.
  ///
  /// Transactions run in order with `block_time_ms` as the logical time; a
  /// result is returned for every transaction, failed ones included.
  autoproof::schema::block_result_t finalize_block(
      uint64_t height,
      autoproof::schema::timestamp_milliseconds_t block_time_ms,
      const std::vector<autoproof::schema::bytes_t>& txs);

  /// Persist the latest finalized height and state_root.
  autoproof::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state_root).
  autoproof::schema::app_info_t info() const;

  /// Execute a read-path query by route.  Keys and values are SCALE encoded.
  autoproof::schema::query_result_t query(
      std::string_view path,
      const autoproof::schema::bytes_view_t& data) const;

  const autoproof::schema::hash32_t& chain_id() const;

  autoproof::registry::registry& part_registry();
  const autoproof::registry::registry& part_registry() const;

 private:
  /// Run a validated transaction payload against the registry.
  autoproof::schema::transaction_result_t execute_operation(
      const autoproof::schema::transaction_t& tx,
      const autoproof::registry::call_context& ctx);

  /// Validate transaction envelope: version and chain id.
  autoproof::schema::transaction_result_t validate_transaction(
      const autoproof::schema::transaction_t& tx,
      std::string_view codespace) const;

  /// Load committed height/state_root from storage at startup.
  void load_persisted_state();

  mutable std::mutex mutex_;
  autoproof::schema::encoding::encoder<
      autoproof::schema::encoding::scale_encoder_tag>& encoder_;
  autoproof::storage::storage<autoproof::storage::rocksdb_storage_tag>&
      storage_;
  autoproof::registry::registry registry_;
  autoproof::schema::hash32_t chain_id_{};
  int64_t last_committed_height_{};
  autoproof::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  autoproof::schema::hash32_t pending_state_root_{};
  autoproof::schema::timestamp_milliseconds_t last_block_time_ms_{};
};

}  // namespace autoproof::execution
