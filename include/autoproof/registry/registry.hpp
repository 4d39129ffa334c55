#pragma once

#include <autoproof/schema/encoding/encoder.hpp>
#include <autoproof/schema/encoding/scale/encoder.hpp>
#include <autoproof/schema/history_event.hpp>
#include <autoproof/schema/operation_result.hpp>
#include <autoproof/schema/part_metadata.hpp>
#include <autoproof/schema/primitives.hpp>
#include <autoproof/schema/registry_state.hpp>
#include <autoproof/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace autoproof::registry {

/// Who is calling and at which logical time.  Both are supplied by the host:
/// the caller is already authenticated and `now` never decreases.
struct call_context final {
  autoproof::schema::principal_t caller;
  autoproof::schema::timestamp_milliseconds_t now{};
};

/// Part registry state machine.
///
/// Every mutating operation checks access control, validates its inputs, then
/// writes the lifecycle rows and exactly one history row in a single atomic
/// batch.  A failed operation writes nothing.  Mutations are serialized;
/// queries may run concurrently with each other.
class registry final {
 public:
  using encoder_t = autoproof::schema::encoding::encoder<
      autoproof::schema::encoding::scale_encoder_tag>;
  using storage_t =
      autoproof::storage::storage<autoproof::storage::rocksdb_storage_tag>;

  registry(encoder_t& encoder, storage_t& storage);

  /// Write the initial registry state when none exists yet.
  ///
  /// Returns false and leaves storage untouched when state was already
  /// present.  A burn or empty genesis admin is a fatal configuration error.
  bool initialize(const autoproof::schema::principal_t& genesis_admin);

  bool is_admin(const autoproof::schema::principal_t& caller) const;

  /// Admin only.  Returns the new flag value.
  autoproof::schema::operation_result<bool> set_paused(const call_context& ctx,
                                                       bool pause);

  /// Admin only.  The burn identity can never become admin.
  autoproof::schema::operation_result<bool> transfer_admin(
      const call_context& ctx,
      const autoproof::schema::principal_t& new_admin);

  /// Admin only.  Allocates the next id, mints it to the caller and records
  /// the "registered" event at history index 1.
  autoproof::schema::operation_result<autoproof::schema::part_id_t>
  register_part(const call_context& ctx,
                const std::string& serial_number,
                const std::string& material_spec,
                const std::string& origin_factory);

  /// Current owner only, and only while the registry is not paused.
  autoproof::schema::operation_result<bool> transfer_part(
      const call_context& ctx,
      autoproof::schema::part_id_t part_id,
      const autoproof::schema::principal_t& new_owner);

  /// Admin only.  Any status value is accepted; "recycled" is terminal.
  autoproof::schema::operation_result<bool> update_part_status(
      const call_context& ctx,
      autoproof::schema::part_id_t part_id,
      const std::string& new_status);

  /// Requires a caller that is both admin and current owner.
  autoproof::schema::operation_result<bool> burn_part(
      const call_context& ctx,
      autoproof::schema::part_id_t part_id);

  autoproof::schema::operation_result<autoproof::schema::part_metadata_t>
  get_part_metadata(autoproof::schema::part_id_t part_id) const;

  autoproof::schema::operation_result<autoproof::schema::principal_t>
  get_part_owner(autoproof::schema::part_id_t part_id) const;

  autoproof::schema::operation_result<autoproof::schema::history_event_t>
  get_part_history(autoproof::schema::part_id_t part_id,
                   autoproof::schema::history_index_t index) const;

  /// Zero for parts that were never registered.
  uint64_t get_history_count(autoproof::schema::part_id_t part_id) const;

  /// False once the part has been burned, and for unknown parts.
  bool part_token_exists(autoproof::schema::part_id_t part_id) const;

  autoproof::schema::principal_t get_admin() const;
  bool is_paused() const;
  uint64_t get_total_parts() const;

 private:
  autoproof::schema::registry_state_t load_state() const;
  std::optional<autoproof::schema::part_metadata_t> load_metadata(
      autoproof::schema::part_id_t part_id) const;
  std::optional<autoproof::schema::principal_t> load_owner(
      autoproof::schema::part_id_t part_id) const;
  uint64_t load_history_count(autoproof::schema::part_id_t part_id) const;

  /// Stage the next history row for part_id and bump its count.  The only
  /// writer of history rows, so indices stay contiguous from 1.
  void append_history(autoproof::storage::write_batch& batch,
                      autoproof::schema::part_id_t part_id,
                      std::string_view event,
                      const call_context& ctx) const;

  mutable std::shared_mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace autoproof::registry
