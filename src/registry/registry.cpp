#include <spdlog/spdlog.h>
#include <autoproof/common/critical.hpp>
#include <autoproof/registry/registry.hpp>
#include <autoproof/schema/key/engine_keys.hpp>
#include <autoproof/schema/part_status.hpp>
#include <mutex>

using namespace autoproof::schema;

namespace {

bool valid_field(const std::string& value, const std::size_t max_length) {
  return !value.empty() && value.size() <= max_length;
}

}  // namespace

namespace autoproof::registry {

registry::registry(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

bool registry::initialize(const principal_t& genesis_admin) {
  auto lock = std::unique_lock{mutex_};
  if (is_burn_principal(genesis_admin)) {
    autoproof::common::critical(
        "genesis admin must not be empty or the burn address");
  }
  auto state_key = key::make_registry_state_key(encoder_);
  if (storage_.exists(state_key)) {
    return false;
  }

  auto batch = autoproof::storage::write_batch{};
  batch.put(encoder_, std::move(state_key),
            registry_state_t{.admin = genesis_admin, .paused = false,
                             .next_part_id = 0});
  storage_.commit(batch);
  spdlog::info("Initialized part registry with admin '{}'", genesis_admin);
  return true;
}

bool registry::is_admin(const principal_t& caller) const {
  auto lock = std::shared_lock{mutex_};
  return load_state().admin == caller;
}

operation_result<bool> registry::set_paused(const call_context& ctx,
                                            const bool pause) {
  auto lock = std::unique_lock{mutex_};
  auto state = load_state();
  if (ctx.caller != state.admin) {
    return make_failure<bool>(registry_error_code::not_authorized);
  }

  state.paused = pause;
  auto batch = autoproof::storage::write_batch{};
  batch.put(encoder_, key::make_registry_state_key(encoder_), state);
  storage_.commit(batch);
  spdlog::info("Registry {} by '{}'", pause ? "paused" : "unpaused",
               ctx.caller);
  return make_success(pause);
}

operation_result<bool> registry::transfer_admin(const call_context& ctx,
                                                const principal_t& new_admin) {
  auto lock = std::unique_lock{mutex_};
  auto state = load_state();
  if (ctx.caller != state.admin) {
    return make_failure<bool>(registry_error_code::not_authorized);
  }
  if (is_burn_principal(new_admin)) {
    return make_failure<bool>(registry_error_code::zero_address);
  }

  state.admin = new_admin;
  auto batch = autoproof::storage::write_batch{};
  batch.put(encoder_, key::make_registry_state_key(encoder_), state);
  storage_.commit(batch);
  spdlog::info("Registry admin moved from '{}' to '{}'", ctx.caller,
               new_admin);
  return make_success(true);
}

operation_result<part_id_t> registry::register_part(
    const call_context& ctx,
    const std::string& serial_number,
    const std::string& material_spec,
    const std::string& origin_factory) {
  auto lock = std::unique_lock{mutex_};
  auto state = load_state();
  if (ctx.caller != state.admin) {
    return make_failure<part_id_t>(registry_error_code::not_authorized);
  }
  if (!valid_field(serial_number, kMaxSerialNumberLength) ||
      !valid_field(material_spec, kMaxMaterialSpecLength) ||
      !valid_field(origin_factory, kMaxOriginFactoryLength)) {
    return make_failure<part_id_t>(registry_error_code::invalid_metadata);
  }

  // The counter only advances in the same batch as the part rows, so a
  // rejected registration never leaves a gap.
  const auto part_id = state.next_part_id + 1;
  if (storage_.exists(key::make_part_metadata_key(encoder_, part_id))) {
    return make_failure<part_id_t>(registry_error_code::already_registered);
  }

  auto batch = autoproof::storage::write_batch{};
  batch.put(encoder_, key::make_part_token_key(encoder_, part_id),
            ctx.caller);
  batch.put(encoder_, key::make_part_owner_key(encoder_, part_id), ctx.caller);
  batch.put(encoder_, key::make_part_metadata_key(encoder_, part_id),
            part_metadata_t{.serial_number = serial_number,
                            .manufacturer = ctx.caller,
                            .production_date = ctx.now,
                            .material_spec = material_spec,
                            .status = std::string{kPartStatusActive},
                            .last_owner = ctx.caller,
                            .origin_factory = origin_factory});
  append_history(batch, part_id, kHistoryEventRegistered, ctx);
  state.next_part_id = part_id;
  batch.put(encoder_, key::make_registry_state_key(encoder_), state);
  storage_.commit(batch);

  spdlog::debug("Registered part {} serial '{}' from '{}'", part_id,
                serial_number, origin_factory);
  return make_success(part_id);
}

operation_result<bool> registry::transfer_part(const call_context& ctx,
                                               const part_id_t part_id,
                                               const principal_t& new_owner) {
  auto lock = std::unique_lock{mutex_};
  if (load_state().paused) {
    return make_failure<bool>(registry_error_code::paused);
  }
  if (is_burn_principal(new_owner)) {
    return make_failure<bool>(registry_error_code::zero_address);
  }
  auto owner = load_owner(part_id);
  auto metadata = load_metadata(part_id);
  if (!owner || !metadata) {
    return make_failure<bool>(registry_error_code::not_found);
  }
  if (*owner != ctx.caller) {
    return make_failure<bool>(registry_error_code::not_owner);
  }
  if (is_recycled(metadata->status)) {
    return make_failure<bool>(registry_error_code::already_recycled);
  }

  metadata->last_owner = new_owner;
  auto batch = autoproof::storage::write_batch{};
  batch.put(encoder_, key::make_part_token_key(encoder_, part_id), new_owner);
  batch.put(encoder_, key::make_part_owner_key(encoder_, part_id), new_owner);
  batch.put(encoder_, key::make_part_metadata_key(encoder_, part_id),
            *metadata);
  append_history(batch, part_id, kHistoryEventTransferred, ctx);
  storage_.commit(batch);

  spdlog::debug("Transferred part {} from '{}' to '{}'", part_id, ctx.caller,
                new_owner);
  return make_success(true);
}

operation_result<bool> registry::update_part_status(
    const call_context& ctx,
    const part_id_t part_id,
    const std::string& new_status) {
  auto lock = std::unique_lock{mutex_};
  if (ctx.caller != load_state().admin) {
    return make_failure<bool>(registry_error_code::not_authorized);
  }
  auto metadata = load_metadata(part_id);
  if (!metadata) {
    return make_failure<bool>(registry_error_code::not_found);
  }
  if (is_recycled(metadata->status)) {
    return make_failure<bool>(registry_error_code::already_recycled);
  }
  if (new_status.size() > kMaxPartStatusLength) {
    return make_failure<bool>(registry_error_code::invalid_metadata);
  }

  metadata->status = new_status;
  auto batch = autoproof::storage::write_batch{};
  batch.put(encoder_, key::make_part_metadata_key(encoder_, part_id),
            *metadata);
  append_history(batch, part_id, make_status_updated_event(new_status), ctx);
  storage_.commit(batch);

  spdlog::debug("Part {} status set to '{}'", part_id, new_status);
  return make_success(true);
}

operation_result<bool> registry::burn_part(const call_context& ctx,
                                           const part_id_t part_id) {
  auto lock = std::unique_lock{mutex_};
  if (ctx.caller != load_state().admin) {
    return make_failure<bool>(registry_error_code::not_authorized);
  }
  auto owner = load_owner(part_id);
  auto metadata = load_metadata(part_id);
  if (!owner || !metadata) {
    return make_failure<bool>(registry_error_code::not_found);
  }
  if (*owner != ctx.caller) {
    return make_failure<bool>(registry_error_code::not_owner);
  }
  if (is_recycled(metadata->status)) {
    return make_failure<bool>(registry_error_code::already_recycled);
  }

  // Only the token marker goes away; metadata, owner and history remain as
  // the provenance record.
  metadata->status = std::string{kPartStatusRecycled};
  auto batch = autoproof::storage::write_batch{};
  batch.erase(key::make_part_token_key(encoder_, part_id));
  batch.put(encoder_, key::make_part_metadata_key(encoder_, part_id),
            *metadata);
  append_history(batch, part_id, kHistoryEventBurned, ctx);
  storage_.commit(batch);

  spdlog::debug("Burned part {} by '{}'", part_id, ctx.caller);
  return make_success(true);
}

operation_result<part_metadata_t> registry::get_part_metadata(
    const part_id_t part_id) const {
  auto lock = std::shared_lock{mutex_};
  auto metadata = load_metadata(part_id);
  if (!metadata) {
    return make_failure<part_metadata_t>(registry_error_code::not_found);
  }
  return make_success(std::move(*metadata));
}

operation_result<principal_t> registry::get_part_owner(
    const part_id_t part_id) const {
  auto lock = std::shared_lock{mutex_};
  auto owner = load_owner(part_id);
  if (!owner) {
    return make_failure<principal_t>(registry_error_code::not_found);
  }
  return make_success(std::move(*owner));
}

operation_result<history_event_t> registry::get_part_history(
    const part_id_t part_id,
    const history_index_t index) const {
  auto lock = std::shared_lock{mutex_};
  auto event = storage_.get<history_event_t>(
      encoder_, key::make_part_history_key(encoder_, part_id, index));
  if (!event) {
    return make_failure<history_event_t>(registry_error_code::not_found);
  }
  return make_success(std::move(*event));
}

uint64_t registry::get_history_count(const part_id_t part_id) const {
  auto lock = std::shared_lock{mutex_};
  return load_history_count(part_id);
}

bool registry::part_token_exists(const part_id_t part_id) const {
  auto lock = std::shared_lock{mutex_};
  return storage_.exists(key::make_part_token_key(encoder_, part_id));
}

principal_t registry::get_admin() const {
  auto lock = std::shared_lock{mutex_};
  return load_state().admin;
}

bool registry::is_paused() const {
  auto lock = std::shared_lock{mutex_};
  return load_state().paused;
}

uint64_t registry::get_total_parts() const {
  auto lock = std::shared_lock{mutex_};
  return load_state().next_part_id;
}

registry_state_t registry::load_state() const {
  auto state = storage_.get<registry_state_t>(
      encoder_, key::make_registry_state_key(encoder_));
  if (!state) {
    autoproof::common::critical("registry state missing; run initialize first");
  }
  return *state;
}

std::optional<part_metadata_t> registry::load_metadata(
    const part_id_t part_id) const {
  return storage_.get<part_metadata_t>(
      encoder_, key::make_part_metadata_key(encoder_, part_id));
}

std::optional<principal_t> registry::load_owner(
    const part_id_t part_id) const {
  return storage_.get<principal_t>(encoder_,
                                   key::make_part_owner_key(encoder_, part_id));
}

uint64_t registry::load_history_count(const part_id_t part_id) const {
  return storage_
      .get<uint64_t>(encoder_,
                     key::make_part_history_count_key(encoder_, part_id))
      .value_or(0);
}

void registry::append_history(autoproof::storage::write_batch& batch,
                              const part_id_t part_id,
                              const std::string_view event,
                              const call_context& ctx) const {
  const auto index = load_history_count(part_id) + 1;
  batch.put(encoder_, key::make_part_history_key(encoder_, part_id, index),
            history_event_t{.event = std::string{event},
                            .timestamp = ctx.now,
                            .actor = ctx.caller});
  batch.put(encoder_, key::make_part_history_count_key(encoder_, part_id),
            index);
}

}  // namespace autoproof::registry
