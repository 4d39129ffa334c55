#include <spdlog/spdlog.h>
#include <autoproof/blake3/hash.hpp>
#include <autoproof/common/critical.hpp>
#include <autoproof/execution/engine.hpp>
#include <autoproof/schema/encoding/scale/encoder.hpp>
#include <autoproof/schema/key/engine_keys.hpp>
#include <autoproof/schema/operation_type.hpp>
#include <autoproof/schema/query_error_code.hpp>
#include <iterator>
#include <string>
#include <tuple>
#include <utility>

using namespace autoproof::schema;

namespace {

using encoder_t = autoproof::schema::encoding::encoder<
    autoproof::schema::encoding::scale_encoder_tag>;

constexpr auto kCheckTxCodespace = std::string_view{"autoproof.checktx"};
constexpr auto kFinalizeCodespace = std::string_view{"autoproof.finalize"};
constexpr auto kRegistryCodespace = std::string_view{"autoproof.registry"};
constexpr auto kQueryCodespace = std::string_view{"autoproof.query"};

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_t& tx,
                         uint64_t height,
                         uint64_t index) {
  auto material = bytes_t{};
  material.reserve(seed.size() + tx.size() + 32);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  encoder.encode(std::tuple{height, index}, material);
  return autoproof::blake3::hash(
      bytes_view_t{material.data(), material.size()});
}

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    error = "malformed SCALE transaction";
  }
  return tx;
}

transaction_result_t make_envelope_error(const transaction_error_code code,
                                         std::string_view log,
                                         std::string info,
                                         std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{log};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

transaction_event_attribute_t make_attribute(std::string key,
                                             std::string value) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = true};
}

/// Translate a registry outcome into a transaction result.  Successful
/// operations carry their SCALE-encoded return value and one event whose
/// type is the operation name.
template <typename T>
transaction_result_t make_operation_result(
    const operation_type_t type,
    const autoproof::registry::call_context& ctx,
    const operation_result<T>& outcome,
    std::vector<transaction_event_attribute_t> attributes) {
  auto result = transaction_result_t{};
  auto name = std::string{to_string(type)};
  if (!outcome.ok()) {
    result.code = static_cast<uint32_t>(outcome.code);
    result.log = std::string{to_string(outcome.code)};
    result.info = name + " rejected";
    result.codespace = std::string{kRegistryCodespace};
    return result;
  }

  auto encoder = encoder_t{};
  result.data = encoder.encode(*outcome.value);
  result.log = "ok";
  result.info = name + " accepted";
  attributes.insert(std::begin(attributes),
                    make_attribute("caller", ctx.caller));
  result.events.push_back(transaction_event_t{
      .type = std::move(name), .attributes = std::move(attributes)});
  return result;
}

query_result_t make_query_error(const query_error_code code,
                                std::string_view log,
                                std::string info,
                                const bytes_view_t& key,
                                const int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{log};
  result.info = std::move(info);
  result.key = make_bytes(key);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};
  return result;
}

query_result_t make_registry_query_error(const registry_error_code code,
                                         const bytes_view_t& key,
                                         const int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.key = make_bytes(key);
  result.height = height;
  result.codespace = std::string{kRegistryCodespace};
  return result;
}

}  // namespace

namespace autoproof::execution {

engine::engine(encoder_t& encoder,
               autoproof::storage::storage<
                   autoproof::storage::rocksdb_storage_tag>& storage,
               const hash32_t& chain_id,
               const principal_t& genesis_admin)
    : encoder_{encoder},
      storage_{storage},
      registry_{encoder, storage},
      chain_id_{chain_id} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing execution engine for chain {}",
               to_hex(chain_id_));

  auto chain_key = key::make_chain_id_key(encoder_);
  if (auto stored = storage_.get<hash32_t>(encoder_, chain_key)) {
    if (*stored != chain_id_) {
      spdlog::error("Stored chain id {} does not match configured {}",
                    to_hex(*stored), to_hex(chain_id_));
      autoproof::common::critical("chain id mismatch with stored state");
    }
  } else {
    auto batch = autoproof::storage::write_batch{};
    batch.put(encoder_, std::move(chain_key), chain_id_);
    storage_.commit(batch);
    spdlog::info("Recorded chain id {}", to_hex(chain_id_));
  }

  if (!registry_.initialize(genesis_admin)) {
    spdlog::info("Resuming registry with admin '{}' and {} part(s)",
                 registry_.get_admin(), registry_.get_total_parts());
  }

  load_persisted_state();
  spdlog::info("Execution engine ready at height {}", last_committed_height_);
}

transaction_result_t engine::check_transaction(
    const bytes_view_t& raw_tx) const {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_envelope_error(transaction_error_code::invalid_transaction,
                               "invalid transaction", decode_error,
                               kCheckTxCodespace);
  }
  return validate_transaction(*maybe_tx, kCheckTxCodespace);
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    std::string_view codespace) const {
  if (tx.version != 1) {
    return make_envelope_error(
        transaction_error_code::unsupported_transaction_version,
        "unsupported transaction version", "expected version 1", codespace);
  }
  if (tx.chain_id != chain_id_) {
    return make_envelope_error(transaction_error_code::invalid_chain_id,
                               "invalid chain id",
                               "transaction chain_id does not match engine",
                               codespace);
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_operation(
    const transaction_t& tx,
    const autoproof::registry::call_context& ctx) {
  return std::visit(
      overloaded{
          [&](const set_paused_t& payload) {
            return make_operation_result(
                operation_type_t::set_paused, ctx,
                registry_.set_paused(ctx, payload.pause),
                {make_attribute("paused", payload.pause ? "true" : "false")});
          },
          [&](const transfer_admin_t& payload) {
            return make_operation_result(
                operation_type_t::transfer_admin, ctx,
                registry_.transfer_admin(ctx, payload.new_admin),
                {make_attribute("new_admin", payload.new_admin)});
          },
          [&](const register_part_t& payload) {
            auto outcome =
                registry_.register_part(ctx, payload.serial_number,
                                        payload.material_spec,
                                        payload.origin_factory);
            auto attributes = std::vector<transaction_event_attribute_t>{
                make_attribute("serial_number", payload.serial_number)};
            if (outcome.ok()) {
              attributes.push_back(
                  make_attribute("part_id", std::to_string(*outcome.value)));
            }
            return make_operation_result(operation_type_t::register_part, ctx,
                                         outcome, std::move(attributes));
          },
          [&](const transfer_part_t& payload) {
            return make_operation_result(
                operation_type_t::transfer_part, ctx,
                registry_.transfer_part(ctx, payload.part_id,
                                        payload.new_owner),
                {make_attribute("part_id", std::to_string(payload.part_id)),
                 make_attribute("new_owner", payload.new_owner)});
          },
          [&](const update_part_status_t& payload) {
            return make_operation_result(
                operation_type_t::update_part_status, ctx,
                registry_.update_part_status(ctx, payload.part_id,
                                             payload.new_status),
                {make_attribute("part_id", std::to_string(payload.part_id)),
                 make_attribute("status", payload.new_status)});
          },
          [&](const burn_part_t& payload) {
            return make_operation_result(
                operation_type_t::burn_part, ctx,
                registry_.burn_part(ctx, payload.part_id),
                {make_attribute("part_id", std::to_string(payload.part_id))});
          }},
      tx.payload);
}

block_result_t engine::finalize_block(uint64_t height,
                                      timestamp_milliseconds_t block_time_ms,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  if (block_time_ms < last_block_time_ms_) {
    spdlog::warn("Block {} time {} precedes previous block time {}; clamping",
                 height, block_time_ms, last_block_time_ms_);
    block_time_ms = last_block_time_ms_;
  }
  last_block_time_ms_ = block_time_ms;

  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  auto rolling_root = last_committed_state_root_;
  auto accepted = std::size_t{};
  for (size_t i = 0; i < txs.size(); ++i) {
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(
        bytes_view_t{txs[i].data(), txs[i].size()}, decode_error);
    if (!maybe_tx) {
      spdlog::warn("Rejected transaction {} in block {}: {}", i, height,
                   decode_error);
      result.tx_results.push_back(make_envelope_error(
          transaction_error_code::invalid_transaction, "invalid transaction",
          decode_error, kFinalizeCodespace));
      continue;
    }

    auto tx_result = validate_transaction(*maybe_tx, kFinalizeCodespace);
    if (tx_result.code == 0) {
      tx_result = execute_operation(
          *maybe_tx, autoproof::registry::call_context{
                         .caller = maybe_tx->caller, .now = block_time_ms});
    }
    if (tx_result.code == 0) {
      rolling_root = fold_state_root(rolling_root, txs[i], height, i);
      ++accepted;
    } else {
      spdlog::info("Rejected transaction {} in block {} from '{}': {} ({})", i,
                   height, maybe_tx->caller, tx_result.log, tx_result.code);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  spdlog::info("Finalized block {} with {}/{} accepted transaction(s)", height,
               accepted, txs.size());
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
  }

  storage_.save_committed_state(autoproof::storage::committed_state{
      .height = last_committed_height_,
      .state_root = last_committed_state_root_,
      .block_time_ms = last_block_time_ms_});

  auto result = commit_result_t{};
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(std::string_view path,
                             const bytes_view_t& data) const {
  auto height = int64_t{};
  auto state_root = hash32_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    height = last_committed_height_;
    state_root = last_committed_state_root_;
  }

  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};

  auto encoder = encoder_t{};
  if (path == "/engine/info") {
    result.value = encoder.encode(std::tuple{height, state_root, chain_id_});
    return result;
  }
  if (path == "/engine/keyspaces") {
    auto prefixes = std::vector<bytes_t>{};
    prefixes.reserve(key::kEngineKeyspaces.size());
    for (const auto& prefix : key::kEngineKeyspaces) {
      prefixes.push_back(key::make_prefix_key(encoder, prefix));
    }
    auto counts = storage_.count_by_prefixes(prefixes);
    auto keyspaces = std::vector<std::tuple<std::string, uint64_t>>{};
    keyspaces.reserve(counts.size());
    for (size_t i = 0; i < counts.size(); ++i) {
      keyspaces.emplace_back(std::string{key::kEngineKeyspaces[i]}, counts[i]);
    }
    result.value = encoder.encode(keyspaces);
    return result;
  }
  if (path == "/registry/admin") {
    result.value = encoder.encode(registry_.get_admin());
    return result;
  }
  if (path == "/registry/paused") {
    result.value = encoder.encode(registry_.is_paused());
    return result;
  }
  if (path == "/registry/total_parts") {
    result.value = encoder.encode(registry_.get_total_parts());
    return result;
  }

  if (path == "/part/history") {
    auto history_key =
        encoder.try_decode<std::tuple<part_id_t, history_index_t>>(data);
    if (!history_key) {
      return make_query_error(query_error_code::invalid_key, "invalid key",
                              "expected SCALE (part_id, index)", data, height);
    }
    auto event = registry_.get_part_history(std::get<0>(*history_key),
                                            std::get<1>(*history_key));
    if (!event.ok()) {
      return make_registry_query_error(event.code, data, height);
    }
    result.value = encoder.encode(*event.value);
    return result;
  }

  const auto is_part_path =
      path == "/part/metadata" || path == "/part/owner" ||
      path == "/part/token" || path == "/part/history_count";
  if (!is_part_path) {
    return make_query_error(query_error_code::unsupported_path,
                            "unsupported path", std::string{path}, data,
                            height);
  }

  auto part_id = encoder.try_decode<part_id_t>(data);
  if (!part_id) {
    return make_query_error(query_error_code::invalid_key, "invalid key",
                            "expected SCALE part_id", data, height);
  }
  if (path == "/part/metadata") {
    auto metadata = registry_.get_part_metadata(*part_id);
    if (!metadata.ok()) {
      return make_registry_query_error(metadata.code, data, height);
    }
    result.value = encoder.encode(*metadata.value);
  } else if (path == "/part/owner") {
    auto owner = registry_.get_part_owner(*part_id);
    if (!owner.ok()) {
      return make_registry_query_error(owner.code, data, height);
    }
    result.value = encoder.encode(*owner.value);
  } else if (path == "/part/token") {
    result.value = encoder.encode(registry_.part_token_exists(*part_id));
  } else {
    result.value = encoder.encode(registry_.get_history_count(*part_id));
  }
  return result;
}

const hash32_t& engine::chain_id() const {
  return chain_id_;
}

autoproof::registry::registry& engine::part_registry() {
  return registry_;
}

const autoproof::registry::registry& engine::part_registry() const {
  return registry_;
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    pending_state_root_ = committed->state_root;
    last_block_time_ms_ = committed->block_time_ms;
  }
}

}  // namespace autoproof::execution
