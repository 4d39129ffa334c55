#include <gtest/gtest.h>

#include <autoproof/execution/engine.hpp>
#include <autoproof/schema/key/engine_keys.hpp>
#include <autoproof/schema/query_error_code.hpp>
#include <autoproof/schema/registry_error_code.hpp>
#include <autoproof/schema/transaction_error_code.hpp>
#include <autoproof/testing/execution_fixture.hpp>

#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace {

using autoproof::testing::decode_value;
using autoproof::testing::execution_fixture;
using autoproof::testing::kAdmin;
using autoproof::testing::kWalletB;
using autoproof::testing::kWalletC;
using autoproof::testing::scale_encoder_t;

autoproof::schema::register_part_t make_register(
    const std::string& serial_number = "SN123456") {
  return autoproof::schema::register_part_t{.serial_number = serial_number,
                                            .material_spec = "Aluminum-Alloy",
                                            .origin_factory = "FactoryA"};
}

autoproof::schema::bytes_t encode_part_id(
    const autoproof::schema::part_id_t part_id) {
  return scale_encoder_t{}.encode(part_id);
}

}  // namespace

TEST(engine, check_transaction_accepts_valid_envelope) {
  auto fixture = execution_fixture{"autoproof_engine_checktx"};
  auto raw = fixture.tx(kAdmin, make_register());

  auto result = fixture.engine().check_transaction(raw);
  EXPECT_EQ(result.code, 0u);
  EXPECT_EQ(fixture.engine().part_registry().get_total_parts(), 0u);
}

TEST(engine, check_transaction_rejects_bad_envelopes) {
  auto fixture = execution_fixture{"autoproof_engine_checktx_errors"};

  auto empty = fixture.engine().check_transaction({});
  EXPECT_EQ(empty.code, static_cast<uint32_t>(
                            autoproof::schema::transaction_error_code::
                                invalid_transaction));
  EXPECT_EQ(empty.codespace, "autoproof.checktx");

  auto garbage = autoproof::schema::bytes_t{0xFF, 0x01, 0x02};
  EXPECT_EQ(fixture.engine().check_transaction(garbage).code,
            static_cast<uint32_t>(autoproof::schema::transaction_error_code::
                                      invalid_transaction));

  auto wrong_version = autoproof::testing::make_transaction(
      fixture.engine().chain_id(), kAdmin, make_register());
  wrong_version.version = 2;
  EXPECT_EQ(fixture.engine()
                .check_transaction(
                    autoproof::testing::encode_transaction(wrong_version))
                .code,
            static_cast<uint32_t>(autoproof::schema::transaction_error_code::
                                      unsupported_transaction_version));

  auto wrong_chain = autoproof::testing::make_transaction(
      autoproof::testing::make_hash(99), kAdmin, make_register());
  EXPECT_EQ(fixture.engine()
                .check_transaction(
                    autoproof::testing::encode_transaction(wrong_chain))
                .code,
            static_cast<uint32_t>(
                autoproof::schema::transaction_error_code::invalid_chain_id));
}

TEST(engine, finalize_block_runs_registry_operations) {
  auto fixture = execution_fixture{"autoproof_engine_finalize"};
  auto& engine = fixture.engine();

  auto block = engine.finalize_block(
      1, 1000,
      {fixture.tx(kAdmin, make_register()),
       fixture.tx(kAdmin, autoproof::schema::transfer_part_t{
                              .part_id = 1, .new_owner = std::string{kWalletB}}),
       fixture.tx(kAdmin, autoproof::schema::burn_part_t{.part_id = 1})});
  ASSERT_EQ(block.tx_results.size(), 3u);

  const auto& registered = block.tx_results[0];
  EXPECT_EQ(registered.code, 0u);
  EXPECT_EQ(decode_value<uint64_t>(registered.data), 1u);
  ASSERT_EQ(registered.events.size(), 1u);
  EXPECT_EQ(registered.events[0].type, "register_part");
  EXPECT_EQ(registered.info, "register_part accepted");

  EXPECT_EQ(block.tx_results[1].code, 0u);
  EXPECT_TRUE(decode_value<bool>(block.tx_results[1].data));

  const auto& burned = block.tx_results[2];
  EXPECT_EQ(burned.code, static_cast<uint32_t>(
                             autoproof::schema::registry_error_code::not_owner));
  EXPECT_EQ(burned.codespace, "autoproof.registry");
  EXPECT_EQ(burned.log, "caller is not the owner");
  EXPECT_TRUE(burned.events.empty());

  auto owner = engine.part_registry().get_part_owner(1);
  ASSERT_TRUE(owner.ok());
  EXPECT_EQ(*owner.value, kWalletB);
  EXPECT_EQ(engine.part_registry().get_part_history(1, 1).value->timestamp,
            1000u);
}

TEST(engine, finalize_block_reports_envelope_failures_per_transaction) {
  auto fixture = execution_fixture{"autoproof_engine_mixed"};
  auto& engine = fixture.engine();

  auto foreign = autoproof::testing::encode_transaction(
      autoproof::testing::make_transaction(autoproof::testing::make_hash(42),
                                           kAdmin, make_register()));
  auto block = engine.finalize_block(
      1, 1000,
      {autoproof::schema::bytes_t{0x00}, foreign,
       fixture.tx(kAdmin, make_register())});
  ASSERT_EQ(block.tx_results.size(), 3u);
  EXPECT_EQ(block.tx_results[0].code, 1u);
  EXPECT_EQ(block.tx_results[0].codespace, "autoproof.finalize");
  EXPECT_EQ(block.tx_results[1].code, 3u);
  EXPECT_EQ(block.tx_results[2].code, 0u);
  EXPECT_EQ(engine.part_registry().get_total_parts(), 1u);
}

TEST(engine, block_time_never_moves_backwards) {
  auto fixture = execution_fixture{"autoproof_engine_clock"};
  auto& engine = fixture.engine();

  ASSERT_EQ(fixture.finalize_single(1, 5000, fixture.tx(kAdmin, make_register()))
                .code,
            0u);
  ASSERT_EQ(fixture
                .finalize_single(2, 3000,
                                 fixture.tx(kAdmin,
                                            autoproof::schema::
                                                update_part_status_t{
                                                    .part_id = 1,
                                                    .new_status = "installed"}))
                .code,
            0u);

  auto event = engine.part_registry().get_part_history(1, 2);
  ASSERT_TRUE(event.ok());
  EXPECT_EQ(event.value->timestamp, 5000u);
}

TEST(engine, block_time_clamp_survives_restart) {
  const auto db_path =
      autoproof::testing::make_db_path("autoproof_engine_clock_restart");
  const auto chain_id = autoproof::testing::make_hash(7);
  auto encoder = scale_encoder_t{};
  auto tx = [&](const autoproof::schema::transaction_payload_t& payload) {
    return autoproof::testing::encode_transaction(
        autoproof::testing::make_transaction(chain_id, kAdmin, payload));
  };
  {
    auto storage = autoproof::storage::make_storage<
        autoproof::storage::rocksdb_storage_tag>(db_path);
    auto engine = autoproof::execution::engine{encoder, storage, chain_id,
                                               std::string{kAdmin}};
    auto block = engine.finalize_block(1, 9000, {tx(make_register())});
    ASSERT_EQ(block.tx_results.at(0).code, 0u);
    engine.commit();
  }
  {
    auto storage = autoproof::storage::make_storage<
        autoproof::storage::rocksdb_storage_tag>(db_path);
    auto engine = autoproof::execution::engine{encoder, storage, chain_id,
                                               std::string{kAdmin}};
    auto block = engine.finalize_block(
        2, 1000,
        {tx(autoproof::schema::update_part_status_t{.part_id = 1,
                                                    .new_status = "installed"})});
    ASSERT_EQ(block.tx_results.at(0).code, 0u);
    engine.commit();

    auto event = engine.part_registry().get_part_history(1, 2);
    ASSERT_TRUE(event.ok());
    EXPECT_EQ(event.value->timestamp, 9000u);
  }
  autoproof::testing::remove_path(db_path);
}

TEST(engine, state_root_folds_successful_transactions_only) {
  auto first = execution_fixture{"autoproof_engine_root_a"};
  auto second = execution_fixture{"autoproof_engine_root_b"};

  auto register_tx = first.tx(kAdmin, make_register());
  auto rejected_tx = first.tx(kWalletB, make_register("SN-OTHER"));

  auto root_a = first.engine().finalize_block(1, 1000, {register_tx}).state_root;
  auto root_b = second.engine()
                    .finalize_block(1, 1000, {register_tx, rejected_tx})
                    .state_root;
  EXPECT_NE(root_a, autoproof::schema::make_zero_hash());
  // The rejected transaction sits at index 1, after the accepted one, so it
  // leaves the fold untouched.
  EXPECT_EQ(root_a, root_b);

  auto empty = execution_fixture{"autoproof_engine_root_empty"};
  EXPECT_EQ(empty.engine().finalize_block(1, 1000, {}).state_root,
            autoproof::schema::make_zero_hash());
}

TEST(engine, commit_persists_height_and_root) {
  const auto db_path = autoproof::testing::make_db_path("autoproof_engine_commit");
  const auto chain_id = autoproof::testing::make_hash(7);
  auto encoder = scale_encoder_t{};
  auto expected_root = autoproof::schema::hash32_t{};
  {
    auto storage = autoproof::storage::make_storage<
        autoproof::storage::rocksdb_storage_tag>(db_path);
    auto engine = autoproof::execution::engine{encoder, storage, chain_id,
                                               std::string{kAdmin}};
    auto raw = autoproof::testing::encode_transaction(
        autoproof::testing::make_transaction(chain_id, kAdmin,
                                             make_register()));
    auto block = engine.finalize_block(3, 1000, {raw});
    auto committed = engine.commit();
    EXPECT_EQ(committed.committed_height, 3);
    EXPECT_EQ(committed.state_root, block.state_root);
    expected_root = committed.state_root;
  }
  {
    auto storage = autoproof::storage::make_storage<
        autoproof::storage::rocksdb_storage_tag>(db_path);
    auto engine = autoproof::execution::engine{encoder, storage, chain_id,
                                               std::string{kWalletB}};
    auto info = engine.info();
    EXPECT_EQ(info.last_block_height, 3);
    EXPECT_EQ(info.last_block_state_root, expected_root);
    EXPECT_EQ(info.data, "autoproof-part-registry");
    // Genesis only runs once; the stored admin wins.
    EXPECT_EQ(engine.part_registry().get_admin(), kAdmin);
    EXPECT_EQ(engine.part_registry().get_total_parts(), 1u);
  }
  autoproof::testing::remove_path(db_path);
}

TEST(engine, query_registry_routes) {
  auto fixture = execution_fixture{"autoproof_engine_query_registry"};
  auto& engine = fixture.engine();
  ASSERT_EQ(fixture.finalize_single(1, 1000, fixture.tx(kAdmin, make_register()))
                .code,
            0u);

  auto admin = engine.query("/registry/admin", {});
  ASSERT_EQ(admin.code, 0u);
  EXPECT_EQ(decode_value<std::string>(admin.value), kAdmin);
  EXPECT_EQ(admin.height, 1);

  auto paused = engine.query("/registry/paused", {});
  ASSERT_EQ(paused.code, 0u);
  EXPECT_FALSE(decode_value<bool>(paused.value));

  auto total = engine.query("/registry/total_parts", {});
  ASSERT_EQ(total.code, 0u);
  EXPECT_EQ(decode_value<uint64_t>(total.value), 1u);

  auto info = engine.query("/engine/info", {});
  ASSERT_EQ(info.code, 0u);
  auto decoded = decode_value<std::tuple<int64_t, autoproof::schema::hash32_t,
                                         autoproof::schema::hash32_t>>(
      info.value);
  EXPECT_EQ(std::get<0>(decoded), 1);
  EXPECT_EQ(std::get<2>(decoded), engine.chain_id());
}

TEST(engine, query_part_routes) {
  auto fixture = execution_fixture{"autoproof_engine_query_part"};
  auto& engine = fixture.engine();
  ASSERT_EQ(fixture.finalize_single(1, 1000, fixture.tx(kAdmin, make_register()))
                .code,
            0u);
  ASSERT_EQ(fixture
                .finalize_single(2, 2000,
                                 fixture.tx(kAdmin,
                                            autoproof::schema::transfer_part_t{
                                                .part_id = 1,
                                                .new_owner =
                                                    std::string{kWalletC}}))
                .code,
            0u);

  auto key = encode_part_id(1);
  auto metadata = engine.query("/part/metadata", key);
  ASSERT_EQ(metadata.code, 0u);
  auto decoded_metadata =
      decode_value<autoproof::schema::part_metadata_t>(metadata.value);
  EXPECT_EQ(decoded_metadata.serial_number, "SN123456");
  EXPECT_EQ(decoded_metadata.last_owner, kWalletC);
  EXPECT_EQ(metadata.key, key);

  auto owner = engine.query("/part/owner", key);
  ASSERT_EQ(owner.code, 0u);
  EXPECT_EQ(decode_value<std::string>(owner.value), kWalletC);

  auto token = engine.query("/part/token", key);
  ASSERT_EQ(token.code, 0u);
  EXPECT_TRUE(decode_value<bool>(token.value));

  auto count = engine.query("/part/history_count", key);
  ASSERT_EQ(count.code, 0u);
  EXPECT_EQ(decode_value<uint64_t>(count.value), 2u);

  auto history = engine.query(
      "/part/history",
      scale_encoder_t{}.encode(std::tuple{uint64_t{1}, uint64_t{2}}));
  ASSERT_EQ(history.code, 0u);
  auto event = decode_value<autoproof::schema::history_event_t>(history.value);
  EXPECT_EQ(event.event, "transferred");
  EXPECT_EQ(event.timestamp, 2000u);
  EXPECT_EQ(event.actor, kAdmin);
}

TEST(engine, query_error_paths) {
  auto fixture = execution_fixture{"autoproof_engine_query_errors"};
  auto& engine = fixture.engine();

  auto unsupported = engine.query("/part/unknown", {});
  EXPECT_EQ(unsupported.code,
            static_cast<uint32_t>(
                autoproof::schema::query_error_code::unsupported_path));
  EXPECT_EQ(unsupported.codespace, "autoproof.query");

  auto invalid = engine.query("/part/metadata", {});
  EXPECT_EQ(invalid.code, static_cast<uint32_t>(
                              autoproof::schema::query_error_code::invalid_key));

  auto missing = engine.query("/part/metadata", encode_part_id(5));
  EXPECT_EQ(missing.code, static_cast<uint32_t>(
                              autoproof::schema::registry_error_code::not_found));
  EXPECT_EQ(missing.codespace, "autoproof.registry");

  auto missing_history = engine.query(
      "/part/history",
      scale_encoder_t{}.encode(std::tuple{uint64_t{5}, uint64_t{1}}));
  EXPECT_EQ(missing_history.code,
            static_cast<uint32_t>(
                autoproof::schema::registry_error_code::not_found));

  auto unknown_count = engine.query("/part/history_count", encode_part_id(5));
  ASSERT_EQ(unknown_count.code, 0u);
  EXPECT_EQ(decode_value<uint64_t>(unknown_count.value), 0u);
}

TEST(engine, query_keyspaces_counts_rows) {
  auto fixture = execution_fixture{"autoproof_engine_keyspaces"};
  auto& engine = fixture.engine();
  ASSERT_EQ(fixture.finalize_single(1, 1000, fixture.tx(kAdmin, make_register()))
                .code,
            0u);
  ASSERT_EQ(fixture
                .finalize_single(2, 2000,
                                 fixture.tx(kAdmin, autoproof::schema::burn_part_t{
                                                        .part_id = 1}))
                .code,
            0u);

  auto result = engine.query("/engine/keyspaces", {});
  ASSERT_EQ(result.code, 0u);
  auto keyspaces =
      decode_value<std::vector<std::tuple<std::string, uint64_t>>>(result.value);
  ASSERT_EQ(keyspaces.size(), autoproof::schema::key::kEngineKeyspaces.size());

  auto rows_for = [&](const std::string_view prefix) {
    for (const auto& [name, rows] : keyspaces) {
      if (name == prefix) {
        return rows;
      }
    }
    return uint64_t{0xFFFF};
  };
  EXPECT_EQ(rows_for(autoproof::schema::key::kRegistryKeyPrefix), 1u);
  EXPECT_EQ(rows_for(autoproof::schema::key::kChainIdKeyPrefix), 1u);
  EXPECT_EQ(rows_for(autoproof::schema::key::kPartMetadataKeyPrefix), 1u);
  EXPECT_EQ(rows_for(autoproof::schema::key::kPartOwnerKeyPrefix), 1u);
  EXPECT_EQ(rows_for(autoproof::schema::key::kPartTokenKeyPrefix), 0u);
  EXPECT_EQ(rows_for(autoproof::schema::key::kPartHistoryCountKeyPrefix), 1u);
  EXPECT_EQ(rows_for(autoproof::schema::key::kPartHistoryPrefix), 2u);
}

TEST(engine, admin_operations_through_transactions) {
  auto fixture = execution_fixture{"autoproof_engine_admin_ops"};
  auto& engine = fixture.engine();

  auto block = engine.finalize_block(
      1, 1000,
      {fixture.tx(kAdmin, autoproof::schema::set_paused_t{.pause = true}),
       fixture.tx(kAdmin, make_register()),
       fixture.tx(kAdmin, autoproof::schema::transfer_part_t{
                              .part_id = 1, .new_owner = std::string{kWalletB}}),
       fixture.tx(kAdmin, autoproof::schema::transfer_admin_t{
                              .new_admin = std::string{kWalletB}}),
       fixture.tx(kAdmin, autoproof::schema::set_paused_t{.pause = false})});
  ASSERT_EQ(block.tx_results.size(), 5u);
  EXPECT_EQ(block.tx_results[0].code, 0u);
  EXPECT_EQ(block.tx_results[1].code, 0u);
  EXPECT_EQ(block.tx_results[2].code,
            static_cast<uint32_t>(
                autoproof::schema::registry_error_code::paused));
  EXPECT_EQ(block.tx_results[3].code, 0u);
  EXPECT_EQ(block.tx_results[4].code,
            static_cast<uint32_t>(
                autoproof::schema::registry_error_code::not_authorized));

  EXPECT_EQ(engine.part_registry().get_admin(), kWalletB);
  EXPECT_TRUE(engine.part_registry().is_paused());

  // The paused transfer left ownership and history alone.
  auto owner = engine.part_registry().get_part_owner(1);
  ASSERT_TRUE(owner.ok());
  EXPECT_EQ(owner.value.value_or(""), kAdmin);
  EXPECT_EQ(engine.part_registry().get_history_count(1), 1u);
}
