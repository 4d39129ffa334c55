#include <gtest/gtest.h>
#include <autoproof/config/node_config.hpp>
#include <autoproof/schema/encoding/scale/encoder.hpp>
#include <autoproof/schema/primitives.hpp>
#include <autoproof/schema/transaction.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include <sys/wait.h>

#ifndef AUTOPROOF_TRANSACTION_BUILDER_PATH
#define AUTOPROOF_TRANSACTION_BUILDER_PATH ""
#endif

namespace {

using encoder_t = autoproof::schema::encoding::encoder<
    autoproof::schema::encoding::scale_encoder_tag>;

constexpr auto kChainId =
    "1111111111111111111111111111111111111111111111111111111111111111";

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_builder(const std::string& builder,
                        const std::string_view command,
                        const std::string_view args) {
  auto line = shell_quote(builder) + " " + std::string{command} + " " +
              std::string{args};
  auto [exit_code, output] = run_capture(line);
  EXPECT_EQ(exit_code, 0) << "command failed: " << line << '\n' << output;
  return trim_ascii_whitespace(output);
}

autoproof::schema::transaction_t decode_transaction(const std::string& b64) {
  auto bytes = autoproof::schema::from_base64(b64);
  return encoder_t{}.decode<autoproof::schema::transaction_t>(
      autoproof::schema::bytes_view_t{bytes.data(), bytes.size()});
}

}  // namespace

TEST(transaction_builder, query_keys_match_engine_routes) {
  auto builder = std::string{AUTOPROOF_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto encoder = encoder_t{};

  EXPECT_EQ(run_builder(builder, "query-key",
                        "--path /part/metadata --part-id 7"),
            autoproof::schema::to_base64(encoder.encode(uint64_t{7})));
  EXPECT_EQ(run_builder(builder, "query-key",
                        "--path /part/history --part-id 7 --index 3"),
            autoproof::schema::to_base64(
                encoder.encode(std::tuple{uint64_t{7}, uint64_t{3}})));
  EXPECT_TRUE(
      run_builder(builder, "query-key", "--path /registry/admin").empty());
}

TEST(transaction_builder, builds_registry_transactions) {
  auto builder = std::string{AUTOPROOF_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto register_tx = decode_transaction(run_builder(
      builder, "transaction",
      "--payload register_part --chain-id " + std::string{kChainId} +
          " --caller ST-ADMIN --serial-number SN123456 "
          "--material-spec Aluminum-Alloy --origin-factory FactoryA"));
  EXPECT_EQ(register_tx.caller, "ST-ADMIN");
  EXPECT_EQ(register_tx.chain_id,
            autoproof::schema::make_hash32(std::string_view{kChainId}));
  auto* registered =
      std::get_if<autoproof::schema::register_part_t>(&register_tx.payload);
  ASSERT_NE(registered, nullptr);
  EXPECT_EQ(registered->serial_number, "SN123456");
  EXPECT_EQ(registered->origin_factory, "FactoryA");

  auto status_tx = decode_transaction(run_builder(
      builder, "transaction",
      "--payload update_part_status --caller ST-ADMIN --part-id 1 "
      "--new-status installed"));
  EXPECT_EQ(status_tx.chain_id, autoproof::config::make_chain_id(
                                    autoproof::config::kDefaultChainName));
  auto* status =
      std::get_if<autoproof::schema::update_part_status_t>(&status_tx.payload);
  ASSERT_NE(status, nullptr);
  EXPECT_EQ(status->part_id, 1u);
  EXPECT_EQ(status->new_status, "installed");

  auto pause_tx = decode_transaction(run_builder(
      builder, "transaction",
      "--payload set_paused --caller ST-ADMIN --pause false"));
  auto* pause = std::get_if<autoproof::schema::set_paused_t>(&pause_tx.payload);
  ASSERT_NE(pause, nullptr);
  EXPECT_FALSE(pause->pause);
}

TEST(transaction_builder, chain_id_hashes_chain_name) {
  auto builder = std::string{AUTOPROOF_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  EXPECT_EQ(run_builder(builder, "chain-id", "--chain-name garage-net"),
            autoproof::schema::to_hex(
                autoproof::config::make_chain_id("garage-net")));
}
