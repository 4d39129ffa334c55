#include <autoproof/common/critical.hpp>
#include <autoproof/config/node_config.hpp>
#include <autoproof/schema/encoding/scale/encoder.hpp>
#include <autoproof/schema/operation_type.hpp>
#include <autoproof/schema/transaction.hpp>
#include <boost/program_options.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <tuple>

namespace {

using encoder_t = autoproof::schema::encoding::encoder<
    autoproof::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

std::string get_string(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    autoproof::common::critical("missing required argument --" + name);
  }
  return vm[name].as<std::string>();
}

autoproof::schema::part_id_t get_part_id(const po::variables_map& vm) {
  if (!vm.contains("part-id")) {
    autoproof::common::critical("missing required argument --part-id");
  }
  return vm["part-id"].as<uint64_t>();
}

autoproof::schema::hash32_t resolve_chain_id(const po::variables_map& vm) {
  if (vm.contains("chain-id")) {
    auto chain_id =
        autoproof::schema::try_make_hash32(vm["chain-id"].as<std::string>());
    if (!chain_id) {
      autoproof::common::critical("chain-id must be 32 bytes of hex");
    }
    return *chain_id;
  }
  return autoproof::config::make_chain_id(vm["chain-name"].as<std::string>());
}

autoproof::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload_name = get_string(vm, "payload");
  auto type =
      autoproof::schema::try_from_string<autoproof::schema::operation_type_t>(
          payload_name);
  if (!type) {
    autoproof::common::critical("unsupported payload type '" + payload_name +
                                "'");
  }

  switch (*type) {
    case autoproof::schema::operation_type_t::set_paused:
      return autoproof::schema::set_paused_t{.pause = vm["pause"].as<bool>()};
    case autoproof::schema::operation_type_t::transfer_admin:
      return autoproof::schema::transfer_admin_t{
          .new_admin = get_string(vm, "new-admin")};
    case autoproof::schema::operation_type_t::register_part:
      return autoproof::schema::register_part_t{
          .serial_number = get_string(vm, "serial-number"),
          .material_spec = get_string(vm, "material-spec"),
          .origin_factory = get_string(vm, "origin-factory")};
    case autoproof::schema::operation_type_t::transfer_part:
      return autoproof::schema::transfer_part_t{
          .part_id = get_part_id(vm), .new_owner = get_string(vm, "new-owner")};
    case autoproof::schema::operation_type_t::update_part_status:
      return autoproof::schema::update_part_status_t{
          .part_id = get_part_id(vm),
          .new_status = get_string(vm, "new-status")};
    case autoproof::schema::operation_type_t::burn_part:
      return autoproof::schema::burn_part_t{.part_id = get_part_id(vm)};
  }
  autoproof::common::critical("unsupported payload type");
}

autoproof::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = get_string(vm, "path");
  if (path == "/engine/info" || path == "/engine/keyspaces" ||
      path == "/registry/admin" || path == "/registry/paused" ||
      path == "/registry/total_parts") {
    return {};
  }
  if (path == "/part/metadata" || path == "/part/owner" ||
      path == "/part/token" || path == "/part/history_count") {
    return encoder.encode(get_part_id(vm));
  }
  if (path == "/part/history") {
    return encoder.encode(
        std::tuple{get_part_id(vm), vm["index"].as<uint64_t>()});
  }
  autoproof::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  transaction_builder transaction --payload TYPE --caller ID "
               "[options]\n"
            << "  transaction_builder query-key --path PATH [options]\n"
            << "  transaction_builder chain-id [--chain-name NAME]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|chain-id")(
      "payload", po::value<std::string>(),
      "set_paused|transfer_admin|register_part|transfer_part|"
      "update_part_status|burn_part")("path", po::value<std::string>(),
                                      "query path")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "chain-name",
      po::value<std::string>()->default_value(
          std::string{autoproof::config::kDefaultChainName}),
      "chain name hashed into the chain id")(
      "caller", po::value<std::string>(), "pre-authenticated caller identity")(
      "pause", po::value<bool>()->default_value(true), "set_paused flag")(
      "new-admin", po::value<std::string>(), "transfer_admin target")(
      "serial-number", po::value<std::string>(), "part serial number")(
      "material-spec", po::value<std::string>(), "part material spec")(
      "origin-factory", po::value<std::string>(), "part origin factory")(
      "part-id", po::value<uint64_t>(), "part id")(
      "new-owner", po::value<std::string>(), "transfer_part target")(
      "new-status", po::value<std::string>(), "update_part_status value")(
      "index", po::value<uint64_t>()->default_value(1), "history index");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    auto transaction =
        autoproof::schema::transaction_t{.version = 1,
                                         .chain_id = resolve_chain_id(vm),
                                         .caller = get_string(vm, "caller"),
                                         .payload = build_payload(vm)};
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << autoproof::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "query-key") {
    auto key = build_query_key(vm);
    std::cout << autoproof::schema::to_base64(key) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    std::cout << autoproof::schema::to_hex(resolve_chain_id(vm)) << '\n';
    return 0;
  }

  autoproof::common::critical("command must be transaction|query-key|chain-id");
}
