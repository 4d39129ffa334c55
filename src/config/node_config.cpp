#include <spdlog/spdlog.h>
#include <autoproof/blake3/hash.hpp>
#include <autoproof/config/node_config.hpp>
#include <fstream>

namespace po = boost::program_options;

namespace autoproof::config {

po::options_description make_node_options() {
  auto options = po::options_description{"autoproofd node options"};
  options.add_options()("config,c", po::value<std::string>(),
                        "INI config file; command line values win")(
      "db-path,d",
      po::value<std::string>()->default_value(std::string{kDefaultDbPath}),
      "RocksDB directory")(
      "chain-name",
      po::value<std::string>()->default_value(std::string{kDefaultChainName}),
      "chain name hashed into the chain id")(
      "chain-id", po::value<std::string>(),
      "32-byte chain id hex; overrides --chain-name")(
      "genesis-admin", po::value<std::string>(),
      "registry admin written at genesis")(
      "log-level", po::value<std::string>()->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file",
      po::value<std::string>()->default_value(std::string{kDefaultLogFile}),
      "log file path");
  return options;
}

autoproof::schema::hash32_t make_chain_id(const std::string_view chain_name) {
  return autoproof::blake3::hash(chain_name);
}

std::variant<node_config, std::string> resolve_node_config(
    const po::variables_map& vm) {
  auto config = node_config{};
  if (vm.contains("config")) {
    config.config_file = vm["config"].as<std::string>();
  }
  if (vm.contains("db-path")) {
    config.db_path = vm["db-path"].as<std::string>();
  }
  if (config.db_path.empty()) {
    return std::string{"db-path must not be empty"};
  }

  if (vm.contains("chain-id")) {
    auto chain_id =
        autoproof::schema::try_make_hash32(vm["chain-id"].as<std::string>());
    if (!chain_id) {
      return std::string{"chain-id must be 32 bytes of hex"};
    }
    config.chain_id = *chain_id;
  } else {
    auto chain_name = vm.contains("chain-name")
                          ? vm["chain-name"].as<std::string>()
                          : std::string{kDefaultChainName};
    if (chain_name.empty()) {
      return std::string{"chain-name must not be empty"};
    }
    config.chain_id = make_chain_id(chain_name);
  }

  if (!vm.contains("genesis-admin")) {
    return std::string{"genesis-admin is required"};
  }
  config.genesis_admin = vm["genesis-admin"].as<std::string>();
  if (autoproof::schema::is_burn_principal(config.genesis_admin)) {
    return std::string{"genesis-admin must not be empty or the burn address"};
  }

  if (vm.contains("log-level")) {
    const auto& level_name = vm["log-level"].as<std::string>();
    config.log_level = spdlog::level::from_str(level_name);
    // from_str maps unknown names to off.
    if (config.log_level == spdlog::level::off && level_name != "off") {
      return "unknown log-level '" + level_name + "'";
    }
  }
  if (vm.contains("log-file")) {
    config.log_file = vm["log-file"].as<std::string>();
  }
  return config;
}

std::variant<node_config, std::string> parse_node_config(
    int argc,
    const char* const argv[],
    const po::options_description& options,
    const po::positional_options_description& positional,
    po::variables_map& vm) {
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      const auto path = vm["config"].as<std::string>();
      auto stream = std::ifstream{path};
      if (!stream) {
        return "unable to open config file '" + path + "'";
      }
      po::store(po::parse_config_file(stream, options), vm);
      spdlog::debug("Loaded config file '{}'", path);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    return std::string{ex.what()};
  }
  return resolve_node_config(vm);
}

std::variant<node_config, std::string> parse_node_config(
    int argc,
    const char* const argv[]) {
  auto vm = po::variables_map{};
  return parse_node_config(argc, argv, make_node_options(),
                           po::positional_options_description{}, vm);
}

}  // namespace autoproof::config
