#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <autoproof/config/node_config.hpp>
#include <autoproof/execution/engine.hpp>
#include <autoproof/schema/encoding/scale/encoder.hpp>
#include <autoproof/storage/rocksdb/storage.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

void install_logger(const autoproof::config::node_config& config) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      config.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "autoproofd", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(config.log_level);
}

void print_transaction_result(
    const std::size_t index,
    const autoproof::schema::transaction_result_t& result) {
  std::cout << "tx[" << index << "] code=" << result.code;
  if (!result.codespace.empty()) {
    std::cout << " codespace=" << result.codespace;
  }
  std::cout << " log=\"" << result.log << "\" info=\"" << result.info << '"';
  if (!result.data.empty()) {
    std::cout << " data=" << autoproof::schema::to_base64(result.data);
  }
  std::cout << '\n';
  for (const auto& event : result.events) {
    std::cout << "  event " << event.type;
    for (const auto& attribute : event.attributes) {
      std::cout << ' ' << attribute.key << '=' << attribute.value;
    }
    std::cout << '\n';
  }
}

int run_apply(autoproof::execution::engine& engine,
              const po::variables_map& vm) {
  if (!vm.contains("height") || !vm.contains("time")) {
    spdlog::error("apply requires --height and --time");
    return 1;
  }
  auto txs = std::vector<autoproof::schema::bytes_t>{};
  if (vm.contains("tx")) {
    for (const auto& encoded : vm["tx"].as<std::vector<std::string>>()) {
      auto raw = autoproof::schema::try_from_base64(encoded);
      if (!raw) {
        spdlog::error("Transaction '{}' is not valid base64", encoded);
        return 1;
      }
      txs.push_back(std::move(*raw));
    }
  }

  auto block = engine.finalize_block(vm["height"].as<uint64_t>(),
                                     vm["time"].as<uint64_t>(), txs);
  for (std::size_t i = 0; i < block.tx_results.size(); ++i) {
    print_transaction_result(i, block.tx_results[i]);
  }
  auto committed = engine.commit();
  std::cout << "committed height=" << committed.committed_height
            << " state_root=" << autoproof::schema::to_hex(committed.state_root)
            << '\n';
  return 0;
}

int run_query(const autoproof::execution::engine& engine,
              const po::variables_map& vm) {
  if (!vm.contains("path")) {
    spdlog::error("query requires --path");
    return 1;
  }
  auto data = autoproof::schema::try_from_base64(vm["data"].as<std::string>());
  if (!data) {
    spdlog::error("Query data is not valid base64");
    return 1;
  }

  auto result = engine.query(vm["path"].as<std::string>(), *data);
  std::cout << "code=" << result.code << " codespace=" << result.codespace
            << " height=" << result.height;
  if (!result.log.empty()) {
    std::cout << " log=\"" << result.log << '"';
  }
  if (!result.info.empty()) {
    std::cout << " info=\"" << result.info << '"';
  }
  std::cout << '\n';
  if (result.code == 0) {
    std::cout << "value=" << autoproof::schema::to_base64(result.value)
              << '\n';
  }
  return result.code == 0 ? 0 : 2;
}

int run_info(const autoproof::execution::engine& engine) {
  auto info = engine.info();
  std::cout << info.data << ' ' << info.version
            << " app_version=" << info.app_version
            << " height=" << info.last_block_height << " state_root="
            << autoproof::schema::to_hex(info.last_block_state_root)
            << " chain_id=" << autoproof::schema::to_hex(engine.chain_id())
            << '\n';
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto options = autoproof::config::make_node_options();
  auto commands = po::options_description{"autoproofd commands"};
  commands.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>()->default_value("info"),
      "info|apply|query")("height", po::value<uint64_t>(),
                          "block height for apply")(
      "time", po::value<uint64_t>(), "block time in milliseconds for apply")(
      "tx", po::value<std::vector<std::string>>()->multitoken(),
      "base64 transactions for apply")("path", po::value<std::string>(),
                                       "query path")(
      "data", po::value<std::string>()->default_value(""),
      "base64 query key");
  options.add(commands);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  auto parsed =
      autoproof::config::parse_node_config(argc, argv, options, positional, vm);
  if (vm.contains("help")) {
    std::cout << "Usage:\n"
              << "  autoproofd info [options]\n"
              << "  autoproofd apply --height N --time MS --tx B64... "
                 "[options]\n"
              << "  autoproofd query --path PATH [--data B64] [options]\n\n"
              << options << std::endl;
    return 0;
  }
  if (auto* error = std::get_if<std::string>(&parsed)) {
    std::cerr << "autoproofd: " << *error << std::endl;
    return 1;
  }
  const auto& config = std::get<autoproof::config::node_config>(parsed);

  install_logger(config);
  spdlog::info("Opening RocksDB at '{}'", config.db_path);

  auto encoder = autoproof::schema::encoding::encoder<
      autoproof::schema::encoding::scale_encoder_tag>{};
  auto storage = autoproof::storage::make_storage<
      autoproof::storage::rocksdb_storage_tag>(config.db_path);
  auto engine = autoproof::execution::engine{encoder, storage, config.chain_id,
                                             config.genesis_admin};

  auto command = vm["command"].as<std::string>();
  auto status = 0;
  if (command == "info") {
    status = run_info(engine);
  } else if (command == "apply") {
    status = run_apply(engine, vm);
  } else if (command == "query") {
    status = run_query(engine, vm);
  } else {
    spdlog::error("Unknown command '{}'; expected info|apply|query", command);
    status = 1;
  }

  spdlog::shutdown();
  return status;
}
