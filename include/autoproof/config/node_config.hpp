#pragma once

#include <spdlog/common.h>
#include <autoproof/schema/primitives.hpp>
#include <boost/program_options.hpp>
#include <optional>
#include <string>
#include <variant>

namespace autoproof::config {

inline constexpr auto kDefaultChainName =
    std::string_view{"autoproof-poc-chain"};
inline constexpr auto kDefaultDbPath = std::string_view{"autoproof-data"};
inline constexpr auto kDefaultLogFile = std::string_view{"autoproofd.log"};

/// Resolved node settings.
struct node_config final {
  std::string db_path{kDefaultDbPath};
  autoproof::schema::hash32_t chain_id{};
  autoproof::schema::principal_t genesis_admin;
  spdlog::level::level_enum log_level{spdlog::level::info};
  std::string log_file{kDefaultLogFile};
  std::optional<std::string> config_file;
};

/// Options shared by the command line and the INI config file.
boost::program_options::options_description make_node_options();

/// Chain id for a human-readable chain name: BLAKE3 of its bytes.
autoproof::schema::hash32_t make_chain_id(std::string_view chain_name);

/// Resolve node settings from an already parsed variables map.
///
/// Returns an error message for invalid or missing settings instead of
/// terminating.
std::variant<node_config, std::string> resolve_node_config(
    const boost::program_options::variables_map& vm);

/// Parse the command line into vm, then merge `--config` underneath it.
/// Command line values take precedence over the config file.  `options`
/// must include make_node_options(); callers add their own on top.
std::variant<node_config, std::string> parse_node_config(
    int argc,
    const char* const argv[],
    const boost::program_options::options_description& options,
    const boost::program_options::positional_options_description& positional,
    boost::program_options::variables_map& vm);

/// Node options only.
std::variant<node_config, std::string> parse_node_config(
    int argc,
    const char* const argv[]);

}  // namespace autoproof::config
