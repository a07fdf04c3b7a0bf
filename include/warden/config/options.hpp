#pragma once
#include <spdlog/common.h>
#include <warden/execution/engine.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/wallet_config.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace warden::config {

/// Settings for one `wardend` run, merged from the command line and an
/// optional INI-style config file. Command line values win.
struct node_options final {
  std::string db_path{"warden.db"};
  std::string log_file{"wardend.log"};
  spdlog::level::level_enum log_level{spdlog::level::info};
  warden::execution::engine_options engine{};

  /// Genesis used when the database holds no wallet yet.
  std::optional<warden::schema::wallet_genesis_t> genesis;

  /// SCALE-encoded list of encoded transactions, applied as one block at the
  /// height after the last committed one.
  std::string block_file;
  warden::schema::timestamp_milliseconds_t block_time_ms{};

  /// Read-path route run last, with its SCALE key.
  std::string query;
  warden::schema::bytes_t query_data;
};

struct parse_result final {
  node_options options;
  bool help_requested{false};
  std::string help_text;
};

/// Parse `argc`/`argv`. Throws std::invalid_argument on malformed values and
/// boost::program_options::error on unknown or badly typed options.
parse_result parse_options(int argc, const char* const argv[]);

/// Genesis fields as they appear in configuration.
struct genesis_options final {
  std::string chain_id;
  std::string wallet_address;
  std::string domain_name{"warden"};
  std::string domain_version{"1"};
  uint32_t max_signers{warden::schema::kDefaultMaxSigners};
  /// `<scheme>:<hex>` each.
  std::vector<std::string> signers;
};

warden::schema::wallet_genesis_t make_genesis(const genesis_options& options);

}  // namespace warden::config
