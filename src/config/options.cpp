#include <boost/program_options.hpp>
#include <warden/config/options.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace po = boost::program_options;

namespace warden::config {

warden::schema::wallet_genesis_t make_genesis(const genesis_options& options) {
  auto genesis = warden::schema::wallet_genesis_t{};
  auto chain_id = warden::schema::try_make_hash32(options.chain_id);
  if (!chain_id) {
    throw std::invalid_argument{"chain-id must be 32 bytes of hex"};
  }
  auto wallet_address = warden::schema::try_make_hash32(options.wallet_address);
  if (!wallet_address) {
    throw std::invalid_argument{"wallet-address must be 32 bytes of hex"};
  }
  genesis.domain.protocol_name = options.domain_name;
  genesis.domain.protocol_version = options.domain_version;
  genesis.domain.chain_id = *chain_id;
  genesis.domain.wallet_address = *wallet_address;
  genesis.max_signers = options.max_signers;
  for (const auto& value : options.signers) {
    auto signer = warden::schema::try_make_signer_id(value);
    if (!signer) {
      throw std::invalid_argument{"malformed signer: " + value};
    }
    genesis.signers.push_back(*signer);
  }
  return genesis;
}

parse_result parse_options(const int argc, const char* const argv[]) {
  auto result = parse_result{};
  auto& options = result.options;
  auto log_level = std::string{"info"};
  auto query_data = std::string{};
  auto genesis = genesis_options{};

  auto generic = po::options_description{"Generic"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(),
      "INI-style config file");

  auto settings = po::options_description{"Wallet"};
  settings.add_options()(
      "db-path",
      po::value<std::string>(&options.db_path)->default_value(options.db_path),
      "RocksDB directory")(
      "log-file",
      po::value<std::string>(&options.log_file)->default_value(options.log_file),
      "Log file path")(
      "log-level", po::value<std::string>(&log_level)->default_value(log_level),
      "trace, debug, info, warn, error, critical or off")(
      "strict-crypto",
      po::value<bool>(&options.engine.require_strict_crypto)
          ->default_value(options.engine.require_strict_crypto),
      "Verify transaction envelope signatures")(
      "max-call-depth",
      po::value<uint32_t>(&options.engine.max_call_depth)
          ->default_value(options.engine.max_call_depth),
      "Bound on nested proposal execution")(
      "chain-id", po::value<std::string>(&genesis.chain_id),
      "Genesis chain id (64 hex characters)")(
      "wallet-address", po::value<std::string>(&genesis.wallet_address),
      "Genesis wallet address (64 hex characters)")(
      "domain-name",
      po::value<std::string>(&genesis.domain_name)
          ->default_value(genesis.domain_name),
      "Signing domain protocol name")(
      "domain-version",
      po::value<std::string>(&genesis.domain_version)
          ->default_value(genesis.domain_version),
      "Signing domain protocol version")(
      "max-signers",
      po::value<uint32_t>(&genesis.max_signers)
          ->default_value(genesis.max_signers),
      "Signer set size bound, fixed at genesis")(
      "signer",
      po::value<std::vector<std::string>>(&genesis.signers)->composing(),
      "Genesis signer as <scheme>:<hex>, repeatable")(
      "block-file", po::value<std::string>(&options.block_file),
      "SCALE list of encoded transactions applied as the next block")(
      "block-time", po::value<uint64_t>(&options.block_time_ms),
      "Block time in unix milliseconds")(
      "query", po::value<std::string>(&options.query),
      "Query route to answer after the block")(
      "query-data", po::value<std::string>(&query_data),
      "Hex SCALE key for the query");

  auto command_line = po::options_description{"wardend"};
  command_line.add(generic).add(settings);

  auto vm = po::variables_map{};
  po::store(po::parse_command_line(argc, argv, command_line), vm);
  if (vm.contains("config")) {
    auto stream = std::ifstream{vm["config"].as<std::string>()};
    if (!stream) {
      throw std::invalid_argument{"cannot open config file: " +
                                  vm["config"].as<std::string>()};
    }
    po::store(po::parse_config_file(stream, settings), vm);
  }
  po::notify(vm);

  if (vm.contains("help")) {
    auto text = std::ostringstream{};
    text << command_line;
    result.help_requested = true;
    result.help_text = text.str();
    return result;
  }

  options.log_level = spdlog::level::from_str(log_level);
  if (options.log_level == spdlog::level::off && log_level != "off") {
    throw std::invalid_argument{"unknown log-level: " + log_level};
  }
  if (options.engine.max_call_depth == 0) {
    throw std::invalid_argument{"max-call-depth must be at least 1"};
  }
  if (!query_data.empty()) {
    auto decoded = warden::schema::try_from_hex(query_data);
    if (!decoded) {
      throw std::invalid_argument{"query-data must be hex"};
    }
    options.query_data = std::move(*decoded);
  }
  if (vm.contains("chain-id") || vm.contains("wallet-address") ||
      !genesis.signers.empty()) {
    options.genesis = make_genesis(genesis);
  }
  return result;
}

}  // namespace warden::config
