#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <warden/config/options.hpp>
#include <warden/execution/engine.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/storage/rocksdb/storage.hpp>
#include <fstream>
#include <iterator>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using encoder_t = warden::schema::encoding::encoder<
    warden::schema::encoding::scale_encoder_tag>;

void configure_logging(const warden::config::node_options& options) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "wardend", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(options.log_level);
}

std::vector<warden::schema::bytes_t> read_block_file(encoder_t& encoder,
                                                     const std::string& path) {
  auto stream = std::ifstream{path, std::ios::binary};
  if (!stream) {
    throw std::invalid_argument{"cannot open block file: " + path};
  }
  auto raw = warden::schema::bytes_t{std::istreambuf_iterator<char>{stream},
                                     std::istreambuf_iterator<char>{}};
  auto txs = encoder.try_decode<std::vector<warden::schema::bytes_t>>(
      warden::schema::bytes_view_t{raw});
  if (!txs) {
    throw std::invalid_argument{"block file is not a SCALE transaction list"};
  }
  return *txs;
}

int run(const warden::config::node_options& options) {
  auto encoder = encoder_t{};
  auto storage =
      warden::storage::make_storage<warden::storage::rocksdb_storage_tag>(
          options.db_path);
  auto engine = warden::execution::engine{encoder, storage, options.engine};

  if (!engine.info().wallet_initialized) {
    if (!options.genesis) {
      spdlog::error("Wallet is not initialized and no genesis was given");
      return 1;
    }
    auto genesis = engine.init_wallet(*options.genesis);
    if (genesis.code != 0) {
      return 1;
    }
    engine.commit();
  } else if (options.genesis) {
    spdlog::warn("Wallet already initialized; ignoring genesis options");
  }

  if (!options.block_file.empty()) {
    auto txs = read_block_file(encoder, options.block_file);
    auto height =
        static_cast<uint64_t>(engine.info().last_block_height) + 1;
    auto block = engine.finalize_block(height, options.block_time_ms, txs);
    for (size_t i = 0; i < block.tx_results.size(); ++i) {
      const auto& result = block.tx_results[i];
      if (result.code == 0) {
        spdlog::info("tx {} ok ({} event(s))", i, result.events.size());
      } else {
        spdlog::warn("tx {} failed [{}:{}] {}", i, result.codespace,
                     result.code, result.log);
      }
    }
    auto committed = engine.commit();
    spdlog::info("Committed height {} state root {}",
                 committed.committed_height,
                 warden::schema::to_hex(committed.state_root));
  }

  if (!options.query.empty()) {
    auto result = engine.query(
        options.query, warden::schema::bytes_view_t{options.query_data});
    if (result.code != 0) {
      spdlog::error("{} failed [{}:{}] {}", options.query, result.codespace,
                    result.code, result.log);
      return 1;
    }
    std::cout << warden::schema::to_hex(result.value) << std::endl;
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto parsed = warden::config::parse_result{};
  try {
    parsed = warden::config::parse_options(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "wardend: " << e.what() << std::endl;
    return 2;
  }
  if (parsed.help_requested) {
    std::cout << parsed.help_text << std::endl;
    return 0;
  }

  configure_logging(parsed.options);
  auto status = 0;
  try {
    status = run(parsed.options);
  } catch (const std::exception& e) {
    spdlog::critical("wardend stopped: {}", e.what());
    status = 1;
  }
  spdlog::shutdown();
  return status;
}
