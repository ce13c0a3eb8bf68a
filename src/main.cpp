#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <safekeeper/execution/engine.hpp>
#include <safekeeper/schema/encoding/scale/encoder.hpp>
#include <safekeeper/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct block_input final {
  uint64_t height{};
  safekeeper::schema::timestamp_seconds_t block_time{};
  std::vector<safekeeper::schema::bytes_t> txs;
};

// Each non-empty, non-comment line is "height block_time hex_tx". Consecutive
// lines with the same height form one block.
std::optional<std::vector<block_input>> read_blocks(const std::string& path) {
  auto file = std::ifstream{path};
  if (!file) {
    spdlog::error("Cannot open transaction file {}", path);
    return std::nullopt;
  }

  auto blocks = std::vector<block_input>{};
  auto line = std::string{};
  auto line_number = size_t{0};
  while (std::getline(file, line)) {
    ++line_number;
    if (line.empty() || line.front() == '#') {
      continue;
    }
    auto stream = std::istringstream{line};
    auto height = uint64_t{};
    auto block_time = safekeeper::schema::timestamp_seconds_t{};
    auto hex = std::string{};
    if (!(stream >> height >> block_time >> hex)) {
      spdlog::error("{}:{}: expected 'height block_time hex_tx'", path,
                    line_number);
      return std::nullopt;
    }
    auto tx = safekeeper::schema::try_from_hex(hex);
    if (!tx) {
      spdlog::error("{}:{}: transaction is not valid hex", path, line_number);
      return std::nullopt;
    }
    if (blocks.empty() || blocks.back().height != height) {
      if (!blocks.empty() && height < blocks.back().height) {
        spdlog::error("{}:{}: block heights must not decrease", path,
                      line_number);
        return std::nullopt;
      }
      blocks.push_back(block_input{.height = height, .block_time = block_time});
    }
    blocks.back().txs.push_back(std::move(*tx));
  }
  return blocks;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto owner_hex = std::string{};
  auto fee_basis_points = safekeeper::schema::basis_points_t{};
  auto fee_policy_name = std::string{};
  auto chain_name = std::string{};
  auto tx_file = std::string{};
  auto log_file = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description =
      boost::program_options::options_description{"SafeKeeper"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "safekeeper-db"),
      "RocksDB directory")(
      "owner,o", boost::program_options::value<std::string>(&owner_hex),
      "Fee administrator account id (32 byte hex)")(
      "fee-basis-points,f",
      boost::program_options::value<safekeeper::schema::basis_points_t>(
          &fee_basis_points)
          ->default_value(42),
      "Initial fee rate in basis points")(
      "fee-policy",
      boost::program_options::value<std::string>(&fee_policy_name)
          ->default_value("store_and_claim"),
      "store_and_claim|store_only")(
      "chain-name",
      boost::program_options::value<std::string>(&chain_name)->default_value(
          std::string{safekeeper::execution::kDefaultChainName}),
      "Chain name hashed into the chain id")(
      "strict-crypto", "Verify Ed25519 transaction signatures")(
      "tx-file,t", boost::program_options::value<std::string>(&tx_file),
      "Blocks to execute, one 'height block_time hex_tx' per line")(
      "log-file,l",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "safekeeper.log"),
      "Log file path")("verbose,v", "Enable verbose output");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "safekeeper", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto config = safekeeper::ledger::treasury_config{};
  config.fee_basis_points = fee_basis_points;
  if (!owner_hex.empty()) {
    auto owner = safekeeper::schema::try_make_hash32(owner_hex);
    if (!owner) {
      spdlog::error("--owner must be a 32 byte hex account id");
      spdlog::shutdown();
      return 1;
    }
    config.owner = *owner;
  }
  auto fee_policy =
      safekeeper::schema::try_from_string<safekeeper::schema::fee_policy_t>(
          fee_policy_name);
  if (!fee_policy) {
    spdlog::error("Unknown fee policy '{}'", fee_policy_name);
    spdlog::shutdown();
    return 1;
  }
  config.fee_policy = *fee_policy;

  auto blocks = std::vector<block_input>{};
  if (!tx_file.empty()) {
    auto parsed = read_blocks(tx_file);
    if (!parsed) {
      spdlog::shutdown();
      return 1;
    }
    blocks = std::move(*parsed);
  }

  auto encoder = safekeeper::schema::encoding::scale_encoder_t{};
  auto storage = safekeeper::storage::make_storage<
      safekeeper::storage::rocksdb_storage_tag>(db_path);
  auto engine = safekeeper::execution::engine{
      encoder, storage, config, vm.contains("strict-crypto"), chain_name};
  spdlog::info("Chain id {}", safekeeper::schema::to_hex(engine.chain_id()));

  for (const auto& block : blocks) {
    const auto committed_height = engine.info().last_block_height;
    if (static_cast<int64_t>(block.height) <= committed_height) {
      spdlog::info("Block {} already committed (height {}); skipping",
                   block.height, committed_height);
      continue;
    }
    auto result =
        engine.finalize_block(block.height, block.block_time, block.txs);
    for (size_t i = 0; i < result.tx_results.size(); ++i) {
      const auto& tx_result = result.tx_results[i];
      if (tx_result.code == 0) {
        spdlog::info("  tx {}: {}", i, tx_result.info);
      } else {
        spdlog::warn("  tx {}: {} [{}] {}", i, tx_result.log,
                     tx_result.codespace, tx_result.info);
      }
    }
    auto committed = engine.commit();
    spdlog::info("Committed height {} state root {}",
                 committed.committed_height,
                 safekeeper::schema::to_hex(committed.state_root));
  }

  auto info = engine.info();
  spdlog::info("{} {} at height {}", info.data, info.version,
               info.last_block_height);
  spdlog::shutdown();
  return 0;
}
