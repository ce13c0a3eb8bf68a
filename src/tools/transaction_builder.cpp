#include <boost/program_options.hpp>
#include <safekeeper/common/critical.hpp>
#include <safekeeper/execution/signing.hpp>
#include <safekeeper/schema/encoding/scale/encoder.hpp>
#include <safekeeper/schema/transaction.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <tuple>

namespace {

using encoder_t = safekeeper::schema::encoding::scale_encoder_t;
namespace po = boost::program_options;

safekeeper::schema::hash32_t get_hash32(const po::variables_map& vm,
                                        const std::string& name) {
  if (!vm.contains(name)) {
    safekeeper::common::critical("missing required account argument");
  }
  auto hash = safekeeper::schema::try_make_hash32(vm[name].as<std::string>());
  if (!hash) {
    safekeeper::common::critical("account arguments must be 32 byte hex");
  }
  return *hash;
}

safekeeper::schema::hash32_t get_chain_id(const po::variables_map& vm) {
  if (vm.contains("chain-id")) {
    return get_hash32(vm, "chain-id");
  }
  return safekeeper::execution::make_chain_id(
      vm["chain-name"].as<std::string>());
}

safekeeper::schema::amount_t get_amount(const po::variables_map& vm,
                                        const std::string& name) {
  auto amount =
      safekeeper::schema::try_make_amount(vm[name].as<std::string>());
  if (!amount) {
    safekeeper::common::critical("amount must be a decimal uint256");
  }
  return *amount;
}

safekeeper::schema::signature_t make_signature(const po::variables_map& vm) {
  auto kind = vm["signature-kind"].as<std::string>();
  auto hex = vm["signature-hex"].as<std::string>();
  auto bytes = safekeeper::schema::bytes_t{};
  if (!hex.empty()) {
    auto decoded = safekeeper::schema::try_from_hex(hex);
    if (!decoded) {
      safekeeper::common::critical("signature-hex is not valid hex");
    }
    bytes = std::move(*decoded);
  }
  if (kind == "ed25519") {
    auto signature = safekeeper::schema::ed25519_signature_t{};
    if (!bytes.empty()) {
      if (bytes.size() != signature.size()) {
        safekeeper::common::critical("ed25519 signature must be 64 bytes");
      }
      std::copy(std::begin(bytes), std::end(bytes), std::begin(signature));
    }
    return safekeeper::schema::signature_t{signature};
  }
  if (kind == "secp256k1") {
    auto signature = safekeeper::schema::secp256k1_signature_t{};
    if (!bytes.empty()) {
      if (bytes.size() != signature.size()) {
        safekeeper::common::critical("secp256k1 signature must be 65 bytes");
      }
      std::copy(std::begin(bytes), std::end(bytes), std::begin(signature));
    }
    return safekeeper::schema::signature_t{signature};
  }
  safekeeper::common::critical("unsupported signature-kind");
}

safekeeper::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "store") {
    return safekeeper::schema::store_treasure_t{
        .beneficiary = get_hash32(vm, "beneficiary"),
        .unlock_time = vm["unlock-time"].as<uint64_t>(),
        .value = get_amount(vm, "value")};
  }
  if (payload == "claim") {
    return safekeeper::schema::claim_treasure_t{
        .treasure_id = vm["treasure-id"].as<uint64_t>()};
  }
  if (payload == "set_fee_basis_points") {
    return safekeeper::schema::set_fee_basis_points_t{
        .fee_basis_points = vm["fee-basis-points"].as<uint32_t>()};
  }
  if (payload == "withdraw_fees") {
    return safekeeper::schema::withdraw_fees_t{
        .recipient = get_hash32(vm, "recipient")};
  }
  if (payload == "transfer_ownership") {
    return safekeeper::schema::transfer_ownership_t{
        .new_owner = get_hash32(vm, "new-owner")};
  }
  if (payload == "renounce_ownership") {
    return safekeeper::schema::renounce_ownership_t{};
  }
  safekeeper::common::critical("unsupported payload type");
}

safekeeper::schema::transaction_t build_transaction(
    const po::variables_map& vm) {
  if (!vm.contains("payload")) {
    safekeeper::common::critical("transaction mode requires --payload");
  }
  return safekeeper::schema::transaction_t{
      .version = 1,
      .chain_id = get_chain_id(vm),
      .nonce = vm["nonce"].as<uint64_t>(),
      .signer = get_hash32(vm, "signer"),
      .payload = build_payload(vm),
      .signature = make_signature(vm)};
}

safekeeper::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/treasury/state") {
    return {};
  }
  if (path == "/treasure/details") {
    return encoder.encode(vm["treasure-id"].as<uint64_t>());
  }
  if (path == "/treasure/by_depositor" || path == "/treasure/by_beneficiary" ||
      path == "/account/balance" || path == "/account/nonce") {
    return encoder.encode(get_hash32(vm, "account"));
  }
  if (path == "/events/range" || path == "/history/range") {
    return encoder.encode(std::tuple{vm["from-height"].as<uint64_t>(),
                                     vm["to-height"].as<uint64_t>()});
  }
  safekeeper::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  safekeeper_transaction_builder transaction [options]\n"
            << "  safekeeper_transaction_builder signing-message [options]\n"
            << "  safekeeper_transaction_builder query-key [options]\n"
            << "  safekeeper_transaction_builder chain-id [options]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options =
      po::options_description{"safekeeper_transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|signing-message|query-key|chain-id")(
      "payload", po::value<std::string>(),
      "store|claim|set_fee_basis_points|withdraw_fees|transfer_ownership|"
      "renounce_ownership")("path", po::value<std::string>(), "query path")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "chain-name",
      po::value<std::string>()->default_value(
          std::string{safekeeper::execution::kDefaultChainName}),
      "chain name hashed into the chain id")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "signer", po::value<std::string>(), "signer account hex")(
      "signature-kind", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("signature-hex",
                           po::value<std::string>()->default_value(""),
                           "signature bytes hex")(
      "beneficiary", po::value<std::string>(), "beneficiary account hex")(
      "unlock-time", po::value<uint64_t>()->default_value(0),
      "unlock time in seconds since epoch")(
      "value", po::value<std::string>()->default_value("0"),
      "deposited value, decimal")(
      "treasure-id", po::value<uint64_t>()->default_value(0), "treasure id")(
      "fee-basis-points", po::value<uint32_t>()->default_value(42),
      "new fee rate")("recipient", po::value<std::string>(),
                      "fee recipient account hex")(
      "new-owner", po::value<std::string>(), "new owner account hex")(
      "account", po::value<std::string>(), "queried account hex")(
      "from-height", po::value<uint64_t>()->default_value(1),
      "range from height")("to-height",
                           po::value<uint64_t>()->default_value(1),
                           "range to height");

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
    auto transaction = build_transaction(vm);
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << safekeeper::schema::to_hex(
                     safekeeper::schema::make_bytes_view(encoded))
              << '\n';
    return 0;
  }

  if (command == "signing-message") {
    auto message =
        safekeeper::execution::make_signing_message(build_transaction(vm));
    std::cout << safekeeper::schema::to_hex(
                     safekeeper::schema::make_bytes_view(message))
              << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      safekeeper::common::critical("query-key mode requires --path");
    }
    auto key = build_query_key(vm);
    std::cout << safekeeper::schema::to_hex(
                     safekeeper::schema::make_bytes_view(key))
              << '\n';
    return 0;
  }

  if (command == "chain-id") {
    std::cout << safekeeper::schema::to_hex(get_chain_id(vm)) << '\n';
    return 0;
  }

  safekeeper::common::critical(
      "command must be transaction|signing-message|query-key|chain-id");
}
