#include <boost/program_options.hpp>
#include <agora/blake3/hash.hpp>
#include <agora/common/critical.hpp>
#include <agora/schema/encoding/scale/encoder.hpp>
#include <agora/schema/transaction.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

using namespace agora::schema;

namespace {

using encoder_t = agora::schema::encoding::encoder<
    agora::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

std::string required(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    agora::common::critical("missing required argument --{}", name);
  }
  return vm[name].as<std::string>();
}

hash32_t get_hash32(const po::variables_map& vm, const std::string& name) {
  auto hash = try_make_hash32(required(vm, name));
  if (!hash) {
    agora::common::critical(
        "--{} must be 64 hex chars or a label of at most 32 chars", name);
  }
  return *hash;
}

std::optional<hash32_t> get_optional_hash32(const po::variables_map& vm,
                                            const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return get_hash32(vm, name);
}

amount_t get_amount(const po::variables_map& vm, const std::string& name) {
  auto amount = try_make_amount(vm[name].as<std::string>());
  if (!amount) {
    agora::common::critical("--{} must be an unsigned integer", name);
  }
  return *amount;
}

bytes_t get_text(const po::variables_map& vm, const std::string& name) {
  return make_bytes(std::string_view{vm[name].as<std::string>()});
}

signature_t make_signature(const po::variables_map& vm) {
  auto kind = vm["signature-kind"].as<std::string>();
  auto hex = vm["signature-hex"].as<std::string>();
  auto bytes = bytes_t{};
  if (!hex.empty()) {
    auto decoded = try_from_hex(hex);
    if (!decoded) {
      agora::common::critical("--signature-hex is not valid hex");
    }
    bytes = *decoded;
  }
  auto fill = [&](auto signature) -> signature_t {
    if (!bytes.empty()) {
      if (bytes.size() != signature.size()) {
        agora::common::critical("signature has the wrong length for {}", kind);
      }
      std::copy(std::begin(bytes), std::end(bytes), std::begin(signature));
    }
    return signature;
  };
  if (kind == "ed25519") {
    return fill(ed25519_signature_t{});
  }
  if (kind == "secp256k1") {
    return fill(secp256k1_signature_t{});
  }
  agora::common::critical("--signature-kind must be ed25519|secp256k1");
}

cross_chain_message_t build_message(const po::variables_map& vm) {
  auto kind = required(vm, "message");
  if (kind == "create_proposal") {
    return create_proposal_message_t{
        .dao_id = get_hash32(vm, "dao-id"),
        .proposal_id = get_hash32(vm, "proposal-id"),
        .description = get_text(vm, "description"),
        .start = vm["start"].as<uint64_t>(),
        .end = vm["end"].as<uint64_t>(),
        .quorum = vm["quorum"].as<uint64_t>()};
  }
  if (kind == "vote") {
    return vote_message_t{.proposal_id = get_hash32(vm, "proposal-id"),
                          .weight = vm["weight"].as<uint64_t>(),
                          .voter = get_hash32(vm, "voter")};
  }
  if (kind == "finalize") {
    return finalize_message_t{.proposal_id = get_hash32(vm, "proposal-id")};
  }
  agora::common::critical("--message must be create_proposal|vote|finalize");
}

transaction_payload_t build_payload(const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "register_dao") {
    return register_dao_t{
        .dao_id = get_hash32(vm, "dao-id"),
        .name = get_text(vm, "dao-name"),
        .description = get_text(vm, "description"),
        .metadata_ref = get_optional_hash32(vm, "metadata-ref"),
        .governance_token = get_hash32(vm, "token"),
        .minimum_tokens = get_amount(vm, "minimum-tokens"),
        .fee = get_amount(vm, "fee")};
  }
  if (payload == "set_minimum_tokens") {
    return set_minimum_tokens_t{
        .dao_id = get_hash32(vm, "dao-id"),
        .minimum_tokens = get_amount(vm, "minimum-tokens")};
  }
  if (payload == "set_creation_fee") {
    return set_creation_fee_t{.fee = get_amount(vm, "fee")};
  }
  if (payload == "set_dispatch_fee") {
    return set_dispatch_fee_t{.fee = get_amount(vm, "fee")};
  }
  if (payload == "create_proposal") {
    return create_proposal_t{.dao_id = get_hash32(vm, "dao-id"),
                             .proposal_id = get_hash32(vm, "proposal-id"),
                             .description = get_text(vm, "description"),
                             .start = vm["start"].as<uint64_t>(),
                             .end = vm["end"].as<uint64_t>(),
                             .quorum = vm["quorum"].as<uint64_t>()};
  }
  if (payload == "cast_vote") {
    return cast_vote_t{.proposal_id = get_hash32(vm, "proposal-id"),
                       .weight = vm["weight"].as<uint64_t>()};
  }
  if (payload == "finalize_proposal") {
    return finalize_proposal_t{.proposal_id = get_hash32(vm, "proposal-id")};
  }
  if (payload == "send_cross_chain") {
    return send_cross_chain_t{
        .destination_chain = get_hash32(vm, "destination-chain"),
        .message = build_message(vm),
        .fee = get_amount(vm, "fee")};
  }
  if (payload == "deliver_cross_chain") {
    auto bytes = try_from_base64(required(vm, "envelope-base64"));
    if (!bytes) {
      agora::common::critical("--envelope-base64 is not valid base64");
    }
    return deliver_cross_chain_t{.payload = *bytes};
  }
  if (payload == "upsert_whitelist") {
    return upsert_whitelist_t{.address = get_hash32(vm, "address"),
                              .whitelisted = vm["enabled"].as<bool>()};
  }
  if (payload == "upsert_token_balance") {
    return upsert_token_balance_t{.token = get_hash32(vm, "token"),
                                  .address = get_hash32(vm, "address"),
                                  .balance = get_amount(vm, "balance")};
  }
  if (payload == "upsert_route") {
    return upsert_route_t{.chain = get_hash32(vm, "remote-chain"),
                          .receiver = get_hash32(vm, "receiver"),
                          .relayer = get_hash32(vm, "relayer"),
                          .enabled = vm["enabled"].as<bool>()};
  }
  if (payload == "withdraw_fees") {
    return withdraw_fees_t{};
  }
  agora::common::critical("unsupported payload type");
}

bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/state/parameters" ||
      path == "/state/fees") {
    return {};
  }
  if (path == "/state/dao") {
    return encoder.encode(get_hash32(vm, "dao-id"));
  }
  if (path == "/state/proposal" || path == "/state/tallies") {
    return encoder.encode(get_hash32(vm, "proposal-id"));
  }
  if (path == "/state/tally") {
    return encoder.encode(
        std::tuple{get_hash32(vm, "proposal-id"), get_hash32(vm, "voter")});
  }
  if (path == "/state/route") {
    return encoder.encode(get_hash32(vm, "remote-chain"));
  }
  if (path == "/state/whitelist") {
    return encoder.encode(get_hash32(vm, "address"));
  }
  if (path == "/state/balance") {
    return encoder.encode(
        std::tuple{get_hash32(vm, "token"), get_hash32(vm, "address")});
  }
  if (path == "/outbox/range" || path == "/history/range" ||
      path == "/events/range") {
    return encoder.encode(
        std::tuple{vm["from"].as<uint64_t>(), vm["to"].as<uint64_t>()});
  }
  agora::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  agora-transaction-builder transaction [options]\n"
            << "  agora-transaction-builder query-key [options]\n"
            << "  agora-transaction-builder chain-id --name <label>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"agora-transaction-builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|chain-id")("payload", po::value<std::string>(),
                                        "transaction payload type")(
      "path", po::value<std::string>(), "query path")(
      "chain-id", po::value<std::string>(), "local chain id")(
      "name", po::value<std::string>()->default_value("agora-local"),
      "label hashed by the chain-id command")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "signer", po::value<std::string>(), "named signer identity")(
      "signature-kind", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("signature-hex",
                           po::value<std::string>()->default_value(""),
                           "signature bytes hex")(
      "dao-id", po::value<std::string>(), "DAO id")(
      "proposal-id", po::value<std::string>(), "proposal id")(
      "dao-name", po::value<std::string>()->default_value(""), "DAO name")(
      "description", po::value<std::string>()->default_value(""),
      "DAO or proposal description")(
      "metadata-ref", po::value<std::string>(), "DAO metadata reference")(
      "token", po::value<std::string>(), "governance token id")(
      "minimum-tokens", po::value<std::string>()->default_value("0"),
      "minimum token balance to vote")(
      "fee", po::value<std::string>()->default_value("0"), "attached fee")(
      "start", po::value<uint64_t>()->default_value(0), "voting start")(
      "end", po::value<uint64_t>()->default_value(0), "voting end")(
      "quorum", po::value<uint64_t>()->default_value(0), "quorum weight")(
      "weight", po::value<uint64_t>()->default_value(0), "vote weight")(
      "voter", po::value<std::string>(), "voter address")(
      "message", po::value<std::string>(),
      "create_proposal|vote|finalize for send_cross_chain")(
      "destination-chain", po::value<std::string>(), "destination chain id")(
      "envelope-base64", po::value<std::string>(),
      "outbox payload for deliver_cross_chain")(
      "address", po::value<std::string>(), "member address")(
      "balance", po::value<std::string>()->default_value("0"),
      "token balance")("remote-chain", po::value<std::string>(),
                       "route chain id")(
      "receiver", po::value<std::string>(), "route receiver address")(
      "relayer", po::value<std::string>(), "route relayer identity")(
      "enabled", po::value<bool>()->default_value(true),
      "route enabled / address whitelisted")(
      "from", po::value<uint64_t>()->default_value(1), "range start")(
      "to", po::value<uint64_t>()->default_value(1), "range end");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n';
    print_help(options);
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    if (!vm.contains("payload")) {
      agora::common::critical("transaction mode requires --payload");
    }
    auto transaction =
        transaction_t{.version = 1,
                      .chain_id = get_hash32(vm, "chain-id"),
                      .nonce = vm["nonce"].as<uint64_t>(),
                      .signer = signer_id_t{get_hash32(vm, "signer")},
                      .payload = build_payload(vm),
                      .signature = make_signature(vm)};
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << to_base64(bytes_view_t{encoded}) << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      agora::common::critical("query-key mode requires --path");
    }
    auto key = build_query_key(vm);
    std::cout << to_base64(bytes_view_t{key}) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    auto chain_id = agora::blake3::hash(
        std::string_view{vm["name"].as<std::string>()});
    std::cout << to_hex(bytes_view_t{chain_id}) << '\n';
    return 0;
  }

  agora::common::critical("command must be transaction|query-key|chain-id");
}
