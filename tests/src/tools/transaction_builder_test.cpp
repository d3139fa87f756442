#include <gtest/gtest.h>
#include <agora/schema/encoding/scale/encoder.hpp>
#include <agora/schema/primitives.hpp>
#include <agora/schema/transaction.hpp>
#include <agora/testing/common.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include <sys/wait.h>

#ifndef AGORA_TRANSACTION_BUILDER_PATH
#define AGORA_TRANSACTION_BUILDER_PATH ""
#endif

namespace {

using encoder_t = agora::schema::encoding::encoder<
    agora::schema::encoding::scale_encoder_tag>;
using agora::testing::make_label;

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_command(const std::string& builder,
                        const std::string_view command,
                        const std::string_view args) {
  auto line = shell_quote(builder) + " " + std::string{command} + " " +
              std::string{args} + " 2>/dev/null";
  auto [exit_code, output] = run_capture(line);
  EXPECT_EQ(exit_code, 0) << "command failed: " << line << '\n' << output;
  return trim_ascii_whitespace(output);
}

std::string builder_path() {
  return std::string{AGORA_TRANSACTION_BUILDER_PATH};
}

}  // namespace

TEST(transaction_builder, query_keys_match_engine_query_formats) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction builder binary not available: " << builder;
  }
  auto encoder = encoder_t{};

  auto dao_key = encoder.encode(make_label("dao-1"));
  EXPECT_EQ(run_command(builder, "query-key", "--path /state/dao --dao-id dao-1"),
            agora::schema::to_base64(agora::schema::bytes_view_t{dao_key}));

  auto tally_key =
      encoder.encode(std::tuple{make_label("proposal-1"), make_label("alice")});
  EXPECT_EQ(run_command(builder, "query-key",
                        "--path /state/tally --proposal-id proposal-1 "
                        "--voter alice"),
            agora::schema::to_base64(agora::schema::bytes_view_t{tally_key}));

  auto range_key = encoder.encode(std::tuple{uint64_t{3}, uint64_t{9}});
  EXPECT_EQ(
      run_command(builder, "query-key", "--path /outbox/range --from 3 --to 9"),
      agora::schema::to_base64(agora::schema::bytes_view_t{range_key}));

  EXPECT_TRUE(
      run_command(builder, "query-key", "--path /state/parameters").empty());
}

TEST(transaction_builder, builds_decodable_transactions) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction builder binary not available: " << builder;
  }
  auto encoder = encoder_t{};

  auto output = run_command(
      builder, "transaction",
      "--payload send_cross_chain --chain-id chain-a --signer bob --nonce 4 "
      "--destination-chain chain-b --message vote --proposal-id proposal-1 "
      "--voter bob --weight 30 --fee 7");
  auto bytes = agora::schema::try_from_base64(output);
  ASSERT_TRUE(bytes.has_value());
  auto tx = encoder.try_decode<agora::schema::transaction_t>(
      agora::schema::bytes_view_t{*bytes});
  ASSERT_TRUE(tx.has_value());
  EXPECT_EQ(tx->chain_id, make_label("chain-a"));
  EXPECT_EQ(tx->nonce, 4u);
  EXPECT_EQ(std::get<agora::schema::named_signer_t>(tx->signer),
            make_label("bob"));

  const auto& send = std::get<agora::schema::send_cross_chain_t>(tx->payload);
  EXPECT_EQ(send.destination_chain, make_label("chain-b"));
  EXPECT_EQ(send.fee, agora::schema::amount_t{7});
  const auto& vote = std::get<agora::schema::vote_message_t>(send.message);
  EXPECT_EQ(vote.weight, 30u);
  EXPECT_EQ(vote.voter, make_label("bob"));
}

TEST(transaction_builder, rejects_unknown_payload) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction builder binary not available: " << builder;
  }
  auto [exit_code, output] = run_capture(
      shell_quote(builder) +
      " transaction --payload mint --chain-id chain-a --signer bob 2>/dev/null");
  EXPECT_NE(exit_code, 0);
}
