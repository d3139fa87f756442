#include <gtest/gtest.h>
#include <agora/testing/governance_fixture.hpp>

#include <limits>

using agora::schema::local_source_t;
using agora::schema::remote_source_t;
using agora::schema::transaction_error_code;
using agora::testing::make_hash;

namespace {

const auto kDao = make_hash(1);
const auto kProposal = make_hash(2);
const auto kController = make_hash(5);
const auto kToken = make_hash(90);

/// DAO with minimum balance 10 and a proposal active on [100, 200].
struct voting_fixture final {
  explicit voting_fixture(const std::string_view prefix) : governance{prefix} {
    governance.register_dao(kDao, kController, kToken, 10);
    governance.create_proposal(kDao, kProposal, kController, 100, 200, 50);
    governance.events.clear();
  }

  void admit(const agora::schema::address_t& voter,
             agora::schema::amount_t balance = 10) {
    governance.oracle.whitelist(voter);
    governance.oracle.set_balance(kToken, voter, std::move(balance));
  }

  agora::governance::status_t vote(const agora::schema::address_t& voter,
                                   const agora::schema::weight_t weight,
                                   const agora::schema::timestamp_t now = 150,
                                   const agora::schema::vote_source_t& source =
                                       local_source_t{}) {
    return governance.votes.apply_vote(governance.context(voter, now),
                                       kProposal, voter, weight, source);
  }

  agora::testing::governance_fixture governance;
};

}  // namespace

TEST(vote_aggregator, accumulates_weight_per_voter_and_in_total) {
  auto fixture = voting_fixture{"agora_vote_accumulate"};
  fixture.admit(make_hash(10));
  fixture.admit(make_hash(11));

  ASSERT_FALSE(fixture.vote(make_hash(10), 30).has_value());
  ASSERT_FALSE(fixture.vote(make_hash(11), 20).has_value());
  ASSERT_FALSE(fixture.vote(make_hash(10), 5).has_value());

  auto proposal = fixture.governance.proposals.get(kProposal);
  ASSERT_TRUE(proposal.has_value());
  EXPECT_EQ(proposal->total_weight, 55u);
  EXPECT_EQ(proposal->voter_count, 2u);
  EXPECT_EQ(fixture.governance.proposals.tally(kProposal, make_hash(10)), 35u);
  EXPECT_EQ(fixture.governance.proposals.tally(kProposal, make_hash(11)), 20u);

  auto tallies = fixture.governance.proposals.tallies(kProposal);
  ASSERT_EQ(tallies.size(), 2u);
  auto sum = uint64_t{};
  for (const auto& tally : tallies) {
    sum += tally.weight;
  }
  EXPECT_EQ(sum, proposal->total_weight);
  EXPECT_EQ(fixture.governance.events.size(), 3u);
  EXPECT_EQ(fixture.governance.events.back().type, "vote_accepted");
}

TEST(vote_aggregator, zero_weight_vote_is_accepted_without_counting_voter) {
  auto fixture = voting_fixture{"agora_vote_zero"};
  fixture.admit(make_hash(10));
  ASSERT_FALSE(fixture.vote(make_hash(10), 0).has_value());
  auto proposal = fixture.governance.proposals.get(kProposal);
  EXPECT_EQ(proposal->total_weight, 0u);
  EXPECT_EQ(proposal->voter_count, 0u);
}

TEST(vote_aggregator, rejects_voter_outside_whitelist) {
  auto fixture = voting_fixture{"agora_vote_not_whitelisted"};
  fixture.governance.oracle.set_balance(kToken, make_hash(10), 1000);
  EXPECT_EQ(fixture.vote(make_hash(10), 1), transaction_error_code::not_eligible);
}

TEST(vote_aggregator, rejects_balance_below_minimum) {
  auto fixture = voting_fixture{"agora_vote_tokens"};
  fixture.admit(make_hash(10), 9);
  EXPECT_EQ(fixture.vote(make_hash(10), 1),
            transaction_error_code::insufficient_tokens);
  EXPECT_EQ(fixture.governance.proposals.get(kProposal)->total_weight, 0u);
}

TEST(vote_aggregator, rejects_votes_outside_voting_window) {
  auto fixture = voting_fixture{"agora_vote_window"};
  fixture.admit(make_hash(10));
  EXPECT_EQ(fixture.vote(make_hash(10), 1, 99),
            transaction_error_code::voting_not_active);
  EXPECT_FALSE(fixture.vote(make_hash(10), 1, 100).has_value());
  EXPECT_FALSE(fixture.vote(make_hash(10), 1, 200).has_value());
  EXPECT_EQ(fixture.vote(make_hash(10), 1, 201),
            transaction_error_code::voting_not_active);
}

TEST(vote_aggregator, rejects_unknown_proposal) {
  auto fixture = voting_fixture{"agora_vote_unknown"};
  fixture.admit(make_hash(10));
  EXPECT_EQ(fixture.governance.votes.apply_vote(
                fixture.governance.context(make_hash(10), 150), make_hash(3),
                make_hash(10), 1, local_source_t{}),
            transaction_error_code::proposal_not_found);
}

TEST(vote_aggregator, remote_vote_is_applied_once_per_message) {
  auto fixture = voting_fixture{"agora_vote_remote_dedup"};
  fixture.admit(make_hash(10));
  auto source = remote_source_t{
      .chain = agora::testing::chain_b(), .sequence = 4, .message_id = make_hash(77)};

  ASSERT_FALSE(fixture.vote(make_hash(10), 40, 150, source).has_value());
  EXPECT_EQ(fixture.vote(make_hash(10), 40, 151, source),
            transaction_error_code::duplicate_message);
  EXPECT_EQ(fixture.governance.proposals.get(kProposal)->total_weight, 40u);
  EXPECT_TRUE(
      fixture.governance.proposals.has_applied(kProposal, make_hash(77)));
}

TEST(vote_aggregator, rejected_remote_vote_can_be_redelivered) {
  auto fixture = voting_fixture{"agora_vote_remote_retry"};
  auto source = remote_source_t{
      .chain = agora::testing::chain_b(), .sequence = 4, .message_id = make_hash(77)};

  EXPECT_EQ(fixture.vote(make_hash(10), 40, 150, source),
            transaction_error_code::not_eligible);
  EXPECT_FALSE(
      fixture.governance.proposals.has_applied(kProposal, make_hash(77)));

  fixture.admit(make_hash(10));
  EXPECT_FALSE(fixture.vote(make_hash(10), 40, 150, source).has_value());
}

TEST(vote_aggregator, local_and_remote_votes_merge_into_one_tally) {
  auto fixture = voting_fixture{"agora_vote_merge"};
  fixture.admit(make_hash(10));
  ASSERT_FALSE(fixture.vote(make_hash(10), 60).has_value());
  ASSERT_FALSE(fixture
                   .vote(make_hash(10), 40, 150,
                         remote_source_t{.chain = agora::testing::chain_b(),
                                         .sequence = 1,
                                         .message_id = make_hash(70)})
                   .has_value());
  auto proposal = fixture.governance.proposals.get(kProposal);
  EXPECT_EQ(proposal->total_weight, 100u);
  EXPECT_EQ(proposal->voter_count, 1u);
  EXPECT_EQ(fixture.governance.proposals.tally(kProposal, make_hash(10)), 100u);
}

TEST(vote_aggregator, rejects_weight_that_would_overflow_total) {
  auto fixture = voting_fixture{"agora_vote_overflow"};
  fixture.admit(make_hash(10));
  fixture.admit(make_hash(11));
  ASSERT_FALSE(
      fixture.vote(make_hash(10), std::numeric_limits<uint64_t>::max() - 1)
          .has_value());
  EXPECT_EQ(fixture.vote(make_hash(11), 2),
            transaction_error_code::weight_overflow);
  EXPECT_FALSE(fixture.vote(make_hash(11), 1).has_value());
  EXPECT_EQ(fixture.governance.proposals.get(kProposal)->total_weight,
            std::numeric_limits<uint64_t>::max());
}
