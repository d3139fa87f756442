#include <gtest/gtest.h>
#include <agora/testing/governance_fixture.hpp>

using agora::schema::proposal_outcome_t;
using agora::schema::transaction_error_code;
using agora::testing::make_hash;

namespace {

const auto kDao = make_hash(1);
const auto kProposal = make_hash(2);
const auto kController = make_hash(5);
const auto kToken = make_hash(90);

void prepare(agora::testing::governance_fixture& fixture,
             const agora::schema::weight_t weight) {
  fixture.register_dao(kDao, kController, kToken);
  fixture.create_proposal(kDao, kProposal, kController, 100, 200, 100);
  if (weight > 0) {
    fixture.oracle.whitelist(make_hash(10));
    ASSERT_FALSE(fixture.votes
                     .apply_vote(fixture.context(make_hash(10), 150), kProposal,
                                 make_hash(10), weight,
                                 agora::schema::local_source_t{})
                     .has_value());
  }
  fixture.events.clear();
}

}  // namespace

TEST(finalization_controller, rejects_finalize_while_voting_is_open) {
  auto fixture = agora::testing::governance_fixture{"agora_finalize_open"};
  prepare(fixture, 0);
  EXPECT_EQ(fixture.finalization.finalize(fixture.context(kController, 200),
                                          kProposal),
            transaction_error_code::voting_still_active);
  EXPECT_FALSE(fixture.proposals.get(kProposal)->finalized);
}

TEST(finalization_controller, only_controller_finalizes_locally) {
  auto fixture = agora::testing::governance_fixture{"agora_finalize_auth"};
  prepare(fixture, 0);
  EXPECT_EQ(fixture.finalization.finalize(fixture.context(make_hash(6), 201),
                                          kProposal),
            transaction_error_code::unauthorized);
  EXPECT_EQ(fixture.finalization.finalize(fixture.context(kController, 201),
                                          make_hash(3)),
            transaction_error_code::proposal_not_found);
}

TEST(finalization_controller, records_passed_when_quorum_met) {
  auto fixture = agora::testing::governance_fixture{"agora_finalize_passed"};
  prepare(fixture, 100);
  ASSERT_FALSE(fixture.finalization
                   .finalize(fixture.context(kController, 201), kProposal)
                   .has_value());
  auto proposal = fixture.proposals.get(kProposal);
  EXPECT_TRUE(proposal->finalized);
  EXPECT_EQ(proposal->outcome, proposal_outcome_t::passed);
  EXPECT_EQ(proposal->finalized_at, 201u);
  ASSERT_EQ(fixture.events.size(), 1u);
  EXPECT_EQ(fixture.events[0].type, "proposal_finalized");
}

TEST(finalization_controller, records_quorum_not_met_below_quorum) {
  auto fixture = agora::testing::governance_fixture{"agora_finalize_failed"};
  prepare(fixture, 99);
  ASSERT_FALSE(fixture.finalization
                   .finalize(fixture.context(kController, 300), kProposal)
                   .has_value());
  EXPECT_EQ(fixture.proposals.get(kProposal)->outcome,
            proposal_outcome_t::quorum_not_met);
}

TEST(finalization_controller, second_finalize_always_fails) {
  auto fixture = agora::testing::governance_fixture{"agora_finalize_twice"};
  prepare(fixture, 100);
  ASSERT_FALSE(fixture.finalization
                   .finalize(fixture.context(kController, 201), kProposal)
                   .has_value());
  EXPECT_EQ(fixture.finalization.finalize(fixture.context(kController, 202),
                                          kProposal),
            transaction_error_code::already_finalized);
  EXPECT_EQ(fixture.finalization.finalize(fixture.context(make_hash(6), 202),
                                          kProposal, true),
            transaction_error_code::already_finalized);
}

TEST(finalization_controller, trusted_finalize_skips_controller_check) {
  auto fixture = agora::testing::governance_fixture{"agora_finalize_trusted"};
  prepare(fixture, 0);
  ASSERT_FALSE(fixture.finalization
                   .finalize(fixture.context(make_hash(6), 201), kProposal,
                             true)
                   .has_value());
  EXPECT_TRUE(fixture.proposals.get(kProposal)->finalized);
}

TEST(finalization_controller, votes_after_finalize_are_rejected) {
  auto fixture = agora::testing::governance_fixture{"agora_finalize_late_vote"};
  prepare(fixture, 100);
  ASSERT_FALSE(fixture.finalization
                   .finalize(fixture.context(kController, 201), kProposal)
                   .has_value());
  // A vote stamped inside the window still sees the terminal state.
  EXPECT_EQ(fixture.votes.apply_vote(fixture.context(make_hash(10), 150),
                                     kProposal, make_hash(10), 1,
                                     agora::schema::local_source_t{}),
            transaction_error_code::voting_not_active);
}

TEST(finalization_controller, finalize_forgets_vote_message_ids) {
  auto fixture = agora::testing::governance_fixture{"agora_finalize_prune"};
  prepare(fixture, 0);
  fixture.oracle.whitelist(make_hash(10));
  ASSERT_FALSE(fixture.votes
                   .apply_vote(fixture.context(make_hash(10), 150), kProposal,
                               make_hash(10), 100,
                               agora::schema::remote_source_t{
                                   .chain = agora::testing::chain_b(),
                                   .sequence = 3,
                                   .message_id = make_hash(70)})
                   .has_value());
  fixture.proposals.record_applied(agora::schema::applied_message_t{
      .proposal_id = kProposal,
      .message_id = make_hash(71),
      .kind = agora::schema::message_kind_t::create_proposal,
      .source_chain = agora::testing::chain_b(),
      .sequence = 1});
  ASSERT_TRUE(fixture.proposals.has_applied(kProposal, make_hash(70)));

  ASSERT_FALSE(fixture.finalization
                   .finalize(fixture.context(kController, 201), kProposal)
                   .has_value());
  EXPECT_FALSE(fixture.proposals.has_applied(kProposal, make_hash(70)));
  EXPECT_TRUE(fixture.proposals.has_applied(kProposal, make_hash(71)));
  EXPECT_EQ(fixture.proposals.get(kProposal)->outcome,
            proposal_outcome_t::passed);

  // Redelivery of the pruned vote is still refused by the terminal state.
  EXPECT_EQ(fixture.votes.apply_vote(fixture.context(make_hash(10), 150),
                                     kProposal, make_hash(10), 100,
                                     agora::schema::remote_source_t{
                                         .chain = agora::testing::chain_b(),
                                         .sequence = 3,
                                         .message_id = make_hash(70)}),
            transaction_error_code::voting_not_active);
  EXPECT_EQ(fixture.proposals.get(kProposal)->total_weight, 100u);
}
