#include <gtest/gtest.h>
#include <warden/governance/events.hpp>
#include <warden/testing/governance_fixture.hpp>

using warden::schema::transaction_error_code;
using warden::testing::make_named_signer;

TEST(vote_ledger, cast_appends_history_and_sets_flag) {
  auto fixture = warden::testing::governance_fixture{};
  auto a = make_named_signer(1);
  auto b = make_named_signer(2);
  fixture.initialize({a, b});
  auto id = fixture.propose(a);
  fixture.events.clear();

  ASSERT_FALSE(fixture.ledger.cast_yes(id, b, 2'000, fixture.events));
  EXPECT_TRUE(fixture.ledger.has_voted_yes(id, b));
  EXPECT_EQ(fixture.ledger.yes_voter_history(id),
            (std::vector<warden::schema::signer_id_t>{a, b}));
  EXPECT_EQ(fixture.ledger.valid_yes_count(id), 2u);
  ASSERT_EQ(fixture.events.size(), 1u);
  EXPECT_EQ(fixture.events[0].type, warden::governance::kVoteCastEvent);
}

TEST(vote_ledger, double_vote_is_rejected) {
  auto fixture = warden::testing::governance_fixture{};
  auto a = make_named_signer(1);
  fixture.initialize({a, make_named_signer(2)});
  auto id = fixture.propose(a);

  auto error = fixture.ledger.cast_yes(id, a, 2'000, fixture.events);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::already_voted);
  EXPECT_EQ(fixture.ledger.yes_voter_history(id).size(), 1u);
}

TEST(vote_ledger, expiry_is_inclusive) {
  auto fixture = warden::testing::governance_fixture{};
  auto a = make_named_signer(1);
  auto b = make_named_signer(2);
  auto c = make_named_signer(3);
  fixture.initialize({a, b, c});
  auto id = fixture.propose(a, 10'000);

  EXPECT_FALSE(fixture.ledger.cast_yes(id, b, 10'000, fixture.events));
  auto error = fixture.ledger.cast_yes(id, c, 10'001, fixture.events);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::proposal_expired);
}

TEST(vote_ledger, voting_requires_open_proposal) {
  auto fixture = warden::testing::governance_fixture{};
  auto a = make_named_signer(1);
  auto b = make_named_signer(2);
  fixture.initialize({a, b});

  auto error = fixture.ledger.cast_yes(5, b, 2'000, fixture.events);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::proposal_not_proposed);

  auto id = fixture.propose(a);
  ASSERT_FALSE(fixture.proposals.cancel(id, a, fixture.events));
  error = fixture.ledger.cast_yes(id, b, 2'000, fixture.events);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::proposal_not_proposed);
}

TEST(vote_ledger, retract_swap_removes_from_history) {
  auto fixture = warden::testing::governance_fixture{};
  auto a = make_named_signer(1);
  auto b = make_named_signer(2);
  auto c = make_named_signer(3);
  fixture.initialize({a, b, c});
  auto id = fixture.propose(a);
  ASSERT_FALSE(fixture.ledger.cast_yes(id, b, 2'000, fixture.events));
  ASSERT_FALSE(fixture.ledger.cast_yes(id, c, 2'000, fixture.events));
  fixture.events.clear();

  ASSERT_FALSE(fixture.ledger.retract_yes(id, a, fixture.events));
  EXPECT_FALSE(fixture.ledger.has_voted_yes(id, a));
  EXPECT_EQ(fixture.ledger.yes_voter_history(id),
            (std::vector<warden::schema::signer_id_t>{c, b}));
  ASSERT_EQ(fixture.events.size(), 1u);
  EXPECT_EQ(fixture.events[0].type, warden::governance::kVoteRetractedEvent);

  auto error = fixture.ledger.retract_yes(id, a, fixture.events);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::vote_not_cast);
}

TEST(vote_ledger, retract_after_cancel_is_rejected) {
  auto fixture = warden::testing::governance_fixture{};
  auto a = make_named_signer(1);
  fixture.initialize({a, make_named_signer(2)});
  auto id = fixture.propose(a);
  ASSERT_FALSE(fixture.proposals.cancel(id, a, fixture.events));

  auto error = fixture.ledger.retract_yes(id, a, fixture.events);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::proposal_not_proposed);
  EXPECT_TRUE(fixture.ledger.has_voted_yes(id, a));
}

TEST(vote_ledger, valid_count_follows_live_membership) {
  auto fixture = warden::testing::governance_fixture{};
  auto a = make_named_signer(1);
  auto b = make_named_signer(2);
  auto c = make_named_signer(3);
  fixture.initialize({a, b, c});
  auto tracked = fixture.propose(a);
  ASSERT_FALSE(fixture.ledger.cast_yes(tracked, b, 2'000, fixture.events));
  EXPECT_EQ(fixture.ledger.valid_yes_count(tracked), 2u);

  auto removal = fixture.propose_calls(
      a, {fixture.governance_call(warden::schema::remove_signer_t{.signer = b})});
  ASSERT_FALSE(fixture.ledger.cast_yes(removal, c, 2'000, fixture.events));
  ASSERT_FALSE(fixture.execute(removal, a).has_value());

  // The history keeps the ex-signer; only the valid count drops.
  EXPECT_EQ(fixture.ledger.yes_voter_history(tracked).size(), 2u);
  EXPECT_TRUE(fixture.ledger.has_voted_yes(tracked, b));
  EXPECT_EQ(fixture.ledger.valid_yes_count(tracked), 1u);

  auto restore = fixture.propose_calls(
      a, {fixture.governance_call(warden::schema::add_signer_t{.signer = b})});
  ASSERT_FALSE(fixture.ledger.cast_yes(restore, c, 2'000, fixture.events));
  ASSERT_FALSE(fixture.execute(restore, a).has_value());
  EXPECT_EQ(fixture.ledger.valid_yes_count(tracked), 2u);
}
