#include <gtest/gtest.h>
#include <warden/governance/events.hpp>
#include <warden/testing/governance_fixture.hpp>

using warden::schema::transaction_error_code;
using warden::testing::make_named_signer;

TEST(signer_registry, initialize_installs_signers_in_order) {
  auto fixture = warden::testing::governance_fixture{};
  auto a = make_named_signer(1);
  auto b = make_named_signer(2);
  auto error = fixture.registry.initialize(
      warden::testing::make_genesis({a, b}), fixture.events);
  ASSERT_FALSE(error.has_value());

  EXPECT_TRUE(fixture.registry.is_signer(a));
  EXPECT_TRUE(fixture.registry.is_signer(b));
  EXPECT_FALSE(fixture.registry.is_signer(make_named_signer(3)));
  EXPECT_EQ(fixture.registry.count(), 2u);
  EXPECT_EQ(fixture.registry.list(),
            (std::vector<warden::schema::signer_id_t>{a, b}));
  ASSERT_EQ(fixture.events.size(), 2u);
  EXPECT_EQ(fixture.events[0].type, warden::governance::kSignerAddedEvent);

  auto config = fixture.registry.config();
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->max_signers, warden::schema::kDefaultMaxSigners);
}

TEST(signer_registry, initialize_runs_once) {
  auto fixture = warden::testing::governance_fixture{};
  fixture.initialize({make_named_signer(1)});
  auto error = fixture.registry.initialize(
      warden::testing::make_genesis({make_named_signer(2)}), fixture.events);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::wallet_already_initialized);
  EXPECT_FALSE(fixture.registry.is_signer(make_named_signer(2)));
}

TEST(signer_registry, initialize_rejects_bad_genesis) {
  {
    auto fixture = warden::testing::governance_fixture{};
    auto error = fixture.registry.initialize(warden::testing::make_genesis({}),
                                             fixture.events);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, transaction_error_code::invalid_genesis);
  }
  {
    auto fixture = warden::testing::governance_fixture{};
    auto error = fixture.registry.initialize(
        warden::testing::make_genesis(
            {make_named_signer(1), make_named_signer(2)}, 1),
        fixture.events);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, transaction_error_code::invalid_genesis);
  }
  {
    auto fixture = warden::testing::governance_fixture{};
    auto error = fixture.registry.initialize(
        warden::testing::make_genesis(
            {make_named_signer(1), make_named_signer(1)}),
        fixture.events);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, transaction_error_code::duplicate_signer);
  }
  {
    auto fixture = warden::testing::governance_fixture{};
    auto error = fixture.registry.initialize(
        warden::testing::make_genesis(
            {warden::schema::signer_id_t{warden::schema::named_signer_t{}}}),
        fixture.events);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, transaction_error_code::null_signer);
    EXPECT_FALSE(fixture.registry.config().has_value());
  }
}

TEST(signer_registry, governance_add_appends_signer) {
  auto fixture = warden::testing::governance_fixture{};
  auto a = make_named_signer(1);
  auto c = make_named_signer(3);
  fixture.initialize({a});
  auto id = fixture.propose_calls(
      a, {fixture.governance_call(warden::schema::add_signer_t{.signer = c})});
  ASSERT_FALSE(fixture.execute(id, a).has_value());

  EXPECT_TRUE(fixture.registry.is_signer(c));
  EXPECT_EQ(fixture.registry.list().back(), c);
}

TEST(signer_registry, governance_add_respects_limit_and_duplicates) {
  auto fixture = warden::testing::governance_fixture{};
  auto a = make_named_signer(1);
  auto b = make_named_signer(2);
  fixture.initialize({a, b}, 2);

  auto full = fixture.propose_calls(
      a, {fixture.governance_call(
             warden::schema::add_signer_t{.signer = make_named_signer(3)})});
  ASSERT_FALSE(fixture.ledger.cast_yes(full, b, 1'500, fixture.events));
  auto error = fixture.execute(full, a);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::signer_limit_reached);

  auto duplicate = fixture.propose_calls(
      a, {fixture.governance_call(warden::schema::add_signer_t{.signer = b})});
  ASSERT_FALSE(fixture.ledger.cast_yes(duplicate, b, 1'500, fixture.events));
  error = fixture.execute(duplicate, a);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::duplicate_signer);
  EXPECT_EQ(fixture.registry.count(), 2u);
}

TEST(signer_registry, governance_remove_swaps_last_into_place) {
  auto fixture = warden::testing::governance_fixture{};
  auto a = make_named_signer(1);
  auto b = make_named_signer(2);
  auto c = make_named_signer(3);
  fixture.initialize({a, b, c});

  auto id = fixture.propose_calls(
      a, {fixture.governance_call(warden::schema::remove_signer_t{.signer = a})});
  ASSERT_FALSE(fixture.ledger.cast_yes(id, b, 1'500, fixture.events));
  ASSERT_FALSE(fixture.execute(id, b).has_value());

  EXPECT_FALSE(fixture.registry.is_signer(a));
  EXPECT_EQ(fixture.registry.list(),
            (std::vector<warden::schema::signer_id_t>{c, b}));
}

TEST(signer_registry, last_signer_cannot_be_removed) {
  auto fixture = warden::testing::governance_fixture{};
  auto a = make_named_signer(1);
  fixture.initialize({a});
  auto id = fixture.propose_calls(
      a, {fixture.governance_call(warden::schema::remove_signer_t{.signer = a})});
  auto error = fixture.execute(id, a);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::last_signer);
  EXPECT_TRUE(fixture.registry.is_signer(a));
  EXPECT_EQ(fixture.proposals.get(id).status,
            warden::schema::proposal_status_t::proposed);
}

TEST(signer_registry, removing_absent_signer_fails) {
  auto fixture = warden::testing::governance_fixture{};
  auto a = make_named_signer(1);
  fixture.initialize({a});
  auto id = fixture.propose_calls(
      a, {fixture.governance_call(
             warden::schema::remove_signer_t{.signer = make_named_signer(9)})});
  auto error = fixture.execute(id, a);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::signer_missing);
}
