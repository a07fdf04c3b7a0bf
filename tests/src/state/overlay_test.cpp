#include <gtest/gtest.h>
#include <warden/state/overlay.hpp>
#include <warden/testing/governance_fixture.hpp>

namespace {

warden::schema::bytes_t key(const std::string_view value) {
  return warden::schema::make_bytes(value);
}

warden::schema::bytes_view_t view(const warden::schema::bytes_t& bytes) {
  return warden::schema::bytes_view_t{bytes};
}

}  // namespace

TEST(overlay, child_reads_through_to_parent) {
  auto base = warden::testing::empty_reader{};
  auto parent = warden::state::overlay{base};
  parent.write(view(key("a")), key("1"));

  auto child = warden::state::overlay{parent};
  EXPECT_EQ(child.read(view(key("a"))), key("1"));
  EXPECT_FALSE(child.read(view(key("b"))).has_value());
}

TEST(overlay, discarded_child_leaves_parent_untouched) {
  auto base = warden::testing::empty_reader{};
  auto parent = warden::state::overlay{base};
  parent.write(view(key("a")), key("1"));
  {
    auto child = warden::state::overlay{parent};
    child.write(view(key("a")), key("2"));
    child.write(view(key("b")), key("3"));
    EXPECT_EQ(child.read(view(key("a"))), key("2"));
  }
  EXPECT_EQ(parent.read(view(key("a"))), key("1"));
  EXPECT_FALSE(parent.read(view(key("b"))).has_value());
}

TEST(overlay, merge_applies_writes_and_erasures) {
  auto base = warden::testing::empty_reader{};
  auto parent = warden::state::overlay{base};
  parent.write(view(key("a")), key("1"));
  parent.write(view(key("b")), key("2"));

  auto child = warden::state::overlay{parent};
  child.erase(view(key("a")));
  child.write(view(key("c")), key("3"));
  EXPECT_FALSE(child.read(view(key("a"))).has_value());
  parent.merge(std::move(child));

  EXPECT_FALSE(parent.read(view(key("a"))).has_value());
  EXPECT_EQ(parent.read(view(key("b"))), key("2"));
  EXPECT_EQ(parent.read(view(key("c"))), key("3"));

  auto pending = parent.pending();
  ASSERT_EQ(pending.size(), 3u);
  EXPECT_EQ(pending[0].first, key("a"));
  EXPECT_FALSE(pending[0].second.has_value());
}

TEST(overlay, clear_drops_journal) {
  auto base = warden::testing::empty_reader{};
  auto state = warden::state::overlay{base};
  state.write(view(key("a")), key("1"));
  EXPECT_FALSE(state.empty());
  state.clear();
  EXPECT_TRUE(state.empty());
  EXPECT_FALSE(state.read(view(key("a"))).has_value());
}

TEST(prefixed_view, keys_are_rooted_under_prefix) {
  auto base = warden::testing::empty_reader{};
  auto state = warden::state::overlay{base};
  auto scoped = warden::state::prefixed_view{state, key("T|")};
  scoped.write(view(key("x")), key("9"));

  EXPECT_EQ(state.read(view(key("T|x"))), key("9"));
  EXPECT_FALSE(state.read(view(key("x"))).has_value());
  EXPECT_EQ(scoped.read(view(key("x"))), key("9"));

  scoped.erase(view(key("x")));
  EXPECT_FALSE(state.read(view(key("T|x"))).has_value());
}
