#include <gtest/gtest.h>

#include "stanza/scope.hh"
#include "test_util.hh"

using namespace stanza;
using namespace stanza::test;

class ScopeResolution : public ::testing::Test {
 protected:
  void SetUp() override {
    bindings_ = yaml(
        "project: demo\n"
        "user:\n"
        "  name: Ada\n"
        "  address: null\n"
        "features: [auth, db, cache]\n"
        "empty: ''\n");
    root_ = arena_.push_root(bindings_);
  }

  ordered_node bindings_;
  ScopeArena arena_;
  std::size_t root_ = 0;
};

TEST_F(ScopeResolution, TopLevelAndDottedNames) {
  auto project = arena_.resolve("project", root_);
  ASSERT_TRUE(project);
  EXPECT_EQ(to_string_any(*project), "demo");

  auto name = arena_.resolve("user.name", root_);
  ASSERT_TRUE(name);
  EXPECT_EQ(to_string_any(*name), "Ada");

  auto empty = arena_.resolve("empty", root_);
  ASSERT_TRUE(empty);
  EXPECT_EQ(to_string_any(*empty), "");
}

TEST_F(ScopeResolution, MissingStepsAreUndefined) {
  EXPECT_FALSE(arena_.resolve("nope", root_));
  EXPECT_FALSE(arena_.resolve("user.email", root_));
  EXPECT_FALSE(arena_.resolve("user.address.city", root_));
  EXPECT_FALSE(arena_.resolve("project.name", root_));
  EXPECT_FALSE(arena_.resolve("missing.deeper.still", root_));
}

TEST_F(ScopeResolution, NullLeafIsDefined) {
  auto addr = arena_.resolve("user.address", root_);
  ASSERT_TRUE(addr);
  EXPECT_TRUE(addr->is_null());
}

TEST_F(ScopeResolution, SequenceIndexAndLength) {
  auto second = arena_.resolve("features.1", root_);
  ASSERT_TRUE(second);
  EXPECT_EQ(to_string_any(*second), "db");
  EXPECT_FALSE(arena_.resolve("features.3", root_));

  auto count = arena_.resolve("features.length", root_);
  ASSERT_TRUE(count);
  EXPECT_EQ(to_string_any(*count), "3");

  auto chars = arena_.resolve("project.length", root_);
  ASSERT_TRUE(chars);
  EXPECT_EQ(to_string_any(*chars), "4");
}

TEST_F(ScopeResolution, LoopFrameNames) {
  const ordered_node &features = bindings_.at("features");
  std::size_t last = arena_.push_loop(root_, features.at(2), 2, 3);

  EXPECT_EQ(to_string_any(*arena_.resolve("this", last)), "cache");
  EXPECT_EQ(to_string_any(*arena_.resolve("@index", last)), "2");
  EXPECT_FALSE(is_truthy(arena_.resolve("@first", last)));
  EXPECT_TRUE(is_truthy(arena_.resolve("@last", last)));

  // Names the loop frame does not bind are looked up in the parent
  EXPECT_EQ(to_string_any(*arena_.resolve("project", last)), "demo");
  EXPECT_EQ(to_string_any(*arena_.resolve("user.name", last)), "Ada");
  arena_.pop();
  EXPECT_EQ(arena_.size(), 1u);
}

TEST_F(ScopeResolution, InnerLoopShadowsOuter) {
  std::size_t outer = arena_.push_loop(root_, map({{"name", str("outer")}}), 0, 2);
  std::size_t inner = arena_.push_loop(outer, str("inner"), 1, 2);

  EXPECT_EQ(to_string_any(*arena_.resolve("this", inner)), "inner");
  EXPECT_EQ(to_string_any(*arena_.resolve("@index", inner)), "1");
  EXPECT_EQ(to_string_any(*arena_.resolve("this.name", outer)), "outer");
  EXPECT_EQ(arena_.at(inner).parent, outer);
  EXPECT_FALSE(arena_.at(root_).has_parent());
}

TEST_F(ScopeResolution, LoopItemPropertiesResolve) {
  std::size_t frame = arena_.push_loop(root_, map({{"host", str("db.local")}, {"port", num(5432)}}), 0, 1);
  EXPECT_EQ(to_string_any(*arena_.resolve("this.host", frame)), "db.local");
  EXPECT_EQ(to_string_any(*arena_.resolve("this.port", frame)), "5432");
  EXPECT_FALSE(arena_.resolve("this.user", frame));
}

TEST_F(ScopeResolution, LiteralsResolveToThemselves) {
  EXPECT_EQ(to_string_any(*resolve("'api'", arena_, root_)), "api");
  EXPECT_EQ(to_string_any(*resolve("42", arena_, root_)), "42");
  EXPECT_EQ(to_string_any(*resolve("project", arena_, root_)), "demo");
}

TEST(ScopeArena, RootMustBeAMapping) {
  ScopeArena arena;
  const ordered_node sequence = list({str("a")});
  EXPECT_THROW(arena.push_root(sequence), Error);

  const ordered_node nothing;
  std::size_t root = arena.push_root(nothing);
  EXPECT_FALSE(arena.resolve("anything", root));
}
