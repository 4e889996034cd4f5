/// @file test_variable_context.cpp
/// @brief Unit tests for variable bindings and `${name}` substitution.

#include "scenario/variable_context.hpp"

#include <gtest/gtest.h>

using namespace loadcurve;

TEST(VariableContextTest, SubstitutesBoundNames) {
  VariableContext ctx;
  ctx.set("a", "1");
  ctx.set("b", "2");
  EXPECT_EQ(ctx.substitute("/x/${a}/${b}"), "/x/1/2");
}

TEST(VariableContextTest, UnboundPlaceholderStaysLiteral) {
  VariableContext ctx;
  ctx.set("a", "1");
  EXPECT_EQ(ctx.substitute("/x/${a}/${c}"), "/x/1/${c}");
}

TEST(VariableContextTest, MalformedPlaceholdersPassThrough) {
  VariableContext ctx;
  ctx.set("a", "1");
  EXPECT_EQ(ctx.substitute("${}"), "${}");
  EXPECT_EQ(ctx.substitute("${a-b}"), "${a-b}");
  EXPECT_EQ(ctx.substitute("tail ${a"), "tail ${a");
  EXPECT_EQ(ctx.substitute("${x ${a}"), "${x 1");
}

TEST(VariableContextTest, ValuesAreNotRescanned) {
  VariableContext ctx;
  ctx.set("a", "${b}");
  ctx.set("b", "nope");
  EXPECT_EQ(ctx.substitute("${a}"), "${b}");
}

TEST(VariableContextTest, SetOverwrites) {
  VariableContext ctx;
  ctx.set("token", "old");
  ctx.set("token", "new");
  EXPECT_EQ(ctx.get("token"), "new");
  EXPECT_EQ(ctx.size(), 1u);
}

TEST(VariableContextTest, LoadRowOverwritesExistingKeys) {
  VariableContext ctx;
  ctx.set("user", "stale");
  ctx.set("keep", "me");
  ctx.load_row(DataRow{{"user", "alice"}, {"pass", "pw"}});
  EXPECT_EQ(ctx.get("user"), "alice");
  EXPECT_EQ(ctx.get("pass"), "pw");
  EXPECT_EQ(ctx.get("keep"), "me");
}

TEST(VariableContextTest, TimestampBuiltInWhenUnbound) {
  VariableContext ctx;
  auto out = ctx.substitute("${timestamp}");
  ASSERT_FALSE(out.empty());
  EXPECT_NE(out, "${timestamp}");
  EXPECT_EQ(out.find_first_not_of("0123456789"), std::string::npos);
}

TEST(VariableContextTest, BoundTimestampWins) {
  VariableContext ctx;
  ctx.set("timestamp", "42");
  EXPECT_EQ(ctx.substitute("t=${timestamp}"), "t=42");
}

TEST(VariableContextTest, SubstitutionDoesNotMutate) {
  VariableContext ctx;
  (void)substitute_variables("${timestamp} ${x}", ctx);
  EXPECT_EQ(ctx.size(), 0u);
  EXPECT_FALSE(ctx.contains("timestamp"));
}
