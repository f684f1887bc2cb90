#include "halyard/handler-registry.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#include "halyard/execution-context.hpp"
#include "halyard/handler-phase.hpp"
#include "halyard/http-method.hpp"

namespace halyard {

namespace {
void Noop([[maybe_unused]] ExecutionContext& ctx) {}
}  // namespace

class HandlerRegistryTest : public ::testing::Test {
 protected:
  HandlerRegistry registry;
};

TEST_F(HandlerRegistryTest, FindEntriesKeepsRegistrationOrder) {
  registry.get("/items/{id}", Noop).get("/items/*", Noop).get("/other", Noop);

  const auto matches = registry.findEntries(HandlerPhase::GET, "/items/12");
  ASSERT_EQ(matches.size(), 2U);
  EXPECT_EQ(matches[0].entry->pattern.str(), "/items/{id}");
  EXPECT_EQ(matches[0].params.at("id"), "12");
  EXPECT_EQ(matches[1].entry->pattern.str(), "/items/*");
  ASSERT_EQ(matches[1].splats.size(), 1U);
  EXPECT_EQ(matches[1].splats[0], "12");
}

TEST_F(HandlerRegistryTest, PhasesAreSeparated) {
  registry.before("*", Noop).post("/x", Noop);
  EXPECT_TRUE(registry.findEntries(HandlerPhase::GET, "/x").empty());
  EXPECT_EQ(registry.findEntries(HandlerPhase::POST, "/x").size(), 1U);
  EXPECT_EQ(registry.findEntries(HandlerPhase::BEFORE, "/x").size(), 1U);
  EXPECT_TRUE(registry.hasEntries(HandlerPhase::POST, "/x"));
  EXPECT_FALSE(registry.hasEntries(HandlerPhase::AFTER, "/x"));
}

TEST_F(HandlerRegistryTest, AvailableMethodsExcludesFilters) {
  registry.before("/x", Noop).after("/x", Noop).get("/x", Noop).post("/x", Noop).del("/y", Noop);
  EXPECT_EQ(registry.availableMethods("/x"), http::Method::GET | http::Method::POST);
  EXPECT_EQ(registry.availableMethods("/y"), static_cast<http::MethodBmp>(http::Method::DELETE));
  EXPECT_EQ(registry.availableMethods("/z"), 0);
}

TEST_F(HandlerRegistryTest, CaseInsensitivePatternsMatchLowercasedPaths) {
  registry.get("/Hello", Noop);
  EXPECT_TRUE(registry.hasEntries(HandlerPhase::GET, "/hello"));

  HandlerRegistry caseSensitive(true);
  caseSensitive.get("/Hello", Noop);
  EXPECT_FALSE(caseSensitive.hasEntries(HandlerPhase::GET, "/hello"));
  EXPECT_TRUE(caseSensitive.hasEntries(HandlerPhase::GET, "/Hello"));
}

TEST_F(HandlerRegistryTest, InvalidRegistrations) {
  EXPECT_THROW(registry.add(HandlerPhase::INVALID, "/x", Noop), std::invalid_argument);
  EXPECT_THROW(registry.get("/x", Handler{}), std::invalid_argument);
  EXPECT_THROW(registry.get("x", Noop), std::invalid_argument);
}

}  // namespace halyard
