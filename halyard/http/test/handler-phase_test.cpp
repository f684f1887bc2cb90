#include "halyard/handler-phase.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string_view>

#include "halyard/http-method.hpp"

namespace halyard {

TEST(HandlerPhase, FromRequestMethod) {
  EXPECT_EQ(PhaseFromRequest("GET", std::nullopt), HandlerPhase::GET);
  EXPECT_EQ(PhaseFromRequest("head", std::nullopt), HandlerPhase::HEAD);
  EXPECT_EQ(PhaseFromRequest("Patch", std::nullopt), HandlerPhase::PATCH);
  EXPECT_EQ(PhaseFromRequest("OPTIONS", std::nullopt), HandlerPhase::OPTIONS);
}

TEST(HandlerPhase, MethodOverrideHeaderWins) {
  EXPECT_EQ(PhaseFromRequest("POST", std::string_view("delete")), HandlerPhase::DELETE);
  EXPECT_EQ(PhaseFromRequest("POST", std::string_view("PUT")), HandlerPhase::PUT);
}

TEST(HandlerPhase, UnknownMethodIsInvalid) {
  EXPECT_EQ(PhaseFromRequest("BREW", std::nullopt), HandlerPhase::INVALID);
  EXPECT_EQ(PhaseFromRequest("GET", std::string_view("BOGUS")), HandlerPhase::INVALID);
  EXPECT_EQ(PhaseFromRequest("", std::nullopt), HandlerPhase::INVALID);
}

TEST(HandlerPhase, EndpointPhases) {
  EXPECT_FALSE(IsEndpointPhase(HandlerPhase::BEFORE));
  EXPECT_FALSE(IsEndpointPhase(HandlerPhase::AFTER));
  EXPECT_FALSE(IsEndpointPhase(HandlerPhase::INVALID));
  EXPECT_TRUE(IsEndpointPhase(HandlerPhase::GET));
  EXPECT_TRUE(IsEndpointPhase(HandlerPhase::TRACE));
}

TEST(HandlerPhase, MethodConversions) {
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    const auto method = http::MethodFromIdx(methodIdx);
    const auto phase = PhaseFromMethod(method);
    ASSERT_TRUE(IsEndpointPhase(phase));
    EXPECT_EQ(PhaseToMethod(phase), method);
    EXPECT_EQ(HandlerPhaseToStr(phase), http::MethodToStr(method));
  }
  EXPECT_FALSE(PhaseToMethod(HandlerPhase::BEFORE).has_value());
  EXPECT_EQ(HandlerPhaseToStr(HandlerPhase::AFTER), "AFTER");
}

}  // namespace halyard
