#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "halyard/http-method.hpp"

namespace halyard {

// Bucket of the handler registry consulted for a request.
// BEFORE and AFTER hold filters, every other value except INVALID is an endpoint phase
// mapping one to one to an HTTP method.
enum class HandlerPhase : uint8_t {
  BEFORE,
  GET,
  POST,
  PUT,
  PATCH,
  DELETE,
  HEAD,
  TRACE,
  CONNECT,
  OPTIONS,
  AFTER,
  INVALID
};

inline constexpr std::size_t kNbHandlerPhases = static_cast<std::size_t>(HandlerPhase::INVALID) + 1U;

[[nodiscard]] constexpr bool IsEndpointPhase(HandlerPhase phase) noexcept {
  return phase != HandlerPhase::BEFORE && phase != HandlerPhase::AFTER && phase != HandlerPhase::INVALID;
}

[[nodiscard]] std::string_view HandlerPhaseToStr(HandlerPhase phase) noexcept;

// Returns the HTTP method of an endpoint phase, nullopt for BEFORE, AFTER and INVALID.
[[nodiscard]] std::optional<http::Method> PhaseToMethod(HandlerPhase phase) noexcept;

[[nodiscard]] HandlerPhase PhaseFromMethod(http::Method method) noexcept;

// Determine the endpoint phase of a request from its method token.
// 'methodOverride' (value of X-HTTP-Method-Override, if any) takes precedence over 'method'.
// Comparison is case-insensitive. Unknown tokens give HandlerPhase::INVALID.
[[nodiscard]] HandlerPhase PhaseFromRequest(std::string_view method, std::optional<std::string_view> methodOverride);

}  // namespace halyard
