#include "halyard/handler-phase.hpp"

#include <optional>
#include <string_view>

#include "halyard/http-method.hpp"
#include "halyard/string-equal-ignore-case.hpp"

namespace halyard {

std::string_view HandlerPhaseToStr(HandlerPhase phase) noexcept {
  switch (phase) {
    case HandlerPhase::BEFORE:
      return "BEFORE";
    case HandlerPhase::AFTER:
      return "AFTER";
    case HandlerPhase::INVALID:
      return "INVALID";
    default:
      return http::MethodToStr(*PhaseToMethod(phase));
  }
}

std::optional<http::Method> PhaseToMethod(HandlerPhase phase) noexcept {
  switch (phase) {
    case HandlerPhase::GET:
      return http::Method::GET;
    case HandlerPhase::POST:
      return http::Method::POST;
    case HandlerPhase::PUT:
      return http::Method::PUT;
    case HandlerPhase::PATCH:
      return http::Method::PATCH;
    case HandlerPhase::DELETE:
      return http::Method::DELETE;
    case HandlerPhase::HEAD:
      return http::Method::HEAD;
    case HandlerPhase::TRACE:
      return http::Method::TRACE;
    case HandlerPhase::CONNECT:
      return http::Method::CONNECT;
    case HandlerPhase::OPTIONS:
      return http::Method::OPTIONS;
    default:
      return std::nullopt;
  }
}

HandlerPhase PhaseFromMethod(http::Method method) noexcept {
  switch (method) {
    case http::Method::GET:
      return HandlerPhase::GET;
    case http::Method::HEAD:
      return HandlerPhase::HEAD;
    case http::Method::POST:
      return HandlerPhase::POST;
    case http::Method::PUT:
      return HandlerPhase::PUT;
    case http::Method::DELETE:
      return HandlerPhase::DELETE;
    case http::Method::CONNECT:
      return HandlerPhase::CONNECT;
    case http::Method::OPTIONS:
      return HandlerPhase::OPTIONS;
    case http::Method::TRACE:
      return HandlerPhase::TRACE;
    case http::Method::PATCH:
      return HandlerPhase::PATCH;
    default:
      return HandlerPhase::INVALID;
  }
}

HandlerPhase PhaseFromRequest(std::string_view method, std::optional<std::string_view> methodOverride) {
  const std::string_view token = methodOverride ? *methodOverride : method;
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    if (CaseInsensitiveEqual(token, http::MethodIdxToStr(methodIdx))) {
      return PhaseFromMethod(http::MethodFromIdx(methodIdx));
    }
  }
  return HandlerPhase::INVALID;
}

}  // namespace halyard
