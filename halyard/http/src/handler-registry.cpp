#include "halyard/handler-registry.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "halyard/handler-phase.hpp"
#include "halyard/handler.hpp"
#include "halyard/http-method.hpp"
#include "halyard/log.hpp"
#include "halyard/path-pattern.hpp"

namespace halyard {

HandlerRegistry& HandlerRegistry::add(HandlerPhase phase, std::string_view pathPattern, Handler handler) {
  if (phase == HandlerPhase::INVALID) {
    throw std::invalid_argument("Cannot register a handler for the INVALID phase");
  }
  if (!handler) {
    throw std::invalid_argument("Cannot register an empty handler for '" + std::string(pathPattern) + "'");
  }
  auto& entries = _entries[static_cast<std::size_t>(phase)];
  entries.push_back(HandlerEntry{phase, PathPattern(pathPattern, _caseSensitiveUrls), std::move(handler)});
  log::debug("Registered {} handler for '{}'", HandlerPhaseToStr(phase), pathPattern);
  return *this;
}

std::vector<HandlerMatch> HandlerRegistry::findEntries(HandlerPhase phase, std::string_view normalizedPath) const {
  std::vector<HandlerMatch> matches;
  for (const HandlerEntry& entry : _entries[static_cast<std::size_t>(phase)]) {
    auto match = entry.pattern.match(normalizedPath);
    if (match) {
      matches.push_back(HandlerMatch{&entry, std::move(match->params), std::move(match->splats)});
    }
  }
  return matches;
}

bool HandlerRegistry::hasEntries(HandlerPhase phase, std::string_view normalizedPath) const {
  const auto& entries = _entries[static_cast<std::size_t>(phase)];
  return std::ranges::any_of(entries,
                             [normalizedPath](const HandlerEntry& entry) { return entry.pattern.matches(normalizedPath); });
}

http::MethodBmp HandlerRegistry::availableMethods(std::string_view normalizedPath) const {
  http::MethodBmp methods{};
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    const http::Method method = http::MethodFromIdx(methodIdx);
    if (hasEntries(PhaseFromMethod(method), normalizedPath)) {
      methods = methods | method;
    }
  }
  return methods;
}

}  // namespace halyard
