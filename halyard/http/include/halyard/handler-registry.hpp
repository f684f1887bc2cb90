#pragma once

#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "halyard/handler-phase.hpp"
#include "halyard/handler.hpp"
#include "halyard/http-method.hpp"
#include "halyard/path-pattern.hpp"

namespace halyard {

// A registered (phase, path pattern, handler) association.
struct HandlerEntry {
  HandlerPhase phase;
  PathPattern pattern;
  Handler handler;
};

// A binding matching a given path, with the values captured from that path.
// 'entry' points into the registry, which must outlive the match.
struct HandlerMatch {
  const HandlerEntry* entry;
  PathParams params;
  std::vector<std::string> splats;
};

// Maps (phase, path) to the ordered list of matching handler bindings.
// Registration is not thread-safe and should be done before serving requests. Lookups are const and
// may run concurrently.
class HandlerRegistry {
 public:
  // When 'caseSensitiveUrls' is false, literal parts of registered patterns are lowercased
  // to match paths normalized by the dispatcher.
  explicit HandlerRegistry(bool caseSensitiveUrls = false) noexcept : _caseSensitiveUrls(caseSensitiveUrls) {}

  // Registers 'handler' for 'phase' at 'pathPattern'. See PathPattern for the pattern syntax.
  // Throws std::invalid_argument for an invalid pattern, the INVALID phase or an empty handler.
  HandlerRegistry& add(HandlerPhase phase, std::string_view pathPattern, Handler handler);

  HandlerRegistry& before(std::string_view pathPattern, Handler handler) {
    return add(HandlerPhase::BEFORE, pathPattern, std::move(handler));
  }

  HandlerRegistry& after(std::string_view pathPattern, Handler handler) {
    return add(HandlerPhase::AFTER, pathPattern, std::move(handler));
  }

  HandlerRegistry& get(std::string_view pathPattern, Handler handler) {
    return add(HandlerPhase::GET, pathPattern, std::move(handler));
  }

  HandlerRegistry& post(std::string_view pathPattern, Handler handler) {
    return add(HandlerPhase::POST, pathPattern, std::move(handler));
  }

  HandlerRegistry& put(std::string_view pathPattern, Handler handler) {
    return add(HandlerPhase::PUT, pathPattern, std::move(handler));
  }

  HandlerRegistry& patch(std::string_view pathPattern, Handler handler) {
    return add(HandlerPhase::PATCH, pathPattern, std::move(handler));
  }

  HandlerRegistry& del(std::string_view pathPattern, Handler handler) {
    return add(HandlerPhase::DELETE, pathPattern, std::move(handler));
  }

  HandlerRegistry& head(std::string_view pathPattern, Handler handler) {
    return add(HandlerPhase::HEAD, pathPattern, std::move(handler));
  }

  HandlerRegistry& options(std::string_view pathPattern, Handler handler) {
    return add(HandlerPhase::OPTIONS, pathPattern, std::move(handler));
  }

  // All bindings of 'phase' matching 'normalizedPath', in registration order.
  [[nodiscard]] std::vector<HandlerMatch> findEntries(HandlerPhase phase, std::string_view normalizedPath) const;

  // Tells whether at least one binding of 'phase' matches 'normalizedPath'.
  [[nodiscard]] bool hasEntries(HandlerPhase phase, std::string_view normalizedPath) const;

  // Set of HTTP methods having at least one endpoint binding matching 'normalizedPath'.
  [[nodiscard]] http::MethodBmp availableMethods(std::string_view normalizedPath) const;

  [[nodiscard]] bool caseSensitiveUrls() const noexcept { return _caseSensitiveUrls; }

 private:
  std::array<std::vector<HandlerEntry>, kNbHandlerPhases> _entries;
  bool _caseSensitiveUrls;
};

}  // namespace halyard
