#include "halyard/error-mapper.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "halyard/execution-context.hpp"
#include "halyard/handler.hpp"
#include "halyard/http-status-code.hpp"

namespace halyard {

ErrorMapper& ErrorMapper::add(http::StatusCode statusCode, Handler handler) {
  if (!handler) {
    throw std::invalid_argument("Cannot register an empty status handler for " + std::to_string(statusCode));
  }
  _handlers.insert_or_assign(statusCode, std::move(handler));
  return *this;
}

void ErrorMapper::handle(http::StatusCode statusCode, ExecutionContext& ctx) const {
  const auto it = _handlers.find(statusCode);
  if (it != _handlers.end()) {
    it->second(ctx);
  }
}

}  // namespace halyard
