#pragma once

#include <unordered_map>

#include "halyard/handler.hpp"
#include "halyard/http-status-code.hpp"

namespace halyard {

// Status handlers: customize the response once its final status is known.
class ErrorMapper {
 public:
  // Registers 'handler' for 'statusCode', replacing any previous one.
  // Throws std::invalid_argument if 'handler' is empty.
  ErrorMapper& add(http::StatusCode statusCode, Handler handler);

  // Runs the handler registered for 'statusCode', if any.
  void handle(http::StatusCode statusCode, ExecutionContext& ctx) const;

  [[nodiscard]] bool empty() const noexcept { return _handlers.empty(); }

 private:
  std::unordered_map<http::StatusCode, Handler> _handlers;
};

}  // namespace halyard
