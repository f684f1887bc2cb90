#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace halyard {

class AsyncExchange;
class ServerResponse;

using HeaderViews = std::vector<std::pair<std::string_view, std::string_view>>;

// Request side of the host transport, as seen by the dispatcher.
// The transport owns the parsed request. Implementations are not required to be thread-safe:
// a request is only used by one phase of its lifecycle at a time.
class ServerRequest {
 public:
  ServerRequest() noexcept = default;

  ServerRequest(const ServerRequest&) = delete;
  ServerRequest(ServerRequest&&) noexcept = delete;
  ServerRequest& operator=(const ServerRequest&) = delete;
  ServerRequest& operator=(ServerRequest&&) noexcept = delete;

  virtual ~ServerRequest() = default;

  // Method token as received (for instance "GET").
  [[nodiscard]] virtual std::string_view method() const = 0;

  // Request path, without query string, as received.
  [[nodiscard]] virtual std::string_view path() const = 0;

  // Value of the first header named 'name' (case-insensitive), nullopt if absent.
  [[nodiscard]] virtual std::optional<std::string_view> header(std::string_view name) const = 0;

  // All request headers in reception order.
  [[nodiscard]] virtual HeaderViews headers() const = 0;

  // Reads the whole request body from the transport.
  // The transport body can only be consumed once, subsequent calls return an empty string.
  virtual std::string readBody() = 0;

  // Suspends the exchange: the response will not be completed when the current call stack
  // returns to the transport, but only when AsyncExchange::complete() is called.
  virtual std::shared_ptr<AsyncExchange> startAsync(ServerResponse& response) = 0;
};

}  // namespace halyard
