#pragma once

#include <optional>
#include <string_view>

#include "halyard/http-status-code.hpp"
#include "halyard/server-request.hpp"

namespace halyard {

// Response side of the host transport (the output byte sink).
// Status and headers can be modified until the response is committed, which happens on the first
// body write or on an explicit commit(). Modifications after that point are ignored.
class ServerResponse {
 public:
  ServerResponse() noexcept = default;

  ServerResponse(const ServerResponse&) = delete;
  ServerResponse(ServerResponse&&) noexcept = delete;
  ServerResponse& operator=(const ServerResponse&) = delete;
  ServerResponse& operator=(ServerResponse&&) noexcept = delete;

  virtual ~ServerResponse() = default;

  virtual void setStatus(http::StatusCode statusCode) = 0;

  [[nodiscard]] virtual http::StatusCode status() const = 0;

  // Sets header 'name' to 'value', replacing any existing value(s) for this name (case-insensitive).
  virtual void setHeader(std::string_view name, std::string_view value) = 0;

  // Appends a header line, keeping existing values of the same name.
  virtual void addHeader(std::string_view name, std::string_view value) = 0;

  // Value of the first header named 'name' (case-insensitive), nullopt if absent.
  [[nodiscard]] virtual std::optional<std::string_view> header(std::string_view name) const = 0;

  [[nodiscard]] virtual HeaderViews headers() const = 0;

  // Writes body bytes. The first call commits status and headers.
  // Throws std::runtime_error (or a subclass) on I/O failure.
  virtual void write(std::string_view data) = 0;

  // Commits status and headers if not already done. No-op otherwise.
  virtual void commit() = 0;

  [[nodiscard]] virtual bool isCommitted() const = 0;
};

// Completion handle of a suspended exchange, returned by ServerRequest::startAsync.
// It may be used from any thread, but by one thread at a time.
class AsyncExchange {
 public:
  AsyncExchange() noexcept = default;

  AsyncExchange(const AsyncExchange&) = delete;
  AsyncExchange(AsyncExchange&&) noexcept = delete;
  AsyncExchange& operator=(const AsyncExchange&) = delete;
  AsyncExchange& operator=(AsyncExchange&&) noexcept = delete;

  virtual ~AsyncExchange() = default;

  // The response of the suspended exchange, to be written by the completion path.
  [[nodiscard]] virtual ServerResponse& response() = 0;

  // Signals that the exchange is finished. The transport flushes and releases it.
  virtual void complete() = 0;
};

}  // namespace halyard
