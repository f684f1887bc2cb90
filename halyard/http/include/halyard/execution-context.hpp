#pragma once

#include <any>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "halyard/async-result.hpp"
#include "halyard/handler-phase.hpp"
#include "halyard/http-status-code.hpp"
#include "halyard/path-pattern.hpp"
#include "halyard/result-stream.hpp"
#include "halyard/server-request.hpp"
#include "halyard/server-response.hpp"
#include "halyard/timedef.hpp"

namespace halyard {

// Per-request state shared by all the handlers invoked for one request.
//
// Status and headers are forwarded to the transport response as soon as they are set.
// The result is held here until finalization. It is exactly one of:
//  - nothing,
//  - an immediate byte stream (ResultStream),
//  - a pending value (AsyncResult).
// Setting a result replaces the previous one.
//
// A context is used by one thread at a time. When a pending value is installed, ownership moves to
// the thread which resolves it once the dispatch call has returned.
class ExecutionContext {
 public:
  enum class ResultKind : std::uint8_t { None, Stream, Async };

  ExecutionContext(ServerRequest& request, ServerResponse& response, HandlerPhase phase, std::string normalizedPath);

  ExecutionContext(const ExecutionContext&) = delete;
  ExecutionContext(ExecutionContext&&) noexcept = delete;
  ExecutionContext& operator=(const ExecutionContext&) = delete;
  ExecutionContext& operator=(ExecutionContext&&) noexcept = delete;

  ~ExecutionContext() = default;

  // ===========================
  // Request side
  // ===========================

  [[nodiscard]] ServerRequest& request() const noexcept { return *_request; }

  [[nodiscard]] std::string_view method() const { return _request->method(); }

  // Request path as received.
  [[nodiscard]] std::string_view path() const { return _request->path(); }

  // Request path used for matching (lowercased when URLs are case-insensitive).
  [[nodiscard]] std::string_view normalizedPath() const noexcept { return _normalizedPath; }

  // Endpoint phase of the request, derived from its method (or method override header).
  [[nodiscard]] HandlerPhase phase() const noexcept { return _phase; }

  // Request header lookup, case-insensitive.
  [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const { return _request->header(name); }

  // Request body. Can be read several times when it fits in the request body cache.
  [[nodiscard]] std::string body() const { return _request->readBody(); }

  // Value of path parameter 'name' for the binding being executed.
  // Throws std::invalid_argument if the matched pattern does not declare it.
  [[nodiscard]] std::string_view pathParam(std::string_view name) const;

  [[nodiscard]] const PathParams& pathParams() const noexcept { return _pathParams; }

  // Text matched by the wildcard segments of the binding being executed, in pattern order.
  [[nodiscard]] const std::vector<std::string>& splats() const noexcept { return _splats; }

  [[nodiscard]] std::optional<std::string_view> splat(std::size_t idx) const;

  // Pattern of the binding being executed, empty if none.
  [[nodiscard]] std::string_view matchedPath() const noexcept { return _matchedPath; }

  // Attributes carry arbitrary values from one handler to the next ones of the same request.
  void attribute(std::string_view key, std::any value);

  [[nodiscard]] const std::any* attribute(std::string_view key) const;

  template <class T>
  [[nodiscard]] const T* attributeAs(std::string_view key) const {
    const std::any* value = attribute(key);
    return value == nullptr ? nullptr : std::any_cast<T>(value);
  }

  // ===========================
  // Response side
  // ===========================

  [[nodiscard]] ServerResponse& response() const noexcept { return *_response; }

  ExecutionContext& status(http::StatusCode statusCode);

  [[nodiscard]] http::StatusCode status() const { return _response->status(); }

  // Sets response header 'name', replacing any previous value.
  ExecutionContext& header(std::string_view name, std::string_view value);

  [[nodiscard]] std::optional<std::string_view> responseHeader(std::string_view name) const {
    return _response->header(name);
  }

  ExecutionContext& contentType(std::string_view value);

  [[nodiscard]] std::optional<std::string_view> contentType() const;

  ExecutionContext& result(std::string data);

  ExecutionContext& result(ResultStream stream);

  ExecutionContext& result(AsyncResult pending);

  // Sets 'data' as result with content type text/html.
  ExecutionContext& html(std::string data);

  // Sets 'data' (an already serialized JSON document) as result with content type application/json.
  ExecutionContext& json(std::string data);

  // Sets the Location header and the redirection status.
  ExecutionContext& redirect(std::string_view location, http::StatusCode statusCode = http::StatusCodeFound);

  void clearResult() noexcept { _result = std::monostate{}; }

  [[nodiscard]] ResultKind resultKind() const noexcept { return static_cast<ResultKind>(_result.index()); }

  // Immediate result stream, nullptr if the result is not a stream.
  [[nodiscard]] ResultStream* resultStream() noexcept { return std::get_if<ResultStream>(&_result); }

  // Pending result, nullptr if the result is not pending.
  [[nodiscard]] AsyncResult* asyncResult() noexcept { return std::get_if<AsyncResult>(&_result); }

  // Content of the result stream, read then rewound. nullopt if the result is not a stream.
  [[nodiscard]] std::optional<std::string> resultString();

  // ===========================
  // Lifecycle
  // ===========================

  [[nodiscard]] SteadyTimePoint startTime() const noexcept { return _startTime; }

  // Milliseconds elapsed since the context creation.
  [[nodiscard]] float elapsedMillis() const;

  // Makes the route data of the binding about to be executed visible to handlers.
  void bindRoute(std::string_view matchedPath, PathParams params, std::vector<std::string> splats);

 private:
  using Result = std::variant<std::monostate, ResultStream, AsyncResult>;

  static_assert(std::variant_size_v<Result> == 3U && static_cast<std::size_t>(ResultKind::Async) == 2U,
                "ResultKind should follow the Result alternatives");

  ServerRequest* _request;
  ServerResponse* _response;
  std::string _normalizedPath;
  std::string _matchedPath;
  PathParams _pathParams;
  std::vector<std::string> _splats;
  std::map<std::string, std::any, std::less<>> _attributes;
  Result _result;
  SteadyTimePoint _startTime;
  HandlerPhase _phase;
};

}  // namespace halyard
