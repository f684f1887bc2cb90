#pragma once

#include <exception>
#include <memory>
#include <utility>

#include "halyard/async-result.hpp"
#include "halyard/dispatcher-config.hpp"
#include "halyard/error-mapper.hpp"
#include "halyard/exception-mapper.hpp"
#include "halyard/execution-context.hpp"
#include "halyard/handler-registry.hpp"
#include "halyard/handler.hpp"
#include "halyard/response-finalizer.hpp"
#include "halyard/server-request.hpp"
#include "halyard/server-response.hpp"
#include "halyard/single-page-handler.hpp"
#include "halyard/static-file-resolver.hpp"

namespace halyard {

// Runs the lifecycle of one request:
//   before handlers -> first matching endpoint handler (or fallbacks, or 404 / 405)
//   -> status handlers -> after handlers -> finalization -> request log.
// Any exception raised by a handler is converted into a response by the ExceptionMapper, each phase
// being guarded separately. Only finalization (I/O) failures propagate to the caller.
//
// When the result installed by the handlers is an AsyncResult, the exchange is suspended and dispatch()
// returns immediately. The status / after / finalize / log tail then runs when the value is resolved,
// on the resolving thread, and completes the suspended exchange.
//
// Handlers and collaborators should be set up before dispatching. dispatch() is const and may be called
// concurrently for different requests. The dispatcher (and the transport request) must outlive the
// asynchronous exchanges it started.
class RequestDispatcher {
 public:
  // Throws std::invalid_argument if 'config' is invalid.
  explicit RequestDispatcher(DispatcherConfig config = {});

  RequestDispatcher(const RequestDispatcher&) = delete;
  RequestDispatcher(RequestDispatcher&&) noexcept = delete;
  RequestDispatcher& operator=(const RequestDispatcher&) = delete;
  RequestDispatcher& operator=(RequestDispatcher&&) noexcept = delete;

  ~RequestDispatcher() = default;

  [[nodiscard]] HandlerRegistry& registry() noexcept { return _registry; }
  [[nodiscard]] const HandlerRegistry& registry() const noexcept { return _registry; }

  [[nodiscard]] ExceptionMapper& exceptionMapper() noexcept { return _exceptionMapper; }

  [[nodiscard]] ErrorMapper& errorMapper() noexcept { return _errorMapper; }

  [[nodiscard]] SinglePageHandler& singlePageHandler() noexcept { return _singlePageHandler; }

  // Installs the resolver tried first for unmatched GET / HEAD requests (typically a StaticFileResolver).
  void setStaticResolver(StaticResolver resolver) { _staticResolver = std::move(resolver); }

  // Installs the request logger, called once per completed request. It replaces debug logging.
  void setRequestLogger(RequestLogger logger) { _requestLogger = std::move(logger); }

  [[nodiscard]] const DispatcherConfig& config() const noexcept { return _config; }

  // Handles 'request', writing the outcome to 'response'.
  // Throws std::runtime_error if writing the response fails.
  void dispatch(ServerRequest& request, ServerResponse& response) const;

 private:
  struct RequestState;

  void runBeforeAndEndpointHandlers(RequestState& state) const;

  void runStatusHandlers(ExecutionContext& ctx) const;

  void runAfterHandlers(ExecutionContext& ctx) const;

  // Status handlers, after handlers, finalization against 'sink' and request log.
  void finishRequest(ExecutionContext& ctx, ServerResponse& sink) const;

  void completeAsync(RequestState& state, AsyncExchange& exchange, AsyncResult::Value value,
                     std::exception_ptr error) const;

  void logRequest(const ExecutionContext& ctx) const;

  DispatcherConfig _config;
  HandlerRegistry _registry;
  ExceptionMapper _exceptionMapper;
  ErrorMapper _errorMapper;
  SinglePageHandler _singlePageHandler;
  StaticResolver _staticResolver;
  RequestLogger _requestLogger;
  ResponseFinalizer _finalizer;
};

}  // namespace halyard
