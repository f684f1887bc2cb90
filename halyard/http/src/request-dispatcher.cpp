#include "halyard/request-dispatcher.hpp"

#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "halyard/async-result.hpp"
#include "halyard/cached-request.hpp"
#include "halyard/dispatcher-config.hpp"
#include "halyard/execution-context.hpp"
#include "halyard/handler-phase.hpp"
#include "halyard/handler-registry.hpp"
#include "halyard/http-constants.hpp"
#include "halyard/http-exception.hpp"
#include "halyard/http-method.hpp"
#include "halyard/log.hpp"
#include "halyard/request-log.hpp"
#include "halyard/response-finalizer.hpp"
#include "halyard/result-stream.hpp"
#include "halyard/server-request.hpp"
#include "halyard/server-response.hpp"
#include "halyard/string-equal-ignore-case.hpp"

namespace halyard {

struct RequestDispatcher::RequestState {
  RequestState(ServerRequest& transportRequest, ServerResponse& response, const DispatcherConfig& config)
      : request(transportRequest, config.maxRequestCacheBodySize),
        ctx(request, response,
            PhaseFromRequest(transportRequest.method(), transportRequest.header(http::XHttpMethodOverride)),
            config.caseSensitiveUrls ? std::string(transportRequest.path()) : ToLowerCopy(transportRequest.path())) {}

  CachedRequest request;
  ExecutionContext ctx;
};

namespace {

void Invoke(HandlerMatch& match, ExecutionContext& ctx) {
  ctx.bindRoute(match.entry->pattern.str(), std::move(match.params), std::move(match.splats));
  match.entry->handler(ctx);
}

}  // namespace

RequestDispatcher::RequestDispatcher(DispatcherConfig config)
    : _config(std::move(config)), _registry(_config.caseSensitiveUrls), _finalizer(_config) {
  _config.validate();
}

void RequestDispatcher::dispatch(ServerRequest& request, ServerResponse& response) const {
  auto state = std::make_shared<RequestState>(request, response, _config);
  ExecutionContext& ctx = state->ctx;

  ctx.header(http::Server, _config.serverHeader);
  ctx.contentType(_config.defaultContentType);

  runBeforeAndEndpointHandlers(*state);

  AsyncResult* pending = ctx.asyncResult();
  if (pending == nullptr) {
    finishRequest(ctx, response);
    return;
  }

  log::debug("{} {} suspended until its asynchronous result is available", ctx.method(), ctx.path());
  std::shared_ptr<AsyncExchange> exchange = state->request.startAsync(response);
  AsyncResult pendingHandle = *pending;
  // the continuation owns the request state, the context must not own the continuation back
  ctx.clearResult();
  pendingHandle.then([this, state = std::move(state), exchange = std::move(exchange)](AsyncResult::Value value,
                                                                                       std::exception_ptr error) {
    completeAsync(*state, *exchange, std::move(value), std::move(error));
  });
}

void RequestDispatcher::runBeforeAndEndpointHandlers(RequestState& state) const {
  ExecutionContext& ctx = state.ctx;
  _exceptionMapper.catchException(ctx, [this, &state, &ctx] {
    const auto phase = ctx.phase();
    const auto path = ctx.normalizedPath();

    for (HandlerMatch& match : _registry.findEntries(HandlerPhase::BEFORE, path)) {
      Invoke(match, ctx);
    }

    auto endpoints = _registry.findEntries(phase, path);
    if (!endpoints.empty()) {
      Invoke(endpoints.front(), ctx);
      return;
    }

    if (phase == HandlerPhase::HEAD && _registry.hasEntries(HandlerPhase::GET, path)) {
      // a GET binding answers HEAD requests with an empty body
      return;
    }

    if (phase == HandlerPhase::GET || phase == HandlerPhase::HEAD) {
      if (_staticResolver && _staticResolver(state.request, ctx.response())) {
        return;
      }
      if (_singlePageHandler.handle(ctx)) {
        return;
      }
    }

    const http::MethodBmp availableMethods = _registry.availableMethods(path);
    if (_config.prefer405over404 && availableMethods != 0) {
      ctx.header(http::Allow, http::MethodBmpToStr(availableMethods));
      throw MethodNotAllowedResponse(availableMethods);
    }
    throw NotFoundResponse();
  });
}

void RequestDispatcher::runStatusHandlers(ExecutionContext& ctx) const {
  _exceptionMapper.catchException(ctx, [this, &ctx] { _errorMapper.handle(ctx.status(), ctx); });
}

void RequestDispatcher::runAfterHandlers(ExecutionContext& ctx) const {
  _exceptionMapper.catchException(ctx, [this, &ctx] {
    for (HandlerMatch& match : _registry.findEntries(HandlerPhase::AFTER, ctx.normalizedPath())) {
      Invoke(match, ctx);
    }
  });
}

void RequestDispatcher::finishRequest(ExecutionContext& ctx, ServerResponse& sink) const {
  runStatusHandlers(ctx);
  runAfterHandlers(ctx);
  const auto outcome = _finalizer.finalize(ctx, sink);
  log::debug("{} {} finalized: {}", ctx.method(), ctx.path(), OutcomeToStr(outcome));
  logRequest(ctx);
}

void RequestDispatcher::completeAsync(RequestState& state, AsyncExchange& exchange, AsyncResult::Value value,
                                      std::exception_ptr error) const {
  ExecutionContext& ctx = state.ctx;
  if (error) {
    ctx.clearResult();
    _exceptionMapper.handle(error, ctx);
  } else if (auto* str = std::get_if<std::string>(&value)) {
    ctx.result(std::move(*str));
  } else if (auto* stream = std::get_if<ResultStream>(&value)) {
    ctx.result(std::move(*stream));
  } else {
    // opaque payload, no bytes to write
    ctx.clearResult();
  }

  try {
    finishRequest(ctx, exchange.response());
  } catch (const std::exception& ex) {
    log::error("Unable to write asynchronous response of {} {}: {}", ctx.method(), ctx.path(), ex.what());
    exchange.complete();
    throw;
  }
  exchange.complete();
}

void RequestDispatcher::logRequest(const ExecutionContext& ctx) const {
  const float elapsedMillis = ctx.elapsedMillis();
  try {
    if (_requestLogger) {
      _requestLogger(ctx, elapsedMillis);
    } else if (_config.debugLogging) {
      LogRequestAndResponse(ctx, _registry, elapsedMillis);
    }
  } catch (const std::exception& ex) {
    log::error("Request logger failed for {} {}: {}", ctx.method(), ctx.path(), ex.what());
  }
}

}  // namespace halyard
