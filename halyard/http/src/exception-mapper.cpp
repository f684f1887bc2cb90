#include "halyard/exception-mapper.hpp"

#include <exception>
#include <string>

#include "halyard/execution-context.hpp"
#include "halyard/http-constants.hpp"
#include "halyard/http-exception.hpp"
#include "halyard/json-escape.hpp"
#include "halyard/log.hpp"
#include "halyard/string-equal-ignore-case.hpp"

namespace halyard {

namespace {

bool AcceptsJson(const ExecutionContext& ctx) {
  const auto accept = ctx.header(http::Accept);
  return accept && ContainsCaseInsensitive(*accept, http::ContentTypeApplicationJson);
}

std::string BuildJsonBody(const HttpResponseException& ex) {
  std::string body("{\"title\":\"");
  AppendJsonEscaped(ex.what(), body);
  body.append("\",\"status\":");
  body.append(std::to_string(ex.status()));
  body.append(",\"type\":\"");
  AppendJsonEscaped(ex.type(), body);
  body.append("\",\"details\":{");
  bool first = true;
  for (const auto& [key, value] : ex.details()) {
    if (!first) {
      body.push_back(',');
    }
    first = false;
    body.push_back('"');
    AppendJsonEscaped(key, body);
    body.append("\":\"");
    AppendJsonEscaped(value, body);
    body.push_back('"');
  }
  body.append("}}");
  return body;
}

// "<message>" or "<message> [key1: value1, key2: value2]"
std::string BuildTextBody(const HttpResponseException& ex) {
  std::string body(ex.what());
  if (!ex.details().empty()) {
    body.append(" [");
    bool first = true;
    for (const auto& [key, value] : ex.details()) {
      if (!first) {
        body.append(", ");
      }
      first = false;
      body.append(key);
      body.append(": ");
      body.append(value);
    }
    body.push_back(']');
  }
  return body;
}

}  // namespace

void ExceptionMapper::handle(const std::exception_ptr& eptr, ExecutionContext& ctx) const noexcept {
  for (const TypedHandler& handler : _handlers) {
    try {
      if (handler(eptr, ctx)) {
        return;
      }
    } catch (const std::exception& ex) {
      log::warn("Exception handler threw {}", ex.what());
      HandleDefault(std::make_exception_ptr(InternalServerErrorResponse()), ctx);
      return;
    } catch (...) {
      log::warn("Exception handler threw an unknown exception");
      HandleDefault(std::make_exception_ptr(InternalServerErrorResponse()), ctx);
      return;
    }
  }
  HandleDefault(eptr, ctx);
}

void ExceptionMapper::RenderHttpResponseException(const HttpResponseException& ex, ExecutionContext& ctx) {
  ctx.status(ex.status());
  if (AcceptsJson(ctx)) {
    ctx.json(BuildJsonBody(ex));
  } else {
    ctx.result(BuildTextBody(ex));
  }
}

void ExceptionMapper::HandleDefault(const std::exception_ptr& eptr, ExecutionContext& ctx) noexcept {
  try {
    try {
      std::rethrow_exception(eptr);
    } catch (const HttpResponseException& ex) {
      RenderHttpResponseException(ex, ctx);
    } catch (const std::exception& ex) {
      log::error("Uncaught exception while handling {} {}: {}", ctx.method(), ctx.path(), ex.what());
      RenderHttpResponseException(InternalServerErrorResponse(), ctx);
    } catch (...) {
      log::error("Uncaught unknown exception while handling {} {}", ctx.method(), ctx.path());
      RenderHttpResponseException(InternalServerErrorResponse(), ctx);
    }
  } catch (const std::exception& ex) {
    log::critical("Unable to render error response for {} {}: {}", ctx.method(), ctx.path(), ex.what());
  }
}

}  // namespace halyard
