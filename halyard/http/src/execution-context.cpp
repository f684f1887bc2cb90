#include "halyard/execution-context.hpp"

#include <any>
#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "halyard/async-result.hpp"
#include "halyard/handler-phase.hpp"
#include "halyard/http-constants.hpp"
#include "halyard/http-status-code.hpp"
#include "halyard/path-pattern.hpp"
#include "halyard/result-stream.hpp"
#include "halyard/server-request.hpp"
#include "halyard/server-response.hpp"
#include "halyard/timedef.hpp"

namespace halyard {

ExecutionContext::ExecutionContext(ServerRequest& request, ServerResponse& response, HandlerPhase phase,
                                   std::string normalizedPath)
    : _request(&request),
      _response(&response),
      _normalizedPath(std::move(normalizedPath)),
      _startTime(SteadyClock::now()),
      _phase(phase) {}

std::string_view ExecutionContext::pathParam(std::string_view name) const {
  const auto it = _pathParams.find(name);
  if (it == _pathParams.end()) {
    throw std::invalid_argument("'" + std::string(name) + "' is not a valid path parameter for '" + _matchedPath +
                                "'");
  }
  return it->second;
}

std::optional<std::string_view> ExecutionContext::splat(std::size_t idx) const {
  if (idx >= _splats.size()) {
    return std::nullopt;
  }
  return _splats[idx];
}

void ExecutionContext::attribute(std::string_view key, std::any value) {
  auto it = _attributes.find(key);
  if (it == _attributes.end()) {
    _attributes.emplace(std::string(key), std::move(value));
  } else {
    it->second = std::move(value);
  }
}

const std::any* ExecutionContext::attribute(std::string_view key) const {
  const auto it = _attributes.find(key);
  return it == _attributes.end() ? nullptr : &it->second;
}

ExecutionContext& ExecutionContext::status(http::StatusCode statusCode) {
  _response->setStatus(statusCode);
  return *this;
}

ExecutionContext& ExecutionContext::header(std::string_view name, std::string_view value) {
  _response->setHeader(name, value);
  return *this;
}

ExecutionContext& ExecutionContext::contentType(std::string_view value) {
  _response->setHeader(http::ContentType, value);
  return *this;
}

std::optional<std::string_view> ExecutionContext::contentType() const { return _response->header(http::ContentType); }

ExecutionContext& ExecutionContext::result(std::string data) {
  _result = ResultStream::FromString(std::move(data));
  return *this;
}

ExecutionContext& ExecutionContext::result(ResultStream stream) {
  _result = std::move(stream);
  return *this;
}

ExecutionContext& ExecutionContext::result(AsyncResult pending) {
  _result = std::move(pending);
  return *this;
}

ExecutionContext& ExecutionContext::html(std::string data) {
  contentType(http::ContentTypeTextHtml);
  return result(std::move(data));
}

ExecutionContext& ExecutionContext::json(std::string data) {
  contentType(http::ContentTypeApplicationJson);
  return result(std::move(data));
}

ExecutionContext& ExecutionContext::redirect(std::string_view location, http::StatusCode statusCode) {
  _response->setHeader(http::Location, location);
  return status(statusCode);
}

std::optional<std::string> ExecutionContext::resultString() {
  ResultStream* stream = resultStream();
  if (stream == nullptr) {
    return std::nullopt;
  }
  std::string ret = stream->readAll();
  stream->reset();
  return ret;
}

float ExecutionContext::elapsedMillis() const {
  return std::chrono::duration<float, std::milli>(SteadyClock::now() - _startTime).count();
}

void ExecutionContext::bindRoute(std::string_view matchedPath, PathParams params, std::vector<std::string> splats) {
  _matchedPath = matchedPath;
  _pathParams = std::move(params);
  _splats = std::move(splats);
}

}  // namespace halyard
