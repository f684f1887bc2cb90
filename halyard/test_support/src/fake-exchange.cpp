#include "halyard/fake-exchange.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "halyard/http-status-code.hpp"
#include "halyard/server-request.hpp"
#include "halyard/server-response.hpp"
#include "halyard/string-equal-ignore-case.hpp"

namespace halyard::test {

namespace {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

std::optional<std::string_view> FindHeader(const HeaderList& headers, std::string_view name) {
  const auto it = std::ranges::find_if(
      headers, [name](const auto& nameValue) { return CaseInsensitiveEqual(nameValue.first, name); });
  if (it == headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

HeaderViews ToViews(const HeaderList& headers) {
  HeaderViews ret;
  ret.reserve(headers.size());
  for (const auto& [name, value] : headers) {
    ret.emplace_back(name, value);
  }
  return ret;
}

}  // namespace

void FakeResponse::setStatus(http::StatusCode statusCode) {
  if (!_committed) {
    _status = statusCode;
  }
}

void FakeResponse::setHeader(std::string_view name, std::string_view value) {
  if (_committed) {
    return;
  }
  // 'value' may point into an existing header value
  std::string valueStr(value);
  std::erase_if(_headers, [name](const auto& nameValue) { return CaseInsensitiveEqual(nameValue.first, name); });
  _headers.emplace_back(std::string(name), std::move(valueStr));
}

void FakeResponse::addHeader(std::string_view name, std::string_view value) {
  if (!_committed) {
    _headers.emplace_back(std::string(name), std::string(value));
  }
}

std::optional<std::string_view> FakeResponse::header(std::string_view name) const { return FindHeader(_headers, name); }

HeaderViews FakeResponse::headers() const { return ToViews(_headers); }

void FakeResponse::write(std::string_view data) {
  if (_failWrites) {
    throw std::runtime_error("Simulated write failure");
  }
  _committed = true;
  ++_nbWrites;
  _body.append(data);
}

std::vector<std::string> FakeResponse::headerValues(std::string_view name) const {
  std::vector<std::string> values;
  for (const auto& [headerName, value] : _headers) {
    if (CaseInsensitiveEqual(headerName, name)) {
      values.push_back(value);
    }
  }
  return values;
}

void FakeAsyncExchange::complete() {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    ++_nbCompletions;
  }
  _cv.notify_all();
}

bool FakeAsyncExchange::waitForCompletion(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(_mutex);
  return _cv.wait_for(lock, timeout, [this] { return _nbCompletions != 0; });
}

int FakeAsyncExchange::nbCompletions() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _nbCompletions;
}

FakeRequest& FakeRequest::withHeader(std::string_view name, std::string_view value) {
  _headers.emplace_back(std::string(name), std::string(value));
  return *this;
}

FakeRequest& FakeRequest::withBody(std::string_view body) {
  _body = body;
  return *this;
}

std::optional<std::string_view> FakeRequest::header(std::string_view name) const { return FindHeader(_headers, name); }

HeaderViews FakeRequest::headers() const { return ToViews(_headers); }

std::string FakeRequest::readBody() {
  ++_nbBodyReads;
  if (_bodyConsumed) {
    return {};
  }
  _bodyConsumed = true;
  return _body;
}

std::shared_ptr<AsyncExchange> FakeRequest::startAsync(ServerResponse& response) {
  if (_exchange) {
    throw std::logic_error("Exchange already suspended");
  }
  _exchange = std::make_shared<FakeAsyncExchange>(response);
  return _exchange;
}

}  // namespace halyard::test
