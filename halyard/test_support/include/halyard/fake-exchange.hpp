#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "halyard/http-status-code.hpp"
#include "halyard/server-request.hpp"
#include "halyard/server-response.hpp"

namespace halyard::test {

// In-memory response recording everything written to it.
class FakeResponse : public ServerResponse {
 public:
  void setStatus(http::StatusCode statusCode) override;

  [[nodiscard]] http::StatusCode status() const override { return _status; }

  void setHeader(std::string_view name, std::string_view value) override;

  void addHeader(std::string_view name, std::string_view value) override;

  [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const override;

  [[nodiscard]] HeaderViews headers() const override;

  // Throws std::runtime_error when failing writes were requested with failWrites().
  void write(std::string_view data) override;

  void commit() override { _committed = true; }

  [[nodiscard]] bool isCommitted() const override { return _committed; }

  // All the values of header 'name', in insertion order.
  [[nodiscard]] std::vector<std::string> headerValues(std::string_view name) const;

  [[nodiscard]] const std::string& body() const noexcept { return _body; }

  [[nodiscard]] std::size_t nbWrites() const noexcept { return _nbWrites; }

  void failWrites(bool on = true) noexcept { _failWrites = on; }

 private:
  std::vector<std::pair<std::string, std::string>> _headers;
  std::string _body;
  std::size_t _nbWrites{0};
  http::StatusCode _status{http::StatusCodeOK};
  bool _committed{false};
  bool _failWrites{false};
};

// Completion handle recording completion, which can be awaited from the test thread.
class FakeAsyncExchange : public AsyncExchange {
 public:
  explicit FakeAsyncExchange(ServerResponse& response) noexcept : _response(&response) {}

  [[nodiscard]] ServerResponse& response() override { return *_response; }

  void complete() override;

  // Waits until complete() has been called, returns false on timeout.
  bool waitForCompletion(std::chrono::milliseconds timeout);

  [[nodiscard]] int nbCompletions() const;

 private:
  ServerResponse* _response;
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  int _nbCompletions{0};
};

// In-memory request with a fluent builder.
class FakeRequest : public ServerRequest {
 public:
  FakeRequest(std::string_view method, std::string_view path) : _method(method), _path(path) {}

  FakeRequest& withHeader(std::string_view name, std::string_view value);

  FakeRequest& withBody(std::string_view body);

  [[nodiscard]] std::string_view method() const override { return _method; }

  [[nodiscard]] std::string_view path() const override { return _path; }

  [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const override;

  [[nodiscard]] HeaderViews headers() const override;

  std::string readBody() override;

  std::shared_ptr<AsyncExchange> startAsync(ServerResponse& response) override;

  // Exchange created by startAsync(), nullptr if the request was not suspended.
  [[nodiscard]] FakeAsyncExchange* exchange() const noexcept { return _exchange.get(); }

  [[nodiscard]] int nbBodyReads() const noexcept { return _nbBodyReads; }

 private:
  std::string _method;
  std::string _path;
  std::vector<std::pair<std::string, std::string>> _headers;
  std::string _body;
  std::shared_ptr<FakeAsyncExchange> _exchange;
  int _nbBodyReads{0};
  bool _bodyConsumed{false};
};

}  // namespace halyard::test
