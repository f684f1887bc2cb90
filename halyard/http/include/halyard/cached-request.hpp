#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "halyard/server-request.hpp"

namespace halyard {

// Wraps a transport request so that its body can be read several times.
// The body is pulled from the transport on first access and kept in memory when its size does not
// exceed 'maxCachedBodySize'. A larger body is returned once and not retained.
class CachedRequest final : public ServerRequest {
 public:
  CachedRequest(ServerRequest& request, std::size_t maxCachedBodySize) noexcept
      : _request(&request), _maxCachedBodySize(maxCachedBodySize) {}

  [[nodiscard]] std::string_view method() const override { return _request->method(); }

  [[nodiscard]] std::string_view path() const override { return _request->path(); }

  [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const override {
    return _request->header(name);
  }

  [[nodiscard]] HeaderViews headers() const override { return _request->headers(); }

  std::string readBody() override;

  std::shared_ptr<AsyncExchange> startAsync(ServerResponse& response) override {
    return _request->startAsync(response);
  }

  // Tells whether the body has been read and retained in memory.
  [[nodiscard]] bool isBodyCached() const noexcept { return _bodyCached; }

  [[nodiscard]] ServerRequest& underlying() const noexcept { return *_request; }

 private:
  ServerRequest* _request;
  std::size_t _maxCachedBodySize;
  std::string _body;
  bool _bodyRead{false};
  bool _bodyCached{false};
};

}  // namespace halyard
