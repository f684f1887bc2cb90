#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "halyard/http-method.hpp"
#include "halyard/http-status-code.hpp"

namespace halyard {

// Exception carrying the HTTP status (and optional details) of the response it should produce.
// Throwing it from a handler lets the ExceptionMapper render it, unless a user mapping intercepts it.
class HttpResponseException : public std::runtime_error {
 public:
  // Ordered (key, value) pairs appended to the rendered error.
  using Details = std::vector<std::pair<std::string, std::string>>;

  HttpResponseException(http::StatusCode status, std::string_view message, Details details = {},
                        std::string_view type = "about:blank");

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] const Details& details() const noexcept { return _details; }

  // Short identifier of the error kind, emitted as the 'type' member of JSON error bodies.
  [[nodiscard]] std::string_view type() const noexcept { return _type; }

 private:
  Details _details;
  std::string _type;
  http::StatusCode _status;
};

class BadRequestResponse : public HttpResponseException {
 public:
  explicit BadRequestResponse(std::string_view message = "Bad request", Details details = {})
      : HttpResponseException(http::StatusCodeBadRequest, message, std::move(details), "bad-request") {}
};

class UnauthorizedResponse : public HttpResponseException {
 public:
  explicit UnauthorizedResponse(std::string_view message = "Unauthorized", Details details = {})
      : HttpResponseException(http::StatusCodeUnauthorized, message, std::move(details), "unauthorized") {}
};

class ForbiddenResponse : public HttpResponseException {
 public:
  explicit ForbiddenResponse(std::string_view message = "Forbidden", Details details = {})
      : HttpResponseException(http::StatusCodeForbidden, message, std::move(details), "forbidden") {}
};

class NotFoundResponse : public HttpResponseException {
 public:
  explicit NotFoundResponse(std::string_view message = "Not found", Details details = {})
      : HttpResponseException(http::StatusCodeNotFound, message, std::move(details), "not-found") {}
};

// Raised by the dispatcher when the path is bound for other methods only.
// Its details hold 'availableMethods', the comma separated list of allowed methods.
class MethodNotAllowedResponse : public HttpResponseException {
 public:
  explicit MethodNotAllowedResponse(http::MethodBmp allowedMethods, std::string_view message = "Method not allowed");

  [[nodiscard]] http::MethodBmp allowedMethods() const noexcept { return _allowedMethods; }

 private:
  http::MethodBmp _allowedMethods;
};

class ConflictResponse : public HttpResponseException {
 public:
  explicit ConflictResponse(std::string_view message = "Conflict", Details details = {})
      : HttpResponseException(http::StatusCodeConflict, message, std::move(details), "conflict") {}
};

class GoneResponse : public HttpResponseException {
 public:
  explicit GoneResponse(std::string_view message = "Gone", Details details = {})
      : HttpResponseException(http::StatusCodeGone, message, std::move(details), "gone") {}
};

class InternalServerErrorResponse : public HttpResponseException {
 public:
  explicit InternalServerErrorResponse(std::string_view message = "Internal server error", Details details = {})
      : HttpResponseException(http::StatusCodeInternalServerError, message, std::move(details),
                              "internal-server-error") {}
};

class ServiceUnavailableResponse : public HttpResponseException {
 public:
  explicit ServiceUnavailableResponse(std::string_view message = "Service unavailable", Details details = {})
      : HttpResponseException(http::StatusCodeServiceUnavailable, message, std::move(details),
                              "service-unavailable") {}
};

}  // namespace halyard
