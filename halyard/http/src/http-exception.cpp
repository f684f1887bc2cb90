#include "halyard/http-exception.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "halyard/http-method.hpp"
#include "halyard/http-status-code.hpp"

namespace halyard {

HttpResponseException::HttpResponseException(http::StatusCode status, std::string_view message, Details details,
                                             std::string_view type)
    : std::runtime_error(std::string(message)), _details(std::move(details)), _type(type), _status(status) {}

MethodNotAllowedResponse::MethodNotAllowedResponse(http::MethodBmp allowedMethods, std::string_view message)
    : HttpResponseException(http::StatusCodeMethodNotAllowed, message,
                            Details{{"availableMethods", http::MethodBmpToStr(allowedMethods)}},
                            "method-not-allowed"),
      _allowedMethods(allowedMethods) {}

}  // namespace halyard
