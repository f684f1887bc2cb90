#pragma once

#include <exception>
#include <functional>
#include <utility>
#include <vector>

#include "halyard/execution-context.hpp"
#include "halyard/http-exception.hpp"

namespace halyard {

// Fault boundary of the dispatcher: converts any exception raised by handlers into a response
// (status and body set on the context). Nothing escapes it.
//
// User mappings registered with on<E>() are tried in registration order, the first one whose
// type matches the exception wins. Without a matching mapping:
//  - HttpResponseException: its status and message (and details) are rendered, as JSON when the
//    request accepts application/json, as plain text otherwise.
//  - any other exception: logged at error level and rendered as 500 Internal server error.
// A user mapping throwing itself is logged and falls back to the 500 rendering.
class ExceptionMapper {
 public:
  template <class E>
  using ExceptionHandler = std::function<void(const E&, ExecutionContext&)>;

  template <class E>
  ExceptionMapper& on(ExceptionHandler<E> handler) {
    _handlers.push_back([handler = std::move(handler)](const std::exception_ptr& eptr, ExecutionContext& ctx) {
      try {
        std::rethrow_exception(eptr);
      } catch (const E& ex) {
        handler(ex, ctx);
        return true;
      } catch (...) {
        // not an E, let the next mapping try
        return false;
      }
    });
    return *this;
  }

  // Runs 'func', mapping any exception it throws to 'ctx'.
  template <class Func>
  void catchException(ExecutionContext& ctx, Func&& func) const noexcept {
    try {
      std::forward<Func>(func)();
    } catch (...) {
      handle(std::current_exception(), ctx);
    }
  }

  // Maps exception 'eptr' to 'ctx'.
  void handle(const std::exception_ptr& eptr, ExecutionContext& ctx) const noexcept;

  // Default rendering of an HttpResponseException, used when no user mapping applies.
  static void RenderHttpResponseException(const HttpResponseException& ex, ExecutionContext& ctx);

 private:
  // Returns true if the exception was handled.
  using TypedHandler = std::function<bool(const std::exception_ptr&, ExecutionContext&)>;

  static void HandleDefault(const std::exception_ptr& eptr, ExecutionContext& ctx) noexcept;

  std::vector<TypedHandler> _handlers;
};

}  // namespace halyard
