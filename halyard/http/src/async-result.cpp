#include "halyard/async-result.hpp"

#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "halyard/log.hpp"

namespace halyard {

AsyncResult::State::~State() {
  if (!continuation) {
    return;
  }
  log::warn("AsyncResult destroyed before completion, running its continuation with an error");
  try {
    continuation({}, std::make_exception_ptr(AsyncResultAbandoned()));
  } catch (const std::exception& ex) {
    log::error("Continuation of an abandoned AsyncResult failed: {}", ex.what());
  }
}

AsyncResult::AsyncResult() : _state(std::make_shared<State>()) {}

void AsyncResult::resolve(Value value) { complete(std::move(value), nullptr); }

void AsyncResult::reject(std::exception_ptr error) {
  if (!error) {
    throw std::invalid_argument("AsyncResult cannot be rejected with a null exception");
  }
  complete({}, std::move(error));
}

void AsyncResult::complete(Value value, std::exception_ptr error) {
  Continuation continuation;
  {
    std::lock_guard<std::mutex> lock(_state->mutex);
    if (_state->done) {
      throw std::logic_error("AsyncResult already completed");
    }
    _state->done = true;
    if (!_state->continuation) {
      _state->value = std::move(value);
      _state->error = std::move(error);
      return;
    }
    continuation = std::move(_state->continuation);
  }
  continuation(std::move(value), std::move(error));
}

void AsyncResult::then(Continuation continuation) {
  Value value;
  std::exception_ptr error;
  {
    std::lock_guard<std::mutex> lock(_state->mutex);
    if (_state->continuationAttached) {
      throw std::logic_error("AsyncResult continuation already attached");
    }
    _state->continuationAttached = true;
    if (!_state->done) {
      _state->continuation = std::move(continuation);
      return;
    }
    value = std::move(_state->value);
    error = std::move(_state->error);
  }
  continuation(std::move(value), std::move(error));
}

bool AsyncResult::isDone() const {
  std::lock_guard<std::mutex> lock(_state->mutex);
  return _state->done;
}

}  // namespace halyard
