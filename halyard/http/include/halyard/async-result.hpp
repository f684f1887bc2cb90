#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <variant>

#include "halyard/result-stream.hpp"

namespace halyard {

// Error given to the continuation of an AsyncResult whose last copy was destroyed before completion.
class AsyncResultAbandoned : public std::runtime_error {
 public:
  AsyncResultAbandoned() : std::runtime_error("Pending value abandoned before completion") {}
};

// One-shot, thread-safe pending value installed as a result by a handler.
// Copies share the same state: the handler keeps one copy to resolve it later (from any thread),
// the dispatcher attaches the continuation to another.
class AsyncResult {
 public:
  // std::monostate stands for an opaque payload which carries no bytes.
  using Value = std::variant<std::monostate, std::string, ResultStream>;

  // Called exactly once with either a value or a non null exception.
  using Continuation = std::function<void(Value value, std::exception_ptr error)>;

  AsyncResult();

  // Fulfills the pending value. The continuation, if already attached, runs on the calling thread.
  // Throws std::logic_error if already resolved or rejected.
  void resolve(Value value);

  // Fails the pending value with 'error' (must not be null).
  // Throws std::logic_error if already resolved or rejected, std::invalid_argument if error is null.
  void reject(std::exception_ptr error);

  // Attaches the continuation. If the value is already available, it runs immediately on the calling thread.
  // If every copy is destroyed before completion, the continuation runs with an AsyncResultAbandoned error
  // on the thread releasing the last copy.
  // Throws std::logic_error if a continuation is already attached.
  void then(Continuation continuation);

  [[nodiscard]] bool isDone() const;

 private:
  struct State {
    State() = default;
    State(const State&) = delete;
    State& operator=(const State&) = delete;
    ~State();

    mutable std::mutex mutex;
    Value value;
    std::exception_ptr error;
    Continuation continuation;
    bool done{false};
    bool continuationAttached{false};
  };

  void complete(Value value, std::exception_ptr error);

  std::shared_ptr<State> _state;
};

}  // namespace halyard
