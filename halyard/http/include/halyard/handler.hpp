#pragma once

#include <functional>

namespace halyard {

class ExecutionContext;

// User handler, invoked for before, endpoint, after and status phases.
// Throwing from a handler is the way to report failures: the dispatcher maps them to a response.
using Handler = std::function<void(ExecutionContext&)>;

// Called once at the end of each request lifecycle with the total elapsed time in milliseconds.
using RequestLogger = std::function<void(const ExecutionContext&, float)>;

}  // namespace halyard
