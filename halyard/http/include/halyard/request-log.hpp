#pragma once

#include <string>

#include "halyard/execution-context.hpp"
#include "halyard/handler-registry.hpp"

namespace halyard {

// Multi-line description of a completed request and its response, for debug logging.
[[nodiscard]] std::string DescribeRequestAndResponse(const ExecutionContext& ctx, const HandlerRegistry& registry,
                                                     float elapsedMillis);

// Logs DescribeRequestAndResponse() at info level.
void LogRequestAndResponse(const ExecutionContext& ctx, const HandlerRegistry& registry, float elapsedMillis);

}  // namespace halyard
