#include "halyard/request-log.hpp"

#include <fmt/format.h>

#include <string>
#include <string_view>

#include "halyard/execution-context.hpp"
#include "halyard/handler-phase.hpp"
#include "halyard/handler-registry.hpp"
#include "halyard/log.hpp"
#include "halyard/server-request.hpp"

namespace halyard {

namespace {

void AppendHeaders(const HeaderViews& headers, std::string& out) {
  out.push_back('{');
  bool first = true;
  for (const auto& [name, value] : headers) {
    if (!first) {
      out.append(", ");
    }
    first = false;
    out.append(name);
    out.push_back('=');
    out.append(value);
  }
  out.push_back('}');
}

std::string_view ResultKindToStr(ExecutionContext::ResultKind kind) {
  switch (kind) {
    case ExecutionContext::ResultKind::None:
      return "No body was set";
    case ExecutionContext::ResultKind::Stream:
      return "Body is streamed";
    case ExecutionContext::ResultKind::Async:
      return "Body is async";
    default:
      return "Unknown body";
  }
}

}  // namespace

std::string DescribeRequestAndResponse(const ExecutionContext& ctx, const HandlerRegistry& registry,
                                       float elapsedMillis) {
  std::string out("REQUEST DEBUG LOG:\n");
  out.append(fmt::format("Request: {} [{}]\n", ctx.method(), ctx.path()));

  out.append("    Matching endpoint-handlers: [");
  bool first = true;
  for (const HandlerMatch& match : registry.findEntries(ctx.phase(), ctx.normalizedPath())) {
    if (!first) {
      out.append(", ");
    }
    first = false;
    out.append(HandlerPhaseToStr(match.entry->phase));
    out.push_back('=');
    out.append(match.entry->pattern.str());
  }
  out.append("]\n");

  out.append("    Headers: ");
  AppendHeaders(ctx.request().headers(), out);
  out.push_back('\n');
  out.append(fmt::format("    Body: {}\n", ctx.body()));

  out.append(fmt::format("Response: [{}], execution took {:.2f} ms\n", ctx.status(), elapsedMillis));
  out.append("    Headers: ");
  AppendHeaders(ctx.response().headers(), out);
  out.push_back('\n');
  out.append("    ");
  out.append(ResultKindToStr(ctx.resultKind()));
  return out;
}

void LogRequestAndResponse(const ExecutionContext& ctx, const HandlerRegistry& registry, float elapsedMillis) {
  log::info("{}", DescribeRequestAndResponse(ctx, registry, elapsedMillis));
}

}  // namespace halyard
