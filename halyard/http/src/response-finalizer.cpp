#include "halyard/response-finalizer.hpp"

#include <zconf.h>
#include <zlib.h>

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "halyard/execution-context.hpp"
#include "halyard/gzip-output-stream.hpp"
#include "halyard/handler-phase.hpp"
#include "halyard/http-constants.hpp"
#include "halyard/http-status-code.hpp"
#include "halyard/log.hpp"
#include "halyard/result-stream.hpp"
#include "halyard/server-response.hpp"
#include "halyard/string-equal-ignore-case.hpp"

namespace halyard {

namespace {
constexpr std::size_t kCopyBufferSize = 8192;
}  // namespace

std::string ResponseFinalizer::ComputeETag(ResultStream& stream) {
  std::array<char, kCopyBufferSize> buf;
  uLong checksum = adler32(0L, Z_NULL, 0);
  for (std::size_t nbRead = stream.read(buf); nbRead != 0; nbRead = stream.read(buf)) {
    checksum = adler32(checksum, reinterpret_cast<const Bytef*>(buf.data()), static_cast<uInt>(nbRead));
  }
  stream.reset();
  return std::to_string(checksum);
}

bool ResponseFinalizer::shouldGzip(const ExecutionContext& ctx, const ResultStream& stream) const {
  if (!_dynamicGzip || stream.available() <= _compression.minBytes) {
    return false;
  }
  const auto acceptEncoding = ctx.header(http::AcceptEncoding);
  return acceptEncoding && ContainsCaseInsensitive(*acceptEncoding, http::gzip);
}

ResponseFinalizer::Outcome ResponseFinalizer::finalize(ExecutionContext& ctx, ServerResponse& sink) const {
  if (sink.isCommitted()) {
    return Outcome::AlreadyCommitted;
  }
  ResultStream* stream = ctx.resultStream();
  if (stream == nullptr || !stream->isOpen()) {
    return Outcome::NothingToWrite;
  }

  const auto explicitEtag = sink.header(http::ETag);
  if (explicitEtag || (_autogeneratedEtags && ctx.phase() == HandlerPhase::GET)) {
    const std::string serverEtag = explicitEtag ? std::string(*explicitEtag) : ComputeETag(*stream);
    sink.setHeader(http::ETag, serverEtag);
    const auto ifNoneMatch = ctx.header(http::IfNoneMatch);
    if (ifNoneMatch && *ifNoneMatch == serverEtag) {
      log::debug("ETag {} matches If-None-Match, replying 304", serverEtag);
      sink.setStatus(http::StatusCodeNotModified);
      stream->close();
      sink.commit();
      return Outcome::NotModified;
    }
  }

  std::array<char, kCopyBufferSize> buf;
  if (shouldGzip(ctx, *stream)) {
    sink.setHeader(http::ContentEncoding, http::gzip);
    if (_compression.addVaryHeader) {
      sink.addHeader(http::Vary, http::AcceptEncoding);
    }
    GzipOutputStream gzipStream(sink, _compression);
    for (std::size_t nbRead = stream->read(buf); nbRead != 0; nbRead = stream->read(buf)) {
      gzipStream.write(std::string_view(buf.data(), nbRead));
    }
    gzipStream.close();
    stream->close();
    sink.commit();
    return Outcome::WrittenGzip;
  }

  for (std::size_t nbRead = stream->read(buf); nbRead != 0; nbRead = stream->read(buf)) {
    sink.write(std::string_view(buf.data(), nbRead));
  }
  stream->close();
  sink.commit();
  return Outcome::Written;
}

std::string_view OutcomeToStr(ResponseFinalizer::Outcome outcome) noexcept {
  switch (outcome) {
    case ResponseFinalizer::Outcome::AlreadyCommitted:
      return "already-committed";
    case ResponseFinalizer::Outcome::NothingToWrite:
      return "nothing-to-write";
    case ResponseFinalizer::Outcome::NotModified:
      return "not-modified";
    case ResponseFinalizer::Outcome::Written:
      return "written";
    case ResponseFinalizer::Outcome::WrittenGzip:
      return "written-gzip";
    default:
      return "unknown";
  }
}

}  // namespace halyard
