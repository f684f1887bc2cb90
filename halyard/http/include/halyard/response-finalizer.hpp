#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "halyard/compression-config.hpp"
#include "halyard/dispatcher-config.hpp"
#include "halyard/execution-context.hpp"
#include "halyard/result-stream.hpp"
#include "halyard/server-response.hpp"

namespace halyard {

// Output stage of a request: writes the context result to the response sink, at most once.
//
// Steps, in order:
//  1. nothing happens if the sink is already committed or the result is not an immediate stream.
//  2. conditional GET: when the response has an explicit ETag, or auto ETags are enabled for a GET
//     request, the ETag header is set (computed as a checksum of the result if needed). If it equals
//     the request If-None-Match value, the status becomes 304 and no body is written.
//  3. the result is gzip compressed when dynamic compression is enabled, its remaining size is
//     strictly greater than the configured threshold and the request Accept-Encoding contains "gzip".
//  4. otherwise the result is copied as is.
// The result stream is closed and the sink committed afterwards.
// Write and compression failures propagate (std::runtime_error).
class ResponseFinalizer {
 public:
  enum class Outcome : std::uint8_t { AlreadyCommitted, NothingToWrite, NotModified, Written, WrittenGzip };

  explicit ResponseFinalizer(const DispatcherConfig& config)
      : _compression(config.compression),
        _dynamicGzip(config.dynamicGzip),
        _autogeneratedEtags(config.autogeneratedEtags) {}

  Outcome finalize(ExecutionContext& ctx, ServerResponse& sink) const;

  // Checksum of the remaining bytes of 'stream' (decimal Adler-32), which is rewound afterwards.
  [[nodiscard]] static std::string ComputeETag(ResultStream& stream);

 private:
  [[nodiscard]] bool shouldGzip(const ExecutionContext& ctx, const ResultStream& stream) const;

  CompressionConfig _compression;
  bool _dynamicGzip;
  bool _autogeneratedEtags;
};

[[nodiscard]] std::string_view OutcomeToStr(ResponseFinalizer::Outcome outcome) noexcept;

}  // namespace halyard
