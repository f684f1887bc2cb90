#pragma once

#include <string_view>

#include "halyard/compression-config.hpp"
#include "halyard/server-response.hpp"
#include "halyard/zlib-encoder.hpp"

namespace halyard {

// Gzip encoding adapter in front of a response sink.
// Compressed bytes are forwarded to the sink as they are produced. close() emits the gzip trailer:
// it must be called for the output to be a complete gzip member.
class GzipOutputStream {
 public:
  GzipOutputStream(ServerResponse& sink, const CompressionConfig& config);

  GzipOutputStream(const GzipOutputStream&) = delete;
  GzipOutputStream(GzipOutputStream&&) noexcept = delete;
  GzipOutputStream& operator=(const GzipOutputStream&) = delete;
  GzipOutputStream& operator=(GzipOutputStream&&) noexcept = delete;

  ~GzipOutputStream() = default;

  // Compresses 'data'. Throws std::runtime_error on compression or write failure, std::logic_error if closed.
  void write(std::string_view data);

  // Flushes the remaining compressed bytes and the trailer. Idempotent.
  void close();

  [[nodiscard]] bool isClosed() const noexcept { return _encoder.finished(); }

 private:
  ServerResponse* _sink;
  ZlibEncoderContext _encoder;
};

}  // namespace halyard
