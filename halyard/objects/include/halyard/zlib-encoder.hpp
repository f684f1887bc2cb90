#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "halyard/compression-config.hpp"
#include "halyard/gzip-deflate-stream.hpp"

namespace halyard {

// Stateful streaming gzip compressor.
// Lifecycle: encodeChunk(data)* -> encodeChunk({}) (finish) -> destroy.
// Not thread-safe, confined to a single response.
class ZlibEncoderContext {
 public:
  explicit ZlibEncoderContext(const CompressionConfig& config);

  // Streaming chunk encoder. If 'chunk' is empty, it will be considered as a finish.
  // Returned view is valid until the next call.
  // Throws std::runtime_error on zlib streaming error.
  std::string_view encodeChunk(std::string_view chunk);

  [[nodiscard]] bool finished() const noexcept { return _finished; }

 private:
  std::string _buf;
  std::size_t _encoderChunkSize;
  GzipDeflateStream _deflater;
  bool _finished{false};
};

}  // namespace halyard
