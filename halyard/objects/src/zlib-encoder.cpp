#include "halyard/zlib-encoder.hpp"

#include <cstddef>
#include <span>
#include <string_view>

#include "halyard/compression-config.hpp"
#include "halyard/gzip-deflate-stream.hpp"

namespace halyard {

ZlibEncoderContext::ZlibEncoderContext(const CompressionConfig& config)
    : _encoderChunkSize(config.encoderChunkSize), _deflater(config.zlib.level) {}

std::string_view ZlibEncoderContext::encodeChunk(std::string_view chunk) {
  _buf.clear();
  if (_finished) {
    return _buf;
  }

  const bool finish = chunk.empty();
  while (true) {
    const std::size_t oldSize = _buf.size();
    _buf.resize(oldSize + _encoderChunkSize);

    const auto step = _deflater.deflateInto(chunk, std::span<char>(_buf.data() + oldSize, _encoderChunkSize), finish);
    _buf.resize(oldSize + step.produced);

    if (step.ended) {
      _finished = true;
      break;
    }
    // a partially filled output buffer means deflate has nothing more to give for now
    if (chunk.empty() && !finish && step.produced < _encoderChunkSize) {
      break;
    }
  }

  return _buf;
}

}  // namespace halyard
