#include "halyard/gzip-output-stream.hpp"

#include <stdexcept>
#include <string_view>

#include "halyard/compression-config.hpp"
#include "halyard/server-response.hpp"
#include "halyard/zlib-encoder.hpp"

namespace halyard {

GzipOutputStream::GzipOutputStream(ServerResponse& sink, const CompressionConfig& config)
    : _sink(&sink), _encoder(config) {}

void GzipOutputStream::write(std::string_view data) {
  if (_encoder.finished()) {
    throw std::logic_error("Cannot write to a closed gzip stream");
  }
  if (data.empty()) {
    // an empty chunk would finish the encoder
    return;
  }
  const std::string_view compressed = _encoder.encodeChunk(data);
  if (!compressed.empty()) {
    _sink->write(compressed);
  }
}

void GzipOutputStream::close() {
  if (_encoder.finished()) {
    return;
  }
  const std::string_view trailer = _encoder.encodeChunk({});
  if (!trailer.empty()) {
    _sink->write(trailer);
  }
}

}  // namespace halyard
