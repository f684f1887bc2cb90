#include "halyard/gzip-deflate-stream.hpp"

#include <fmt/format.h>
#include <zconf.h>
#include <zlib.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>

#include "halyard/log.hpp"

namespace halyard {

namespace {
// 16 added to the window size selects gzip framing instead of the zlib header.
constexpr int kGzipWindowBits = MAX_WBITS + 16;
constexpr int kMemLevel = 8;
}  // namespace

GzipDeflateStream::GzipDeflateStream(int8_t level) {
  const auto ret = deflateInit2(&_stream, level, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY);
  if (ret != Z_OK) {
    throw std::runtime_error(fmt::format("Unable to start gzip compression at level {}: zlib error {}",
                                         static_cast<int>(level), ret));
  }
}

GzipDeflateStream::~GzipDeflateStream() {
  const auto ret = deflateEnd(&_stream);
  // Z_DATA_ERROR: the member was dropped before its trailer, e.g. when a response write failed
  if (ret != Z_OK && ret != Z_DATA_ERROR) {
    log::error("zlib: deflateEnd returned {} (ignored)", ret);
  }
}

GzipDeflateStream::Step GzipDeflateStream::deflateInto(std::string_view& input, std::span<char> output, bool finish) {
  _stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
  _stream.avail_in = static_cast<uInt>(input.size());
  _stream.next_out = reinterpret_cast<Bytef*>(output.data());
  _stream.avail_out = static_cast<uInt>(output.size());

  const auto ret = deflate(&_stream, finish ? Z_FINISH : Z_NO_FLUSH);
  // Z_BUF_ERROR only means that no progress was possible with the given buffers
  if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
    throw std::runtime_error(fmt::format("gzip compression failed: zlib error {}", ret));
  }

  input.remove_prefix(input.size() - _stream.avail_in);
  return Step{output.size() - _stream.avail_out, ret == Z_STREAM_END};
}

}  // namespace halyard
