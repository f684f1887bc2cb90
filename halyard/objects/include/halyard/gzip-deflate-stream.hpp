#pragma once

#include <zlib.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace halyard {

// Owns a zlib deflate state producing a single gzip member.
class GzipDeflateStream {
 public:
  struct Step {
    std::size_t produced;
    bool ended;
  };

  // Throws std::runtime_error if zlib rejects 'level'.
  explicit GzipDeflateStream(int8_t level);

  GzipDeflateStream(const GzipDeflateStream&) = delete;
  GzipDeflateStream(GzipDeflateStream&&) noexcept = delete;
  GzipDeflateStream& operator=(const GzipDeflateStream&) = delete;
  GzipDeflateStream& operator=(GzipDeflateStream&&) noexcept = delete;

  ~GzipDeflateStream();

  // Compresses the front of 'input' into 'output' and drops the consumed bytes from 'input'.
  // With 'finish', the gzip trailer is emitted once all input is consumed; 'ended' then becomes true.
  // Throws std::runtime_error on zlib stream errors.
  Step deflateInto(std::string_view& input, std::span<char> output, bool finish);

 private:
  z_stream _stream{};
};

}  // namespace halyard
