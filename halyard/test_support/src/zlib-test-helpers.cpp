#include "halyard/zlib-test-helpers.hpp"

#include <fmt/format.h>
#include <zconf.h>
#include <zlib.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace halyard::test {

namespace {

class GzipInflateStream {
 public:
  GzipInflateStream() {
    const auto ret = inflateInit2(&stream, MAX_WBITS + 16);
    if (ret != Z_OK) {
      throw std::runtime_error(fmt::format("inflateInit2 failed with error {}", ret));
    }
  }

  GzipInflateStream(const GzipInflateStream&) = delete;
  GzipInflateStream& operator=(const GzipInflateStream&) = delete;

  ~GzipInflateStream() { inflateEnd(&stream); }

  z_stream stream{};
};

}  // namespace

std::string GzipDecompress(std::string_view compressed) {
  GzipInflateStream zs;

  zs.stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
  zs.stream.avail_in = static_cast<uInt>(compressed.size());

  static constexpr std::size_t kChunkSize = 4096;

  std::string out;
  int ret;
  do {
    const std::size_t oldSize = out.size();
    out.resize(oldSize + kChunkSize);
    zs.stream.next_out = reinterpret_cast<unsigned char*>(out.data() + oldSize);
    zs.stream.avail_out = static_cast<uInt>(kChunkSize);

    ret = inflate(&zs.stream, Z_NO_FLUSH);
    out.resize(oldSize + kChunkSize - zs.stream.avail_out);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      throw std::runtime_error(fmt::format("inflate failed with error {}", ret));
    }
    if (ret == Z_OK && zs.stream.avail_in == 0 && zs.stream.avail_out != 0) {
      throw std::runtime_error("truncated gzip member");
    }
  } while (ret != Z_STREAM_END);

  return out;
}

}  // namespace halyard::test
