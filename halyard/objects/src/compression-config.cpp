#include "halyard/compression-config.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace halyard {

void CompressionConfig::validate() const {
  if (encoderChunkSize == 0) {
    throw std::invalid_argument("Invalid encoder chunk size");
  }
  if (zlib.level != Zlib::kDefaultLevel && (zlib.level < Zlib::kMinLevel || zlib.level > Zlib::kMaxLevel)) {
    throw std::invalid_argument(fmt::format("Invalid ZLIB compression level {}", zlib.level));
  }
}

}  // namespace halyard
