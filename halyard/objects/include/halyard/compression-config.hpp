#pragma once

#include <zlib.h>

#include <cstddef>
#include <cstdint>

#include "halyard/http-constants.hpp"

namespace halyard {

// Dynamic response compression settings. Only gzip is produced.
struct CompressionConfig {
  // Validates config. Throws std::invalid_argument if it is not valid.
  void validate() const;

  struct Zlib {
    static constexpr int8_t kDefaultLevel = Z_DEFAULT_COMPRESSION;
    static constexpr int8_t kMinLevel = Z_BEST_SPEED;
    static constexpr int8_t kMaxLevel = Z_BEST_COMPRESSION;

    int8_t level = kDefaultLevel;
  } zlib;

  // Only results whose remaining size is strictly greater than this threshold are compressed.
  std::size_t minBytes{http::kMtuBytes};

  // If true, appends Accept-Encoding to the Vary header whenever compression is applied.
  bool addVaryHeader{true};

  // Growth step of the output buffer used while deflating.
  std::size_t encoderChunkSize{16UL * 1024UL};
};

}  // namespace halyard
