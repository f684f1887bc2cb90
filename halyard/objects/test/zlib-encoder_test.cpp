#include "halyard/zlib-encoder.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <string_view>

#include "halyard/compression-config.hpp"
#include "halyard/zlib-test-helpers.hpp"

namespace halyard {

namespace {
std::string MakePayload(std::size_t size) {
  std::string payload;
  payload.reserve(size);
  for (std::size_t pos = 0; pos < size; ++pos) {
    payload.push_back(static_cast<char>('a' + (pos % 7) + ((pos / 97) % 5)));
  }
  return payload;
}
}  // namespace

TEST(ZlibEncoderContext, StreamingGzipRoundTrip) {
  CompressionConfig config;
  config.encoderChunkSize = 64;  // force several output buffer growths
  ZlibEncoderContext ctx(config);

  const std::string payload = MakePayload(10000);
  std::string compressed;
  for (std::size_t pos = 0; pos < payload.size(); pos += 1000) {
    compressed.append(ctx.encodeChunk(std::string_view(payload).substr(pos, 1000)));
  }
  EXPECT_FALSE(ctx.finished());
  compressed.append(ctx.encodeChunk({}));
  EXPECT_TRUE(ctx.finished());

  ASSERT_GE(compressed.size(), 2U);
  EXPECT_EQ(static_cast<unsigned char>(compressed[0]), 0x1FU);
  EXPECT_EQ(static_cast<unsigned char>(compressed[1]), 0x8BU);
  EXPECT_LT(compressed.size(), payload.size());
  EXPECT_EQ(test::GzipDecompress(compressed), payload);
}

TEST(ZlibEncoderContext, FinishOnEmptyInputProducesValidMember) {
  CompressionConfig config;
  ZlibEncoderContext ctx(config);

  const std::string compressed(ctx.encodeChunk({}));
  EXPECT_TRUE(ctx.finished());
  EXPECT_EQ(test::GzipDecompress(compressed), "");
}

TEST(ZlibEncoderContext, EncodeAfterFinishIsEmpty) {
  CompressionConfig config;
  ZlibEncoderContext ctx(config);

  (void)ctx.encodeChunk("data");
  (void)ctx.encodeChunk({});
  EXPECT_TRUE(ctx.encodeChunk({}).empty());
}

}  // namespace halyard
