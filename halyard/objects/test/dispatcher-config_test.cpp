#include "halyard/dispatcher-config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#include "halyard/compression-config.hpp"

namespace halyard {

TEST(DispatcherConfigTest, DefaultsAreValid) {
  DispatcherConfig config;

  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.defaultContentType, "text/plain");
  EXPECT_EQ(config.serverHeader, "halyard");
  EXPECT_FALSE(config.caseSensitiveUrls);
  EXPECT_FALSE(config.prefer405over404);
  EXPECT_TRUE(config.dynamicGzip);
  EXPECT_FALSE(config.autogeneratedEtags);
  EXPECT_FALSE(config.debugLogging);
}

TEST(DispatcherConfigTest, FluentSetters) {
  auto config = DispatcherConfig{}
                    .withDefaultContentType("application/json")
                    .withServerHeader("edge")
                    .withCaseSensitiveUrls()
                    .withPrefer405over404()
                    .withDynamicGzip(false)
                    .withAutogeneratedEtags()
                    .withMaxRequestCacheBodySize(16)
                    .withDebugLogging();

  EXPECT_EQ(config.defaultContentType, "application/json");
  EXPECT_EQ(config.serverHeader, "edge");
  EXPECT_TRUE(config.caseSensitiveUrls);
  EXPECT_TRUE(config.prefer405over404);
  EXPECT_FALSE(config.dynamicGzip);
  EXPECT_TRUE(config.autogeneratedEtags);
  EXPECT_EQ(config.maxRequestCacheBodySize, 16U);
  EXPECT_TRUE(config.debugLogging);
  EXPECT_NO_THROW(config.validate());
}

TEST(DispatcherConfigTest, EmptyDefaultContentTypeThrows) {
  DispatcherConfig config;
  config.withDefaultContentType("");

  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(DispatcherConfigTest, InvalidCompressionPropagates) {
  CompressionConfig compression;
  compression.encoderChunkSize = 0;

  DispatcherConfig config;
  config.withCompression(compression);

  EXPECT_THROW(config.validate(), std::invalid_argument);
}

}  // namespace halyard
