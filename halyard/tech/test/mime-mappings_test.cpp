#include "halyard/mime-mappings.hpp"

#include <gtest/gtest.h>

namespace halyard {

TEST(MimeMappings, KnownExtensions) {
  EXPECT_EQ(DetermineMIMEType("index.html"), "text/html");
  EXPECT_EQ(DetermineMIMEType("/assets/app.JS"), "text/javascript");
  EXPECT_EQ(DetermineMIMEType("/img/logo.png"), "image/png");
  EXPECT_EQ(DetermineMIMEType("style.css"), "text/css");
}

TEST(MimeMappings, UnknownOrMissingExtension) {
  EXPECT_EQ(DetermineMIMEType("README"), "application/octet-stream");
  EXPECT_EQ(DetermineMIMEType("archive.unknownext"), "application/octet-stream");
  EXPECT_EQ(DetermineMIMEType("/some.dir/file"), "application/octet-stream");
  EXPECT_EQ(DetermineMIMEType("trailingdot."), "application/octet-stream");
}

}  // namespace halyard
