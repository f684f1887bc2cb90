#include "halyard/cached-request.hpp"

#include <gtest/gtest.h>

#include <string>

#include "halyard/fake-exchange.hpp"

namespace halyard {

TEST(CachedRequest, SmallBodyCanBeReadSeveralTimes) {
  test::FakeRequest fakeRequest("POST", "/upload");
  fakeRequest.withBody("payload").withHeader("X-Test", "1");
  CachedRequest request(fakeRequest, 16);

  EXPECT_EQ(request.method(), "POST");
  EXPECT_EQ(request.path(), "/upload");
  EXPECT_EQ(request.header("x-test"), "1");

  EXPECT_EQ(request.readBody(), "payload");
  EXPECT_EQ(request.readBody(), "payload");
  EXPECT_TRUE(request.isBodyCached());
  EXPECT_EQ(fakeRequest.nbBodyReads(), 1);
}

TEST(CachedRequest, LargeBodyIsReadOnce) {
  test::FakeRequest fakeRequest("POST", "/upload");
  fakeRequest.withBody(std::string(32, 'b'));
  CachedRequest request(fakeRequest, 16);

  EXPECT_EQ(request.readBody(), std::string(32, 'b'));
  EXPECT_FALSE(request.isBodyCached());
  EXPECT_EQ(request.readBody(), "");
  EXPECT_EQ(fakeRequest.nbBodyReads(), 1);
}

TEST(CachedRequest, BodyAtLimitIsCached) {
  test::FakeRequest fakeRequest("PUT", "/x");
  fakeRequest.withBody(std::string(16, 'c'));
  CachedRequest request(fakeRequest, 16);

  EXPECT_EQ(request.readBody(), std::string(16, 'c'));
  EXPECT_EQ(request.readBody(), std::string(16, 'c'));
}

}  // namespace halyard
