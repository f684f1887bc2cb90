#include "halyard/execution-context.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "halyard/async-result.hpp"
#include "halyard/fake-exchange.hpp"
#include "halyard/handler-phase.hpp"
#include "halyard/http-constants.hpp"
#include "halyard/http-status-code.hpp"
#include "halyard/result-stream.hpp"

namespace halyard {

class ExecutionContextTest : public ::testing::Test {
 protected:
  test::FakeRequest request{"GET", "/Users/42"};
  test::FakeResponse response;
  ExecutionContext ctx{request, response, HandlerPhase::GET, "/users/42"};
};

TEST_F(ExecutionContextTest, RequestAccessors) {
  request.withHeader("Accept", "text/html").withBody("body");
  EXPECT_EQ(ctx.method(), "GET");
  EXPECT_EQ(ctx.path(), "/Users/42");
  EXPECT_EQ(ctx.normalizedPath(), "/users/42");
  EXPECT_EQ(ctx.phase(), HandlerPhase::GET);
  EXPECT_EQ(ctx.header("accept"), "text/html");
  EXPECT_FALSE(ctx.header("missing"));
  EXPECT_EQ(ctx.body(), "body");
}

TEST_F(ExecutionContextTest, StatusAndHeadersGoToResponse) {
  EXPECT_EQ(ctx.status(), http::StatusCodeOK);
  ctx.status(http::StatusCodeCreated).header("X-Custom", "v1").contentType("application/xml");
  EXPECT_EQ(response.status(), http::StatusCodeCreated);
  EXPECT_EQ(response.header("x-custom"), "v1");
  EXPECT_EQ(ctx.responseHeader("X-Custom"), "v1");
  EXPECT_EQ(ctx.contentType(), "application/xml");

  ctx.header("X-Custom", "v2");
  EXPECT_EQ(response.headerValues("X-Custom"), std::vector<std::string>{"v2"});
}

TEST_F(ExecutionContextTest, ResultReplacesPrevious) {
  EXPECT_EQ(ctx.resultKind(), ExecutionContext::ResultKind::None);
  EXPECT_FALSE(ctx.resultString());

  ctx.result("first");
  ctx.result("second");
  EXPECT_EQ(ctx.resultKind(), ExecutionContext::ResultKind::Stream);
  EXPECT_EQ(ctx.resultString(), "second");
  // reading the result string does not consume it
  EXPECT_EQ(ctx.resultString(), "second");

  ctx.result(AsyncResult{});
  EXPECT_EQ(ctx.resultKind(), ExecutionContext::ResultKind::Async);
  EXPECT_EQ(ctx.resultStream(), nullptr);
  EXPECT_NE(ctx.asyncResult(), nullptr);
  EXPECT_FALSE(ctx.resultString());

  ctx.result(ResultStream::FromString("third"));
  EXPECT_EQ(ctx.asyncResult(), nullptr);
  EXPECT_EQ(ctx.resultString(), "third");

  ctx.clearResult();
  EXPECT_EQ(ctx.resultKind(), ExecutionContext::ResultKind::None);
}

TEST_F(ExecutionContextTest, HtmlJsonAndRedirect) {
  ctx.html("<p>hi</p>");
  EXPECT_EQ(ctx.contentType(), http::ContentTypeTextHtml);
  EXPECT_EQ(ctx.resultString(), "<p>hi</p>");

  ctx.json(R"({"a":1})");
  EXPECT_EQ(ctx.contentType(), http::ContentTypeApplicationJson);
  EXPECT_EQ(ctx.resultString(), R"({"a":1})");

  ctx.redirect("/elsewhere");
  EXPECT_EQ(ctx.status(), http::StatusCodeFound);
  EXPECT_EQ(response.header(http::Location), "/elsewhere");

  ctx.redirect("/moved", http::StatusCodeMovedPermanently);
  EXPECT_EQ(ctx.status(), http::StatusCodeMovedPermanently);
}

TEST_F(ExecutionContextTest, RouteBinding) {
  EXPECT_EQ(ctx.matchedPath(), "");
  EXPECT_THROW((void)ctx.pathParam("id"), std::invalid_argument);

  ctx.bindRoute("/users/{id}/*", PathParams{{"id", "42"}}, {"rest/of/path"});
  EXPECT_EQ(ctx.matchedPath(), "/users/{id}/*");
  EXPECT_EQ(ctx.pathParam("id"), "42");
  EXPECT_EQ(ctx.splat(0), "rest/of/path");
  EXPECT_FALSE(ctx.splat(1));
  EXPECT_EQ(ctx.splats().size(), 1U);
}

TEST_F(ExecutionContextTest, Attributes) {
  EXPECT_EQ(ctx.attribute("user"), nullptr);
  ctx.attribute("user", std::string("alice"));
  ctx.attribute("count", 3);
  ASSERT_NE(ctx.attributeAs<std::string>("user"), nullptr);
  EXPECT_EQ(*ctx.attributeAs<std::string>("user"), "alice");
  EXPECT_EQ(*ctx.attributeAs<int>("count"), 3);
  EXPECT_EQ(ctx.attributeAs<double>("count"), nullptr);

  ctx.attribute("count", 4);
  EXPECT_EQ(*ctx.attributeAs<int>("count"), 4);
}

TEST_F(ExecutionContextTest, ElapsedTimeIsMonotonic) {
  const float first = ctx.elapsedMillis();
  EXPECT_GE(first, 0.0F);
  EXPECT_GE(ctx.elapsedMillis(), first);
}

}  // namespace halyard
