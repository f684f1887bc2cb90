#include "halyard/exception-mapper.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "halyard/execution-context.hpp"
#include "halyard/fake-exchange.hpp"
#include "halyard/handler-phase.hpp"
#include "halyard/http-constants.hpp"
#include "halyard/http-exception.hpp"
#include "halyard/http-method.hpp"
#include "halyard/http-status-code.hpp"

namespace halyard {

namespace {
struct CustomError : std::runtime_error {
  CustomError() : std::runtime_error("custom") {}
};
}  // namespace

class ExceptionMapperTest : public ::testing::Test {
 protected:
  test::FakeRequest request{"GET", "/x"};
  test::FakeResponse response;
  ExecutionContext ctx{request, response, HandlerPhase::GET, "/x"};
  ExceptionMapper mapper;
};

TEST_F(ExceptionMapperTest, NoExceptionLeavesContextUntouched) {
  bool ran = false;
  mapper.catchException(ctx, [&ran] { ran = true; });
  EXPECT_TRUE(ran);
  EXPECT_EQ(ctx.status(), http::StatusCodeOK);
  EXPECT_EQ(ctx.resultKind(), ExecutionContext::ResultKind::None);
}

TEST_F(ExceptionMapperTest, HttpResponseExceptionAsText) {
  mapper.catchException(ctx, [] { throw NotFoundResponse(); });
  EXPECT_EQ(ctx.status(), http::StatusCodeNotFound);
  EXPECT_EQ(ctx.resultString(), "Not found");
}

TEST_F(ExceptionMapperTest, DetailsAppendedToText) {
  mapper.catchException(ctx, [] { throw MethodNotAllowedResponse(http::Method::GET | http::Method::POST); });
  EXPECT_EQ(ctx.status(), http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(ctx.resultString(), "Method not allowed [availableMethods: GET, POST]");
}

TEST_F(ExceptionMapperTest, HttpResponseExceptionAsJson) {
  request.withHeader(http::Accept, "application/json, text/plain");
  mapper.catchException(ctx, [] { throw BadRequestResponse("Invalid \"id\"", {{"field", "id"}}); });
  EXPECT_EQ(ctx.status(), http::StatusCodeBadRequest);
  EXPECT_EQ(ctx.contentType(), http::ContentTypeApplicationJson);
  EXPECT_EQ(ctx.resultString(),
            R"({"title":"Invalid \"id\"","status":400,"type":"bad-request","details":{"field":"id"}})");
}

TEST_F(ExceptionMapperTest, UnknownExceptionIsInternalServerError) {
  mapper.catchException(ctx, [] { throw std::runtime_error("boom"); });
  EXPECT_EQ(ctx.status(), http::StatusCodeInternalServerError);
  EXPECT_EQ(ctx.resultString(), "Internal server error");

  ctx.status(http::StatusCodeOK);
  mapper.catchException(ctx, [] { throw 42; });
  EXPECT_EQ(ctx.status(), http::StatusCodeInternalServerError);
}

TEST_F(ExceptionMapperTest, FirstMatchingUserHandlerWins) {
  int nbGeneric = 0;
  mapper.on<CustomError>([](const CustomError& ex, ExecutionContext& context) {
    context.status(http::StatusCodeImATeapot).result(ex.what());
  });
  mapper.on<std::exception>([&nbGeneric](const std::exception&, ExecutionContext&) { ++nbGeneric; });

  mapper.catchException(ctx, [] { throw CustomError(); });
  EXPECT_EQ(ctx.status(), http::StatusCodeImATeapot);
  EXPECT_EQ(ctx.resultString(), "custom");
  EXPECT_EQ(nbGeneric, 0);

  mapper.catchException(ctx, [] { throw std::logic_error("other"); });
  EXPECT_EQ(nbGeneric, 1);
}

TEST_F(ExceptionMapperTest, UserHandlerCanInterceptRoutingFailures) {
  mapper.on<NotFoundResponse>([](const NotFoundResponse&, ExecutionContext& context) {
    context.status(http::StatusCodeNotFound).html("<h1>404</h1>");
  });
  mapper.catchException(ctx, [] { throw NotFoundResponse(); });
  EXPECT_EQ(ctx.resultString(), "<h1>404</h1>");
}

TEST_F(ExceptionMapperTest, ThrowingUserHandlerFallsBackTo500) {
  mapper.on<CustomError>([](const CustomError&, ExecutionContext&) { throw std::runtime_error("handler failure"); });
  mapper.catchException(ctx, [] { throw CustomError(); });
  EXPECT_EQ(ctx.status(), http::StatusCodeInternalServerError);
  EXPECT_EQ(ctx.resultString(), "Internal server error");
}

}  // namespace halyard
