#include "halyard/single-page-handler.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "halyard/execution-context.hpp"
#include "halyard/fake-exchange.hpp"
#include "halyard/handler-phase.hpp"
#include "halyard/http-constants.hpp"

namespace halyard {

TEST(SinglePageHandler, ServesPageForHtmlRequests) {
  SinglePageHandler handler;
  EXPECT_TRUE(handler.empty());
  handler.addPage("/app", "<html>app</html>").addPage("/", "<html>root</html>");

  test::FakeRequest request("GET", "/app/settings");
  request.withHeader(http::Accept, "text/html,application/xhtml+xml");
  test::FakeResponse response;
  ExecutionContext ctx(request, response, HandlerPhase::GET, "/app/settings");

  ASSERT_TRUE(handler.handle(ctx));
  EXPECT_EQ(ctx.resultString(), "<html>app</html>");
  EXPECT_EQ(ctx.contentType(), http::ContentTypeTextHtml);
}

TEST(SinglePageHandler, IgnoresNonHtmlRequests) {
  SinglePageHandler handler;
  handler.addPage("/", "<html>root</html>");

  test::FakeRequest request("GET", "/data");
  request.withHeader(http::Accept, "application/json");
  test::FakeResponse response;
  ExecutionContext ctx(request, response, HandlerPhase::GET, "/data");
  EXPECT_FALSE(handler.handle(ctx));

  test::FakeRequest noAccept("GET", "/data");
  ExecutionContext ctxNoAccept(noAccept, response, HandlerPhase::GET, "/data");
  EXPECT_FALSE(handler.handle(ctxNoAccept));
  EXPECT_EQ(ctxNoAccept.resultKind(), ExecutionContext::ResultKind::None);
}

TEST(SinglePageHandler, UnmatchedPrefix) {
  SinglePageHandler handler;
  handler.addPage("/app", "<html>app</html>");

  test::FakeRequest request("GET", "/other");
  request.withHeader(http::Accept, "text/html");
  test::FakeResponse response;
  ExecutionContext ctx(request, response, HandlerPhase::GET, "/other");
  EXPECT_FALSE(handler.handle(ctx));
}

TEST(SinglePageHandler, PageReadFromFile) {
  const auto path = std::filesystem::temp_directory_path() / "halyard-spa-index.html";
  {
    std::ofstream out(path);
    out << "<html>from file</html>";
  }
  SinglePageHandler handler;
  handler.add("/", path);
  std::filesystem::remove(path);

  test::FakeRequest request("GET", "/deep/link");
  request.withHeader(http::Accept, "TEXT/HTML");
  test::FakeResponse response;
  ExecutionContext ctx(request, response, HandlerPhase::GET, "/deep/link");
  ASSERT_TRUE(handler.handle(ctx));
  EXPECT_EQ(ctx.resultString(), "<html>from file</html>");

  EXPECT_THROW(handler.add("/x", path), std::runtime_error);
}

}  // namespace halyard
