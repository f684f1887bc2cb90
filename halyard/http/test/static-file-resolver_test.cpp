#include "halyard/static-file-resolver.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "halyard/fake-exchange.hpp"
#include "halyard/http-constants.hpp"
#include "halyard/http-status-code.hpp"

namespace halyard {

class StaticFileResolverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root = std::filesystem::temp_directory_path() /
           ("halyard-static-" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root / "assets");
    std::filesystem::create_directories(root / "docs");
    WriteFile(root / "assets" / "app.js", "console.log('hi');");
    WriteFile(root / "docs" / "index.html", "<h1>docs</h1>");
    WriteFile(root.parent_path() / "halyard-secret.txt", "secret");
  }

  void TearDown() override {
    std::filesystem::remove_all(root);
    std::filesystem::remove(root.parent_path() / "halyard-secret.txt");
  }

  static void WriteFile(const std::filesystem::path& path, std::string_view content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
  }

  std::filesystem::path root;
  test::FakeResponse response;
};

TEST_F(StaticFileResolverTest, ServesFileWithMimeType) {
  StaticFileResolver resolver({root});
  test::FakeRequest request("GET", "/assets/app.js");
  ASSERT_TRUE(resolver(request, response));
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.header(http::ContentType), "text/javascript");
  EXPECT_EQ(response.header(http::ContentLength), "18");
  EXPECT_EQ(response.body(), "console.log('hi');");
  EXPECT_TRUE(response.isCommitted());
}

TEST_F(StaticFileResolverTest, DirectoryServesIndex) {
  StaticFileResolver resolver({root});
  test::FakeRequest request("GET", "/docs/");
  ASSERT_TRUE(resolver(request, response));
  EXPECT_EQ(response.header(http::ContentType), "text/html");
  EXPECT_EQ(response.body(), "<h1>docs</h1>");
}

TEST_F(StaticFileResolverTest, HeadHasNoBody) {
  StaticFileResolver resolver({root});
  test::FakeRequest request("HEAD", "/assets/app.js");
  ASSERT_TRUE(resolver(request, response));
  EXPECT_EQ(response.header(http::ContentLength), "18");
  EXPECT_TRUE(response.body().empty());
  EXPECT_TRUE(response.isCommitted());
}

TEST_F(StaticFileResolverTest, NotFoundOrNotServed) {
  StaticFileResolver resolver({root});
  test::FakeRequest missing("GET", "/assets/missing.js");
  EXPECT_FALSE(resolver(missing, response));

  test::FakeRequest post("POST", "/assets/app.js");
  EXPECT_FALSE(resolver(post, response));

  test::FakeRequest directoryWithoutIndex("GET", "/assets");
  EXPECT_FALSE(resolver(directoryWithoutIndex, response));

  EXPECT_FALSE(response.isCommitted());
}

TEST_F(StaticFileResolverTest, TraversalIsRejected) {
  StaticFileResolver resolver({root});
  test::FakeRequest request("GET", "/../halyard-secret.txt");
  EXPECT_FALSE(resolver(request, response));
  EXPECT_TRUE(response.body().empty());
}

TEST_F(StaticFileResolverTest, RootsAreTriedInOrder) {
  const auto otherRoot = root / "docs";
  StaticFileResolver resolver;
  EXPECT_FALSE(resolver(test::FakeRequest("GET", "/index.html"), response));
  resolver.addRoot(root / "assets").addRoot(otherRoot);
  EXPECT_EQ(resolver.roots().size(), 2U);
  ASSERT_TRUE(resolver(test::FakeRequest("GET", "/index.html"), response));
  EXPECT_EQ(response.body(), "<h1>docs</h1>");
}

TEST_F(StaticFileResolverTest, InvalidRoot) {
  EXPECT_THROW(StaticFileResolver({root / "does-not-exist"}), std::invalid_argument);
}

}  // namespace halyard
