#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "halyard/execution-context.hpp"

namespace halyard {

// Fallback resolver serving the HTML shell of single page applications.
// When an unmatched request accepting text/html has a path starting with a registered prefix,
// the page registered for it becomes the result.
class SinglePageHandler {
 public:
  // Registers the page at 'filePath' for paths starting with 'pathPrefix'. The file is read once, now.
  // Prefixes are tried in registration order.
  // Throws std::runtime_error if the file cannot be read.
  SinglePageHandler& add(std::string_view pathPrefix, const std::filesystem::path& filePath);

  // Same as add(), with the page content given directly.
  SinglePageHandler& addPage(std::string_view pathPrefix, std::string html);

  // Installs the page matching the request, if any. Returns true when it did.
  bool handle(ExecutionContext& ctx) const;

  [[nodiscard]] bool empty() const noexcept { return _pages.empty(); }

 private:
  struct Page {
    std::string prefix;
    std::string html;
  };

  std::vector<Page> _pages;
};

}  // namespace halyard
