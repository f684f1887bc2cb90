#include "halyard/single-page-handler.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "halyard/execution-context.hpp"
#include "halyard/http-constants.hpp"
#include "halyard/log.hpp"
#include "halyard/result-stream.hpp"
#include "halyard/string-equal-ignore-case.hpp"

namespace halyard {

SinglePageHandler& SinglePageHandler::add(std::string_view pathPrefix, const std::filesystem::path& filePath) {
  return addPage(pathPrefix, ResultStream::FromFile(filePath).readAll());
}

SinglePageHandler& SinglePageHandler::addPage(std::string_view pathPrefix, std::string html) {
  log::debug("Registered single page for prefix '{}' ({} bytes)", pathPrefix, html.size());
  _pages.push_back(Page{std::string(pathPrefix), std::move(html)});
  return *this;
}

bool SinglePageHandler::handle(ExecutionContext& ctx) const {
  const auto accept = ctx.header(http::Accept);
  if (!accept || !ContainsCaseInsensitive(*accept, http::ContentTypeTextHtml)) {
    return false;
  }
  for (const Page& page : _pages) {
    // prefixes are matched on the path as received, whatever the URL case policy
    if (ctx.path().starts_with(page.prefix)) {
      ctx.html(page.html);
      return true;
    }
  }
  return false;
}

}  // namespace halyard
