#include "halyard/mime-mappings.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string_view>

#include "halyard/http-constants.hpp"
#include "halyard/toupperlower.hpp"

namespace halyard {

static_assert(std::ranges::is_sorted(kMIMEMappings, {}, &MIMEMapping::extension),
              "kMIMEMappings must be sorted by extension");

std::string_view DetermineMIMEType(std::string_view path) {
  const auto dotPos = path.rfind('.');

  static constexpr std::size_t kMaximumKnownExtensionSize =
      std::ranges::max_element(kMIMEMappings, [](const auto &lhs, const auto &rhs) {
        return lhs.extension.size() < rhs.extension.size();
      })->extension.size();

  if (dotPos != std::string_view::npos && (path.size() - dotPos - 1U) <= kMaximumKnownExtensionSize &&
      path.find('/', dotPos) == std::string_view::npos) {
    char extBuf[kMaximumKnownExtensionSize];
    const auto endIt =
        std::transform(path.begin() + dotPos + 1U, path.end(), extBuf, [](char ch) { return tolower(ch); });

    const std::string_view ext(extBuf, endIt);
    const auto it = std::ranges::lower_bound(kMIMEMappings, ext, {}, &MIMEMapping::extension);
    if (it != std::end(kMIMEMappings) && it->extension == ext) {
      return it->mimeType;
    }
  }
  return http::ContentTypeApplicationOctetStream;
}

}  // namespace halyard
