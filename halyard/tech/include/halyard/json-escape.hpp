#pragma once

#include <string>
#include <string_view>

namespace halyard {

// Appends 'value' to 'out' escaped for inclusion inside a JSON string literal (quotes not added).
void AppendJsonEscaped(std::string_view value, std::string& out);

[[nodiscard]] inline std::string JsonEscape(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  AppendJsonEscaped(value, out);
  return out;
}

}  // namespace halyard
