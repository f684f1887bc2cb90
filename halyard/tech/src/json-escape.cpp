#include "halyard/json-escape.hpp"

#include <string>
#include <string_view>

namespace halyard {

void AppendJsonEscaped(std::string_view value, std::string& out) {
  static constexpr char kHexDigits[] = "0123456789abcdef";

  for (char ch : value) {
    switch (ch) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\b':
        out.append("\\b");
        break;
      case '\f':
        out.append("\\f");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\r':
        out.append("\\r");
        break;
      case '\t':
        out.append("\\t");
        break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          const auto uch = static_cast<unsigned char>(ch);
          out.append("\\u00");
          out.push_back(kHexDigits[uch >> 4]);
          out.push_back(kHexDigits[uch & 0x0F]);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

}  // namespace halyard
