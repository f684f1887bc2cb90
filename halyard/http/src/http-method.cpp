#include "halyard/http-method.hpp"

#include <string>
#include <string_view>

namespace halyard::http {

std::string MethodBmpToStr(MethodBmp methods, std::string_view sep) {
  std::string ret;
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (IsMethodIdxSet(methods, methodIdx)) {
      if (!ret.empty()) {
        ret.append(sep);
      }
      ret.append(MethodIdxToStr(methodIdx));
    }
  }
  return ret;
}

}  // namespace halyard::http
